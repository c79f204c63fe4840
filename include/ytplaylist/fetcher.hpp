#pragma once

#include <ytplaylist/ytplaylist_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <ytplaylist/http_client.hpp>
#include <ytplaylist/result.hpp>
#include <ytplaylist/types.hpp>

namespace ytplaylist::net {

/// Retrieves a page body by URL.
///
/// Completes with the body text, or with errc::request_failed on network
/// failure and errc::http_error on a non-2xx status. Retries, if any, are
/// the implementation's business.
class YTPLAYLIST_EXPORT PageFetcher {
   public:
	virtual ~PageFetcher() = default;

	[[nodiscard]] virtual asio::any_io_executor get_executor() const = 0;

	using CompletionExecutor = asio::any_completion_executor;

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<std::string>))
				  CompletionToken>
	auto async_fetch(std::string_view url, HttpHeaders headers,
					 CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken, void(Result<std::string>)>(
			[this, ex, url_s = std::string(url),
			 headers = std::move(headers)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<std::string>)>{
						std::forward<decltype(handler)>(handler)};

				async_fetch_impl(std::move(url_s), std::move(headers),
								 std::move(any_handler), std::move(handler_ex));
			},
			token);
	}

   protected:
	virtual void async_fetch_impl(
		std::string url, HttpHeaders headers,
		asio::any_completion_handler<void(Result<std::string>)> handler,
		CompletionExecutor handler_ex) = 0;
};

/// PageFetcher over HttpClient. Adds the configured User-Agent and
/// Accept-Language to every request unless the caller sets them.
class YTPLAYLIST_EXPORT HttpPageFetcher : public PageFetcher {
   public:
	HttpPageFetcher(std::shared_ptr<HttpClient> http,
					std::shared_ptr<const PlaylistOptions> options);

	[[nodiscard]] asio::any_io_executor get_executor() const override;

   protected:
	void async_fetch_impl(
		std::string url, HttpHeaders headers,
		asio::any_completion_handler<void(Result<std::string>)> handler,
		CompletionExecutor handler_ex) override;

   private:
	std::shared_ptr<HttpClient> http_;
	std::shared_ptr<const PlaylistOptions> options_;
};

}  // namespace ytplaylist::net

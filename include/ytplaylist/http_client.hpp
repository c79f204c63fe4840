#pragma once

#include <ytplaylist/ytplaylist_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <map>
#include <memory>
#include <string>
#include <string_view>

#include "result.hpp"

namespace ytplaylist::net {

namespace asio = boost::asio;

using HttpHeaders = std::map<std::string, std::string>;

struct YTPLAYLIST_EXPORT HttpResponse {
	int status_code;
	std::string body;
};

class YTPLAYLIST_EXPORT HttpClient {
   public:
	HttpClient(const HttpClient &) = delete;
	HttpClient &operator=(const HttpClient &) = delete;
	HttpClient(HttpClient &&) noexcept;
	HttpClient &operator=(HttpClient &&) noexcept;
	~HttpClient();

	explicit HttpClient(asio::any_io_executor ex);

	[[nodiscard]] asio::any_io_executor get_executor() const;

	/// Cancel all in-flight requests. Pending handlers complete with
	/// errc::request_failed.
	void shutdown();

	using CompletionExecutor = asio::any_completion_executor;

	// Async GET. Any status code is a successful completion; the caller
	// decides what a non-2xx status means.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<HttpResponse>))
				  CompletionToken>
	auto async_get(std::string_view url, CompletionToken &&token,
				   HttpHeaders headers = {}) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken,
									void(Result<HttpResponse>)>(
			[this, ex, url_s = std::string(url),
			 headers = std::move(headers)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<HttpResponse>)>{
						std::forward<decltype(handler)>(handler)};

				async_get_impl(std::move(url_s), std::move(headers),
							   std::move(any_handler), std::move(handler_ex));
			},
			token);
	}

   private:
	struct Impl;

	void async_get_impl(
		std::string url, HttpHeaders headers,
		asio::any_completion_handler<void(Result<HttpResponse>)> handler,
		CompletionExecutor handler_ex);

	std::unique_ptr<Impl> m_impl;
};

}  // namespace ytplaylist::net

#include <spdlog/spdlog.h>

#include <boost/asio/dispatch.hpp>
#include <ytplaylist/fetcher.hpp>

namespace ytplaylist::net {

HttpPageFetcher::HttpPageFetcher(std::shared_ptr<HttpClient> http,
								 std::shared_ptr<const PlaylistOptions> options)
	: http_(std::move(http)), options_(std::move(options)) {}

asio::any_io_executor HttpPageFetcher::get_executor() const {
	return http_->get_executor();
}

void HttpPageFetcher::async_fetch_impl(
	std::string url, HttpHeaders headers,
	asio::any_completion_handler<void(Result<std::string>)> handler,
	CompletionExecutor handler_ex) {
	// emplace keeps caller-provided values
	headers.emplace("User-Agent", options_->user_agent);
	headers.emplace("Accept-Language", options_->accept_language);

	http_->async_get(
		url,
		[url, handler = std::move(handler),
		 handler_ex](Result<HttpResponse> res) mutable {
			Result<std::string> out = outcome::failure(errc::request_failed);
			if (res.has_error()) {
				out = outcome::failure(res.error());
			} else if (res.value().status_code < 200 ||
					   res.value().status_code >= 300) {
				spdlog::debug("GET {} returned HTTP {}", url,
							  res.value().status_code);
				out = outcome::failure(errc::http_error);
			} else {
				out = std::move(res.value().body);
			}

			asio::dispatch(handler_ex, [handler = std::move(handler),
										out = std::move(out)]() mutable {
				handler(std::move(out));
			});
		},
		std::move(headers));
}

}  // namespace ytplaylist::net

#include "pagination_driver.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>

#include "initial_data.hpp"
#include "innertube.hpp"

namespace ytplaylist::youtube {

PaginationDriver::PaginationDriver(
	std::shared_ptr<net::PageFetcher> fetcher,
	std::shared_ptr<const PlaylistOptions> options, std::string playlist_id,
	std::string listing_html)
	: fetcher_(std::move(fetcher)),
	  options_(std::move(options)),
	  parser_(options_),
	  playlist_id_(std::move(playlist_id)),
	  state_(Initial{std::move(listing_html)}) {}

void PaginationDriver::complete(PageHandler handler,
								CompletionExecutor handler_ex,
								PageResult result) {
	// Never complete inline: callers loop on async_next_page
	asio::post(handler_ex, [handler = std::move(handler),
							result = std::move(result)]() mutable {
		handler(std::move(result));
	});
}

void PaginationDriver::finish(std::error_code ec) { state_ = Done{ec}; }

void PaginationDriver::advance(const std::optional<ContinuationToken> &next,
							   const ContinuationToken *used_token) {
	if (!next) {
		state_ = Done{};
		return;
	}

	if (used_token && *next == *used_token) {
		spdlog::warn("{}: Continuation token did not advance, stopping",
					 playlist_id_);
		finish(make_error_code(errc::pagination_stalled));
		return;
	}

	if (fetch_count_ >= options_->max_continuations) {
		spdlog::warn("{}: Reached the limit of {} continuation pages, stopping",
					 playlist_id_, options_->max_continuations);
		finish(make_error_code(errc::pagination_stalled));
		return;
	}

	state_ = Continuing{*next};
}

void PaginationDriver::next_page_impl(PageHandler handler,
									  CompletionExecutor handler_ex) {
	if (const auto *done = std::get_if<Done>(&state_)) {
		if (done->error) {
			return complete(std::move(handler), std::move(handler_ex),
							outcome::failure(*done->error));
		}
		return complete(std::move(handler), std::move(handler_ex),
						std::optional<Page>{});
	}

	if (std::holds_alternative<Initial>(state_)) {
		return process_initial(std::move(handler), std::move(handler_ex));
	}

	if (cancelled_) {
		finish(make_error_code(errc::cancelled));
		return complete(std::move(handler), std::move(handler_ex),
						outcome::failure(errc::cancelled));
	}

	fetch_continuation(std::move(handler), std::move(handler_ex));
}

void PaginationDriver::process_initial(PageHandler handler,
									   CompletionExecutor handler_ex) {
	std::string html = std::move(std::get<Initial>(state_).html);

	auto data = extract_initial_data(html);
	if (data.has_error()) {
		finish(data.error());
		return complete(std::move(handler), std::move(handler_ex),
						outcome::failure(data.error()));
	}

	Page page = parser_.parse_page(data.value());
	spdlog::info(
		"{}: Page 1: {} video(s)", playlist_id_, page.entries.size());

	advance(page.continuation, nullptr);
	complete(std::move(handler), std::move(handler_ex),
			 std::optional<Page>(std::move(page)));
}

void PaginationDriver::fetch_continuation(PageHandler handler,
										  CompletionExecutor handler_ex) {
	ContinuationToken token = std::get<Continuing>(state_).token;
	auto req = Innertube::build_continuation_request(token, *options_);

	++fetch_count_;
	spdlog::info("{}: Downloading page {}", playlist_id_, fetch_count_ + 1);
	spdlog::debug("Continuation URL: {}", req.url);

	auto self = shared_from_this();
	fetcher_->async_fetch(
		req.url, std::move(req.headers),
		[self, token = std::move(token), handler = std::move(handler),
		 handler_ex](Result<std::string> body) mutable {
			self->on_continuation(token, std::move(body), std::move(handler),
								  std::move(handler_ex));
		});
}

void PaginationDriver::on_continuation(const ContinuationToken &used_token,
									   Result<std::string> body,
									   PageHandler handler,
									   CompletionExecutor handler_ex) {
	if (cancelled_) {
		finish(make_error_code(errc::cancelled));
		return complete(std::move(handler), std::move(handler_ex),
						outcome::failure(errc::cancelled));
	}

	if (body.has_error()) {
		spdlog::warn("{}: Continuation request failed: {}", playlist_id_,
					 body.error().message());
		finish(make_error_code(errc::pagination_fetch_failed));
		return complete(std::move(handler), std::move(handler_ex),
						outcome::failure(errc::pagination_fetch_failed));
	}

	auto json = nlohmann::json::parse(body.value(), nullptr, false);
	if (json.is_discarded()) {
		spdlog::warn("{}: Continuation response is not JSON ({} bytes)",
					 playlist_id_, body.value().size());
		finish(make_error_code(errc::pagination_fetch_failed));
		return complete(std::move(handler), std::move(handler_ex),
						outcome::failure(errc::pagination_fetch_failed));
	}

	Page page = parser_.parse_page(json, ResponseShape::continuation);
	spdlog::info("{}: Page {}: {} video(s)", playlist_id_, fetch_count_ + 1,
				 page.entries.size());

	advance(page.continuation, &used_token);
	complete(std::move(handler), std::move(handler_ex),
			 std::optional<Page>(std::move(page)));
}

}  // namespace ytplaylist::youtube

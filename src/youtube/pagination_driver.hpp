#pragma once

#include <atomic>
#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/async_result.hpp>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <variant>
#include <ytplaylist/fetcher.hpp>
#include <ytplaylist/result.hpp>
#include <ytplaylist/types.hpp>

#include "continuation_parser.hpp"

namespace ytplaylist::youtube {

namespace asio = boost::asio;

/// Lazily walks a playlist listing page by page.
///
/// The first call parses the listing page handed to the constructor; every
/// later call fetches the next continuation. Each call completes with the
/// next Page, with std::nullopt once the listing is exhausted, or with an
/// error that ends the sequence:
///   - errc::extraction_failed / errc::malformed_data from the first page
///   - errc::pagination_fetch_failed when a continuation can't be fetched
///     or decoded
///   - errc::pagination_stalled when the service repeats a token or the
///     continuation cap is reached (the page carrying the repeated token is
///     still delivered)
///   - errc::cancelled after cancel()
/// The sequence is single-pass. Only one request may be outstanding.
class PaginationDriver : public std::enable_shared_from_this<PaginationDriver> {
   public:
	using CompletionExecutor = asio::any_completion_executor;
	using PageResult = Result<std::optional<Page>>;

	PaginationDriver(std::shared_ptr<net::PageFetcher> fetcher,
					 std::shared_ptr<const PlaylistOptions> options,
					 std::string playlist_id, std::string listing_html);

	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(PageResult))
				  CompletionToken>
	auto async_next_page(CompletionToken &&token) {
		auto ex = fetcher_->get_executor();
		return asio::async_initiate<CompletionToken, void(PageResult)>(
			[this, ex](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler = asio::any_completion_handler<void(
					PageResult)>{std::forward<decltype(handler)>(handler)};

				next_page_impl(std::move(any_handler), std::move(handler_ex));
			},
			token);
	}

	/// Stop before the next continuation request. A request already in
	/// flight completes, but its page is dropped.
	void cancel() { cancelled_ = true; }

	[[nodiscard]] bool done() const {
		return std::holds_alternative<Done>(state_);
	}

	// Continuation requests issued so far
	[[nodiscard]] std::size_t fetch_count() const { return fetch_count_; }

   private:
	struct Initial {
		std::string html;
	};
	struct Continuing {
		ContinuationToken token;
	};
	struct Done {
		std::optional<std::error_code> error;
	};
	using State = std::variant<Initial, Continuing, Done>;

	using PageHandler = asio::any_completion_handler<void(PageResult)>;

	void next_page_impl(PageHandler handler, CompletionExecutor handler_ex);

	void process_initial(PageHandler handler, CompletionExecutor handler_ex);
	void fetch_continuation(PageHandler handler, CompletionExecutor handler_ex);
	void on_continuation(const ContinuationToken &used_token,
						 Result<std::string> body, PageHandler handler,
						 CompletionExecutor handler_ex);

	// Moves to the state that follows a page with the given token
	void advance(const std::optional<ContinuationToken> &next,
				 const ContinuationToken *used_token);
	void finish(std::error_code ec);

	static void complete(PageHandler handler, CompletionExecutor handler_ex,
						 PageResult result);

	std::shared_ptr<net::PageFetcher> fetcher_;
	std::shared_ptr<const PlaylistOptions> options_;
	ContinuationParser parser_;
	std::string playlist_id_;
	State state_;
	std::size_t fetch_count_ = 0;
	std::atomic<bool> cancelled_{false};
};

}  // namespace ytplaylist::youtube

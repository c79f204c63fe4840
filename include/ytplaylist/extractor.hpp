#pragma once

#include <ytplaylist/ytplaylist_export.h>

#include <boost/asio/any_completion_executor.hpp>
#include <boost/asio/any_completion_handler.hpp>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <ytplaylist/playlist.hpp>
#include <ytplaylist/result.hpp>
#include <ytplaylist/types.hpp>

// Forward declarations
namespace ytplaylist::net {
class PageFetcher;
}  // namespace ytplaylist::net

namespace ytplaylist::youtube {

namespace asio = boost::asio;

class YTPLAYLIST_EXPORT PlaylistExtractor {
   public:
	PlaylistExtractor(const PlaylistExtractor &) = delete;
	PlaylistExtractor &operator=(const PlaylistExtractor &) = delete;
	PlaylistExtractor(PlaylistExtractor &&) noexcept;
	PlaylistExtractor &operator=(PlaylistExtractor &&) noexcept;
	~PlaylistExtractor();

	/// `options` is shared with the fetcher and every build; null means
	/// defaults.
	explicit PlaylistExtractor(
		std::shared_ptr<net::PageFetcher> fetcher,
		std::shared_ptr<const PlaylistOptions> options = nullptr);

	[[nodiscard]] asio::any_io_executor get_executor() const;
	[[nodiscard]] const PlaylistOptions &options() const;

	/// Cancel all builds in progress. They complete with errc::cancelled, or
	/// with a partial Playlist if pagination had already started.
	void shutdown();

	using CompletionExecutor = asio::any_completion_executor;

	/// Fetch a playlist by URL (".../playlist?list=<id>") or bare id and
	/// follow its continuations to the end.
	template <BOOST_ASIO_COMPLETION_TOKEN_FOR(void(Result<Playlist>))
				  CompletionToken>
	auto async_build(std::string_view url_or_id, CompletionToken &&token) {
		auto ex = get_executor();
		return asio::async_initiate<CompletionToken, void(Result<Playlist>)>(
			[this, ex, url_s = std::string(url_or_id)](auto &&handler) mutable {
				CompletionExecutor handler_ex =
					asio::get_associated_executor(handler, ex);

				auto any_handler =
					asio::any_completion_handler<void(Result<Playlist>)>{
						std::forward<decltype(handler)>(handler)};

				async_build_impl(std::move(url_s), std::move(any_handler),
								 std::move(handler_ex));
			},
			token);
	}

   private:
	struct Impl;

	void async_build_impl(
		std::string url_or_id,
		asio::any_completion_handler<void(Result<Playlist>)> handler,
		CompletionExecutor handler_ex);

	std::unique_ptr<Impl> m_impl;
};

/// Resolve a playlist URL or bare id to its id and canonical listing URL.
/// A string containing '?' is read as a URL and must carry a `list`
/// parameter.
YTPLAYLIST_EXPORT Result<PlaylistReference> parse_playlist_reference(
	std::string_view url_or_id,
	std::string_view base_url = "https://www.youtube.com");

}  // namespace ytplaylist::youtube

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/dispatch.hpp>
#include <boost/url.hpp>
#include <vector>
#include <ytplaylist/extractor.hpp>
#include <ytplaylist/fetcher.hpp>

#include "accumulator.hpp"
#include "metadata.hpp"
#include "pagination_driver.hpp"

namespace ytplaylist::youtube {

Result<PlaylistReference> parse_playlist_reference(std::string_view url_or_id,
												   std::string_view base_url) {
	std::string id;

	if (url_or_id.find('?') == std::string_view::npos) {
		// Assume that the input is just the id
		id = std::string(url_or_id);
	} else {
		auto r = boost::urls::parse_uri_reference(url_or_id);
		if (r.has_error()) {
			spdlog::debug("Unparseable playlist URL: {}", url_or_id);
			return outcome::failure(errc::invalid_url);
		}
		for (auto p : r->params()) {
			if (p.key == "list") {
				id = p.value;
				break;
			}
		}
	}

	if (id.empty()) { return outcome::failure(errc::invalid_url); }

	auto base = boost::urls::parse_uri(base_url);
	if (base.has_error()) {
		spdlog::debug("Unparseable base URL: {}", base_url);
		return outcome::failure(errc::invalid_url);
	}

	// The id was decoded from the query; params() encodes it again
	boost::urls::url listing(*base);
	listing.set_path("/playlist");
	listing.params().append({"list", id});

	PlaylistReference ref;
	ref.url = std::string(listing.buffer());
	ref.id = std::move(id);
	return ref;
}

using PlaylistHandler = asio::any_completion_handler<void(Result<Playlist>)>;

// One playlist build: listing page, then continuations until the driver
// reports the end of the listing.
struct BuildSession : public std::enable_shared_from_this<BuildSession> {
	using CompletionExecutor = PlaylistExtractor::CompletionExecutor;

	std::shared_ptr<net::PageFetcher> fetcher;
	std::shared_ptr<const PlaylistOptions> options;
	std::string url_or_id;
	PlaylistHandler handler;
	CompletionExecutor handler_ex;

	PlaylistReference reference;
	std::optional<std::string> title;
	std::optional<PlaylistDate> last_updated;
	std::shared_ptr<PaginationDriver> driver;
	PlaylistAccumulator accumulator;
	std::atomic<bool> cancelled{false};

	BuildSession(std::shared_ptr<net::PageFetcher> f,
				 std::shared_ptr<const PlaylistOptions> o, std::string u,
				 PlaylistHandler handler, CompletionExecutor handler_ex)
		: fetcher(std::move(f)),
		  options(std::move(o)),
		  url_or_id(std::move(u)),
		  handler(std::move(handler)),
		  handler_ex(std::move(handler_ex)) {}

	void cancel() {
		cancelled = true;
		if (driver) { driver->cancel(); }
	}

	void complete(Result<Playlist> result) {
		asio::dispatch(handler_ex, [h = std::move(handler),
									result = std::move(result)]() mutable {
			h(std::move(result));
		});
	}

	void start() {
		auto ref = parse_playlist_reference(url_or_id, options->base_url);
		if (ref.has_error()) {
			spdlog::error("Invalid playlist URL or id: {}", url_or_id);
			return complete(outcome::failure(ref.error()));
		}
		reference = std::move(ref.value());

		spdlog::info("{}: Downloading webpage", reference.id);

		auto self = shared_from_this();
		fetcher->async_fetch(
			reference.url, {}, [self](Result<std::string> res) {
				self->on_webpage(std::move(res));
			});
	}

	void on_webpage(Result<std::string> res) {
		if (cancelled) { return complete(outcome::failure(errc::cancelled)); }
		if (res.has_error()) {
			spdlog::error("{}: Failed to download webpage: {}", reference.id,
						  res.error().message());
			return complete(outcome::failure(res.error()));
		}

		std::string html = std::move(res.value());
		title = extract_playlist_title(html);
		last_updated = extract_last_update(html);
		if (title) { spdlog::debug("{}: Title: {}", reference.id, *title); }

		driver = std::make_shared<PaginationDriver>(
			fetcher, options, reference.id, std::move(html));
		next_page();
	}

	void next_page() {
		if (cancelled) { driver->cancel(); }

		auto self = shared_from_this();
		driver->async_next_page([self](PaginationDriver::PageResult res) {
			self->on_page(std::move(res));
		});
	}

	void on_page(PaginationDriver::PageResult res) {
		if (res.has_error()) {
			// Nothing collected yet: the listing page itself is unusable
			if (accumulator.pages() == 0) {
				spdlog::error("{}: {}", reference.id, res.error().message());
				return complete(outcome::failure(res.error()));
			}
			spdlog::warn("{}: Playlist incomplete after {} page(s): {}",
						 reference.id, accumulator.pages(),
						 res.error().message());
			return finish(res.error());
		}

		if (!res.value()) { return finish(std::nullopt); }

		size_t added = accumulator.add(std::move(*res.value()));
		spdlog::debug("{}: {} new video(s), {} total", reference.id, added,
					  accumulator.size());
		next_page();
	}

	void finish(std::optional<std::error_code> terminal_error) {
		spdlog::info("{}: Playlist has {} video(s)", reference.id,
					 accumulator.size());
		complete(Playlist(std::move(reference), accumulator.release(),
						  std::move(title), last_updated, terminal_error));
	}
};

struct PlaylistExtractor::Impl {
	std::shared_ptr<net::PageFetcher> fetcher;
	std::shared_ptr<const PlaylistOptions> options;
	std::vector<std::weak_ptr<BuildSession>> sessions;
	std::atomic<bool> shutdown_flag{false};

	Impl(std::shared_ptr<net::PageFetcher> f,
		 std::shared_ptr<const PlaylistOptions> o)
		: fetcher(std::move(f)), options(std::move(o)) {
		if (!options) { options = std::make_shared<const PlaylistOptions>(); }
	}

	~Impl() { shutdown(); }

	void shutdown() {
		if (shutdown_flag.exchange(true)) { return; }  // Already shut down

		for (auto &w : sessions) {
			if (auto s = w.lock()) { s->cancel(); }
		}
		sessions.clear();
	}

	void async_build(std::string url_or_id, PlaylistHandler handler,
					 CompletionExecutor handler_ex) {
		if (shutdown_flag) {
			asio::dispatch(
				handler_ex, [handler = std::move(handler)]() mutable {
					handler(outcome::failure(errc::cancelled));
				});
			return;
		}

		auto session = std::make_shared<BuildSession>(
			fetcher, options, std::move(url_or_id), std::move(handler),
			std::move(handler_ex));

		sessions.erase(std::remove_if(sessions.begin(), sessions.end(),
									  [](const std::weak_ptr<BuildSession> &w) {
										  return w.expired();
									  }),
					   sessions.end());
		sessions.push_back(session);

		session->start();
	}
};

PlaylistExtractor::PlaylistExtractor(
	std::shared_ptr<net::PageFetcher> fetcher,
	std::shared_ptr<const PlaylistOptions> options)
	: m_impl(std::make_unique<Impl>(std::move(fetcher), std::move(options))) {}

PlaylistExtractor::~PlaylistExtractor() = default;
PlaylistExtractor::PlaylistExtractor(PlaylistExtractor &&) noexcept = default;
PlaylistExtractor &PlaylistExtractor::operator=(PlaylistExtractor &&) noexcept =
	default;

asio::any_io_executor PlaylistExtractor::get_executor() const {
	return m_impl->fetcher->get_executor();
}

const PlaylistOptions &PlaylistExtractor::options() const {
	return *m_impl->options;
}

void PlaylistExtractor::shutdown() {
	if (m_impl) { m_impl->shutdown(); }
}

void PlaylistExtractor::async_build_impl(std::string url_or_id,
										 PlaylistHandler handler,
										 CompletionExecutor handler_ex) {
	m_impl->async_build(
		std::move(url_or_id), std::move(handler), std::move(handler_ex));
}

}  // namespace ytplaylist::youtube

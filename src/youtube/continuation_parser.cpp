#include "continuation_parser.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

#include "utils.hpp"

namespace ytplaylist::youtube {

namespace {

// Returns the playlistVideoList{Renderer,Continuation} object, or nullptr if
// the response doesn't have the given shape.
const nlohmann::json *find_list_container(const nlohmann::json &data,
										  ResponseShape shape) {
	const nlohmann::json *container = nullptr;
	switch (shape) {
		case ResponseShape::initial:
			container = utils::traverse_ptr(
				data, {"contents", "twoColumnBrowseResultsRenderer", "tabs", 0,
					   "tabRenderer", "content", "sectionListRenderer",
					   "contents", 0, "itemSectionRenderer", "contents", 0,
					   "playlistVideoListRenderer"});
			break;
		case ResponseShape::continuation:
			// browse_ajax answers with [page_metadata, {"response": ...}];
			// some deployments drop the array around the envelope.
			container = utils::traverse_ptr(
				data, {1, "response", "continuationContents",
					   "playlistVideoListContinuation"});
			if (!container) {
				container = utils::traverse_ptr(
					data, {"response", "continuationContents",
						   "playlistVideoListContinuation"});
			}
			break;
	}

	if (!container || !container->is_object()) return nullptr;
	auto contents = container->find("contents");
	if (contents == container->end() || !contents->is_array()) return nullptr;
	return container;
}

}  // namespace

ContinuationParser::ContinuationParser(
	std::shared_ptr<const PlaylistOptions> options)
	: options_(std::move(options)) {}

std::string ContinuationParser::watch_url(std::string_view video_id) const {
	std::string url = options_->base_url;
	url += "/watch?";
	url += options_->watch_key;
	url += '=';
	url += video_id;
	return url;
}

std::optional<VideoEntry> ContinuationParser::parse_entry(
	const nlohmann::json &item) const {
	const auto *renderer = utils::traverse_ptr(item, {"playlistVideoRenderer"});
	if (!renderer) return std::nullopt;

	auto video_id = utils::traverse_obj<std::string>(*renderer, {"videoId"});
	if (!video_id || video_id->empty()) return std::nullopt;

	auto title =
		utils::traverse_obj<std::string>(*renderer, {"title", "simpleText"});
	if (!title) {
		// Newer layouts split the title into runs
		auto text = utils::get_text_from_runs(*renderer, {"title", "runs"});
		if (text.empty()) return std::nullopt;
		title = std::move(text);
	}

	return VideoEntry{watch_url(*video_id), utils::html_unescape(*title)};
}

Page ContinuationParser::parse_container(
	const nlohmann::json &container) const {
	Page page;

	std::unordered_set<std::string> seen;
	size_t skipped = 0;
	for (const auto &item : container["contents"]) {
		auto entry = parse_entry(item);
		if (!entry) {
			++skipped;
			continue;
		}
		if (seen.insert(entry->url).second) {
			page.entries.push_back(std::move(*entry));
		}
	}
	if (skipped > 0) {
		spdlog::debug("Skipped {} non-video list item(s)", skipped);
	}

	auto token = utils::traverse_obj<std::string>(
		container, {"continuations", 0, "nextContinuationData", "continuation"});
	if (token && !token->empty()) { page.continuation = std::move(*token); }

	return page;
}

Page ContinuationParser::parse_page(const nlohmann::json &data,
									ResponseShape shape) const {
	const auto *container = find_list_container(data, shape);
	if (!container) return {};
	return parse_container(*container);
}

Page ContinuationParser::parse_page(const nlohmann::json &data) const {
	if (const auto *c = find_list_container(data, ResponseShape::initial)) {
		return parse_container(*c);
	}
	if (const auto *c = find_list_container(data, ResponseShape::continuation)) {
		spdlog::debug("Video list found in continuation envelope");
		return parse_container(*c);
	}
	spdlog::debug("No video list in response");
	return {};
}

}  // namespace ytplaylist::youtube

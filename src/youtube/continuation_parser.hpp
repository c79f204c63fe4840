#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <ytplaylist/types.hpp>

namespace ytplaylist::youtube {

// Where the video list lives in a decoded response
enum class ResponseShape {
	initial,	  // ytInitialData of the listing page
	continuation  // browse_ajax continuation envelope
};

/// Turns decoded listing JSON into a Page.
///
/// A response that matches no known shape yields an empty page without a
/// token, which ends pagination. List items that are not playable videos
/// (ads, continuation placeholders, deleted entries) are skipped.
class ContinuationParser {
   public:
	explicit ContinuationParser(std::shared_ptr<const PlaylistOptions> options);

	// Tries the initial shape, then the continuation shape
	[[nodiscard]] Page parse_page(const nlohmann::json &data) const;

	[[nodiscard]] Page parse_page(const nlohmann::json &data,
								  ResponseShape shape) const;

	// <base_url>/watch?<watch_key>=<video_id>
	[[nodiscard]] std::string watch_url(std::string_view video_id) const;

   private:
	[[nodiscard]] std::optional<VideoEntry> parse_entry(
		const nlohmann::json &item) const;
	[[nodiscard]] Page parse_container(const nlohmann::json &container) const;

	std::shared_ptr<const PlaylistOptions> options_;
};

}  // namespace ytplaylist::youtube

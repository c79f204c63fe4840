#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>
#include <ytplaylist/types.hpp>

namespace ytplaylist::youtube {

// Collects pages into one list, keeping the first occurrence of each watch
// URL in the order it was seen.
class PlaylistAccumulator {
   public:
	// Returns the number of entries that were not seen before
	std::size_t add(Page page);

	[[nodiscard]] std::size_t size() const { return entries_.size(); }
	[[nodiscard]] std::size_t pages() const { return pages_; }
	[[nodiscard]] const std::vector<VideoEntry> &entries() const {
		return entries_;
	}

	// Hands over the collected entries and resets the accumulator
	std::vector<VideoEntry> release();

   private:
	std::unordered_set<std::string> seen_urls_;
	std::vector<VideoEntry> entries_;
	std::size_t pages_ = 0;
};

}  // namespace ytplaylist::youtube

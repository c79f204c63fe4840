#include "accumulator.hpp"

namespace ytplaylist::youtube {

std::size_t PlaylistAccumulator::add(Page page) {
	++pages_;
	std::size_t added = 0;
	for (auto &entry : page.entries) {
		if (seen_urls_.find(entry.url) != seen_urls_.end()) continue;
		seen_urls_.insert(entry.url);
		entries_.push_back(std::move(entry));
		++added;
	}
	return added;
}

std::vector<VideoEntry> PlaylistAccumulator::release() {
	std::vector<VideoEntry> out = std::move(entries_);
	entries_.clear();
	seen_urls_.clear();
	pages_ = 0;
	return out;
}

}  // namespace ytplaylist::youtube

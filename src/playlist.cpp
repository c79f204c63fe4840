#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <ytplaylist/playlist.hpp>

namespace ytplaylist {

std::string PlaylistDate::to_string() const {
	return fmt::format("{:04d}-{:02d}-{:02d}", year, month, day);
}

Playlist::Playlist(PlaylistReference reference, std::vector<VideoEntry> entries,
				   std::optional<std::string> title,
				   std::optional<PlaylistDate> last_updated,
				   std::optional<std::error_code> terminal_error)
	: reference_(std::move(reference)),
	  title_(std::move(title)),
	  last_updated_(last_updated),
	  terminal_error_(terminal_error) {
	std::unordered_set<std::string> seen;
	entries_.reserve(entries.size());
	for (auto &e : entries) {
		if (seen.insert(e.url).second) { entries_.push_back(std::move(e)); }
	}
}

const VideoEntry &Playlist::at(size_type i) const {
	if (i >= entries_.size()) {
		throw std::out_of_range(fmt::format(
			"playlist index {} out of range (size {})", i, entries_.size()));
	}
	return entries_[i];
}

std::vector<VideoEntry> Playlist::slice(long start, long stop) const {
	const long n = static_cast<long>(entries_.size());
	auto clamp = [n](long pos) {
		if (pos < 0) pos += n;
		return std::clamp(pos, 0L, n);
	};
	start = clamp(start);
	stop = clamp(stop);
	if (start >= stop) return {};
	return {entries_.begin() + start, entries_.begin() + stop};
}

std::vector<std::string> Playlist::numbered_prefixes(bool reverse) const {
	const size_t n = entries_.size();
	const size_t digits = std::to_string(n).size();

	std::vector<std::string> prefixes;
	prefixes.reserve(n);
	for (size_t i = 0; i < n; ++i) {
		size_t ordinal = reverse ? n - i : i + 1;
		prefixes.push_back(fmt::format("{:0{}d}", ordinal, digits));
	}
	return prefixes;
}

void to_json(nlohmann::json &j, const VideoEntry &e) {
	j = nlohmann::json{{"url", e.url}, {"title", e.title}};
}

void to_json(nlohmann::json &j, const Playlist &p) {
	nlohmann::json entries_json = nlohmann::json::array();
	for (const auto &e : p) {
		nlohmann::json entry_j;
		to_json(entry_j, e);
		entries_json.push_back(entry_j);
	}

	j = nlohmann::json{{"id", p.id()},
					   {"webpage_url", p.url()},
					   {"entries", entries_json},
					   {"playlist_count", p.size()},
					   {"complete", p.complete()},
					   {"_type", "playlist"}};

	// Explicit null handling
	if (p.title())
		j["title"] = *p.title();
	else
		j["title"] = nullptr;
	if (p.last_updated())
		j["last_updated"] = p.last_updated()->to_string();
	else
		j["last_updated"] = nullptr;
	if (p.terminal_error())
		j["error"] = p.terminal_error()->message();
}

}  // namespace ytplaylist

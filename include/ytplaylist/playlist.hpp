#pragma once

#include <ytplaylist/ytplaylist_export.h>

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <system_error>
#include <vector>
#include <ytplaylist/types.hpp>

namespace ytplaylist {

/// The videos of one playlist, in listing order, each watch URL once.
///
/// A Playlist is produced by a single build that drains pagination and does
/// not change afterwards. When pagination ended early (a continuation
/// request failed, the service stopped advancing, or the build was
/// cancelled) the entries collected up to that point are kept and
/// terminal_error() tells why the listing is incomplete.
class YTPLAYLIST_EXPORT Playlist {
   public:
	using value_type = VideoEntry;
	using const_iterator = std::vector<VideoEntry>::const_iterator;
	using size_type = std::size_t;

	// Entries with a watch URL seen earlier in the list are dropped
	Playlist(PlaylistReference reference, std::vector<VideoEntry> entries,
			 std::optional<std::string> title = std::nullopt,
			 std::optional<PlaylistDate> last_updated = std::nullopt,
			 std::optional<std::error_code> terminal_error = std::nullopt);

	[[nodiscard]] const PlaylistReference &reference() const {
		return reference_;
	}
	[[nodiscard]] const std::string &id() const { return reference_.id; }
	[[nodiscard]] const std::string &url() const { return reference_.url; }
	[[nodiscard]] const std::optional<std::string> &title() const {
		return title_;
	}
	[[nodiscard]] const std::optional<PlaylistDate> &last_updated() const {
		return last_updated_;
	}

	[[nodiscard]] const std::optional<std::error_code> &terminal_error() const {
		return terminal_error_;
	}
	[[nodiscard]] bool complete() const { return !terminal_error_; }

	[[nodiscard]] size_type size() const { return entries_.size(); }
	[[nodiscard]] bool empty() const { return entries_.empty(); }
	[[nodiscard]] const std::vector<VideoEntry> &entries() const {
		return entries_;
	}

	const VideoEntry &operator[](size_type i) const { return entries_[i]; }
	// Throws std::out_of_range
	[[nodiscard]] const VideoEntry &at(size_type i) const;

	[[nodiscard]] const_iterator begin() const { return entries_.begin(); }
	[[nodiscard]] const_iterator end() const { return entries_.end(); }

	/// Entries in [start, stop). Negative positions count from the end and
	/// out-of-range positions are clamped, as with Python slices.
	[[nodiscard]] std::vector<VideoEntry> slice(long start, long stop) const;

	/// Zero-padded ordinals ("01".."12") for numbering entries, counting
	/// down from size() when reverse is set.
	[[nodiscard]] std::vector<std::string> numbered_prefixes(
		bool reverse = false) const;

   private:
	PlaylistReference reference_;
	std::vector<VideoEntry> entries_;
	std::optional<std::string> title_;
	std::optional<PlaylistDate> last_updated_;
	std::optional<std::error_code> terminal_error_;
};

// JSON Serialization
YTPLAYLIST_EXPORT void to_json(nlohmann::json &j, const VideoEntry &e);
YTPLAYLIST_EXPORT void to_json(nlohmann::json &j, const Playlist &p);

}  // namespace ytplaylist

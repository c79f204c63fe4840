#pragma once

#include <ytplaylist/ytplaylist_export.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace ytplaylist {

// Opaque cursor issued by the remote service for the next listing page
using ContinuationToken = std::string;

// A single video of a playlist. Two entries are the same video when their
// watch URLs match; the title is informational only.
struct YTPLAYLIST_EXPORT VideoEntry {
	std::string url;	// Absolute watch URL
	std::string title;	// Plain text, HTML entities decoded

	friend bool operator==(const VideoEntry &a, const VideoEntry &b) {
		return a.url == b.url;
	}
	friend bool operator!=(const VideoEntry &a, const VideoEntry &b) {
		return !(a == b);
	}
};

// One page of listing results, consumed immediately by whoever drives
// pagination.
struct YTPLAYLIST_EXPORT Page {
	std::vector<VideoEntry> entries;
	std::optional<ContinuationToken> continuation;
};

struct YTPLAYLIST_EXPORT PlaylistReference {
	std::string id;
	std::string url;  // https://<host>/playlist?list=<id>
};

struct YTPLAYLIST_EXPORT PlaylistDate {
	int year = 0;
	unsigned month = 0;	 // 1-12
	unsigned day = 0;	 // 1-31

	// YYYY-MM-DD
	[[nodiscard]] std::string to_string() const;

	friend bool operator==(const PlaylistDate &a, const PlaylistDate &b) {
		return a.year == b.year && a.month == b.month && a.day == b.day;
	}
};

// Playlist extraction options
struct YTPLAYLIST_EXPORT PlaylistOptions {
	std::string base_url = "https://www.youtube.com";
	std::string watch_key = "id";  // watch?<key>=<video id>, "id" or "v"

	// Client identity sent with continuation requests. The version is a
	// protocol constant of the legacy web client.
	std::string client_version = "2.20200720.00.02";
	std::string user_agent = "Mozilla/5.0";
	std::string accept_language = "en-US,en";

	// Upper bound on continuation requests per playlist
	std::size_t max_continuations = 1000;
};

}  // namespace ytplaylist

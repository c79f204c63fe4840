#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <ytplaylist/types.hpp>

namespace ytplaylist::youtube {

/// Playlist title from the listing page's <title>, without the site suffix.
/// Falls back to the title in the embedded playlist metadata.
std::optional<std::string> extract_playlist_title(std::string_view html);

/// "Last updated on Mar 7, 2020" as shown in the playlist sidebar.
/// English month names only.
std::optional<PlaylistDate> extract_last_update(std::string_view html);

}  // namespace ytplaylist::youtube

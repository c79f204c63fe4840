#pragma once

#include <nlohmann/json.hpp>
#include <string_view>
#include <ytplaylist/result.hpp>

namespace ytplaylist::youtube {

/// Locate the `ytInitialData` assignment in a listing page and decode its
/// JSON literal.
///
/// Fails with errc::extraction_failed when no known marker is present and
/// with errc::malformed_data when the literal does not parse.
Result<nlohmann::json> extract_initial_data(std::string_view html);

/// Decode the right-hand side of the assignment. A trailing `;` and
/// surrounding whitespace are ignored.
Result<nlohmann::json> parse_initial_data_json(std::string_view literal);

}  // namespace ytplaylist::youtube

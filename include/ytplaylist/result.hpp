#pragma once

#include <ytplaylist/ytplaylist_export.h>

#include <boost/outcome.hpp>
#include <system_error>

namespace ytplaylist {

namespace outcome = boost::outcome_v2;

enum class errc {
	success = 0,
	// HTTP/Net errors
	request_failed = 10,
	http_error,	 // Non-2xx status

	// Parsing errors
	malformed_data = 20,  // Embedded JSON does not parse
	invalid_url,

	// Playlist extraction
	extraction_failed = 30,	 // Initial data marker not found
	pagination_fetch_failed,
	pagination_stalled,	 // Repeated token or continuation cap reached
	cancelled,

	// Conversion
	invalid_number_format = 50,

	unknown = 100
};

YTPLAYLIST_EXPORT const std::error_category &ytplaylist_category();

YTPLAYLIST_EXPORT std::error_code make_error_code(errc e);

}  // namespace ytplaylist

namespace std {
template <>
struct is_error_code_enum<ytplaylist::errc> : true_type {};
}  // namespace std

namespace ytplaylist {
template <typename T>
using Result = outcome::result<T, std::error_code>;
}  // namespace ytplaylist

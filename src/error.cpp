#include <string>
#include <ytplaylist/result.hpp>

namespace ytplaylist {

struct ytplaylist_error_category : std::error_category {
	const char *name() const noexcept override { return "ytplaylist"; }

	std::string message(int ev) const override {
		switch (static_cast<errc>(ev)) {
			case errc::success: return "Success";
			case errc::request_failed: return "Request failed";
			case errc::http_error: return "HTTP error";
			case errc::malformed_data: return "Malformed embedded data";
			case errc::invalid_url: return "Invalid playlist URL";
			case errc::extraction_failed:
				return "Initial data not found in page";
			case errc::pagination_fetch_failed:
				return "Failed to fetch continuation page";
			case errc::pagination_stalled:
				return "Pagination stopped advancing";
			case errc::cancelled: return "Operation cancelled";
			case errc::invalid_number_format: return "Invalid number format";
			default: return "Unknown error";
		}
	}
};

const std::error_category &ytplaylist_category() {
	static ytplaylist_error_category category;
	return category;
}

std::error_code make_error_code(errc e) {
	return {static_cast<int>(e), ytplaylist_category()};
}

}  // namespace ytplaylist

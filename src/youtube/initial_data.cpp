#include "initial_data.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <boost/regex.hpp>
#include <optional>

#include "utils.hpp"

namespace ytplaylist::youtube {

namespace {

// Assignment markers seen across page generations, newest last. The literal
// occupies the rest of the line.
const std::array<boost::regex, 2> &initial_data_patterns() {
	static const std::array<boost::regex, 2> patterns = {
		boost::regex(R"RE(window\["ytInitialData"\]\s*=\s*([^\n]+))RE"),
		boost::regex(R"RE(var\s+ytInitialData\s*=\s*([^\n]+))RE"),
	};
	return patterns;
}

std::optional<std::string_view> find_literal(std::string_view html) {
	for (const auto &re : initial_data_patterns()) {
		boost::cmatch m;
		try {
			if (!boost::regex_search(
					html.data(), html.data() + html.size(), m, re)) {
				continue;
			}
		} catch (const std::runtime_error &e) {
			// Boost.Regex gives up on pathological inputs
			spdlog::debug("Initial data search aborted: {}", e.what());
			continue;
		}

		std::string_view literal(
			m[1].first, static_cast<size_t>(m[1].second - m[1].first));

		// Inline scripts may close on the same line
		auto script_end = literal.find("</script>");
		if (script_end != std::string_view::npos) {
			literal = literal.substr(0, script_end);
		}
		return literal;
	}
	return std::nullopt;
}

}  // namespace

Result<nlohmann::json> parse_initial_data_json(std::string_view literal) {
	literal = utils::trim(literal);
	while (!literal.empty() && literal.back() == ';') {
		literal.remove_suffix(1);
		literal = utils::trim(literal);
	}

	auto json = nlohmann::json::parse(literal, nullptr, false);
	if (json.is_discarded()) {
		spdlog::debug("Initial data is not valid JSON ({} bytes)",
					  literal.size());
		return outcome::failure(errc::malformed_data);
	}
	return json;
}

Result<nlohmann::json> extract_initial_data(std::string_view html) {
	auto literal = find_literal(html);
	if (!literal) {
		spdlog::debug("ytInitialData marker not found in page");
		return outcome::failure(errc::extraction_failed);
	}
	return parse_initial_data_json(*literal);
}

}  // namespace ytplaylist::youtube

#include "metadata.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <boost/regex.hpp>
#include <nlohmann/json.hpp>

#include "utils.hpp"

namespace ytplaylist::youtube {

namespace {

std::optional<boost::cmatch> search(std::string_view text,
									const boost::regex &re) {
	boost::cmatch m;
	try {
		if (boost::regex_search(text.data(), text.data() + text.size(), m, re)) {
			return m;
		}
	} catch (const std::runtime_error &e) {
		spdlog::debug("Metadata search aborted: {}", e.what());
	}
	return std::nullopt;
}

std::string_view group(const boost::cmatch &m, int i) {
	return {m[i].first, static_cast<size_t>(m[i].second - m[i].first)};
}

std::optional<std::string> title_from_head(std::string_view html) {
	static const boost::regex re(R"RE(<title>([^<]*)</title>)RE");
	auto m = search(html, re);
	if (!m) return std::nullopt;

	std::string title(group(*m, 1));
	static constexpr std::string_view suffix = "- YouTube";
	auto pos = title.rfind(suffix);
	if (pos != std::string::npos) { title.erase(pos, suffix.size()); }

	title = std::string(utils::trim(utils::html_unescape(title)));
	if (title.empty()) return std::nullopt;
	return title;
}

std::optional<std::string> title_from_metadata(std::string_view html) {
	// The value is a JSON string literal; let the JSON parser undo escapes
	static const boost::regex re(
		R"RE("playlistMetadataRenderer"\s*:\s*\{\s*"title"\s*:\s*("(?:[^"\\]|\\.)*"))RE");
	auto m = search(html, re);
	if (!m) return std::nullopt;

	auto literal = nlohmann::json::parse(group(*m, 1), nullptr, false);
	if (literal.is_discarded() || !literal.is_string()) return std::nullopt;

	auto title = literal.get<std::string>();
	if (title.empty()) return std::nullopt;
	return title;
}

std::optional<unsigned> month_from_abbrev(std::string_view name) {
	static constexpr std::array<std::string_view, 12> months = {
		"Jan", "Feb", "Mar", "Apr", "May", "Jun",
		"Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
	for (size_t i = 0; i < months.size(); ++i) {
		if (months[i] == name) return static_cast<unsigned>(i + 1);
	}
	return std::nullopt;
}

}  // namespace

std::optional<std::string> extract_playlist_title(std::string_view html) {
	if (auto title = title_from_head(html)) return title;
	return title_from_metadata(html);
}

std::optional<PlaylistDate> extract_last_update(std::string_view html) {
	static const boost::regex re(
		R"RE(<li>Last updated on (\w{3}) (\d{1,2}), (\d{4})</li>)RE");
	auto m = search(html, re);
	if (!m) return std::nullopt;

	auto month = month_from_abbrev(group(*m, 1));
	auto day = utils::to_int(group(*m, 2));
	auto year = utils::to_int(group(*m, 3));
	if (!month || day.has_error() || year.has_error()) {
		spdlog::debug("Unrecognised last update date: {}", group(*m, 0));
		return std::nullopt;
	}
	if (day.value() < 1 || day.value() > 31) return std::nullopt;

	return PlaylistDate{year.value(), *month,
						static_cast<unsigned>(day.value())};
}

}  // namespace ytplaylist::youtube

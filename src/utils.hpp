#pragma once

#include <boost/charconv.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <ytplaylist/result.hpp>

namespace ytplaylist::utils {

// =============================================================================
// Safe numeric conversions utilizing boost::charconv
// =============================================================================

template <typename T>
Result<T> to_number(std::string_view sv, int base = 10) {
	T val;
	auto res = boost::charconv::from_chars(
		sv.data(), sv.data() + sv.size(), val, base);
	if (res.ec == std::errc{} && res.ptr == sv.data() + sv.size()) {
		return val;
	}
	return make_error_code(errc::invalid_number_format);
}

inline Result<int> to_int(std::string_view sv) { return to_number<int>(sv); }

// =============================================================================
// JSON Traversal Utilities (similar to yt-dlp's traverse_obj)
// =============================================================================

// PathElement wrapper to handle both string keys and integer indices
// Supports implicit conversion from const char*, std::string, and int
class PathElement {
   public:
	PathElement(const char *key) : m_is_index(false), m_key(key), m_index(0) {}
	PathElement(const std::string &key)
		: m_is_index(false), m_key(key), m_index(0) {}
	PathElement(int index) : m_is_index(true), m_index(index) {}

	[[nodiscard]] bool is_index() const { return m_is_index; }
	[[nodiscard]] const std::string &key() const { return m_key; }
	[[nodiscard]] int index() const { return m_index; }

   private:
	bool m_is_index;
	std::string m_key;
	int m_index;
};

namespace detail {

// Navigate one step in the JSON structure
inline const nlohmann::json *step(const nlohmann::json *j,
								  const PathElement &elem) {
	if (!j) return nullptr;

	if (!elem.is_index()) {
		if (j->is_object()) {
			auto it = j->find(elem.key());
			if (it != j->end()) { return &*it; }
		}
	} else {
		int idx = elem.index();
		if (j->is_array()) {
			// Support negative indexing like Python
			if (idx < 0) { idx = static_cast<int>(j->size()) + idx; }
			if (idx >= 0 && static_cast<size_t>(idx) < j->size()) {
				return &(*j)[static_cast<size_t>(idx)];
			}
		}
	}
	return nullptr;
}

inline const nlohmann::json *traverse(
	const nlohmann::json *j, std::initializer_list<PathElement> path) {
	for (const auto &elem : path) {
		j = step(j, elem);
		if (!j) return nullptr;
	}
	return j;
}

}  // namespace detail

/// Traverse a JSON object using a path of keys/indices.
/// Returns std::nullopt if path doesn't exist or value can't be converted.
///
/// Usage:
///   auto id = traverse_obj<std::string>(item, {"playlistVideoRenderer",
///                                              "videoId"});
///   auto first = traverse_obj<nlohmann::json>(json, {"tabs", 0});
template <typename T>
std::optional<T> traverse_obj(const nlohmann::json &j,
							  std::initializer_list<PathElement> path) {
	const nlohmann::json *result = detail::traverse(&j, path);
	if (!result) return std::nullopt;

	try {
		return result->get<T>();
	} catch (const nlohmann::json::type_error &) { return std::nullopt; }
}

/// Traverse and return a pointer to the node without copying it.
/// The pointer is valid as long as `j` is.
inline const nlohmann::json *traverse_ptr(
	const nlohmann::json &j, std::initializer_list<PathElement> path) {
	return detail::traverse(&j, path);
}

/// Get text from runs array (common YouTube pattern)
/// Handles: {"runs": [{"text": "hello"}, {"text": " world"}]} -> "hello world"
inline std::string get_text_from_runs(const nlohmann::json &j,
									  std::initializer_list<PathElement> path) {
	const auto *runs = detail::traverse(&j, path);
	if (!runs || !runs->is_array()) { return ""; }

	std::string result;
	for (const auto &run : *runs) {
		auto it = run.find("text");
		if (it != run.end() && it->is_string()) {
			result += it->get<std::string>();
		}
	}
	return result;
}

// =============================================================================
// Text helpers
// =============================================================================

inline std::string_view trim(std::string_view sv) {
	constexpr std::string_view ws = " \t\r\n\f\v";
	auto first = sv.find_first_not_of(ws);
	if (first == std::string_view::npos) return {};
	auto last = sv.find_last_not_of(ws);
	return sv.substr(first, last - first + 1);
}

namespace detail {

inline void append_utf8(std::string &out, unsigned long cp) {
	if (cp < 0x80) {
		out += static_cast<char>(cp);
	} else if (cp < 0x800) {
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else if (cp < 0x10000) {
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else {
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}

// Decodes the body of one entity (between '&' and ';').
inline std::optional<unsigned long> decode_entity(std::string_view name) {
	if (name.size() > 1 && name[0] == '#') {
		Result<unsigned long> cp =
			(name[1] == 'x' || name[1] == 'X')
				? to_number<unsigned long>(name.substr(2), 16)
				: to_number<unsigned long>(name.substr(1));
		if (cp.has_error() || cp.value() == 0 || cp.value() > 0x10FFFF) {
			return std::nullopt;
		}
		// UTF-16 surrogates are not characters
		if (cp.value() >= 0xD800 && cp.value() <= 0xDFFF) {
			return std::nullopt;
		}
		return cp.value();
	}

	if (name == "amp") return '&';
	if (name == "lt") return '<';
	if (name == "gt") return '>';
	if (name == "quot") return '"';
	if (name == "apos") return '\'';
	if (name == "nbsp") return 0xA0;
	return std::nullopt;
}

}  // namespace detail

/// Decode HTML character references ("&amp;", "&#39;", "&#x2764;").
/// Unknown or malformed references are kept verbatim.
inline std::string html_unescape(std::string_view text) {
	std::string out;
	out.reserve(text.size());

	size_t pos = 0;
	while (pos < text.size()) {
		size_t amp = text.find('&', pos);
		if (amp == std::string_view::npos) {
			out.append(text.substr(pos));
			break;
		}
		out.append(text.substr(pos, amp - pos));

		// Entity names are short; don't scan the rest of the document
		size_t semi = text.find(';', amp + 1);
		if (semi == std::string_view::npos || semi - amp > 12) {
			out += '&';
			pos = amp + 1;
			continue;
		}

		auto cp = detail::decode_entity(text.substr(amp + 1, semi - amp - 1));
		if (!cp) {
			out += '&';
			pos = amp + 1;
			continue;
		}
		detail::append_utf8(out, *cp);
		pos = semi + 1;
	}
	return out;
}

}  // namespace ytplaylist::utils

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <ytplaylist/fetcher.hpp>
#include <ytplaylist/result.hpp>

namespace ytplaylist::test {

namespace asio = boost::asio;
using nlohmann::json;

inline const std::string kHost = "https://www.youtube.com";

inline std::string continuation_url(const std::string &token) {
	return kHost + "/browse_ajax?ctoken=" + token + "&continuation=" + token;
}

// Replays canned bodies keyed by URL. Unknown URLs answer with http_error.
// Completions are posted, never invoked inline.
class ScriptedFetcher : public net::PageFetcher {
   public:
	struct Request {
		std::string url;
		net::HttpHeaders headers;
	};

	explicit ScriptedFetcher(asio::any_io_executor ex) : ex_(std::move(ex)) {}

	void respond(const std::string &url, Result<std::string> body) {
		bodies_.insert_or_assign(url, std::move(body));
	}

	[[nodiscard]] const std::vector<Request> &requests() const {
		return requests_;
	}

	// Runs when a request is issued, before its response is posted
	void on_request(std::function<void(const std::string &url)> hook) {
		hook_ = std::move(hook);
	}

	[[nodiscard]] asio::any_io_executor get_executor() const override {
		return ex_;
	}

   protected:
	void async_fetch_impl(
		std::string url, net::HttpHeaders headers,
		asio::any_completion_handler<void(Result<std::string>)> handler,
		CompletionExecutor handler_ex) override {
		requests_.push_back({url, headers});
		if (hook_) { hook_(url); }

		Result<std::string> res = outcome::failure(errc::http_error);
		auto it = bodies_.find(url);
		if (it != bodies_.end()) { res = it->second; }

		asio::post(handler_ex, [handler = std::move(handler),
								res = std::move(res)]() mutable {
			handler(std::move(res));
		});
	}

   private:
	asio::any_io_executor ex_;
	std::map<std::string, Result<std::string>> bodies_;
	std::vector<Request> requests_;
	std::function<void(const std::string &)> hook_;
};

inline json video_item(const std::string &id, const std::string &title) {
	return {{"playlistVideoRenderer",
			 {{"videoId", id}, {"title", {{"simpleText", title}}}}}};
}

// playlistVideoListRenderer / playlistVideoListContinuation body
inline json video_list(const std::vector<json> &items,
					   const std::optional<std::string> &token) {
	json list = {{"contents", items}};
	if (token) {
		list["continuations"] =
			json::array({{{"nextContinuationData", {{"continuation", *token}}}}});
	}
	return list;
}

inline json initial_data(const std::vector<json> &items,
						 const std::optional<std::string> &token) {
	json section = {
		{"itemSectionRenderer",
		 {{"contents",
		   json::array({{{"playlistVideoListRenderer",
						  video_list(items, token)}}})}}}};
	json tab = {{"tabRenderer",
				 {{"content",
				   {{"sectionListRenderer",
					 {{"contents", json::array({section})}}}}}}}};
	return {{"contents",
			 {{"twoColumnBrowseResultsRenderer",
			   {{"tabs", json::array({tab})}}}}}};
}

inline std::string listing_page(const std::vector<json> &items,
								const std::optional<std::string> &token,
								const std::string &title = "Mix - YouTube") {
	return "<html><head><title>" + title +
		   "</title></head><body>\n<script>\n"
		   "window[\"ytInitialData\"] = " +
		   initial_data(items, token).dump() +
		   ";\n</script>\n</body></html>";
}

inline std::string continuation_body(const std::vector<json> &items,
									 const std::optional<std::string> &token) {
	json envelope = {
		{"response",
		 {{"continuationContents",
		   {{"playlistVideoListContinuation", video_list(items, token)}}}}}};
	return json::array({json{{"page", "browse"}}, envelope}).dump();
}

}  // namespace ytplaylist::test

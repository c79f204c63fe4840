#include "innertube.hpp"

namespace ytplaylist::youtube {

const InnertubeContext Innertube::CLIENT_WEB = {
	"2.20200720.00.02",
	1};	 // INNERTUBE_CONTEXT_CLIENT_NAME = 1

net::HttpHeaders Innertube::get_headers(const InnertubeContext &client) {
	return {{"X-YouTube-Client-Name", std::to_string(client.client_id)},
			{"X-YouTube-Client-Version", client.client_version}};
}

ContinuationRequest Innertube::build_continuation_request(
	const ContinuationToken &token, const PlaylistOptions &options) {
	InnertubeContext client = CLIENT_WEB;
	if (!options.client_version.empty()) {
		client.client_version = options.client_version;
	}

	ContinuationRequest req;
	req.url = options.base_url + "/browse_ajax?ctoken=" + token +
			  "&continuation=" + token;
	req.headers = get_headers(client);
	return req;
}

}  // namespace ytplaylist::youtube

#pragma once

#include <string>
#include <ytplaylist/http_client.hpp>
#include <ytplaylist/types.hpp>

namespace ytplaylist::youtube {

struct InnertubeContext {
	std::string client_version;
	int client_id = 1;	// X-YouTube-Client-Name value, 1 = WEB
};

// Follow-up request for one continuation token
struct ContinuationRequest {
	std::string url;
	net::HttpHeaders headers;
};

class Innertube {
   public:
	// Desktop web client of the browse_ajax era. The continuation endpoint
	// only answers clients it still recognises, so the version has to track
	// what the site accepts.
	static const InnertubeContext CLIENT_WEB;

	static net::HttpHeaders get_headers(const InnertubeContext &client);

	/// https://<host>/browse_ajax?ctoken=<token>&continuation=<token>
	/// Both parameters carry the same token; the endpoint rejects requests
	/// where they differ.
	static ContinuationRequest build_continuation_request(
		const ContinuationToken &token, const PlaylistOptions &options);
};

}  // namespace ytplaylist::youtube

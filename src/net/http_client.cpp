#include <spdlog/spdlog.h>
#include <zlib.h>

#include <algorithm>
#include <atomic>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/certify/extensions.hpp>
#include <boost/certify/https_verification.hpp>
#include <boost/url.hpp>
#include <chrono>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>
#include <ytplaylist/http_client.hpp>

namespace beast = boost::beast;
namespace http = beast::http;
namespace asio = boost::asio;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace ytplaylist::net {

// =============================================================================
// GZIP/DEFLATE DECOMPRESSION
// =============================================================================

namespace {

// window_bits: 16 + MAX_WBITS for gzip, -MAX_WBITS for raw deflate
std::optional<std::string> inflate_body(const std::string &compressed,
										int window_bits) {
	if (compressed.empty()) return std::string{};

	z_stream zs{};
	if (inflateInit2(&zs, window_bits) != Z_OK) {
		spdlog::warn("Failed to init zlib (window bits {})", window_bits);
		return std::nullopt;
	}

	zs.next_in =
		reinterpret_cast<Bytef *>(const_cast<char *>(compressed.data()));
	zs.avail_in = static_cast<uInt>(compressed.size());

	std::string decompressed;
	decompressed.reserve(compressed.size() * 4);  // Estimate 4x compression

	constexpr size_t kChunkSize = 32768;
	char outbuffer[kChunkSize];

	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(outbuffer);
		zs.avail_out = kChunkSize;

		ret = inflate(&zs, Z_NO_FLUSH);

		if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
			(ret == Z_BUF_ERROR && zs.avail_in == 0)) {
			inflateEnd(&zs);
			spdlog::warn("zlib inflate error: {}", ret);
			return std::nullopt;
		}

		size_t have = kChunkSize - zs.avail_out;
		decompressed.append(outbuffer, have);
	} while (ret != Z_STREAM_END);

	inflateEnd(&zs);
	return decompressed;
}

// Decompress based on Content-Encoding header
std::string decompress_body(std::string body,
							const std::string &content_encoding) {
	if (content_encoding.empty() || content_encoding == "identity") {
		return body;
	}

	if (content_encoding == "gzip" || content_encoding == "x-gzip") {
		if (auto result = inflate_body(body, 16 + MAX_WBITS)) {
			spdlog::debug("Decompressed gzip: {} -> {} bytes", body.size(),
						  result->size());
			return std::move(*result);
		}
		spdlog::warn("gzip decompression failed, returning raw body");
		return body;
	}

	if (content_encoding == "deflate") {
		// Some servers send gzip as deflate
		if (auto result = inflate_body(body, 16 + MAX_WBITS)) {
			return std::move(*result);
		}
		if (auto result = inflate_body(body, -MAX_WBITS)) {
			return std::move(*result);
		}
		spdlog::warn("deflate decompression failed, returning raw body");
		return body;
	}

	spdlog::debug(
		"Unknown Content-Encoding: {}, returning raw body", content_encoding);
	return body;
}

}  // namespace

// =============================================================================
// DNS CACHE
// =============================================================================
// Caches DNS lookup results so that consecutive continuation requests to the
// same host skip resolution. Owned by one HttpClient; sessions keep it alive
// through a shared_ptr.
// =============================================================================

struct DnsCacheEntry {
	tcp::resolver::results_type results;
	std::chrono::steady_clock::time_point expires_at;
};

class DnsCache {
   public:
	static constexpr auto kDefaultTTL = std::chrono::minutes(5);
	static constexpr size_t kMaxCacheSize = 64;

	std::optional<tcp::resolver::results_type> get(const std::string &host,
												   const std::string &port) {
		std::lock_guard lock(mutex_);
		auto key = host + ":" + port;
		auto it = cache_.find(key);
		if (it == cache_.end()) { return std::nullopt; }
		if (std::chrono::steady_clock::now() > it->second.expires_at) {
			cache_.erase(it);
			return std::nullopt;
		}
		spdlog::debug("DNS cache hit for {}", key);
		return it->second.results;
	}

	void put(const std::string &host, const std::string &port,
			 const tcp::resolver::results_type &results) {
		std::lock_guard lock(mutex_);
		auto key = host + ":" + port;

		if (cache_.size() >= kMaxCacheSize) { evict_expired(); }

		// If still full, evict the entry closest to expiry
		if (cache_.size() >= kMaxCacheSize) {
			auto oldest = std::min_element(
				cache_.begin(), cache_.end(), [](const auto &a, const auto &b) {
					return a.second.expires_at < b.second.expires_at;
				});
			cache_.erase(oldest);
		}

		cache_[key] = DnsCacheEntry{
			results, std::chrono::steady_clock::now() + kDefaultTTL};
	}

	void invalidate(const std::string &host, const std::string &port) {
		std::lock_guard lock(mutex_);
		cache_.erase(host + ":" + port);
	}

   private:
	void evict_expired() {
		auto now = std::chrono::steady_clock::now();
		for (auto it = cache_.begin(); it != cache_.end();) {
			if (now > it->second.expires_at) {
				it = cache_.erase(it);
			} else {
				++it;
			}
		}
	}

	std::mutex mutex_;
	std::unordered_map<std::string, DnsCacheEntry> cache_;
};

// Session cancellation interface
class IActiveSession {
   public:
	virtual ~IActiveSession() = default;
	virtual void cancel() = 0;
};

struct HttpClient::Impl {
	asio::any_io_executor ex;
	ssl::context ssl_ctx;
	std::shared_ptr<DnsCache> dns_cache = std::make_shared<DnsCache>();

	// Active session tracking for cancellation
	std::mutex sessions_mutex_;
	std::vector<std::weak_ptr<IActiveSession>> active_sessions_;
	std::atomic<bool> shutdown_requested_{false};

	Impl(asio::any_io_executor e)
		: ex(std::move(e)), ssl_ctx(ssl::context::tlsv12_client) {
		boost::system::error_code ec;
		ssl_ctx.set_verify_mode(
			ssl::verify_peer | ssl::verify_fail_if_no_peer_cert, ec);
		if (ec) {
			spdlog::error("Failed to set SSL verify mode: {}", ec.message());
		}

		ssl_ctx.set_default_verify_paths(ec);
		if (ec) {
			spdlog::error(
				"Failed to set default SSL verify paths: {}", ec.message());
		}

		boost::certify::enable_native_https_server_verification(ssl_ctx);
	}

	void register_session(std::weak_ptr<IActiveSession> session) {
		std::lock_guard lock(sessions_mutex_);
		active_sessions_.erase(
			std::remove_if(active_sessions_.begin(), active_sessions_.end(),
						   [](const auto &wp) { return wp.expired(); }),
			active_sessions_.end());
		active_sessions_.push_back(std::move(session));
	}

	void shutdown() {
		shutdown_requested_.store(true, std::memory_order_release);

		std::lock_guard lock(sessions_mutex_);
		for (auto &wp : active_sessions_) {
			if (auto sp = wp.lock()) { sp->cancel(); }
		}
		active_sessions_.clear();
	}

	[[nodiscard]] bool is_shutdown() const {
		return shutdown_requested_.load(std::memory_order_acquire);
	}
};

HttpClient::HttpClient(asio::any_io_executor ex)
	: m_impl(std::make_unique<Impl>(std::move(ex))) {}

HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient &&) noexcept = default;
HttpClient &HttpClient::operator=(HttpClient &&) noexcept = default;

asio::any_io_executor HttpClient::get_executor() const { return m_impl->ex; }

void HttpClient::shutdown() {
	if (m_impl) { m_impl->shutdown(); }
}

class RequestSession : public IActiveSession,
					   public std::enable_shared_from_this<RequestSession> {
   public:
	using CompletionExecutor = HttpClient::CompletionExecutor;

	RequestSession(const asio::any_io_executor &ex, ssl::context &ctx,
				   std::shared_ptr<DnsCache> dns_cache,
				   asio::any_completion_handler<void(Result<HttpResponse>)> cb,
				   CompletionExecutor handler_ex)
		: strand_(asio::make_strand(ex)),
		  resolver_(strand_),
		  stream_(strand_, ctx),
		  dns_cache_(std::move(dns_cache)),
		  cb_(std::move(cb)),
		  handler_ex_(std::move(handler_ex)) {}

	void cancel() override {
		asio::dispatch(strand_, [self = shared_from_this()]() {
			self->resolver_.cancel();
			beast::get_lowest_layer(self->stream_).cancel();
		});
	}

	void run(const std::string &url_str, const HttpHeaders &headers) {
		auto u_res = boost::urls::parse_uri(url_str);
		if (u_res.has_error()) {
			return post_result(outcome::failure(errc::invalid_url));
		}
		boost::urls::url_view u = u_res.value();

		host_ = u.host();
		port_ = u.port();
		std::string target = u.encoded_path();
		if (u.has_query()) {
			target += "?";
			target += u.encoded_query();
		}
		if (target.empty()) target = "/";
		if (port_.empty()) port_ = (u.scheme() == "https") ? "443" : "80";

		req_.version(11);
		req_.method(http::verb::get);
		req_.target(target);
		req_.set(http::field::host, host_);
		req_.set(http::field::user_agent, "ytplaylist/1.0");
		// Request compressed responses to save bandwidth
		req_.set(http::field::accept_encoding, "gzip, deflate");
		for (const auto &[key, value] : headers) { req_.set(key, value); }

		boost::system::error_code ec;
		boost::certify::set_server_hostname(stream_, host_, ec);
		if (ec) {
			spdlog::debug("Failed to set SNI for {}: {}", host_, ec.message());
			return post_result(outcome::failure(errc::request_failed));
		}

		if (auto cached = dns_cache_->get(host_, port_)) {
			on_resolve({}, *cached);
		} else {
			resolver_.async_resolve(
				host_, port_,
				beast::bind_front_handler(
					&RequestSession::on_resolve, shared_from_this()));
		}
	}

   private:
	void on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
		if (ec) return fail(ec, "resolve");

		dns_cache_->put(host_, port_, results);

		beast::get_lowest_layer(stream_).expires_after(
			std::chrono::seconds(30));
		beast::get_lowest_layer(stream_).async_connect(
			results, beast::bind_front_handler(
						 &RequestSession::on_connect, shared_from_this()));
	}

	void on_connect(beast::error_code ec, tcp::endpoint /*unused*/) {
		if (ec) {
			// The cached address may be stale
			dns_cache_->invalidate(host_, port_);
			return fail(ec, "connect");
		}

		stream_.async_handshake(
			ssl::stream_base::client,
			beast::bind_front_handler(
				&RequestSession::on_handshake, shared_from_this()));
	}

	void on_handshake(beast::error_code ec) {
		if (ec) return fail(ec, "handshake");

		http::async_write(stream_, req_,
						  beast::bind_front_handler(
							  &RequestSession::on_write, shared_from_this()));
	}

	void on_write(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "write");

		http::async_read(stream_, buf_, res_,
						 beast::bind_front_handler(
							 &RequestSession::on_read, shared_from_this()));
	}

	void on_read(beast::error_code ec, std::size_t) {
		if (ec) return fail(ec, "read");

		// Graceful close - set short timeout
		beast::get_lowest_layer(stream_).expires_after(std::chrono::seconds(2));
		stream_.async_shutdown(beast::bind_front_handler(
			&RequestSession::on_shutdown, shared_from_this()));
	}

	void on_shutdown(beast::error_code /*ec*/) {
		// Shutdown errors (eof, timeout) don't matter once the body is read
		std::string content_encoding;
		auto encoding_it = res_.find(http::field::content_encoding);
		if (encoding_it != res_.end()) {
			content_encoding = std::string(encoding_it->value());
		}
		std::string response_body =
			decompress_body(std::move(res_.body()), content_encoding);

		post_result(HttpResponse{static_cast<int>(res_.result_int()),
								 std::move(response_body)});
	}

	void fail(beast::error_code ec, const char *what) {
		spdlog::debug("GET {}{} failed in {}: {}", host_,
					  std::string(req_.target()), what, ec.message());
		post_result(outcome::failure(errc::request_failed));
	}

	void post_result(Result<HttpResponse> res) {
		asio::dispatch(
			handler_ex_, [cb = std::move(cb_), res = std::move(res)]() mutable {
				cb(std::move(res));
			});
	}

	asio::strand<asio::any_io_executor> strand_;
	tcp::resolver resolver_;
	beast::ssl_stream<beast::tcp_stream> stream_;
	std::shared_ptr<DnsCache> dns_cache_;
	asio::any_completion_handler<void(Result<HttpResponse>)> cb_;
	CompletionExecutor handler_ex_;
	beast::flat_buffer buf_;
	http::request<http::empty_body> req_;
	http::response<http::string_body> res_;
	std::string host_;
	std::string port_;
};

void HttpClient::async_get_impl(
	std::string url, HttpHeaders headers,
	asio::any_completion_handler<void(Result<HttpResponse>)> handler,
	CompletionExecutor handler_ex) {
	if (m_impl->is_shutdown()) {
		asio::dispatch(handler_ex, [handler = std::move(handler)]() mutable {
			handler(outcome::failure(errc::request_failed));
		});
		return;
	}

	auto session = std::make_shared<RequestSession>(
		m_impl->ex, m_impl->ssl_ctx, m_impl->dns_cache, std::move(handler),
		std::move(handler_ex));
	m_impl->register_session(session);
	session->run(url, headers);
}

}  // namespace ytplaylist::net

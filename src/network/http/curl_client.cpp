#include "curl_client.hpp"
#include <algorithm>
#include <cctype>
#include <curl/curl.h>
#include <memory>
#include <string>
#include <string_view>
#include "../../core/types/constants.hpp"

namespace Fetchium {
namespace Network {
namespace Http {

namespace {

constexpr std::string_view CONTENT_TYPE_HEADER = "content-type:";

// Transfers slower than this for stall_timeout seconds are aborted.
constexpr long STALL_SPEED_BYTES = 1;

static inline std::string_view trim_view(std::string_view s) {
    size_t first = s.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos)
        return {};
    size_t last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

static bool istarts_with(std::string_view text, std::string_view prefix) {
    if (text.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char c1, char c2) {
        return std::tolower(static_cast<unsigned char>(c1))
               == std::tolower(static_cast<unsigned char>(c2));
    });
}

static ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_PROXY:
        case CURLE_RECV_ERROR: return ErrorType::Proxy;
        case CURLE_OPERATION_TIMEDOUT: return ErrorType::Timeout;
        case CURLE_ABORTED_BY_CALLBACK: return ErrorType::Cancelled;
        case CURLE_WRITE_ERROR: return ErrorType::Other;
        default: return ErrorType::Network;
    }
}

static long map_proxy_type(const Proxy::ProxyEndpoint& endpoint) {
    using Proxy::DnsResolution;
    using Proxy::ProxyKind;
    switch (endpoint.kind) {
        case ProxyKind::Http: return CURLPROXY_HTTP;
        case ProxyKind::Https: return CURLPROXY_HTTPS;
        case ProxyKind::Socks4:
            return endpoint.dns == DnsResolution::Proxy ? CURLPROXY_SOCKS4A : CURLPROXY_SOCKS4;
        case ProxyKind::Socks5:
            return endpoint.dns == DnsResolution::Proxy ? CURLPROXY_SOCKS5_HOSTNAME
                                                        : CURLPROXY_SOCKS5;
    }
    return CURLPROXY_HTTP;
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx)
        return 0;

    size_t total = size * nmemb;
    if (ctx->sink) {
        ctx->sink->write(static_cast<const char*>(contents), static_cast<std::streamsize>(total));
        if (!*ctx->sink) {
            ctx->sink_failed = true;
            return 0;
        }
    }
    else if (ctx->body) {
        ctx->body->append(static_cast<const char*>(contents), total);
    }
    ctx->bytes_received += total;
    return total;
}

size_t CurlClient::header_callback(char* buffer, size_t size, size_t nitems, void* userp) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(userp);
    if (!ctx || !ctx->content_type)
        return size * nitems;

    std::string_view header(buffer, size * nitems);
    if (!istarts_with(header, CONTENT_TYPE_HEADER))
        return size * nitems;

    *ctx->content_type = std::string(trim_view(header.substr(CONTENT_TYPE_HEADER.size())));
    return size * nitems;
}

int CurlClient::progress_callback(
    void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* ctx = static_cast<CurlClient::RequestContext*>(clientp);
    if (ctx && ctx->transport && ctx->transport->cancelled())
        return 1;
    return 0;
}

Response CurlClient::create_error_response(const std::string& msg) const {
    Response r;
    r.success     = false;
    r.error       = msg;
    r.error_type  = ErrorType::Network;
    r.status_code = static_cast<long>(HTTPCode::NetworkError);
    return r;
}

void CurlClient::apply_proxy(CURL* curl) const {
    if (!transport_.proxy) {
        // Empty string disables proxies, including the ones curl would pick up from the environment.
        curl_easy_setopt(curl, CURLOPT_PROXY, "");
        return;
    }

    const auto& endpoint = *transport_.proxy;
    std::string host     = Proxy::ProxyConfigurator::host_for_transport(endpoint);
    curl_easy_setopt(curl, CURLOPT_PROXY, host.c_str());
    curl_easy_setopt(curl, CURLOPT_PROXYPORT, static_cast<long>(endpoint.port));
    curl_easy_setopt(curl, CURLOPT_PROXYTYPE, map_proxy_type(endpoint));
    if (!endpoint.username.empty()) {
        curl_easy_setopt(curl, CURLOPT_PROXYUSERNAME, endpoint.username.c_str());
        curl_easy_setopt(curl, CURLOPT_PROXYPASSWORD, endpoint.password.c_str());
    }
}

void CurlClient::setup_curl_options(CURL* curl, const Request& req, RequestContext& ctx) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, req.follow_location ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(transport_.connect_timeout.count()));

    if (req.streaming) {
        // Artifacts can be large; bound stalls rather than total time.
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, STALL_SPEED_BYTES);
        curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(transport_.stall_timeout.count()));
        // Keep error pages out of the sink.
        curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    }
    else {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(transport_.request_timeout.count()));
    }

    if (!req.user_agent.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, req.user_agent.c_str());
    if (req.method == HttpMethod::HEAD)
        curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
    else
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

    apply_proxy(curl);
}

Response CurlClient::handle_response(
    CURLcode res, CURL* curl, const Request& req, RequestContext& ctx, std::string& body) const {
    Response response;

    long response_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
    char* eff_url_ptr = nullptr;
    curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &eff_url_ptr);
    curl_off_t content_length = -1;
    curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &content_length);

    response.effective_url  = eff_url_ptr ? std::string(eff_url_ptr) : req.url;
    response.status_code    = response_code;
    response.content_length = static_cast<std::int64_t>(content_length);
    response.bytes_received = ctx.bytes_received;
    if (ctx.content_type)
        response.content_type = *ctx.content_type;

    if (res == CURLE_HTTP_RETURNED_ERROR) {
        response.success = false;
        response.error   = "HTTP " + std::to_string(response.status_code);
        return response;
    }

    if (res != CURLE_OK) {
        response.success    = false;
        response.error      = ctx.sink_failed ? "failed writing to destination" : curl_easy_strerror(res);
        response.error_type = map_curl_code_to_error_type(res);
        if (ctx.transport && ctx.transport->cancelled())
            response.error_type = ErrorType::Cancelled;
        response.status_code = static_cast<long>(HTTPCode::NetworkError);
        return response;
    }

    response.body    = std::move(body);
    response.success = (response.status_code >= 200
                        && response.status_code < static_cast<long>(MaxCode::ClientError));
    if (!response.success && response.error.empty()) {
        response.error = "HTTP " + std::to_string(response.status_code);
    }
    return response;
}

CurlClient::Request CurlClient::create_request(const std::string& url, HttpMethod method) const {
    Request req;
    req.method        = method;
    req.url           = url;
    req.user_agent    = user_agent_;
    req.extra_headers = headers_;
    return req;
}

CurlClient::CurlClient() : curl_(curl_easy_init()), user_agent_(Core::Constants::USER_AGENT) {
}

void CurlClient::set_transport(const Proxy::TransportConfig& transport) {
    transport_ = transport;
}

void CurlClient::set_user_agent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void CurlClient::add_header(const std::string& name, const std::string& value) {
    headers_.push_back(name + ": " + value);
}

void CurlClient::clear_headers() {
    headers_.clear();
}

Response CurlClient::perform(const Request& req, std::ostream* sink) {
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle");
    if (transport_.cancelled()) {
        Response r = create_error_response("cancelled");
        r.error_type = ErrorType::Cancelled;
        return r;
    }

    std::string    body_buffer;
    std::string    content_type;
    RequestContext ctx;
    ctx.body         = &body_buffer;
    ctx.sink         = sink;
    ctx.content_type = &content_type;
    ctx.transport    = &transport_;

    setup_curl_options(curl_.get(), req, ctx);

    struct CurlSlistDeleter {
        void operator()(curl_slist* p) const noexcept {
            curl_slist_free_all(p);
        }
    };
    curl_slist* raw = nullptr;
    for (const auto& h : req.extra_headers)
        raw = curl_slist_append(raw, h.c_str());
    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list(raw);
    if (raw)
        curl_easy_setopt(curl_.get(), CURLOPT_HTTPHEADER, raw);

    CURLcode res = curl_easy_perform(curl_.get());
    return handle_response(res, curl_.get(), req, ctx, body_buffer);
}

Response CurlClient::get(const std::string& url) {
    return perform(create_request(url, HttpMethod::GET), nullptr);
}

Response CurlClient::head(const std::string& url) {
    return perform(create_request(url, HttpMethod::HEAD), nullptr);
}

Response CurlClient::download(const std::string& url, std::ostream& sink) {
    Request req   = create_request(url, HttpMethod::GET);
    req.streaming = true;
    return perform(req, &sink);
}

}  // namespace Http
}  // namespace Network
}  // namespace Fetchium

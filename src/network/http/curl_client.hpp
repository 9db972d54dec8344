#pragma once
#include <curl/curl.h>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "http_client.hpp"

namespace Fetchium {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    enum class HttpMethod { GET, HEAD };

    CurlClient();
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void     set_transport(const Proxy::TransportConfig& transport) override;
    Response get(const std::string& url) override;
    Response head(const std::string& url) override;
    Response download(const std::string& url, std::ostream& sink) override;

    void set_user_agent(const std::string& user_agent);
    void add_header(const std::string& name, const std::string& value);
    void clear_headers();

    const Proxy::TransportConfig& transport() const { return transport_; }

private:
    struct Request {
        HttpMethod               method = HttpMethod::GET;
        std::string              url;
        bool                     follow_location = true;
        bool                     streaming       = false;
        std::vector<std::string> extra_headers;
        std::string              user_agent;
    };

    struct RequestContext {
        std::string*                  body           = nullptr;
        std::ostream*                 sink           = nullptr;
        std::string*                  content_type   = nullptr;
        std::uint64_t                 bytes_received = 0;
        bool                          sink_failed    = false;
        const Proxy::TransportConfig* transport      = nullptr;
    };

    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    Proxy::TransportConfig             transport_;
    std::string                        user_agent_;
    std::vector<std::string>           headers_;

    Response perform(const Request& req, std::ostream* sink);

    Response create_error_response(const std::string& msg) const;
    void     setup_curl_options(CURL* curl, const Request& req, RequestContext& ctx) const;
    void     apply_proxy(CURL* curl) const;
    Response handle_response(CURLcode res, CURL* curl, const Request& req, RequestContext& ctx, std::string& body) const;
    Request  create_request(const std::string& url, HttpMethod method = HttpMethod::GET) const;

    // Callbacks must be static. userp is guaranteed to be RequestContext*.
    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, void* userp);
    static int    progress_callback(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow);
};

}  // namespace Http
}  // namespace Network
}  // namespace Fetchium

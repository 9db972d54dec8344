#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include "../proxy/proxy_config.hpp"

namespace Fetchium {
namespace Network {
namespace Http {

enum class ErrorType { None, Network, Proxy, Timeout, Cancelled, Other };

enum class HTTPCode { Ok = 200, NetworkError = 0, NotFound = 404, Gone = 410, TooManyRequests = 429 };

enum class MaxCode { ClientError = 400, ServerError = 500 };

struct Response {
    std::string   effective_url;
    long          status_code = 0;
    std::string   content_type;
    std::string   body;
    std::string   error;
    std::int64_t  content_length = -1;  // from the headers, -1 if not announced
    std::uint64_t bytes_received = 0;
    bool          success        = false;
    ErrorType     error_type     = ErrorType::None;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    virtual void     set_transport(const Proxy::TransportConfig& transport) = 0;
    virtual Response get(const std::string& url)                            = 0;
    virtual Response head(const std::string& url)                           = 0;
    // Streams the body into sink instead of Response::body.
    virtual Response download(const std::string& url, std::ostream& sink) = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Fetchium

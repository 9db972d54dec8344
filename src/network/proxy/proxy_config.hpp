#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace Fetchium::Network::Proxy {

enum class ProxyKind { Http, Https, Socks4, Socks5 };

// Where the target hostname gets resolved when a proxy is in use.
enum class DnsResolution { Local, Proxy };

struct ProxyEndpoint {
    ProxyKind     kind = ProxyKind::Http;
    DnsResolution dns  = DnsResolution::Proxy;
    std::string   host;
    int           port = 0;
    std::string   username;
    std::string   password;

    bool operator==(const ProxyEndpoint& other) const {
        return kind == other.kind && dns == other.dns && host == other.host && port == other.port
               && username == other.username && password == other.password;
    }
    bool operator!=(const ProxyEndpoint& other) const {
        return !(*this == other);
    }
};

using CancelFlag = std::shared_ptr<std::atomic<bool>>;

struct TransportConfig {
    std::optional<ProxyEndpoint> proxy;
    std::chrono::seconds         connect_timeout{10};
    std::chrono::seconds         request_timeout{30};  // whole-request limit for index queries
    std::chrono::seconds         stall_timeout{60};    // artifact transfers abort below 1 byte/s for this long
    CancelFlag                   cancel;

    bool cancelled() const {
        return cancel && cancel->load();
    }
};

/**
 * @brief Turns a proxy URL into a transport configuration.
 *
 * Accepted schemes: http, https, socks4, socks4a, socks5, socks5h. The "a"/"h"
 * variants hand hostname resolution to the proxy; the plain SOCKS schemes
 * resolve locally before connecting. Throws FetchError(InvalidProxyUrl).
 */
class ProxyConfigurator {
public:
    static TransportConfig parse(const std::string& proxy_url);
    static TransportConfig parse(const std::optional<std::string>& proxy_url);

    // Proxy address as curl expects it in CURLOPT_PROXY, e.g. "127.0.0.1" or "[::1]".
    static std::string host_for_transport(const ProxyEndpoint& endpoint);
    static std::string describe(const ProxyEndpoint& endpoint);
};

}  // namespace Fetchium::Network::Proxy

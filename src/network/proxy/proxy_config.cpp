#include "proxy_config.hpp"
#include <map>
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"
#include "fetchium/errors.hpp"

namespace Fetchium::Network::Proxy {

using namespace Fetchium::Utils;

namespace {

struct SchemeInfo {
    ProxyKind     kind;
    DnsResolution dns;
    int           default_port;
};

const std::map<std::string, SchemeInfo>& get_scheme_map() {
    static const std::map<std::string, SchemeInfo> map = {
        {"http", {ProxyKind::Http, DnsResolution::Proxy, 80}},
        {"https", {ProxyKind::Https, DnsResolution::Proxy, 443}},
        {"socks4", {ProxyKind::Socks4, DnsResolution::Local, 1080}},
        {"socks4a", {ProxyKind::Socks4, DnsResolution::Proxy, 1080}},
        {"socks5", {ProxyKind::Socks5, DnsResolution::Local, 1080}},
        {"socks5h", {ProxyKind::Socks5, DnsResolution::Proxy, 1080}}};
    return map;
}

[[noreturn]] void invalid(const std::string& proxy_url, const std::string& why) {
    ErrorContext ctx;
    ctx.cause = why;
    throw FetchError(ErrorKind::InvalidProxyUrl, "invalid proxy url '" + proxy_url + "'", ctx);
}

int parse_port(const std::string& proxy_url, const std::string& port) {
    if (!Text::is_digits(port) || port.size() > 5)
        invalid(proxy_url, "port must be a number");
    int value = std::stoi(port);
    if (value <= 0 || value > 65535)
        invalid(proxy_url, "port out of range");
    return value;
}

}  // namespace

TransportConfig ProxyConfigurator::parse(const std::optional<std::string>& proxy_url) {
    if (!proxy_url || Text::trim(*proxy_url).empty())
        return TransportConfig{};
    return parse(*proxy_url);
}

TransportConfig ProxyConfigurator::parse(const std::string& proxy_url) {
    std::string url = Text::trim(proxy_url);
    if (url.empty())
        invalid(proxy_url, "empty url");
    if (url.find("://") == std::string::npos)
        invalid(proxy_url, "missing scheme");

    UrlParsed parsed = Url::parse(url);
    auto      it     = get_scheme_map().find(Text::to_lower(parsed.scheme));
    if (it == get_scheme_map().end())
        invalid(proxy_url, "unsupported scheme '" + parsed.scheme + "'");

    if (parsed.host.empty() || parsed.host == "[]")
        invalid(proxy_url, "missing host");
    if (parsed.path != "/" || !parsed.query.empty())
        invalid(proxy_url, "proxy url must not carry a path or query");

    ProxyEndpoint endpoint;
    endpoint.kind = it->second.kind;
    endpoint.dns  = it->second.dns;
    endpoint.host = parsed.host;
    if (endpoint.host.front() == '[' && endpoint.host.back() == ']')
        endpoint.host = endpoint.host.substr(1, endpoint.host.size() - 2);
    endpoint.port = parsed.port.empty() ? it->second.default_port : parse_port(proxy_url, parsed.port);

    if (!parsed.userinfo.empty()) {
        size_t colon = parsed.userinfo.find(':');
        endpoint.username = parsed.userinfo.substr(0, colon);
        if (colon != std::string::npos)
            endpoint.password = parsed.userinfo.substr(colon + 1);
    }

    TransportConfig config;
    config.proxy = endpoint;
    return config;
}

std::string ProxyConfigurator::host_for_transport(const ProxyEndpoint& endpoint) {
    if (endpoint.host.find(':') != std::string::npos)
        return "[" + endpoint.host + "]";
    return endpoint.host;
}

std::string ProxyConfigurator::describe(const ProxyEndpoint& endpoint) {
    std::string scheme;
    switch (endpoint.kind) {
        case ProxyKind::Http: scheme = "http"; break;
        case ProxyKind::Https: scheme = "https"; break;
        case ProxyKind::Socks4:
            scheme = endpoint.dns == DnsResolution::Proxy ? "socks4a" : "socks4";
            break;
        case ProxyKind::Socks5:
            scheme = endpoint.dns == DnsResolution::Proxy ? "socks5h" : "socks5";
            break;
    }
    return scheme + "://" + host_for_transport(endpoint) + ":" + std::to_string(endpoint.port);
}

}  // namespace Fetchium::Network::Proxy

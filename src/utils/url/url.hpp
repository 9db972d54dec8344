#pragma once
#include <string>

namespace Fetchium {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string userinfo;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string start_url;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);
    static std::string encode_component(const std::string& value);
    static std::string last_segment(const std::string& url);
    static std::string artifact_extension(const std::string& url);  // ".zip", ".tar.xz", ... or ""
};

}  // namespace Utils
}  // namespace Fetchium

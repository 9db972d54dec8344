#pragma once
#include <cstdint>
#include <string>

#include "../types/constants.hpp"
#include "fetchium/fetchium.hpp"

namespace Fetchium {
namespace Core {

struct Config {
    std::string browser;  // empty: chromium, or firefox for an "ff" version
    std::string version;
    std::string os;    // empty: host
    std::string arch;  // empty: host
    std::string proxy;
    std::string output_dir;
    std::string cache_dir;
    std::string config_path;

    int          max_retries     = Constants::MAX_RETRIES;
    int          backoff_ms      = Constants::BACKOFF_BASE_MS;
    int          connect_timeout = Constants::CONNECT_TIMEOUT_SECONDS;
    int          request_timeout = Constants::REQUEST_TIMEOUT_SECONDS;
    int          stall_timeout   = Constants::STALL_TIMEOUT_SECONDS;
    std::int64_t latest_ttl      = Constants::DEFAULT_LATEST_TTL_SECONDS;
    std::int64_t prefix_ttl      = Constants::DEFAULT_PREFIX_TTL_SECONDS;
    std::int64_t listing_ttl     = Constants::DEFAULT_LISTING_TTL_SECONDS;
    bool         pin_latest      = false;
    bool         refresh         = false;
    bool         arch_fallback   = true;
    bool         extract         = true;
    bool         quiet           = false;

    std::string firefox_locale         = Constants::FIREFOX_LOCALE;
    std::string chromium_releases_url  = Constants::CHROMIUM_RELEASES_URL;
    std::string chromium_snapshots_url = Constants::CHROMIUM_SNAPSHOTS_URL;
    std::string firefox_releases_url   = Constants::FIREFOX_RELEASES_URL;

    static Config parse(int argc, char* argv[]);

    // Throws std::runtime_error for unknown browser, os or arch names.
    VersionQuery to_query() const;
    FetchOptions to_fetch_options() const;
};

void load_yaml(Config& config, const std::string& path);

// Per-user cache root from LOCALAPPDATA, XDG_CACHE_HOME or HOME, "" if none is set.
std::string default_cache_dir();

}  // namespace Core
}  // namespace Fetchium

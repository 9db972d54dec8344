#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace Fetchium {
namespace Core {

struct Constants {
    static constexpr const char* VERSION    = "0.1.0";
    static constexpr const char* USER_AGENT = "fetchium/0.1";

    static constexpr int MAX_RETRIES               = 3;
    static constexpr int BACKOFF_BASE_MS           = 1000;
    static constexpr int CONNECT_TIMEOUT_SECONDS   = 10;
    static constexpr int REQUEST_TIMEOUT_SECONDS   = 30;
    static constexpr int STALL_TIMEOUT_SECONDS     = 60;
    static constexpr int MAX_INDEX_PAGES           = 1000;
    static constexpr int CHROMIUM_POSITION_WINDOW  = 120;
    static constexpr int FIREFOX_TAR_XZ_MAJOR      = 135;

    static constexpr std::int64_t DEFAULT_LATEST_TTL_SECONDS  = 0;
    static constexpr std::int64_t DEFAULT_PREFIX_TTL_SECONDS  = 24 * 60 * 60;
    static constexpr std::int64_t DEFAULT_LISTING_TTL_SECONDS = 60 * 60;

    static constexpr int         CACHE_SCHEMA      = 1;
    static constexpr const char* CACHE_FILE_NAME   = "resolutions.json";
    static constexpr const char* CACHE_DIR_NAME    = "fetchium";
    static constexpr const char* LISTINGS_DIR_NAME = "listings";
    static constexpr const char* PARTIAL_SUFFIX    = ".part";
    static constexpr const char* LATEST            = "latest";

    static constexpr const char* CHROMIUM_RELEASES_URL =
        "https://chromiumdash.appspot.com/fetch_releases";
    static constexpr const char* CHROMIUM_SNAPSHOTS_URL =
        "https://www.googleapis.com/storage/v1/b/chromium-browser-snapshots/o";
    static constexpr const char* CHROMIUM_CHANNEL = "Stable";
    static constexpr int         CHROMIUM_RELEASES_PAGE = 1000;

    static constexpr const char* FIREFOX_RELEASES_URL = "https://ftp.mozilla.org/pub/firefox/releases/";
    static constexpr const char* FIREFOX_LOCALE       = "en-US";
};

inline const std::vector<std::string>& get_chromium_archives() {
    static const std::vector<std::string> archives = {
        "chrome-win.zip", "chrome-win32.zip", "chrome-mac.zip", "chrome-linux.zip"};
    return archives;
}

inline const std::vector<std::string>& get_artifact_extensions() {
    static const std::vector<std::string> extensions = {
        ".tar.bz2", ".tar.xz", ".tar.gz", ".zip", ".exe", ".msi", ".dmg", ".pkg"};
    return extensions;
}

inline std::chrono::milliseconds get_backoff_time(int attempt,
                                                  std::chrono::milliseconds base =
                                                      std::chrono::milliseconds(
                                                          Constants::BACKOFF_BASE_MS)) {
    if (attempt <= 0)
        return std::chrono::milliseconds(0);
    return base * (1 << (attempt - 1));
}

}  // namespace Core
}  // namespace Fetchium

#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include "errors.hpp"
#include "types.hpp"

namespace Fetchium {

struct FetchOptions {
    std::string cache_dir;   // holds the resolution cache; required
    std::string output_dir;  // artifacts land here; defaults to <cache_dir>/downloads

    std::chrono::seconds latest_ttl{0};
    std::chrono::seconds prefix_ttl{24 * 60 * 60};
    std::chrono::seconds listing_ttl{60 * 60};  // index listings reused for this long; 0 disables
    bool                 pin_latest    = false;
    bool                 refresh       = false;
    bool                 arch_fallback = true;  // retry x86_64 misses as x86
    bool                 extract       = true;  // unpack the artifact next to it

    int                       max_retries = 3;
    std::chrono::milliseconds backoff{1000};
    std::chrono::seconds      connect_timeout{10};
    std::chrono::seconds      request_timeout{30};
    std::chrono::seconds      stall_timeout{60};

    // Empty values select the public endpoints.
    std::string chromium_releases_url;
    std::string chromium_snapshots_url;
    std::string firefox_releases_url;
    std::string firefox_locale;

    std::shared_ptr<std::atomic<bool>> cancel;
};

/**
 * @brief Resolves a version query and makes sure the artifact is on disk.
 *
 * Throws FetchError for every failure the caller can act on; the context names
 * the browser, the version spec and the platform.
 */
DownloadResult fetch_build(const VersionQuery& query, const FetchOptions& options);

// Local path of the artifact for (browser, version_spec, platform).
std::string resolve_and_fetch(Browser                           browser,
                              const std::string&                version_spec,
                              const Platform&                   platform,
                              const std::optional<std::string>& proxy_url,
                              const FetchOptions&               options);

}  // namespace Fetchium

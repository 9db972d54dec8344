#pragma once
#include <chrono>
#include <string>
#include "../network/http/http_client.hpp"
#include "fetchium/types.hpp"

namespace Fetchium {
namespace Download {

struct DownloadOptions {
    int                       max_attempts = 3;
    std::chrono::milliseconds backoff_base{1000};
};

/**
 * @brief Streams a resolved build into a directory.
 *
 * Data goes to "<name>.part" and is renamed to the final name only once the
 * transfer completed and the byte count agrees with the size hint and the
 * announced Content-Length. Transient failures are retried with exponential
 * backoff; 404 and 410 fail at once. Throws FetchError(DownloadFailed) whose
 * context carries the last cause and HTTP status.
 */
class Downloader {
public:
    explicit Downloader(Network::Http::HttpClient& client, DownloadOptions options = {});

    DownloadResult fetch(const ResolvedBuild&                   build,
                         const std::string&                     dest_dir,
                         const Network::Proxy::TransportConfig& transport);

    // "chromium-98.0.4758.102-windows-x86_64.zip"
    static std::string artifact_name(const ResolvedBuild& build);

private:
    Network::Http::HttpClient& client_;
    DownloadOptions            options_;
};

}  // namespace Download
}  // namespace Fetchium

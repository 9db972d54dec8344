#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "../core/types/constants.hpp"
#include "../network/http/http_client.hpp"
#include "../network/http/retry.hpp"
#include "../storage/listing_cache.hpp"
#include "version_index_client.hpp"

namespace Fetchium {
namespace Index {

struct ChromiumIndexOptions {
    std::string                            releases_url;   // chromiumdash fetch_releases endpoint
    std::string                            snapshots_url;  // GCS JSON API object listing of the snapshot bucket
    std::string                            channel;
    int                                    position_window = Core::Constants::CHROMIUM_POSITION_WINDOW;
    Network::Http::RetryPolicy             retry;
    Network::Proxy::TransportConfig        transport;
    std::shared_ptr<Storage::ListingCache> listings;  // release history and snapshot revisions, when set
};

/**
 * @brief Chromium releases joined with snapshot builds.
 *
 * Releases carry a version and the branch base position; snapshots are keyed by
 * revision under a per-platform prefix ("Win_x64/1234567/"). A release is
 * downloadable when a snapshot revision exists at or above its base position
 * within position_window revisions.
 */
class ChromiumIndexClient : public VersionIndexClient {
public:
    ChromiumIndexClient(Network::Http::HttpClient& client, ChromiumIndexOptions options);

    Browser                  browser() const override { return Browser::Chromium; }
    std::vector<Candidate>   list_candidates(const Platform& platform) override;
    std::optional<Candidate> describe(const Candidate& candidate) override;

    // Snapshot bucket folder for the platform; throws UnsupportedPlatform.
    static std::string snapshot_prefix(const Platform& platform);
    // chromiumdash platform name; throws UnsupportedPlatform.
    static std::string release_platform(const Platform& platform);

private:
    struct Release {
        std::string   version;
        std::int64_t  time     = 0;
        std::uint64_t position = 0;
    };

    Network::Http::HttpClient& client_;
    ChromiumIndexOptions       options_;

    std::vector<Release>       load_releases(const Platform& platform);
    std::vector<std::uint64_t> load_revisions(const std::string& prefix);
    std::vector<Release>       fetch_releases(const std::string& platform_name);
    std::vector<std::uint64_t> fetch_revisions(const std::string& prefix);
    std::string                fetch(const std::string& url);
    std::string                listing_url(const std::string& prefix, const std::string& page_token) const;
    std::string                media_url(const std::string& object_name) const;
};

}  // namespace Index
}  // namespace Fetchium

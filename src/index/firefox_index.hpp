#pragma once
#include <memory>
#include <string>
#include <vector>
#include "../network/http/http_client.hpp"
#include "../network/http/retry.hpp"
#include "../storage/listing_cache.hpp"
#include "version_index_client.hpp"

namespace Fetchium {
namespace Index {

struct FirefoxIndexOptions {
    std::string                            releases_url;  // directory listing, one folder per version
    std::string                            locale;
    Network::Http::RetryPolicy             retry;
    Network::Proxy::TransportConfig        transport;
    std::shared_ptr<Storage::ListingCache> listings;  // release versions are kept here when set
};

/**
 * @brief Firefox releases from the public release directory.
 *
 * The listing carries no publish dates, so candidates have published == 0.
 * Artifact URLs follow a fixed layout ({version}/{platform dir}/{locale}/{file});
 * describe() confirms one with a HEAD request.
 */
class FirefoxIndexClient : public VersionIndexClient {
public:
    FirefoxIndexClient(Network::Http::HttpClient& client, FirefoxIndexOptions options);

    Browser                  browser() const override { return Browser::Firefox; }
    std::vector<Candidate>   list_candidates(const Platform& platform) override;
    std::optional<Candidate> describe(const Candidate& candidate) override;

    // Release directory for the platform ("win64", "linux-x86_64", ...); throws UnsupportedPlatform.
    static std::string platform_dir(const Platform& platform);
    // Installer or archive name, already URL-encoded.
    static std::string artifact_file(const std::string& version, const Platform& platform);
    // "128.0", "115.3.1esr"; rejects betas, release candidates and non-version entries.
    static bool is_release_version(const std::string& name);

    std::string artifact_url(const std::string& version, const Platform& platform) const;

private:
    Network::Http::HttpClient& client_;
    FirefoxIndexOptions        options_;

    std::vector<std::string> load_versions();
    std::vector<std::string> fetch_versions();
};

}  // namespace Index
}  // namespace Fetchium

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "fetchium/types.hpp"

namespace Fetchium {
namespace Index {

struct Candidate {
    std::string                  full_version;
    std::string                  download_url;
    std::int64_t                 published = 0;  // unix millis, 0 when the index does not say
    std::optional<std::uint64_t> size_hint;
    std::string                  locator;  // index-specific reference used by describe()
};

/**
 * @brief Source of truth for one browser family.
 *
 * list_candidates() throws FetchError with UnsupportedPlatform when the family
 * has no builds for the platform, and IndexUnavailable on network or parse
 * failures (after retrying transient ones).
 */
class VersionIndexClient {
public:
    virtual ~VersionIndexClient() = default;

    virtual Browser                browser() const                                 = 0;
    virtual std::vector<Candidate> list_candidates(const Platform& platform)      = 0;

    /**
     * @brief Confirms a selected candidate and fills in artifact details.
     * @return The refined candidate, or nullopt when the index has no artifact for it.
     */
    virtual std::optional<Candidate> describe(const Candidate& candidate) { return candidate; }
};

}  // namespace Index
}  // namespace Fetchium

#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include "disk_storage.hpp"
#include "fetchium/types.hpp"

namespace Fetchium {
namespace Storage {

struct CacheKey {
    Browser     browser = Browser::Chromium;
    std::string version_spec;  // as the user wrote it
    Platform    platform;

    // "chromium|98|linux-x86_64"
    std::string to_string() const;
};

struct CacheEntry {
    CacheKey      key;
    ResolvedBuild build;
    std::int64_t  resolved_at = 0;  // unix seconds
};

class StalenessPolicy {
public:
    virtual ~StalenessPolicy() = default;

    virtual bool is_stale(const CacheEntry& entry, std::chrono::system_clock::time_point now) const = 0;
};

/**
 * @brief Default freshness rules.
 *
 * "latest" entries expire after latest_ttl (zero: every lookup is stale)
 * unless pin_latest is set. Entries whose spec is the resolved full version
 * never expire. Any other spec is a prefix and expires after prefix_ttl.
 */
class TtlStalenessPolicy : public StalenessPolicy {
public:
    TtlStalenessPolicy(std::chrono::seconds latest_ttl, std::chrono::seconds prefix_ttl, bool pin_latest = false);

    bool is_stale(const CacheEntry& entry, std::chrono::system_clock::time_point now) const override;

private:
    std::chrono::seconds latest_ttl_;
    std::chrono::seconds prefix_ttl_;
    bool                 pin_latest_;
};

/**
 * @brief Persistent map from resolution query to resolved build.
 *
 * Backed by a single JSON document in cache_dir, guarded by an advisory lock
 * file next to it. Unreadable, malformed or foreign-schema state is treated as
 * an empty cache; write failures are logged and reported through the return
 * value only.
 */
class ArtifactCache {
public:
    explicit ArtifactCache(const std::string& cache_dir, std::shared_ptr<StalenessPolicy> policy = nullptr);

    std::optional<CacheEntry> get(const CacheKey& key);
    bool                      put(const CacheKey& key, const CacheEntry& entry);
    bool                      erase(const CacheKey& key);
    bool is_stale(const CacheEntry& entry, std::chrono::system_clock::time_point now) const;

    std::string path() const;
    std::string lock_path() const;

private:
    DiskStorage                      storage_;
    std::shared_ptr<StalenessPolicy> policy_;
};

}  // namespace Storage
}  // namespace Fetchium

#pragma once
#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "disk_storage.hpp"

namespace Fetchium {
namespace Storage {

/**
 * @brief Index listings kept on disk between runs.
 *
 * Each listing is one file "<name>.json" holding
 * {"source": <url>, "fetched_at": <unix seconds>, "items": [...]}. A listing
 * is served while it is younger than ttl and was fetched from the same source.
 * A ttl of zero disables the cache. With refresh set, load() always misses but
 * store() still writes, so the next run sees the fresh listing.
 */
class ListingCache {
public:
    ListingCache(const std::string& dir, std::chrono::seconds ttl, bool refresh = false);

    std::optional<nlohmann::json> load(const std::string&                    name,
                                       const std::string&                    source,
                                       std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    bool store(const std::string&                    name,
               const std::string&                    source,
               const nlohmann::json&                 items,
               std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    std::string path(const std::string& name) const { return storage_.path(name + ".json"); }

private:
    DiskStorage          storage_;
    std::chrono::seconds ttl_;
    bool                 refresh_;
};

}  // namespace Storage
}  // namespace Fetchium

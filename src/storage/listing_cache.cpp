#include "listing_cache.hpp"
#include "../core/logger/logger.hpp"
#include "fetchium/errors.hpp"

namespace Fetchium {
namespace Storage {

using Fetchium::Core::Logger;
using nlohmann::json;

namespace {

std::int64_t unix_seconds(std::chrono::system_clock::time_point t) {
    return std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count();
}

}  // namespace

ListingCache::ListingCache(const std::string& dir, std::chrono::seconds ttl, bool refresh)
    : storage_(dir), ttl_(ttl), refresh_(refresh) {
}

std::optional<json> ListingCache::load(const std::string&                    name,
                                       const std::string&                    source,
                                       std::chrono::system_clock::time_point now) {
    if (ttl_.count() <= 0 || refresh_)
        return std::nullopt;

    auto content = storage_.load(name + ".json");
    if (!content)
        return std::nullopt;

    json doc = json::parse(*content, nullptr, false);
    if (doc.is_discarded() || !doc.is_object() || !doc.contains("items") || !doc["items"].is_array()
        || !doc.contains("fetched_at") || !doc["fetched_at"].is_number_integer()) {
        Logger::warn(to_string(ErrorKind::CacheCorrupt) + ": listing " + path(name) + ", fetching again");
        return std::nullopt;
    }
    if (doc.value("source", std::string()) != source)
        return std::nullopt;

    std::int64_t age = unix_seconds(now) - doc["fetched_at"].get<std::int64_t>();
    if (age < 0 || age >= ttl_.count()) {
        Logger::info("Cached listing " + name + " expired " + std::to_string(age - ttl_.count()) + "s ago");
        return std::nullopt;
    }

    Logger::info("Using cached listing " + name + " (" + std::to_string(age) + "s old)");
    return doc["items"];
}

bool ListingCache::store(const std::string&                    name,
                         const std::string&                    source,
                         const json&                           items,
                         std::chrono::system_clock::time_point now) {
    if (ttl_.count() <= 0)
        return false;
    // Empty listings are never kept.
    if (!items.is_array() || items.empty())
        return false;

    json doc = {{"source", source}, {"fetched_at", unix_seconds(now)}, {"items", items}};
    return storage_.save(name + ".json", doc.dump());
}

}  // namespace Storage
}  // namespace Fetchium

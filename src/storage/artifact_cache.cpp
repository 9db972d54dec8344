#include "artifact_cache.hpp"
#include <nlohmann/json.hpp>
#include <exception>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../resolver/version.hpp"
#include "../utils/text/string_utils.hpp"
#include "fetchium/errors.hpp"
#include "file_lock.hpp"

namespace Fetchium {
namespace Storage {

using Fetchium::Core::Constants;
using Fetchium::Core::Logger;
using nlohmann::json;

namespace {

void report_corrupt(const std::string& what) {
    Logger::warn(to_string(ErrorKind::CacheCorrupt) + ": " + what + ", treating as a miss");
}

json empty_document() {
    return json{{"schema", Constants::CACHE_SCHEMA}, {"entries", json::object()}};
}

// Cache document from raw text, or an empty document when it cannot be trusted.
json parse_document(const std::optional<std::string>& raw, const std::string& path) {
    if (!raw || raw->empty())
        return empty_document();

    json doc = json::parse(*raw, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        report_corrupt(path + " is not a JSON object");
        return empty_document();
    }
    auto schema = doc.find("schema");
    if (schema == doc.end() || !schema->is_number_integer()
        || schema->get<int>() != Constants::CACHE_SCHEMA) {
        report_corrupt(path + " has an unknown schema");
        return empty_document();
    }
    auto entries = doc.find("entries");
    if (entries == doc.end() || !entries->is_object()) {
        report_corrupt(path + " has no entries table");
        return empty_document();
    }
    return doc;
}

json entry_to_json(const CacheEntry& entry) {
    json build = {
        {"full_version", entry.build.full_version},
        {"download_url", entry.build.download_url},
        {"size_hint", nullptr},
    };
    if (entry.build.size_hint)
        build["size_hint"] = *entry.build.size_hint;

    return json{
        {"browser", to_string(entry.key.browser)},
        {"version_spec", entry.key.version_spec},
        {"os", to_string(entry.key.platform.os)},
        {"arch", to_string(entry.key.platform.arch)},
        {"build", build},
        {"resolved_at", entry.resolved_at},
    };
}

bool is_string_field(const json& obj, const char* name) {
    auto it = obj.find(name);
    return it != obj.end() && it->is_string();
}

std::optional<CacheEntry> entry_from_json(const json& obj) {
    if (!obj.is_object() || !is_string_field(obj, "browser") || !is_string_field(obj, "version_spec")
        || !is_string_field(obj, "os") || !is_string_field(obj, "arch"))
        return std::nullopt;

    auto browser = parse_browser(obj["browser"].get<std::string>());
    auto os      = parse_os(obj["os"].get<std::string>());
    auto arch    = parse_arch(obj["arch"].get<std::string>());
    if (!browser || !os || !arch)
        return std::nullopt;

    auto build = obj.find("build");
    if (build == obj.end() || !build->is_object() || !is_string_field(*build, "full_version")
        || !is_string_field(*build, "download_url"))
        return std::nullopt;

    auto resolved_at = obj.find("resolved_at");
    if (resolved_at == obj.end() || !resolved_at->is_number_integer())
        return std::nullopt;

    CacheEntry entry;
    entry.key.browser           = *browser;
    entry.key.version_spec      = obj["version_spec"].get<std::string>();
    entry.key.platform          = Platform{*os, *arch};
    entry.build.browser         = *browser;
    entry.build.platform        = entry.key.platform;
    entry.build.full_version    = (*build)["full_version"].get<std::string>();
    entry.build.download_url    = (*build)["download_url"].get<std::string>();
    entry.resolved_at           = resolved_at->get<std::int64_t>();

    auto size_hint = build->find("size_hint");
    if (size_hint != build->end() && size_hint->is_number_unsigned())
        entry.build.size_hint = size_hint->get<std::uint64_t>();
    else if (size_hint != build->end() && !size_hint->is_null())
        return std::nullopt;

    if (entry.build.full_version.empty() || entry.build.download_url.empty())
        return std::nullopt;
    return entry;
}

}  // namespace

std::string CacheKey::to_string() const {
    return Fetchium::to_string(browser) + "|" + version_spec + "|" + Fetchium::to_string(platform);
}

TtlStalenessPolicy::TtlStalenessPolicy(std::chrono::seconds latest_ttl,
                                       std::chrono::seconds prefix_ttl,
                                       bool                 pin_latest)
    : latest_ttl_(latest_ttl), prefix_ttl_(prefix_ttl), pin_latest_(pin_latest) {
}

bool TtlStalenessPolicy::is_stale(const CacheEntry& entry, std::chrono::system_clock::time_point now) const {
    auto age = std::chrono::seconds(
        std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count() - entry.resolved_at);

    if (Resolver::is_latest(entry.key.version_spec)) {
        if (pin_latest_)
            return false;
        return latest_ttl_.count() <= 0 || age >= latest_ttl_;
    }
    if (entry.build.full_version == Utils::Text::trim(entry.key.version_spec))
        return false;
    return age >= prefix_ttl_;
}

ArtifactCache::ArtifactCache(const std::string& cache_dir, std::shared_ptr<StalenessPolicy> policy)
    : storage_(cache_dir), policy_(std::move(policy)) {
    if (!policy_) {
        policy_ = std::make_shared<TtlStalenessPolicy>(
            std::chrono::seconds(Constants::DEFAULT_LATEST_TTL_SECONDS),
            std::chrono::seconds(Constants::DEFAULT_PREFIX_TTL_SECONDS));
    }
}

std::string ArtifactCache::path() const {
    return storage_.path(Constants::CACHE_FILE_NAME);
}

std::string ArtifactCache::lock_path() const {
    return path() + ".lock";
}

bool ArtifactCache::is_stale(const CacheEntry& entry, std::chrono::system_clock::time_point now) const {
    return policy_->is_stale(entry, now);
}

std::optional<CacheEntry> ArtifactCache::get(const CacheKey& key) {
    json doc;
    try {
        FileLock lock(lock_path(), FileLock::Mode::Shared);
        doc = parse_document(storage_.load(Constants::CACHE_FILE_NAME), path());
    } catch (const std::exception& e) {
        Logger::warn("Cache unavailable (" + std::string(e.what()) + "), treating as a miss");
        return std::nullopt;
    }

    const std::string id      = key.to_string();
    auto&             entries = doc["entries"];
    auto              it      = entries.find(id);
    if (it == entries.end())
        return std::nullopt;

    auto entry = entry_from_json(*it);
    if (!entry) {
        report_corrupt("entry " + id + " is malformed");
        return std::nullopt;
    }
    if (entry->key.to_string() != id) {
        report_corrupt("entry " + id + " is filed under the wrong key");
        return std::nullopt;
    }
    return entry;
}

bool ArtifactCache::put(const CacheKey& key, const CacheEntry& entry) {
    CacheEntry stored = entry;
    stored.key        = key;

    try {
        FileLock lock(lock_path(), FileLock::Mode::Exclusive);
        json doc = parse_document(storage_.load(Constants::CACHE_FILE_NAME), path());
        doc["entries"][key.to_string()] = entry_to_json(stored);
        if (!storage_.save(Constants::CACHE_FILE_NAME, doc.dump(2))) {
            Logger::warn("Cache write failed for " + key.to_string());
            return false;
        }
    } catch (const std::exception& e) {
        Logger::warn("Cache write failed for " + key.to_string() + ": " + e.what());
        return false;
    }
    Logger::info("Cached " + key.to_string() + " -> " + entry.build.full_version);
    return true;
}

bool ArtifactCache::erase(const CacheKey& key) {
    try {
        FileLock lock(lock_path(), FileLock::Mode::Exclusive);
        json doc = parse_document(storage_.load(Constants::CACHE_FILE_NAME), path());
        if (doc["entries"].erase(key.to_string()) == 0)
            return true;
        if (!storage_.save(Constants::CACHE_FILE_NAME, doc.dump(2))) {
            Logger::warn("Cache write failed while dropping " + key.to_string());
            return false;
        }
    } catch (const std::exception& e) {
        Logger::warn("Cache write failed while dropping " + key.to_string() + ": " + e.what());
        return false;
    }
    Logger::info("Dropped cache entry " + key.to_string());
    return true;
}

}  // namespace Storage
}  // namespace Fetchium

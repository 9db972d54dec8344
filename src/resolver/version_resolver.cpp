#include "version_resolver.hpp"
#include <chrono>
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"
#include "fetchium/errors.hpp"
#include "version.hpp"

namespace Fetchium {
namespace Resolver {

using Fetchium::Core::Logger;

Storage::CacheKey cache_key(const VersionQuery& query) {
    Storage::CacheKey key;
    key.browser      = query.browser;
    key.version_spec = query.version_spec;
    key.platform     = query.platform;
    return key;
}

VersionResolver::VersionResolver(Storage::ArtifactCache& cache, ResolverOptions options)
    : cache_(cache), options_(options) {
}

void VersionResolver::add_index(Index::VersionIndexClient& index) {
    indexes_[index.browser()] = &index;
}

ResolvedBuild VersionResolver::resolve(const VersionQuery& query) {
    last_hit_cache_ = false;
    const std::string spec = Utils::Text::trim(query.version_spec);

    try {
        if (spec.empty())
            throw FetchError(ErrorKind::UnknownVersion, "empty version");

        const auto key = cache_key(query);
        if (!options_.refresh) {
            auto entry = cache_.get(key);
            if (entry && !cache_.is_stale(*entry, std::chrono::system_clock::now())) {
                Logger::success("Cache hit: " + key.to_string() + " -> " + entry->build.full_version);
                last_hit_cache_ = true;
                return entry->build;
            }
            if (entry)
                Logger::info("Cache entry for " + key.to_string() + " is stale");
        }

        ResolvedBuild build = resolve_from_index(query, spec);

        Storage::CacheEntry entry;
        entry.key         = key;
        entry.build       = build;
        entry.resolved_at = std::chrono::duration_cast<std::chrono::seconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count();
        cache_.put(key, entry);
        return build;
    } catch (const FetchError& e) {
        throw e.with_query(to_string(query.browser), query.version_spec, to_string(query.platform));
    }
}

ResolvedBuild VersionResolver::resolve_from_index(const VersionQuery& query, const std::string& spec) {
    auto it = indexes_.find(query.browser);
    if (it == indexes_.end())
        throw FetchError(ErrorKind::UnsupportedPlatform, "no version index for " + to_string(query.browser));
    Index::VersionIndexClient& index = *it->second;

    auto candidates = index.list_candidates(query.platform);
    auto ranked     = rank_matches(spec, candidates);
    if (ranked.empty()) {
        ErrorContext ctx;
        ctx.cause = std::to_string(candidates.size()) + " versions listed, none match";
        throw FetchError(ErrorKind::UnknownVersion, "no build matches \"" + spec + "\"", ctx);
    }

    for (const auto& candidate : ranked) {
        auto described = index.describe(candidate);
        if (!described)
            continue;

        ResolvedBuild build;
        build.browser      = query.browser;
        build.full_version = described->full_version;
        build.platform     = query.platform;
        build.download_url = described->download_url;
        build.size_hint    = described->size_hint;
        Logger::success("Resolved " + to_string(query.browser) + " \"" + spec + "\" -> " + build.full_version);
        return build;
    }

    ErrorContext ctx;
    ctx.cause = std::to_string(ranked.size()) + " matching versions have no downloadable artifact";
    throw FetchError(ErrorKind::UnknownVersion, "no downloadable build matches \"" + spec + "\"", ctx);
}

bool VersionResolver::invalidate(const VersionQuery& query) {
    return cache_.erase(cache_key(query));
}

}  // namespace Resolver
}  // namespace Fetchium

#pragma once
#include <map>
#include "../index/version_index_client.hpp"
#include "../storage/artifact_cache.hpp"
#include "fetchium/types.hpp"

namespace Fetchium {
namespace Resolver {

struct ResolverOptions {
    bool refresh = false;  // skip cache reads; results are still written back
};

/**
 * @brief Turns a version query into one concrete build.
 *
 * Fresh cache entries answer without touching the index. Otherwise the index
 * for the query's browser is listed, candidates are ranked with rank_matches()
 * and the first one the index can describe wins and is written to the cache.
 * Throws FetchError (UnknownVersion, UnsupportedPlatform, IndexUnavailable)
 * with the query attached to its context.
 */
class VersionResolver {
public:
    VersionResolver(Storage::ArtifactCache& cache, ResolverOptions options = {});

    // Registers the index for its browser family; the index must outlive the resolver.
    void add_index(Index::VersionIndexClient& index);

    ResolvedBuild resolve(const VersionQuery& query);

    // Forgets the cached resolution for query, if any.
    bool invalidate(const VersionQuery& query);

    bool last_hit_cache() const { return last_hit_cache_; }

private:
    Storage::ArtifactCache&                       cache_;
    ResolverOptions                               options_;
    std::map<Browser, Index::VersionIndexClient*> indexes_;
    bool                                          last_hit_cache_ = false;

    ResolvedBuild resolve_from_index(const VersionQuery& query, const std::string& spec);
};

Storage::CacheKey cache_key(const VersionQuery& query);

}  // namespace Resolver
}  // namespace Fetchium

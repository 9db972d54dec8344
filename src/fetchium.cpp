#include "fetchium/fetchium.hpp"
#include <filesystem>
#include <stdexcept>
#include <vector>
#include "core/logger/logger.hpp"
#include "core/types/constants.hpp"
#include "download/downloader.hpp"
#include "download/extractor.hpp"
#include "index/chromium_index.hpp"
#include "index/firefox_index.hpp"
#include "network/http/curl_client.hpp"
#include "network/proxy/proxy_config.hpp"
#include "resolver/version_resolver.hpp"
#include "storage/artifact_cache.hpp"
#include "storage/listing_cache.hpp"

namespace Fetchium {

using Core::Logger;
using Network::Http::HTTPCode;

namespace {

bool falls_back(const FetchError& e) {
    return e.kind() == ErrorKind::UnknownVersion || e.kind() == ErrorKind::UnsupportedPlatform;
}

bool location_gone(const FetchError& e) {
    return e.kind() == ErrorKind::DownloadFailed
           && (e.context().http_status == static_cast<long>(HTTPCode::NotFound)
               || e.context().http_status == static_cast<long>(HTTPCode::Gone));
}

Network::Proxy::TransportConfig make_transport(const VersionQuery& query, const FetchOptions& options) {
    auto transport            = Network::Proxy::ProxyConfigurator::parse(query.proxy);
    transport.connect_timeout = options.connect_timeout;
    transport.request_timeout = options.request_timeout;
    transport.stall_timeout   = options.stall_timeout;
    transport.cancel          = options.cancel;
    return transport;
}

// One CurlClient shared by both indexes and the downloader for a single query.
class Session {
public:
    Session(const VersionQuery& query, const FetchOptions& options)
        : transport_(make_transport(query, options)),
          listings_(std::make_shared<Storage::ListingCache>(
              (std::filesystem::path(options.cache_dir) / Core::Constants::LISTINGS_DIR_NAME).string(),
              options.listing_ttl, options.refresh)),
          cache_(options.cache_dir,
                 std::make_shared<Storage::TtlStalenessPolicy>(options.latest_ttl, options.prefix_ttl,
                                                               options.pin_latest)),
          chromium_(client_, chromium_options(options)),
          firefox_(client_, firefox_options(options)),
          resolver_(cache_, Resolver::ResolverOptions{options.refresh}),
          downloader_(client_, Download::DownloadOptions{options.max_retries, options.backoff}),
          output_dir_(options.output_dir),
          extract_(options.extract) {
        if (output_dir_.empty())
            output_dir_ = (std::filesystem::path(options.cache_dir) / "downloads").string();
        resolver_.add_index(chromium_);
        resolver_.add_index(firefox_);
    }

    DownloadResult run(const VersionQuery& query) {
        ResolvedBuild  build  = resolver_.resolve(query);
        DownloadResult result = download(query, build);
        if (!extract_)
            return result;
        if (!Download::Extractor::can_extract(result.local_path)) {
            Logger::info("Keeping " + result.local_path + " as downloaded");
            return result;
        }

        try {
            result.extracted_path =
                Download::Extractor::extract(build, result.local_path, output_dir_, transport_.cancel);
        } catch (const FetchError& e) {
            // Drop the artifact so the next run downloads it again.
            std::error_code ec;
            std::filesystem::remove(result.local_path, ec);
            throw e.with_query(to_string(query.browser), query.version_spec, to_string(query.platform));
        }
        return result;
    }

private:
    Network::Proxy::TransportConfig        transport_;
    Network::Http::CurlClient              client_;
    std::shared_ptr<Storage::ListingCache> listings_;
    Storage::ArtifactCache                 cache_;
    Index::ChromiumIndexClient             chromium_;
    Index::FirefoxIndexClient              firefox_;
    Resolver::VersionResolver              resolver_;
    Download::Downloader                   downloader_;
    std::string                            output_dir_;
    bool                                   extract_;

    DownloadResult download(const VersionQuery& query, ResolvedBuild& build) {
        bool from_cache = resolver_.last_hit_cache();
        try {
            return downloader_.fetch(build, output_dir_, transport_);
        } catch (const FetchError& e) {
            if (!from_cache || !location_gone(e))
                throw e.with_query(to_string(query.browser), query.version_spec, to_string(query.platform));
            Logger::warn("Cached location for " + build.full_version + " is gone, resolving again");
        }

        resolver_.invalidate(query);
        build = resolver_.resolve(query);
        try {
            return downloader_.fetch(build, output_dir_, transport_);
        } catch (const FetchError& e) {
            throw e.with_query(to_string(query.browser), query.version_spec, to_string(query.platform));
        }
    }

    Network::Http::RetryPolicy retry_policy(const FetchOptions& options) const {
        return Network::Http::RetryPolicy{options.max_retries, options.backoff};
    }

    Index::ChromiumIndexOptions chromium_options(const FetchOptions& options) const {
        Index::ChromiumIndexOptions o;
        o.releases_url  = options.chromium_releases_url;
        o.snapshots_url = options.chromium_snapshots_url;
        o.retry         = retry_policy(options);
        o.transport     = transport_;
        o.listings      = listings_;
        return o;
    }

    Index::FirefoxIndexOptions firefox_options(const FetchOptions& options) const {
        Index::FirefoxIndexOptions o;
        o.releases_url = options.firefox_releases_url;
        o.locale       = options.firefox_locale;
        o.retry        = retry_policy(options);
        o.transport    = transport_;
        o.listings     = listings_;
        return o;
    }
};

}  // namespace

DownloadResult fetch_build(const VersionQuery& query, const FetchOptions& options) {
    if (options.cache_dir.empty())
        throw std::runtime_error("cache directory is not set");

    std::vector<Platform> platforms = {query.platform};
    if (options.arch_fallback && query.platform.arch == Arch::X86_64)
        platforms.push_back(Platform{query.platform.os, Arch::X86});

    for (size_t i = 0; i < platforms.size(); ++i) {
        VersionQuery attempt = query;
        attempt.platform     = platforms[i];
        try {
            Session session(attempt, options);
            return session.run(attempt);
        } catch (const FetchError& e) {
            if (i + 1 == platforms.size() || !falls_back(e))
                throw;
            Logger::warn(std::string(e.what()) + "; trying " + to_string(platforms[i + 1]));
        }
    }
    throw std::logic_error("no platform attempted");
}

std::string resolve_and_fetch(Browser                           browser,
                              const std::string&                version_spec,
                              const Platform&                   platform,
                              const std::optional<std::string>& proxy_url,
                              const FetchOptions&               options) {
    VersionQuery query;
    query.browser      = browser;
    query.version_spec = version_spec;
    query.platform     = platform;
    query.proxy        = proxy_url;
    return fetch_build(query, options).local_path;
}

}  // namespace Fetchium

#include "chromium_index.hpp"
#include <algorithm>
#include <nlohmann/json.hpp>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"
#include "fetchium/errors.hpp"

namespace Fetchium {
namespace Index {

using namespace Fetchium::Core;
using namespace Fetchium::Utils;
using nlohmann::json;

namespace {

constexpr const char* LISTING_FIELDS =
    "items(kind,mediaLink,metadata,name,size,updated),kind,prefixes,nextPageToken";

[[noreturn]] void unsupported(const Platform& platform) {
    ErrorContext ctx;
    ctx.browser  = "chromium";
    ctx.platform = to_string(platform);
    throw FetchError(ErrorKind::UnsupportedPlatform, "no chromium builds for " + to_string(platform), ctx);
}

[[noreturn]] void unavailable(const std::string& what, const std::string& cause, long status = 0) {
    ErrorContext ctx;
    ctx.browser     = "chromium";
    ctx.cause       = cause;
    ctx.http_status = status;
    throw FetchError(ErrorKind::IndexUnavailable, what, ctx);
}

json parse_json(const std::string& body, const std::string& what) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded())
        unavailable("malformed " + what, "response is not valid JSON");
    return doc;
}

std::string archive_for(const Platform& platform) {
    switch (platform.os) {
        case Os::Windows: return "chrome-win.zip";
        case Os::Mac: return "chrome-mac.zip";
        case Os::Linux: return "chrome-linux.zip";
    }
    return "chrome-linux.zip";
}

}  // namespace

ChromiumIndexClient::ChromiumIndexClient(Network::Http::HttpClient& client, ChromiumIndexOptions options)
    : client_(client), options_(std::move(options)) {
    if (options_.releases_url.empty())
        options_.releases_url = Constants::CHROMIUM_RELEASES_URL;
    if (options_.snapshots_url.empty())
        options_.snapshots_url = Constants::CHROMIUM_SNAPSHOTS_URL;
    if (options_.channel.empty())
        options_.channel = Constants::CHROMIUM_CHANNEL;
}

std::string ChromiumIndexClient::snapshot_prefix(const Platform& platform) {
    switch (platform.os) {
        case Os::Windows:
            if (platform.arch == Arch::X86)
                return "Win";
            if (platform.arch == Arch::X86_64)
                return "Win_x64";
            return "Win_Arm64";
        case Os::Linux:
            if (platform.arch == Arch::X86)
                return "Linux";
            if (platform.arch == Arch::X86_64)
                return "Linux_x64";
            break;
        case Os::Mac:
            if (platform.arch == Arch::X86_64)
                return "Mac";
            if (platform.arch == Arch::Arm64)
                return "Mac_Arm";
            break;
    }
    unsupported(platform);
}

std::string ChromiumIndexClient::release_platform(const Platform& platform) {
    snapshot_prefix(platform);
    switch (platform.os) {
        case Os::Windows: return "Windows";
        case Os::Mac: return "Mac";
        case Os::Linux: return "Linux";
    }
    unsupported(platform);
}

std::string ChromiumIndexClient::fetch(const std::string& url) {
    auto res = Network::Http::get_with_retry(client_, url, options_.retry, options_.transport);
    if (!res.success)
        unavailable("chromium index request failed: " + url, res.error, res.status_code);
    return res.body;
}

std::string ChromiumIndexClient::listing_url(const std::string& prefix,
                                             const std::string& page_token) const {
    std::string url = options_.snapshots_url + "?delimiter=/&prefix=" + Url::encode_component(prefix)
                      + "&fields=" + Url::encode_component(LISTING_FIELDS);
    if (!page_token.empty())
        url += "&pageToken=" + Url::encode_component(page_token);
    return url;
}

std::string ChromiumIndexClient::media_url(const std::string& object_name) const {
    std::string base = options_.snapshots_url;
    size_t      api  = base.find("/storage/v1/");
    if (api != std::string::npos)
        base.insert(api, "/download");
    return base + "/" + Url::encode_component(object_name) + "?alt=media";
}

std::vector<ChromiumIndexClient::Release> ChromiumIndexClient::load_releases(const Platform& platform) {
    const std::string platform_name = release_platform(platform);
    const std::string name          = "chromium-history-" + platform_name + "-" + options_.channel;

    if (options_.listings) {
        if (auto cached = options_.listings->load(name, options_.releases_url)) {
            try {
                std::vector<Release> found;
                for (const auto& item : *cached)
                    found.push_back(Release{item.at("version").get<std::string>(), item.at("time").get<std::int64_t>(),
                                            item.at("position").get<std::uint64_t>()});
                return found;
            } catch (const json::exception& e) {
                Logger::warn("Cached listing " + name + " is unusable (" + e.what() + "), fetching again");
            }
        }
    }

    Logger::info("Retrieving chromium release history for " + platform_name + " ...");
    auto found = fetch_releases(platform_name);
    if (options_.listings) {
        json items = json::array();
        for (const auto& r : found)
            items.push_back({{"version", r.version}, {"time", r.time}, {"position", r.position}});
        options_.listings->store(name, options_.releases_url, items);
    }
    return found;
}

std::vector<std::uint64_t> ChromiumIndexClient::load_revisions(const std::string& prefix) {
    const std::string name = "chromium-builds-" + prefix;

    if (options_.listings) {
        if (auto cached = options_.listings->load(name, options_.snapshots_url)) {
            try {
                auto found = cached->get<std::vector<std::uint64_t>>();
                std::sort(found.begin(), found.end());
                return found;
            } catch (const json::exception& e) {
                Logger::warn("Cached listing " + name + " is unusable (" + e.what() + "), fetching again");
            }
        }
    }

    Logger::info("Retrieving chromium snapshot builds under " + prefix + "/ ...");
    auto found = fetch_revisions(prefix);
    if (options_.listings)
        options_.listings->store(name, options_.snapshots_url, json(found));
    return found;
}

std::vector<ChromiumIndexClient::Release> ChromiumIndexClient::fetch_releases(const std::string& platform_name) {
    std::vector<Release> releases;
    const int            page_size = Constants::CHROMIUM_RELEASES_PAGE;

    for (int page = 0; page < Constants::MAX_INDEX_PAGES; ++page) {
        std::string url = options_.releases_url + "?channel=" + Url::encode_component(options_.channel)
                          + "&platform=" + platform_name + "&num=" + std::to_string(page_size)
                          + "&offset=" + std::to_string(page * page_size);
        json doc = parse_json(fetch(url), "chromium release history");
        if (!doc.is_array())
            unavailable("malformed chromium release history", "expected a JSON array");

        for (const auto& item : doc) {
            if (!item.is_object() || !item.contains("version") || !item["version"].is_string())
                continue;
            Release r;
            r.version = item["version"].get<std::string>();

            auto pos = item.find("chromium_main_branch_position");
            if (pos == item.end() || !pos->is_number_unsigned()) {
                Logger::warn("chromium " + r.version + ": no base position");
                continue;
            }
            r.position = pos->get<std::uint64_t>();
            auto time  = item.find("time");
            if (time != item.end() && time->is_number())
                r.time = static_cast<std::int64_t>(time->get<double>());
            releases.push_back(std::move(r));
        }

        if (doc.size() < static_cast<size_t>(page_size))
            break;
    }
    return releases;
}

std::vector<std::uint64_t> ChromiumIndexClient::fetch_revisions(const std::string& prefix) {
    std::vector<std::uint64_t> revisions;
    std::string                page_token;

    for (int page = 0; page < Constants::MAX_INDEX_PAGES; ++page) {
        json doc = parse_json(fetch(listing_url(prefix + "/", page_token)), "snapshot listing");
        if (!doc.is_object())
            unavailable("malformed snapshot listing", "expected a JSON object");

        auto prefixes = doc.find("prefixes");
        if (prefixes != doc.end() && prefixes->is_array()) {
            for (const auto& p : *prefixes) {
                if (!p.is_string())
                    continue;
                auto parts = Text::split(p.get<std::string>(), '/');
                if (parts.size() == 3 && parts[0] == prefix && parts[2].empty()
                    && Text::is_digits(parts[1])) {
                    revisions.push_back(std::stoull(parts[1]));
                }
            }
        }

        auto next = doc.find("nextPageToken");
        if (next == doc.end() || !next->is_string() || next->get<std::string>().empty())
            break;
        page_token = next->get<std::string>();
    }

    std::sort(revisions.begin(), revisions.end());
    return revisions;
}

std::vector<Candidate> ChromiumIndexClient::list_candidates(const Platform& platform) {
    const std::string prefix = snapshot_prefix(platform);

    auto releases  = load_releases(platform);
    auto revisions = load_revisions(prefix);

    std::vector<Candidate> candidates;
    for (const auto& release : releases) {
        auto it = std::lower_bound(revisions.begin(), revisions.end(), release.position);
        if (it == revisions.end()
            || *it - release.position > static_cast<std::uint64_t>(options_.position_window)) {
            continue;
        }

        Candidate c;
        c.full_version = release.version;
        c.published    = release.time;
        c.locator      = prefix + "/" + std::to_string(*it) + "/";
        c.download_url = media_url(c.locator + archive_for(platform));
        candidates.push_back(std::move(c));
    }

    Logger::info("chromium: " + std::to_string(candidates.size()) + " of "
                 + std::to_string(releases.size()) + " releases have snapshot builds");
    return candidates;
}

std::optional<Candidate> ChromiumIndexClient::describe(const Candidate& candidate) {
    if (candidate.locator.empty())
        return candidate;

    json doc = parse_json(fetch(listing_url(candidate.locator, "")), "snapshot build listing");
    auto items = doc.is_object() ? doc.find("items") : doc.end();
    if (!doc.is_object() || items == doc.end() || !items->is_array()) {
        Logger::warn("no files listed for build " + candidate.locator);
        return std::nullopt;
    }

    for (const auto& archive : get_chromium_archives()) {
        for (const auto& item : *items) {
            if (!item.is_object() || !item.contains("name") || !item["name"].is_string())
                continue;
            std::string name = item["name"].get<std::string>();
            if (!Text::ends_with(name, "/" + archive))
                continue;

            Candidate found = candidate;
            auto      link  = item.find("mediaLink");
            found.download_url = (link != item.end() && link->is_string()) ? link->get<std::string>()
                                                                            : media_url(name);
            auto size = item.find("size");
            if (size != item.end() && size->is_string() && Text::is_digits(size->get<std::string>()))
                found.size_hint = std::stoull(size->get<std::string>());
            else if (size != item.end() && size->is_number_unsigned())
                found.size_hint = size->get<std::uint64_t>();
            return found;
        }
    }

    Logger::warn("chromium " + candidate.full_version + ": no archive in " + candidate.locator);
    return std::nullopt;
}

}  // namespace Index
}  // namespace Fetchium

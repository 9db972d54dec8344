#include "firefox_index.hpp"
#include <algorithm>
#include <set>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../utils/html/directory_listing.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"
#include "fetchium/errors.hpp"

namespace Fetchium {
namespace Index {

using namespace Fetchium::Core;
using namespace Fetchium::Utils;

namespace {

constexpr const char* LISTING_NAME = "firefox-releases";

[[noreturn]] void unsupported(const Platform& platform) {
    ErrorContext ctx;
    ctx.browser  = "firefox";
    ctx.platform = to_string(platform);
    throw FetchError(ErrorKind::UnsupportedPlatform, "no firefox builds for " + to_string(platform), ctx);
}

[[noreturn]] void unavailable(const std::string& what, const Network::Http::Response& res) {
    ErrorContext ctx;
    ctx.browser     = "firefox";
    ctx.cause       = res.error;
    ctx.http_status = res.status_code;
    throw FetchError(ErrorKind::IndexUnavailable, what, ctx);
}

int major_of(const std::string& version) {
    auto head = version.substr(0, version.find('.'));
    return Text::is_digits(head) && head.size() < 9 ? std::stoi(head) : 0;
}

}  // namespace

FirefoxIndexClient::FirefoxIndexClient(Network::Http::HttpClient& client, FirefoxIndexOptions options)
    : client_(client), options_(std::move(options)) {
    if (options_.releases_url.empty())
        options_.releases_url = Constants::FIREFOX_RELEASES_URL;
    if (!Text::ends_with(options_.releases_url, "/"))
        options_.releases_url += "/";
    if (options_.locale.empty())
        options_.locale = Constants::FIREFOX_LOCALE;
}

std::string FirefoxIndexClient::platform_dir(const Platform& platform) {
    switch (platform.os) {
        case Os::Windows:
            if (platform.arch == Arch::X86)
                return "win32";
            if (platform.arch == Arch::X86_64)
                return "win64";
            return "win64-aarch64";
        case Os::Linux:
            if (platform.arch == Arch::X86)
                return "linux-i686";
            if (platform.arch == Arch::X86_64)
                return "linux-x86_64";
            return "linux-aarch64";
        case Os::Mac:
            // Universal binaries since 84.
            if (platform.arch != Arch::X86)
                return "mac";
            break;
    }
    unsupported(platform);
}

std::string FirefoxIndexClient::artifact_file(const std::string& version, const Platform& platform) {
    switch (platform.os) {
        case Os::Windows: return "Firefox%20Setup%20" + version + ".exe";
        case Os::Mac: return "Firefox%20" + version + ".dmg";
        case Os::Linux:
            if (major_of(version) >= Constants::FIREFOX_TAR_XZ_MAJOR)
                return "firefox-" + version + ".tar.xz";
            return "firefox-" + version + ".tar.bz2";
    }
    unsupported(platform);
}

bool FirefoxIndexClient::is_release_version(const std::string& name) {
    std::string v = name;
    if (Text::ends_with(v, "esr"))
        v = v.substr(0, v.size() - 3);

    auto parts = Text::split(v, '.');
    if (parts.size() < 2 || parts.size() > 4)
        return false;
    for (const auto& p : parts) {
        if (!Text::is_digits(p))
            return false;
    }
    return true;
}

std::string FirefoxIndexClient::artifact_url(const std::string& version, const Platform& platform) const {
    return options_.releases_url + version + "/" + platform_dir(platform) + "/" + options_.locale + "/"
           + artifact_file(version, platform);
}

std::vector<std::string> FirefoxIndexClient::fetch_versions() {
    Logger::info("Retrieving firefox release listing " + options_.releases_url + " ...");
    auto res = Network::Http::get_with_retry(client_, options_.releases_url, options_.retry, options_.transport);
    if (!res.success)
        unavailable("firefox index request failed: " + options_.releases_url, res);

    std::vector<std::string> versions;
    std::set<std::string>    seen;
    for (const auto& href : Html::DirectoryListing::entries(res.body)) {
        std::string version = Url::last_segment(Url::resolve(options_.releases_url, href));
        if (is_release_version(version) && seen.insert(version).second)
            versions.push_back(std::move(version));
    }

    if (versions.empty() && !res.body.empty())
        Logger::warn("firefox release listing contained no release versions");
    return versions;
}

std::vector<std::string> FirefoxIndexClient::load_versions() {
    if (options_.listings) {
        if (auto cached = options_.listings->load(LISTING_NAME, options_.releases_url)) {
            try {
                return cached->get<std::vector<std::string>>();
            } catch (const nlohmann::json::exception& e) {
                Logger::warn(std::string("Cached firefox listing is unusable (") + e.what() + "), fetching again");
            }
        }
    }

    auto versions = fetch_versions();
    if (options_.listings)
        options_.listings->store(LISTING_NAME, options_.releases_url, nlohmann::json(versions));
    return versions;
}

std::vector<Candidate> FirefoxIndexClient::list_candidates(const Platform& platform) {
    platform_dir(platform);

    std::vector<Candidate> candidates;
    for (const auto& version : load_versions()) {
        Candidate c;
        c.full_version = version;
        c.download_url = artifact_url(version, platform);
        candidates.push_back(std::move(c));
    }
    Logger::info("firefox: " + std::to_string(candidates.size()) + " releases listed");
    return candidates;
}

std::optional<Candidate> FirefoxIndexClient::describe(const Candidate& candidate) {
    Network::Http::Response res;
    client_.set_transport(options_.transport);
    for (int attempt = 0; attempt < std::max(1, options_.retry.max_attempts); ++attempt) {
        if (attempt > 0) {
            auto delay = get_backoff_time(attempt, options_.retry.backoff_base);
            Logger::warn("HEAD " + candidate.download_url + " failed (" + res.error + "), retrying in "
                         + std::to_string(delay.count()) + "ms");
            if (!Network::Http::wait_for_retry(delay, options_.transport))
                break;
        }
        res = client_.head(candidate.download_url);
        if (res.success || !Network::Http::is_transient(res))
            break;
    }

    if (res.success) {
        Candidate found = candidate;
        if (res.content_length > 0)
            found.size_hint = static_cast<std::uint64_t>(res.content_length);
        return found;
    }
    if (res.status_code == static_cast<long>(Network::Http::HTTPCode::NotFound)
        || res.status_code == static_cast<long>(Network::Http::HTTPCode::Gone)) {
        Logger::warn("firefox " + candidate.full_version + ": no artifact at " + candidate.download_url);
        return std::nullopt;
    }
    unavailable("firefox artifact check failed: " + candidate.download_url, res);
}

}  // namespace Index
}  // namespace Fetchium

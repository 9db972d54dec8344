#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <yaml-cpp/yaml.h>
#include "../../utils/text/string_utils.hpp"

namespace Fetchium {
namespace Core {

namespace {

const char* env(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

// "ff98" -> "98" when the version carries the firefox shorthand.
bool strip_firefox_prefix(std::string& version) {
    std::string lower = Utils::Text::to_lower(version);
    if (lower.size() > 2 && Utils::Text::starts_with(lower, "ff")) {
        version = version.substr(2);
        return true;
    }
    return false;
}

}  // namespace

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["browser"])
            config.browser = yaml["browser"].as<std::string>();
        if (yaml["version"])
            config.version = yaml["version"].as<std::string>();
        if (yaml["os"])
            config.os = yaml["os"].as<std::string>();
        if (yaml["arch"])
            config.arch = yaml["arch"].as<std::string>();
        if (yaml["proxy"])
            config.proxy = yaml["proxy"].as<std::string>();
        if (yaml["output"])
            config.output_dir = yaml["output"].as<std::string>();
        if (yaml["output_dir"])
            config.output_dir = yaml["output_dir"].as<std::string>();
        if (yaml["cache_dir"])
            config.cache_dir = yaml["cache_dir"].as<std::string>();
        if (yaml["max_retries"])
            config.max_retries = yaml["max_retries"].as<int>();
        if (yaml["backoff_ms"])
            config.backoff_ms = yaml["backoff_ms"].as<int>();
        if (yaml["connect_timeout"])
            config.connect_timeout = yaml["connect_timeout"].as<int>();
        if (yaml["request_timeout"])
            config.request_timeout = yaml["request_timeout"].as<int>();
        if (yaml["stall_timeout"])
            config.stall_timeout = yaml["stall_timeout"].as<int>();
        if (yaml["latest_ttl"])
            config.latest_ttl = yaml["latest_ttl"].as<std::int64_t>();
        if (yaml["prefix_ttl"])
            config.prefix_ttl = yaml["prefix_ttl"].as<std::int64_t>();
        if (yaml["listing_ttl"])
            config.listing_ttl = yaml["listing_ttl"].as<std::int64_t>();
        if (yaml["extract"])
            config.extract = yaml["extract"].as<bool>();
        if (yaml["pin_latest"])
            config.pin_latest = yaml["pin_latest"].as<bool>();
        if (yaml["refresh"])
            config.refresh = yaml["refresh"].as<bool>();
        if (yaml["arch_fallback"])
            config.arch_fallback = yaml["arch_fallback"].as<bool>();
        if (yaml["quiet"])
            config.quiet = yaml["quiet"].as<bool>();
        if (yaml["firefox_locale"])
            config.firefox_locale = yaml["firefox_locale"].as<std::string>();
        if (yaml["chromium_releases_url"])
            config.chromium_releases_url = yaml["chromium_releases_url"].as<std::string>();
        if (yaml["chromium_snapshots_url"])
            config.chromium_snapshots_url = yaml["chromium_snapshots_url"].as<std::string>();
        if (yaml["firefox_releases_url"])
            config.firefox_releases_url = yaml["firefox_releases_url"].as<std::string>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Error parsing config file: " + std::string(e.what()));
    }
}

std::string default_cache_dir() {
    namespace fs = std::filesystem;
    if (const char* local = env("LOCALAPPDATA"))
        return (fs::path(local) / Constants::CACHE_DIR_NAME).string();
    if (const char* xdg = env("XDG_CACHE_HOME"))
        return (fs::path(xdg) / Constants::CACHE_DIR_NAME).string();
    if (const char* home = env("HOME"))
        return (fs::path(home) / ".cache" / Constants::CACHE_DIR_NAME).string();
    return "";
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Fetchium - Resolve, cache and download Chromium and Firefox builds"};

    app.set_version_flag("-V", std::string("fetchium ") + Constants::VERSION);

    app.add_option("-b,--browser", config.browser, "Browser family: chromium or firefox");
    app.add_option("--os", config.os, "Target OS: windows, linux, macos (default: host)");
    app.add_option("--arch", config.arch, "Target architecture: x86, x86_64, arm64 (default: host)");
    app.add_option("-p,--proxy", config.proxy, "Proxy URL (http, https, socks4, socks4a, socks5, socks5h)");
    app.add_option("-o,--output", config.output_dir, "Artifact directory (default: <cache-dir>/downloads)");
    app.add_option("--cache-dir", config.cache_dir, "Resolution cache directory");
    app.add_option("--config", config.config_path, "Path to YAML configuration file");
    app.add_option("--retries", config.max_retries, "Attempts per request");
    app.add_option("--backoff-ms", config.backoff_ms, "First retry delay in milliseconds");
    app.add_option("--connect-timeout", config.connect_timeout, "Connect timeout in seconds");
    app.add_option("--request-timeout", config.request_timeout, "Index request timeout in seconds");
    app.add_option("--stall-timeout", config.stall_timeout, "Abort downloads stalled this many seconds");
    app.add_option("--latest-ttl", config.latest_ttl, "Seconds a \"latest\" resolution stays fresh");
    app.add_option("--prefix-ttl", config.prefix_ttl, "Seconds a partial version resolution stays fresh");
    app.add_option("--listing-ttl", config.listing_ttl, "Seconds downloaded index listings are reused (0: never)");
    app.add_option("--locale", config.firefox_locale, "Firefox build locale");
    app.add_option("--chromium-releases-url", config.chromium_releases_url, "Chromium release history endpoint");
    app.add_option("--chromium-snapshots-url", config.chromium_snapshots_url, "Chromium snapshot listing endpoint");
    app.add_option("--firefox-releases-url", config.firefox_releases_url, "Firefox release directory");

    app.add_flag("--pin-latest", config.pin_latest, "Trust a cached \"latest\" resolution");
    app.add_flag("--refresh", config.refresh, "Ignore cached resolutions and index listings");
    app.add_flag(
        "--no-arch-fallback",
        [&](size_t count) {
            if (count > 0)
                config.arch_fallback = false;
        },
        "Do not retry x86_64 misses with the x86 build");
    app.add_flag(
        "--no-extract",
        [&](size_t count) {
            if (count > 0)
                config.extract = false;
        },
        "Keep the downloaded archive without unpacking it");
    app.add_flag("-q,--quiet", config.quiet, "Only report errors");

    app.add_option("version", config.version, "Version: latest, a prefix like 98, a full version, or ff<version>");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit(app.exit(e));
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            exit(app.exit(e));
        }
    }

    if (config.cache_dir.empty())
        config.cache_dir = default_cache_dir();
    return config;
}

VersionQuery Config::to_query() const {
    VersionQuery query;
    query.version_spec = Utils::Text::trim(version);

    if (browser.empty()) {
        query.browser = strip_firefox_prefix(query.version_spec) ? Browser::Firefox : Browser::Chromium;
    }
    else {
        auto parsed = parse_browser(browser);
        if (!parsed)
            throw std::runtime_error("unknown browser: " + browser);
        query.browser = *parsed;
        if (query.browser == Browser::Firefox)
            strip_firefox_prefix(query.version_spec);
    }

    auto host = host_platform();
    if (os.empty() || arch.empty()) {
        if (!host)
            throw std::runtime_error("cannot detect the host platform, pass --os and --arch");
        query.platform = *host;
    }
    if (!os.empty()) {
        auto parsed = parse_os(os);
        if (!parsed)
            throw std::runtime_error("unknown os: " + os);
        query.platform.os = *parsed;
    }
    if (!arch.empty()) {
        auto parsed = parse_arch(arch);
        if (!parsed)
            throw std::runtime_error("unknown arch: " + arch);
        query.platform.arch = *parsed;
    }

    if (!proxy.empty())
        query.proxy = proxy;
    return query;
}

FetchOptions Config::to_fetch_options() const {
    FetchOptions options;
    options.cache_dir              = cache_dir;
    options.output_dir             = output_dir;
    options.latest_ttl             = std::chrono::seconds(latest_ttl);
    options.prefix_ttl             = std::chrono::seconds(prefix_ttl);
    options.listing_ttl            = std::chrono::seconds(listing_ttl);
    options.pin_latest             = pin_latest;
    options.refresh                = refresh;
    options.arch_fallback          = arch_fallback;
    options.extract                = extract;
    options.max_retries            = max_retries;
    options.backoff                = std::chrono::milliseconds(backoff_ms);
    options.connect_timeout        = std::chrono::seconds(connect_timeout);
    options.request_timeout        = std::chrono::seconds(request_timeout);
    options.stall_timeout          = std::chrono::seconds(stall_timeout);
    options.firefox_locale         = firefox_locale;
    options.chromium_releases_url  = chromium_releases_url;
    options.chromium_snapshots_url = chromium_snapshots_url;
    options.firefox_releases_url   = firefox_releases_url;
    return options;
}

}  // namespace Core
}  // namespace Fetchium

#include <atomic>
#include <csignal>
#include <curl/curl.h>
#include <iostream>
#include <memory>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "fetchium/fetchium.hpp"

namespace {

std::atomic<bool>* g_cancel = nullptr;

extern "C" void on_interrupt(int) {
    if (g_cancel)
        g_cancel->store(true);
}

int exit_code(Fetchium::ErrorKind kind) {
    switch (kind) {
        case Fetchium::ErrorKind::InvalidProxyUrl: return 2;
        case Fetchium::ErrorKind::UnsupportedPlatform: return 3;
        case Fetchium::ErrorKind::IndexUnavailable: return 4;
        case Fetchium::ErrorKind::UnknownVersion: return 5;
        case Fetchium::ErrorKind::DownloadFailed: return 6;
        case Fetchium::ErrorKind::CacheCorrupt: return 1;
    }
    return 1;
}

int run(const Fetchium::Core::Config& config, const std::shared_ptr<std::atomic<bool>>& cancel) {
    using Fetchium::Core::Logger;

    try {
        auto query     = config.to_query();
        auto options   = config.to_fetch_options();
        options.cancel = cancel;
        auto result    = Fetchium::fetch_build(query, options);
        std::cout << (result.extracted_path.empty() ? result.local_path : result.extracted_path) << std::endl;
        if (!result.verified)
            Logger::warn("Size of " + result.local_path + " could not be verified");
        return 0;
    } catch (const Fetchium::FetchError& e) {
        Logger::error(e.what());
        if (e.retryable())
            Logger::info("This failure may be temporary; try again later.");
        return exit_code(e.kind());
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    using Fetchium::Core::Logger;

    Fetchium::Core::Config config;
    try {
        config = Fetchium::Core::Config::parse(argc, argv);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }

    if (config.quiet)
        Logger::set_level(Fetchium::Core::LOG_ERROR);

    if (config.version.empty()) {
        Logger::error("No version provided.");
        return 1;
    }
    if (config.cache_dir.empty()) {
        Logger::error("No cache directory: set --cache-dir, XDG_CACHE_HOME or HOME.");
        return 1;
    }

    auto cancel = std::make_shared<std::atomic<bool>>(false);
    g_cancel    = cancel.get();
    std::signal(SIGINT, on_interrupt);

    curl_global_init(CURL_GLOBAL_ALL);
    int code = run(config, cancel);
    curl_global_cleanup();

    std::signal(SIGINT, SIG_DFL);
    g_cancel = nullptr;
    return code;
}

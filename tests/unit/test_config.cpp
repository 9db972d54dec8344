#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>
#include "../../src/core/config/config.hpp"

using namespace Fetchium;
using namespace Fetchium::Core;

TEST(ConfigTest, ComplexCLI) {
    char* argv[] = {(char*)"fetchium",
                    (char*)"98",
                    (char*)"--browser",
                    (char*)"chromium",
                    (char*)"--os",
                    (char*)"windows",
                    (char*)"--arch",
                    (char*)"x64",
                    (char*)"--proxy",
                    (char*)"socks5h://127.0.0.1:9050",
                    (char*)"--cache-dir",
                    (char*)"/tmp/fetchium-test-cache",
                    (char*)"--retries",
                    (char*)"5",
                    (char*)"--refresh",
                    (char*)"--no-arch-fallback",
                    (char*)"--listing-ttl",
                    (char*)"120",
                    (char*)"--no-extract"};
    auto  config = Config::parse(19, argv);
    EXPECT_EQ(config.version, "98");
    EXPECT_EQ(config.max_retries, 5);
    EXPECT_TRUE(config.refresh);
    EXPECT_FALSE(config.arch_fallback);
    EXPECT_EQ(config.cache_dir, "/tmp/fetchium-test-cache");
    EXPECT_EQ(config.listing_ttl, 120);
    EXPECT_FALSE(config.extract);

    auto query = config.to_query();
    EXPECT_EQ(query.browser, Browser::Chromium);
    EXPECT_EQ(query.version_spec, "98");
    EXPECT_EQ(query.platform, (Platform{Os::Windows, Arch::X86_64}));
    ASSERT_TRUE(query.proxy);
    EXPECT_EQ(*query.proxy, "socks5h://127.0.0.1:9050");

    auto options = config.to_fetch_options();
    EXPECT_EQ(options.max_retries, 5);
    EXPECT_TRUE(options.refresh);
    EXPECT_FALSE(options.arch_fallback);
    EXPECT_EQ(options.cache_dir, "/tmp/fetchium-test-cache");
    EXPECT_EQ(options.listing_ttl, std::chrono::seconds(120));
    EXPECT_FALSE(options.extract);
}

TEST(ConfigTest, FirefoxShorthand) {
    char* argv[] = {(char*)"fetchium", (char*)"ff98", (char*)"--os", (char*)"linux", (char*)"--arch", (char*)"x86_64"};
    auto  query  = Config::parse(6, argv).to_query();
    EXPECT_EQ(query.browser, Browser::Firefox);
    EXPECT_EQ(query.version_spec, "98");
    EXPECT_FALSE(query.proxy);
}

TEST(ConfigTest, ExplicitBrowserKeepsVersion) {
    Config config;
    config.browser = "firefox";
    config.version = "115.3.1esr";
    config.os      = "macos";
    config.arch    = "arm64";
    auto query     = config.to_query();
    EXPECT_EQ(query.browser, Browser::Firefox);
    EXPECT_EQ(query.version_spec, "115.3.1esr");
    EXPECT_EQ(query.platform, (Platform{Os::Mac, Arch::Arm64}));
}

TEST(ConfigTest, UnknownNamesAreRejected) {
    Config config;
    config.version = "98";
    config.os      = "linux";
    config.arch    = "x86_64";

    config.browser = "netscape";
    EXPECT_THROW(config.to_query(), std::runtime_error);

    config.browser = "";
    config.os      = "beos";
    EXPECT_THROW(config.to_query(), std::runtime_error);

    config.os   = "linux";
    config.arch = "sparc";
    EXPECT_THROW(config.to_query(), std::runtime_error);
}

TEST(ConfigTest, YamlLoading) {
    std::string   yaml_content = R"(
        browser: firefox
        version: "latest"
        os: linux
        arch: x86_64
        proxy: "socks5://10.0.0.1:1080"
        output: "custom_output"
        cache_dir: "custom_cache"
        max_retries: 7
        backoff_ms: 250
        latest_ttl: 3600
        prefix_ttl: 60
        pin_latest: true
        arch_fallback: false
        listing_ttl: 0
        extract: false
        firefox_locale: "de"
        firefox_releases_url: "http://127.0.0.1:9/releases/"
    )";
    std::ofstream ofs("test_config.yaml");
    ofs << yaml_content;
    ofs.close();

    char* argv[] = {(char*)"fetchium", (char*)"--config", (char*)"test_config.yaml"};
    auto  config = Config::parse(3, argv);

    EXPECT_EQ(config.browser, "firefox");
    EXPECT_EQ(config.version, "latest");
    EXPECT_EQ(config.proxy, "socks5://10.0.0.1:1080");
    EXPECT_EQ(config.output_dir, "custom_output");
    EXPECT_EQ(config.cache_dir, "custom_cache");
    EXPECT_EQ(config.max_retries, 7);
    EXPECT_EQ(config.backoff_ms, 250);
    EXPECT_EQ(config.latest_ttl, 3600);
    EXPECT_EQ(config.prefix_ttl, 60);
    EXPECT_TRUE(config.pin_latest);
    EXPECT_FALSE(config.arch_fallback);
    EXPECT_EQ(config.firefox_locale, "de");

    auto options = config.to_fetch_options();
    EXPECT_EQ(options.latest_ttl, std::chrono::seconds(3600));
    EXPECT_EQ(options.backoff, std::chrono::milliseconds(250));
    EXPECT_EQ(options.listing_ttl, std::chrono::seconds(0));
    EXPECT_FALSE(options.extract);
    EXPECT_EQ(options.firefox_releases_url, "http://127.0.0.1:9/releases/");

    std::remove("test_config.yaml");
}

TEST(ConfigTest, CliOverridesYaml) {
    std::ofstream ofs("test_ovr.yaml");
    ofs << "max_retries: 7\nbackoff_ms: 250\nversion: \"97\"";
    ofs.close();

    char* argv[] = {(char*)"fetchium", (char*)"--config", (char*)"test_ovr.yaml", (char*)"--retries", (char*)"2",
                    (char*)"99"};
    auto  config = Config::parse(6, argv);

    EXPECT_EQ(config.max_retries, 2);
    EXPECT_EQ(config.backoff_ms, 250);
    EXPECT_EQ(config.version, "99");

    std::remove("test_ovr.yaml");
}

TEST(ConfigTest, BrokenYaml) {
    std::ofstream ofs("test_broken.yaml");
    ofs << "max_retries: [unterminated";
    ofs.close();

    Config config;
    EXPECT_THROW(load_yaml(config, "test_broken.yaml"), std::runtime_error);
    std::remove("test_broken.yaml");
}

TEST(ConfigTest, DefaultCacheDirFollowsEnvironment) {
    const char* saved_xdg  = std::getenv("XDG_CACHE_HOME");
    std::string saved      = saved_xdg ? saved_xdg : "";
    const char* saved_appd = std::getenv("LOCALAPPDATA");

    if (!saved_appd) {
        setenv("XDG_CACHE_HOME", "/tmp/xdg-cache", 1);
        EXPECT_EQ(default_cache_dir(), "/tmp/xdg-cache/fetchium");
    }

    if (saved_xdg)
        setenv("XDG_CACHE_HOME", saved.c_str(), 1);
    else
        unsetenv("XDG_CACHE_HOME");
}

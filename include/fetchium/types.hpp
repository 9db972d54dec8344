#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace Fetchium {

enum class Browser { Chromium, Firefox };

enum class Os { Windows, Linux, Mac };

enum class Arch { X86, X86_64, Arm64 };

struct Platform {
    Os   os   = Os::Linux;
    Arch arch = Arch::X86_64;

    bool operator==(const Platform& other) const {
        return os == other.os && arch == other.arch;
    }
    bool operator!=(const Platform& other) const {
        return !(*this == other);
    }
};

std::string to_string(Browser browser);
std::string to_string(Os os);
std::string to_string(Arch arch);
std::string to_string(const Platform& platform);  // e.g. "windows-x86_64"

std::optional<Browser> parse_browser(const std::string& name);
std::optional<Os>      parse_os(const std::string& name);
std::optional<Arch>    parse_arch(const std::string& name);

// Platform this binary was compiled for, if it is one we can download for.
std::optional<Platform> host_platform();

struct VersionQuery {
    Browser                    browser = Browser::Chromium;
    std::string                version_spec;
    Platform                   platform;
    std::optional<std::string> proxy;
};

// One exact artifact. Identity is (browser, full_version, platform).
struct ResolvedBuild {
    Browser                      browser = Browser::Chromium;
    std::string                  full_version;
    Platform                     platform;
    std::string                  download_url;
    std::optional<std::uint64_t> size_hint;

    bool same_artifact(const ResolvedBuild& other) const {
        return browser == other.browser && full_version == other.full_version
               && platform == other.platform;
    }
};

struct DownloadResult {
    std::string   local_path;
    std::uint64_t bytes_written = 0;
    bool          verified      = false;
    std::string   extracted_path;  // unpacked browser directory, empty when not unpacked
};

}  // namespace Fetchium

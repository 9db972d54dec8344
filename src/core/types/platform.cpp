#include "fetchium/types.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Fetchium {

using Utils::Text::to_lower;

std::string to_string(Browser browser) {
    switch (browser) {
        case Browser::Chromium: return "chromium";
        case Browser::Firefox: return "firefox";
    }
    return "unknown";
}

std::string to_string(Os os) {
    switch (os) {
        case Os::Windows: return "windows";
        case Os::Linux: return "linux";
        case Os::Mac: return "macos";
    }
    return "unknown";
}

std::string to_string(Arch arch) {
    switch (arch) {
        case Arch::X86: return "x86";
        case Arch::X86_64: return "x86_64";
        case Arch::Arm64: return "arm64";
    }
    return "unknown";
}

std::string to_string(const Platform& platform) {
    return to_string(platform.os) + "-" + to_string(platform.arch);
}

std::optional<Browser> parse_browser(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "chromium" || n == "chrome")
        return Browser::Chromium;
    if (n == "firefox" || n == "ff")
        return Browser::Firefox;
    return std::nullopt;
}

std::optional<Os> parse_os(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "windows" || n == "win")
        return Os::Windows;
    if (n == "linux")
        return Os::Linux;
    if (n == "macos" || n == "mac" || n == "darwin" || n == "osx")
        return Os::Mac;
    return std::nullopt;
}

std::optional<Arch> parse_arch(const std::string& name) {
    std::string n = to_lower(name);
    if (n == "x86" || n == "i386" || n == "i686" || n == "win32")
        return Arch::X86;
    if (n == "x86_64" || n == "x64" || n == "amd64")
        return Arch::X86_64;
    if (n == "arm64" || n == "aarch64")
        return Arch::Arm64;
    return std::nullopt;
}

std::optional<Platform> host_platform() {
    Platform platform;
#if defined(_WIN32)
    platform.os = Os::Windows;
#elif defined(__APPLE__)
    platform.os = Os::Mac;
#elif defined(__linux__)
    platform.os = Os::Linux;
#else
    return std::nullopt;
#endif

#if defined(__x86_64__) || defined(_M_X64)
    platform.arch = Arch::X86_64;
#elif defined(__aarch64__) || defined(_M_ARM64)
    platform.arch = Arch::Arm64;
#elif defined(__i386__) || defined(_M_IX86)
    platform.arch = Arch::X86;
#else
    return std::nullopt;
#endif
    return platform;
}

}  // namespace Fetchium

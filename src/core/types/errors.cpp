#include "fetchium/errors.hpp"
#include <utility>

namespace Fetchium {

namespace {

std::string compose(ErrorKind kind, const std::string& message, const ErrorContext& ctx) {
    std::string out = to_string(kind) + ": " + message;

    std::string details;
    auto        append = [&details](const char* name, const std::string& value) {
        if (value.empty())
            return;
        if (!details.empty())
            details += ", ";
        details += name;
        details += "=";
        details += value;
    };
    append("browser", ctx.browser);
    append("spec", ctx.version_spec);
    append("platform", ctx.platform);
    if (!details.empty())
        out += " [" + details + "]";
    if (!ctx.cause.empty() && ctx.cause != message)
        out += ": " + ctx.cause;
    return out;
}

}  // namespace

std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidProxyUrl: return "InvalidProxyUrl";
        case ErrorKind::UnsupportedPlatform: return "UnsupportedPlatform";
        case ErrorKind::IndexUnavailable: return "IndexUnavailable";
        case ErrorKind::UnknownVersion: return "UnknownVersion";
        case ErrorKind::DownloadFailed: return "DownloadFailed";
        case ErrorKind::CacheCorrupt: return "CacheCorrupt";
    }
    return "Unknown";
}

FetchError::FetchError(ErrorKind kind, const std::string& message, ErrorContext context)
    : std::runtime_error(compose(kind, message, context)),
      kind_(kind),
      message_(message),
      context_(std::move(context)) {
}

bool FetchError::retryable() const noexcept {
    return kind_ == ErrorKind::IndexUnavailable || kind_ == ErrorKind::DownloadFailed;
}

FetchError FetchError::with_query(const std::string& browser,
                                  const std::string& version_spec,
                                  const std::string& platform) const {
    ErrorContext ctx = context_;
    if (ctx.browser.empty())
        ctx.browser = browser;
    if (ctx.version_spec.empty())
        ctx.version_spec = version_spec;
    if (ctx.platform.empty())
        ctx.platform = platform;
    return FetchError(kind_, message_, std::move(ctx));
}

}  // namespace Fetchium

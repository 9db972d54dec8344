#pragma once
#include <stdexcept>
#include <string>

namespace Fetchium {

enum class ErrorKind {
    InvalidProxyUrl,
    UnsupportedPlatform,
    IndexUnavailable,
    UnknownVersion,
    DownloadFailed,
    CacheCorrupt
};

std::string to_string(ErrorKind kind);

struct ErrorContext {
    std::string browser;
    std::string version_spec;
    std::string platform;
    std::string cause;
    long        http_status = 0;
};

class FetchError : public std::runtime_error {
public:
    FetchError(ErrorKind kind, const std::string& message, ErrorContext context = {});

    ErrorKind           kind() const noexcept { return kind_; }
    const std::string&  message() const noexcept { return message_; }
    const ErrorContext& context() const noexcept { return context_; }

    // IndexUnavailable and DownloadFailed may succeed if the caller tries again later.
    bool retryable() const noexcept;

    // Same error with the query details filled in where they are still blank.
    FetchError with_query(const std::string& browser,
                          const std::string& version_spec,
                          const std::string& platform) const;

private:
    ErrorKind    kind_;
    std::string  message_;
    ErrorContext context_;
};

}  // namespace Fetchium

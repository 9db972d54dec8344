#include "downloader.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include "../core/logger/logger.hpp"
#include "../core/types/constants.hpp"
#include "../network/http/retry.hpp"
#include "../utils/url/url.hpp"
#include "fetchium/errors.hpp"

namespace Fetchium {
namespace Download {

using namespace Fetchium::Core;
using Network::Http::HTTPCode;
namespace fs = std::filesystem;

namespace {

// Removes the partial file on every exit path unless it was renamed into place.
class PartialFile {
public:
    explicit PartialFile(fs::path path) : path_(std::move(path)) {}
    ~PartialFile() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }
    PartialFile(const PartialFile&)            = delete;
    PartialFile& operator=(const PartialFile&) = delete;

    const fs::path& path() const { return path_; }
    void            release() { path_.clear(); }

private:
    fs::path path_;
};

ErrorContext context_for(const ResolvedBuild& build, const std::string& cause, long status = 0) {
    ErrorContext ctx;
    ctx.browser     = to_string(build.browser);
    ctx.platform    = to_string(build.platform);
    ctx.cause       = cause;
    ctx.http_status = status;
    return ctx;
}

bool is_gone(long status) {
    return status == static_cast<long>(HTTPCode::NotFound) || status == static_cast<long>(HTTPCode::Gone);
}

}  // namespace

Downloader::Downloader(Network::Http::HttpClient& client, DownloadOptions options)
    : client_(client), options_(options) {
}

std::string Downloader::artifact_name(const ResolvedBuild& build) {
    std::string ext = Utils::Url::artifact_extension(build.download_url);
    if (ext.empty())
        ext = ".bin";
    return to_string(build.browser) + "-" + build.full_version + "-" + to_string(build.platform) + ext;
}

DownloadResult Downloader::fetch(const ResolvedBuild&                   build,
                                 const std::string&                     dest_dir,
                                 const Network::Proxy::TransportConfig& transport) {
    std::error_code ec;
    fs::create_directories(dest_dir, ec);
    if (ec) {
        throw FetchError(ErrorKind::DownloadFailed, "cannot create " + dest_dir,
                         context_for(build, ec.message()));
    }

    const fs::path final_path = fs::path(dest_dir) / artifact_name(build);
    fs::path       part_path  = final_path;
    part_path += Constants::PARTIAL_SUFFIX;

    if (fs::is_regular_file(final_path, ec)) {
        auto size = fs::file_size(final_path, ec);
        if (!ec && (!build.size_hint || size == *build.size_hint)) {
            Logger::success("Already downloaded: " + final_path.string());
            return DownloadResult{final_path.string(), size, build.size_hint.has_value()};
        }
        Logger::warn("Existing " + final_path.string() + " does not match the expected size, downloading again");
    }

    client_.set_transport(transport);

    std::string cause  = "no attempt made";
    long        status = 0;
    const int   attempts = std::max(1, options_.max_attempts);

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (transport.cancelled()) {
            cause = "cancelled";
            break;
        }

        std::string log_msg = "Downloading: " + build.download_url;
        if (attempt > 1)
            log_msg += " [Retry " + std::to_string(attempt) + "]";
        Logger::info(log_msg);

        PartialFile partial(part_path);
        bool        retry = true;
        {
            std::ofstream out(partial.path(), std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw FetchError(ErrorKind::DownloadFailed, "cannot write " + partial.path().string(),
                                 context_for(build, "open failed"));
            }

            auto res = client_.download(build.download_url, out);
            out.close();
            status = res.status_code;

            if (res.success && !out.fail()) {
                std::uint64_t written = fs::file_size(partial.path(), ec);
                if (ec) {
                    cause = ec.message();
                }
                else if (build.size_hint && written != *build.size_hint) {
                    cause = "size mismatch: expected " + std::to_string(*build.size_hint) + " bytes, got "
                            + std::to_string(written);
                }
                else if (res.content_length >= 0 && written != static_cast<std::uint64_t>(res.content_length)) {
                    cause = "truncated transfer: announced " + std::to_string(res.content_length)
                            + " bytes, got " + std::to_string(written);
                }
                else {
                    fs::rename(partial.path(), final_path, ec);
                    if (ec) {
                        throw FetchError(ErrorKind::DownloadFailed, "cannot move artifact into place",
                                         context_for(build, ec.message()));
                    }
                    partial.release();

                    bool verified = build.size_hint.has_value() || res.content_length >= 0;
                    Logger::success("Saved: " + final_path.string() + " (" + std::to_string(written) + " bytes)");
                    return DownloadResult{final_path.string(), written, verified};
                }
            }
            else {
                cause = res.success ? "failed writing " + partial.path().string() : res.error;
                if (res.error_type == Network::Http::ErrorType::Cancelled || transport.cancelled()) {
                    cause = "cancelled";
                    retry = false;
                }
                else if (is_gone(res.status_code)) {
                    retry = false;
                }
                else if (!res.success && res.error_type == Network::Http::ErrorType::None
                         && !Network::Http::is_transient(res)) {
                    retry = false;
                }
            }
        }

        if (!retry)
            break;
        if (attempt == attempts) {
            Logger::error("Failed: " + build.download_url + " - Max retries (" + cause + ")");
            break;
        }
        Logger::warn("Download failed (" + cause + "), backing off: " + build.download_url);
        if (!Network::Http::wait_for_retry(get_backoff_time(attempt, options_.backoff_base), transport)) {
            cause = "cancelled";
            break;
        }
    }

    throw FetchError(ErrorKind::DownloadFailed, "download of " + build.download_url + " failed",
                     context_for(build, cause, status));
}

}  // namespace Download
}  // namespace Fetchium

#include "extractor.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include "../core/logger/logger.hpp"
#include "../utils/text/string_utils.hpp"
#include "../utils/url/url.hpp"
#include "fetchium/errors.hpp"

namespace Fetchium {
namespace Download {

using namespace Fetchium::Core;
namespace fs = std::filesystem;

namespace {

constexpr char   SEVEN_ZIP_SIGNATURE[] = {'7', 'z', '\xBC', '\xAF', '\x27', '\x1C'};
constexpr size_t READ_BLOCK_SIZE       = 64 * 1024;

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const noexcept {
        if (a)
            archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(struct archive* a) const noexcept {
        if (a)
            archive_write_free(a);
    }
};

using ArchiveReader = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using ArchiveWriter = std::unique_ptr<struct archive, ArchiveWriteDeleter>;

// Removes the staging tree on every exit path unless it was moved into place.
class StagingDir {
public:
    explicit StagingDir(fs::path path) : path_(std::move(path)) {}
    ~StagingDir() {
        if (!path_.empty()) {
            std::error_code ec;
            fs::remove_all(path_, ec);
        }
    }
    StagingDir(const StagingDir&)            = delete;
    StagingDir& operator=(const StagingDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

[[noreturn]] void fail(const ResolvedBuild& build, const std::string& what, const std::string& cause) {
    ErrorContext ctx;
    ctx.browser  = to_string(build.browser);
    ctx.platform = to_string(build.platform);
    ctx.cause    = cause;
    throw FetchError(ErrorKind::DownloadFailed, what, ctx);
}

std::string archive_error(struct archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "unknown archive error";
}

// Relative, and no ".." component.
bool is_safe_entry(const std::string& name) {
    fs::path p(name);
    if (name.empty() || p.is_absolute() || p.has_root_name() || name.front() == '/' || name.front() == '\\')
        return false;
    for (const auto& part : p) {
        if (part == "..")
            return false;
    }
    return true;
}

void copy_data(const ResolvedBuild& build, struct archive* reader, struct archive* writer) {
    const void* block  = nullptr;
    size_t      size   = 0;
    la_int64_t  offset = 0;
    for (;;) {
        int rc = archive_read_data_block(reader, &block, &size, &offset);
        if (rc == ARCHIVE_EOF)
            return;
        if (rc < ARCHIVE_WARN)
            fail(build, "cannot read archive data", archive_error(reader));
        if (archive_write_data_block(writer, block, size, offset) < ARCHIVE_WARN)
            fail(build, "cannot write extracted data", archive_error(writer));
    }
}

// Picks the folder that becomes the browser directory.
fs::path browser_root(const ResolvedBuild& build, const fs::path& staging) {
    if (build.browser == Browser::Firefox && build.platform.os == Os::Windows && fs::is_directory(staging / "core"))
        return staging / "core";

    fs::path only;
    size_t   count = 0;
    for (const auto& entry : fs::directory_iterator(staging)) {
        only = entry.path();
        if (++count > 1)
            break;
    }
    if (count == 1 && fs::is_directory(only))
        return only;
    return staging;
}

}  // namespace

std::string Extractor::target_dir(const ResolvedBuild& build, const std::string& dest_dir) {
    return (fs::path(dest_dir)
            / (to_string(build.browser) + "-" + build.full_version + "-" + to_string(build.platform)))
        .string();
}

bool Extractor::can_extract(const std::string& artifact_path) {
    std::string name = Utils::Text::to_lower(fs::path(artifact_path).filename().string());
    for (const char* ext : {".zip", ".tar.bz2", ".tar.xz", ".tar.gz", ".exe"}) {
        if (Utils::Text::ends_with(name, ext))
            return true;
    }
    return false;
}

std::string Extractor::extract(const ResolvedBuild&              build,
                               const std::string&                artifact_path,
                               const std::string&                dest_dir,
                               const Network::Proxy::CancelFlag& cancel) {
    std::error_code ec;
    const fs::path  target = fs::weakly_canonical(fs::absolute(target_dir(build, dest_dir)), ec);
    if (ec)
        fail(build, "cannot place " + target_dir(build, dest_dir), ec.message());

    if (fs::is_directory(target, ec)) {
        Logger::success("Already unpacked: " + target.string());
        return target.string();
    }

    fs::path staging_path = target;
    staging_path += ".extracting";
    fs::remove_all(staging_path, ec);
    fs::create_directories(staging_path, ec);
    if (ec)
        fail(build, "cannot create " + staging_path.string(), ec.message());
    StagingDir staging(staging_path);

    ArchiveReader reader(archive_read_new());
    ArchiveWriter writer(archive_write_disk_new());
    if (!reader || !writer)
        fail(build, "cannot unpack " + artifact_path, "out of memory");

    archive_read_support_format_all(reader.get());
    archive_read_support_filter_all(reader.get());
    archive_write_disk_set_options(writer.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM
                                                     | ARCHIVE_EXTRACT_SECURE_NODOTDOT
                                                     | ARCHIVE_EXTRACT_SECURE_SYMLINKS);
    archive_write_disk_set_standard_lookup(writer.get());

    // Installers carry a 7-Zip payload after the executable stub.
    std::string payload;
    int         rc;
    if (Utils::Text::ends_with(Utils::Text::to_lower(artifact_path), ".exe")) {
        std::ifstream in(artifact_path, std::ios::binary);
        payload.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad())
            fail(build, "cannot read " + artifact_path, "read error");

        size_t start = payload.find(std::string(SEVEN_ZIP_SIGNATURE, sizeof(SEVEN_ZIP_SIGNATURE)));
        if (start == std::string::npos)
            fail(build, "cannot unpack " + artifact_path, "no 7-Zip payload in installer");
        rc = archive_read_open_memory(reader.get(), payload.data() + start, payload.size() - start);
    }
    else {
        rc = archive_read_open_filename(reader.get(), artifact_path.c_str(), READ_BLOCK_SIZE);
    }
    if (rc != ARCHIVE_OK)
        fail(build, "cannot open " + artifact_path, archive_error(reader.get()));

    Logger::info("Unpacking " + artifact_path + " ...");
    size_t                entries = 0;
    struct archive_entry* entry   = nullptr;
    while ((rc = archive_read_next_header(reader.get(), &entry)) != ARCHIVE_EOF) {
        if (rc < ARCHIVE_WARN)
            fail(build, "cannot unpack " + artifact_path, archive_error(reader.get()));
        if (cancel && cancel->load())
            fail(build, "unpacking " + artifact_path + " cancelled", "cancelled");

        const char* raw_name = archive_entry_pathname(entry);
        std::string name     = raw_name ? raw_name : "";
        if (!is_safe_entry(name))
            fail(build, "cannot unpack " + artifact_path, "unsafe entry path: " + name);
        archive_entry_set_pathname(entry, (staging.path() / name).string().c_str());

        const char* link = archive_entry_hardlink(entry);
        if (link) {
            if (!is_safe_entry(link))
                fail(build, "cannot unpack " + artifact_path, "unsafe link target: " + std::string(link));
            archive_entry_set_hardlink(entry, (staging.path() / link).string().c_str());
        }

        if (archive_write_header(writer.get(), entry) < ARCHIVE_WARN)
            fail(build, "cannot unpack " + name, archive_error(writer.get()));
        if (archive_entry_filetype(entry) == AE_IFREG)
            copy_data(build, reader.get(), writer.get());
        if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN)
            fail(build, "cannot unpack " + name, archive_error(writer.get()));
        ++entries;
    }
    if (archive_write_close(writer.get()) < ARCHIVE_WARN)
        fail(build, "cannot finish unpacking " + artifact_path, archive_error(writer.get()));
    if (entries == 0)
        fail(build, "cannot unpack " + artifact_path, "archive is empty");

    fs::rename(browser_root(build, staging.path()), target, ec);
    if (ec)
        fail(build, "cannot move unpacked build into place", ec.message());

    Logger::success("Unpacked " + std::to_string(entries) + " entries to " + target.string());
    return target.string();
}

}  // namespace Download
}  // namespace Fetchium

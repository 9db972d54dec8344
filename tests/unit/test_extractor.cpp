#include <archive.h>
#include <archive_entry.h>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <utility>
#include <vector>
#include "../../src/core/logger/logger.hpp"
#include "../../src/download/extractor.hpp"
#include "fetchium/errors.hpp"

using namespace Fetchium;
using namespace Fetchium::Download;
namespace fs = std::filesystem;

namespace {

const std::string OUT = "test_extractor_out";

using Files = std::vector<std::pair<std::string, std::string>>;

struct WriterDeleter {
    void operator()(struct archive* a) const {
        if (a)
            archive_write_free(a);
    }
};

// Writes files (name, content) into a new archive at path.
void write_archive(const std::string& path, const Files& files, bool seven_zip = false) {
    std::unique_ptr<struct archive, WriterDeleter> a(archive_write_new());
    if (seven_zip) {
        ASSERT_EQ(archive_write_set_format_7zip(a.get()), ARCHIVE_OK);
        ASSERT_EQ(archive_write_set_options(a.get(), "7zip:compression=store"), ARCHIVE_OK);
    }
    else {
        ASSERT_EQ(archive_write_set_format_zip(a.get()), ARCHIVE_OK);
    }
    ASSERT_EQ(archive_write_open_filename(a.get(), path.c_str()), ARCHIVE_OK);

    for (const auto& [name, content] : files) {
        struct archive_entry* entry = archive_entry_new();
        archive_entry_set_pathname(entry, name.c_str());
        archive_entry_set_filetype(entry, AE_IFREG);
        archive_entry_set_perm(entry, 0755);
        archive_entry_set_size(entry, static_cast<la_int64_t>(content.size()));
        ASSERT_EQ(archive_write_header(a.get(), entry), ARCHIVE_OK);
        ASSERT_EQ(archive_write_data(a.get(), content.data(), content.size()),
                  static_cast<la_ssize_t>(content.size()));
        archive_entry_free(entry);
    }
    ASSERT_EQ(archive_write_close(a.get()), ARCHIVE_OK);
}

std::string read_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

ResolvedBuild chromium_linux() {
    ResolvedBuild build;
    build.browser      = Browser::Chromium;
    build.full_version = "98.0.4758.102";
    build.platform     = Platform{Os::Linux, Arch::X86_64};
    return build;
}

ResolvedBuild firefox_windows() {
    ResolvedBuild build;
    build.browser      = Browser::Firefox;
    build.full_version = "128.0.3";
    build.platform     = Platform{Os::Windows, Arch::X86_64};
    return build;
}

}  // namespace

class ExtractorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Core::Logger::set_level(Core::LOG_ERROR);
        if (fs::exists(OUT))
            fs::remove_all(OUT);
        fs::create_directories(OUT);
    }

    void TearDown() override {
        Core::Logger::set_level(Core::LOG_ALL);
        if (fs::exists(OUT))
            fs::remove_all(OUT);
    }
};

TEST_F(ExtractorTest, ExtractableArtifacts) {
    EXPECT_TRUE(Extractor::can_extract("chromium-98.0.4758.102-linux-x86_64.zip"));
    EXPECT_TRUE(Extractor::can_extract("firefox-128.0.3-linux-x86_64.tar.bz2"));
    EXPECT_TRUE(Extractor::can_extract("firefox-135.0-linux-x86_64.tar.xz"));
    EXPECT_TRUE(Extractor::can_extract("firefox-128.0.3-windows-x86_64.EXE"));
    EXPECT_FALSE(Extractor::can_extract("firefox-128.0.3-mac-arm64.dmg"));
    EXPECT_FALSE(Extractor::can_extract("chromium-98.0.4758.102-linux-x86_64"));
}

TEST_F(ExtractorTest, TargetDirectoryName) {
    EXPECT_EQ(fs::path(Extractor::target_dir(chromium_linux(), OUT)).filename().string(),
              "chromium-98.0.4758.102-linux-x86_64");
}

TEST_F(ExtractorTest, ZipRootFolderIsStripped) {
    const std::string zip = OUT + "/chromium-98.0.4758.102-linux-x86_64.zip";
    write_archive(zip, {{"chrome-linux/chrome", "ELF chrome"}, {"chrome-linux/locales/en-US.pak", "strings"}});

    std::string target = Extractor::extract(chromium_linux(), zip, OUT);
    EXPECT_TRUE(fs::equivalent(target, Extractor::target_dir(chromium_linux(), OUT)));
    EXPECT_EQ(read_file(fs::path(target) / "chrome"), "ELF chrome");
    EXPECT_EQ(read_file(fs::path(target) / "locales" / "en-US.pak"), "strings");
    EXPECT_FALSE(fs::exists(fs::path(target) / "chrome-linux"));
    EXPECT_FALSE(fs::exists(Extractor::target_dir(chromium_linux(), OUT) + ".extracting"));
    // The archive itself stays where it was downloaded.
    EXPECT_TRUE(fs::exists(zip));
}

TEST_F(ExtractorTest, InstallerPayloadUsesCoreFolder) {
    const std::string payload = OUT + "/payload.7z";
    write_archive(payload, {{"core/firefox.exe", "PE firefox"}, {"core/browser/omni.ja", "omni"}, {"setup.exe", "PE setup"}},
                  true);

    const std::string installer = OUT + "/firefox-128.0.3-windows-x86_64.exe";
    {
        std::ofstream out(installer, std::ios::binary);
        out << "MZ" << std::string(4096, '\x90') << read_file(payload);
    }

    std::string target = Extractor::extract(firefox_windows(), installer, OUT);
    EXPECT_EQ(read_file(fs::path(target) / "firefox.exe"), "PE firefox");
    EXPECT_EQ(read_file(fs::path(target) / "browser" / "omni.ja"), "omni");
    EXPECT_FALSE(fs::exists(fs::path(target) / "setup.exe"));
    EXPECT_FALSE(fs::exists(Extractor::target_dir(firefox_windows(), OUT) + ".extracting"));
}

TEST_F(ExtractorTest, InstallerWithoutPayload) {
    const std::string installer = OUT + "/firefox-128.0.3-windows-x86_64.exe";
    {
        std::ofstream out(installer, std::ios::binary);
        out << "MZ just a stub";
    }
    try {
        Extractor::extract(firefox_windows(), installer, OUT);
        FAIL() << "expected DownloadFailed";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DownloadFailed);
        EXPECT_EQ(e.context().browser, "firefox");
    }
    EXPECT_FALSE(fs::exists(Extractor::target_dir(firefox_windows(), OUT)));
}

TEST_F(ExtractorTest, CorruptArchiveLeavesNothing) {
    const std::string zip = OUT + "/chromium-98.0.4758.102-linux-x86_64.zip";
    {
        std::ofstream out(zip, std::ios::binary);
        out << "PK\x03\x04 truncated";
    }
    try {
        Extractor::extract(chromium_linux(), zip, OUT);
        FAIL() << "expected DownloadFailed";
    } catch (const FetchError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::DownloadFailed);
    }
    EXPECT_FALSE(fs::exists(Extractor::target_dir(chromium_linux(), OUT)));
    EXPECT_FALSE(fs::exists(Extractor::target_dir(chromium_linux(), OUT) + ".extracting"));
}

TEST_F(ExtractorTest, EscapingEntryIsRejected) {
    const std::string zip = OUT + "/chromium-98.0.4758.102-linux-x86_64.zip";
    write_archive(zip, {{"chrome-linux/chrome", "ELF chrome"}, {"../evil", "owned"}});

    EXPECT_THROW(Extractor::extract(chromium_linux(), zip, OUT), FetchError);
    EXPECT_FALSE(fs::exists("evil"));
    EXPECT_FALSE(fs::exists(OUT + "/evil"));
    EXPECT_FALSE(fs::exists(Extractor::target_dir(chromium_linux(), OUT)));
    EXPECT_FALSE(fs::exists(Extractor::target_dir(chromium_linux(), OUT) + ".extracting"));
}

TEST_F(ExtractorTest, ExistingTargetIsKept) {
    const std::string target = Extractor::target_dir(chromium_linux(), OUT);
    fs::create_directories(target);
    {
        std::ofstream out(fs::path(target) / "chrome");
        out << "already here";
    }

    // The archive is not opened when the browser directory exists.
    std::string result = Extractor::extract(chromium_linux(), OUT + "/missing.zip", OUT);
    EXPECT_TRUE(fs::equivalent(result, target));
    EXPECT_EQ(read_file(fs::path(target) / "chrome"), "already here");
}

TEST_F(ExtractorTest, CancelStopsUnpacking) {
    const std::string zip = OUT + "/chromium-98.0.4758.102-linux-x86_64.zip";
    write_archive(zip, {{"chrome-linux/chrome", "ELF chrome"}});

    auto cancel = std::make_shared<std::atomic<bool>>(true);
    EXPECT_THROW(Extractor::extract(chromium_linux(), zip, OUT, cancel), FetchError);
    EXPECT_FALSE(fs::exists(Extractor::target_dir(chromium_linux(), OUT)));
}

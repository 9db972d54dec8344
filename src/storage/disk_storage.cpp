#include "disk_storage.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include "../core/logger/logger.hpp"

namespace Fetchium {
namespace Storage {

using Fetchium::Core::Logger;
namespace fs = std::filesystem;

DiskStorage::DiskStorage(const std::string& base_path) : base_path_(base_path) {
    if (!base_path_.empty()) {
        std::error_code ec;
        fs::create_directories(base_path_, ec);
        if (ec)
            Logger::error("Failed to create storage directory: " + base_path_ + " (" + ec.message() + ")");
    }
}

std::string DiskStorage::path(const std::string& key) const {
    return (fs::path(base_path_) / key).string();
}

std::optional<std::string> DiskStorage::load(const std::string& key) {
    std::ifstream file(path(key), std::ios::binary);
    if (!file.is_open())
        return std::nullopt;

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        Logger::warn("Read Error: " + path(key));
        return std::nullopt;
    }
    return content;
}

bool DiskStorage::save(const std::string& key, const std::string& content) {
    fs::path        target(path(key));
    fs::path        temp = target;
    std::error_code ec;
    temp += ".tmp";

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            Logger::error("FS Error: " + ec.message() + " creating " + target.parent_path().string());
            return false;
        }
    }

    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            Logger::error("Write Error: " + temp.string());
            return false;
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file) {
            Logger::error("Write Error: " + temp.string());
            file.close();
            fs::remove(temp, ec);
            return false;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        Logger::error("FS Error: " + ec.message() + " replacing " + target.string());
        std::error_code ignored;
        fs::remove(temp, ignored);
        return false;
    }
    return true;
}

bool DiskStorage::remove(const std::string& key) {
    std::error_code ec;
    fs::remove(path(key), ec);
    if (ec) {
        Logger::error("FS Error: " + ec.message() + " removing " + path(key));
        return false;
    }
    return true;
}

}  // namespace Storage
}  // namespace Fetchium

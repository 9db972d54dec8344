#include "file_lock.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <stdexcept>
#include <sys/file.h>
#include <unistd.h>

namespace Fetchium {
namespace Storage {

FileLock::FileLock(const std::string& lock_path, Mode mode) {
    std::filesystem::path p(lock_path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }

    fd_ = ::open(lock_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd_ < 0)
        throw std::runtime_error("cannot open lock file " + lock_path + ": " + std::strerror(errno));

    int op = mode == Mode::Shared ? LOCK_SH : LOCK_EX;
    while (::flock(fd_, op) != 0) {
        if (errno == EINTR)
            continue;
        int err = errno;
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("cannot lock " + lock_path + ": " + std::strerror(err));
    }
}

FileLock::~FileLock() {
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
    }
}

}  // namespace Storage
}  // namespace Fetchium

#pragma once
#include <string>

namespace Fetchium {
namespace Storage {

/**
 * @brief Advisory lock on a sidecar file, held for the object's lifetime.
 *
 * Blocks until acquired. Throws std::runtime_error if the lock file cannot be
 * opened or locked.
 */
class FileLock {
public:
    enum class Mode { Shared, Exclusive };

    explicit FileLock(const std::string& lock_path, Mode mode = Mode::Exclusive);
    ~FileLock();

    FileLock(const FileLock&)            = delete;
    FileLock& operator=(const FileLock&) = delete;

private:
    int fd_ = -1;
};

}  // namespace Storage
}  // namespace Fetchium

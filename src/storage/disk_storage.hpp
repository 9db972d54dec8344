#pragma once
#include <string>
#include "storage.hpp"

namespace Fetchium {
namespace Storage {

class DiskStorage : public Storage {
public:
    explicit DiskStorage(const std::string& base_path);
    ~DiskStorage() override = default;

    std::optional<std::string> load(const std::string& key) override;
    bool                       save(const std::string& key, const std::string& content) override;
    bool                       remove(const std::string& key) override;
    std::string                path(const std::string& key) const override;

    const std::string& base_path() const { return base_path_; }

private:
    std::string base_path_;
};

}  // namespace Storage
}  // namespace Fetchium

#pragma once
#include <optional>
#include <string>

namespace Fetchium {
namespace Storage {

// Named text documents. Failures are reported, never thrown.
class Storage {
public:
    virtual ~Storage() = default;

    // nullopt when the document is missing or unreadable.
    virtual std::optional<std::string> load(const std::string& key) = 0;
    // Replaces the document; readers never observe a partial write.
    virtual bool save(const std::string& key, const std::string& content) = 0;
    virtual bool remove(const std::string& key)                            = 0;
    virtual std::string path(const std::string& key) const                 = 0;
};

}  // namespace Storage
}  // namespace Fetchium

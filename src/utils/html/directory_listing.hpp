#pragma once
#include <string>
#include <vector>

namespace Fetchium {
namespace Utils {
namespace Html {

/**
 * @brief Entries of an HTTP server's directory index page.
 *
 * Returns the href of every anchor in document order, trimmed. Anchors without
 * an href, in-page fragments and column sort links ("?C=N;O=D") are skipped.
 * Commented-out markup is ignored.
 */
class DirectoryListing {
public:
    static std::vector<std::string> entries(const std::string& html);
};

}  // namespace Html
}  // namespace Utils
}  // namespace Fetchium

#include "directory_listing.hpp"
#include <gumbo.h>
#include <memory>
#include "../text/string_utils.hpp"

namespace Fetchium {
namespace Utils {
namespace Html {

namespace {

struct GumboOutputDeleter {
    void operator()(GumboOutput* output) const noexcept {
        if (output)
            gumbo_destroy_output(&kGumboDefaultOptions, output);
    }
};

bool is_entry(const std::string& href) {
    return !href.empty() && href.front() != '#' && href.front() != '?';
}

}  // namespace

std::vector<std::string> DirectoryListing::entries(const std::string& html) {
    std::vector<std::string> found;
    if (html.empty())
        return found;

    std::unique_ptr<GumboOutput, GumboOutputDeleter> doc(gumbo_parse_with_options(
        &kGumboDefaultOptions, html.data(), html.size()));
    if (!doc)
        return found;

    // Iterative depth-first walk in document order.
    std::vector<const GumboNode*> pending{doc->root};
    while (!pending.empty()) {
        const GumboNode* node = pending.back();
        pending.pop_back();
        if (node->type != GUMBO_NODE_ELEMENT)
            continue;

        const GumboElement& element = node->v.element;
        if (element.tag == GUMBO_TAG_A) {
            const GumboAttribute* href = gumbo_get_attribute(&element.attributes, "href");
            if (href) {
                std::string target = Text::trim(href->value);
                if (is_entry(target))
                    found.push_back(std::move(target));
            }
        }

        for (unsigned int i = element.children.length; i > 0; --i)
            pending.push_back(static_cast<const GumboNode*>(element.children.data[i - 1]));
    }
    return found;
}

}  // namespace Html
}  // namespace Utils
}  // namespace Fetchium

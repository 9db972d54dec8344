#include "version.hpp"
#include <algorithm>
#include <cctype>
#include "../core/types/constants.hpp"
#include "../utils/text/string_utils.hpp"

namespace Fetchium {
namespace Resolver {

using namespace Fetchium::Utils;

Version Version::parse(const std::string& text) {
    Version     v;
    std::string s = Text::trim(text);
    size_t      i = 0;

    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        std::uint64_t n = 0;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            n = n * 10 + static_cast<std::uint64_t>(s[i] - '0');
            ++i;
        }
        v.components.push_back(n);
        if (i + 1 < s.size() && s[i] == '.' && std::isdigit(static_cast<unsigned char>(s[i + 1])))
            ++i;
        else
            break;
    }
    v.qualifier = s.substr(i);
    return v;
}

int Version::compare(const Version& other) const {
    size_t n = std::max(components.size(), other.components.size());
    for (size_t i = 0; i < n; ++i) {
        std::uint64_t a = i < components.size() ? components[i] : 0;
        std::uint64_t b = i < other.components.size() ? other.components[i] : 0;
        if (a != b)
            return a < b ? -1 : 1;
    }
    if (qualifier.empty() != other.qualifier.empty())
        return qualifier.empty() ? 1 : -1;
    int q = qualifier.compare(other.qualifier);
    return q < 0 ? -1 : (q > 0 ? 1 : 0);
}

bool is_latest(const std::string& spec) {
    return Text::to_lower(Text::trim(spec)) == Core::Constants::LATEST;
}

bool matches(const std::string& spec, const std::string& full_version) {
    if (spec.empty())
        return false;
    if (spec == full_version)
        return true;
    if (!Text::starts_with(full_version, spec) || spec.back() == '.')
        return false;
    char next = full_version[spec.size()];
    return !std::isdigit(static_cast<unsigned char>(next));
}

std::vector<Index::Candidate> rank_matches(const std::string&                   spec,
                                           const std::vector<Index::Candidate>& candidates) {
    std::vector<Index::Candidate> ranked;
    const std::string             wanted = Text::trim(spec);

    if (is_latest(wanted)) {
        ranked = candidates;
    }
    else {
        for (const auto& c : candidates) {
            if (c.full_version == wanted)
                ranked.push_back(c);
        }
        if (ranked.empty()) {
            for (const auto& c : candidates) {
                if (matches(wanted, c.full_version))
                    ranked.push_back(c);
            }
        }
    }

    // Release lines ("115.0.3") go before qualified lines ("115.25.0esr") unless the request names a qualifier.
    const bool plain_first = is_latest(wanted) || Version::parse(wanted).qualifier.empty();

    std::stable_sort(ranked.begin(), ranked.end(), [plain_first](const Index::Candidate& a, const Index::Candidate& b) {
        Version va = Version::parse(a.full_version);
        Version vb = Version::parse(b.full_version);
        if (plain_first && va.qualifier.empty() != vb.qualifier.empty())
            return va.qualifier.empty();
        int cmp = va.compare(vb);
        if (cmp != 0)
            return cmp > 0;
        return a.published > b.published;
    });
    return ranked;
}

}  // namespace Resolver
}  // namespace Fetchium

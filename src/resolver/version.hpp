#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "../index/version_index_client.hpp"

namespace Fetchium {
namespace Resolver {

/**
 * @brief Dotted version split into numeric components and a trailing qualifier.
 *
 * "115.3.1esr" -> {115, 3, 1} + "esr". Missing components compare as zero,
 * so "98.0" == "98.0.0". A version without qualifier ranks above the same
 * numbers with one.
 */
struct Version {
    std::vector<std::uint64_t> components;
    std::string                qualifier;

    static Version parse(const std::string& text);

    int compare(const Version& other) const;
};

// "latest" in any letter case, surrounding blanks ignored.
bool is_latest(const std::string& spec);

// Exact string match, or spec is a leading component prefix ("98" matches "98.0.1" but not "980.1").
bool matches(const std::string& spec, const std::string& full_version);

/**
 * @brief Candidates matching spec, best first.
 *
 * "latest" admits every candidate. If some candidate equals spec exactly only
 * exact matches are kept. Unless spec carries a qualifier itself, unqualified
 * versions come first. Within that, order is descending by version, then by
 * publish time.
 */
std::vector<Index::Candidate> rank_matches(const std::string& spec, const std::vector<Index::Candidate>& candidates);

}  // namespace Resolver
}  // namespace Fetchium

#pragma once

#include <string>
#include <vector>

namespace Fetchium {
namespace Utils {
namespace Text {

std::string              trim(const std::string& str);
std::string              to_lower(const std::string& str);
bool                     starts_with(const std::string& str, const std::string& prefix);
bool                     ends_with(const std::string& str, const std::string& suffix);
bool                     is_digits(const std::string& str);
std::vector<std::string> split(const std::string& str, char delimiter);

}  // namespace Text
}  // namespace Utils
}  // namespace Fetchium

#pragma once

#include <string>
#include <vector>

namespace Strider {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
bool        starts_with(const std::string& str, const std::string& prefix);
bool        ends_with(const std::string& str, const std::string& suffix);
bool        icontains(const std::string& haystack, const std::string& needle);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

}  // namespace Text
}  // namespace Utils
}  // namespace Strider

#include "string_utils.hpp"
#include <algorithm>
#include <cctype>

namespace Strider {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string to_lower(const std::string& str) {
    std::string lower = str;
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string& str, const std::string& suffix) {
    if (suffix.size() > str.size())
        return false;
    return std::equal(suffix.rbegin(), suffix.rend(), str.rbegin());
}

bool icontains(const std::string& haystack, const std::string& needle) {
    if (needle.empty())
        return true;
    auto it = std::search(
        haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char c1, char c2) {
            return std::tolower(static_cast<unsigned char>(c1))
                   == std::tolower(static_cast<unsigned char>(c2));
        });
    return it != haystack.end();
}

std::string join(const std::vector<std::string>& parts, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += separator;
        out += parts[i];
    }
    return out;
}

}  // namespace Text
}  // namespace Utils
}  // namespace Strider

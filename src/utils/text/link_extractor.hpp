#pragma once
#include <string>
#include <vector>

namespace Strider {
namespace Utils {
namespace Text {

class LinkExtractor {
public:
    // Raw href values of every <a> element, in document order. Values are not
    // resolved or validated.
    static std::vector<std::string> extract(const std::string& html);
};

}  // namespace Text
}  // namespace Utils
}  // namespace Strider

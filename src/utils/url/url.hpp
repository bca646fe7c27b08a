#pragma once
#include <string>

namespace Strider {
namespace Utils {

struct UrlParsed {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
    std::string query;
    std::string fragment;
};

class Url {
public:
    static UrlParsed   parse(const std::string& url);
    static std::string resolve(const std::string& base, const std::string& relative);

    // Canonical key used for deduplication:
    //  - scheme and host lowercased, trailing host dot dropped
    //  - default port removed (http:80, https:443)
    //  - dot segments resolved, empty segments and trailing slash removed ("/" stays)
    //  - percent escapes uppercased, fragment removed, empty query removed
    // Throws InvalidUrl unless the input is an absolute http(s) URL with a host.
    static std::string normalize(const std::string& raw);

    // Prefixes https:// to input without a scheme ("example.com/a").
    static std::string ensure_scheme(const std::string& url);

    static std::string to_flat_filename(const std::string& url);
};

}  // namespace Utils
}  // namespace Strider

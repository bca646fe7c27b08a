#include "url.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <vector>
#include "strider/errors.hpp"
#include "../text/string_utils.hpp"

namespace Strider {
namespace Utils {

namespace {

constexpr const char* FORBIDDEN_HOST_CHARS = " <>\"\\^`{|}";

bool is_scheme_char(unsigned char c) {
    return std::isalnum(c) || c == '+' || c == '-' || c == '.';
}

std::string uppercase_escapes(const std::string& segment) {
    std::string out = segment;
    for (size_t i = 0; i + 2 < out.size(); ++i) {
        if (out[i] == '%' && std::isxdigit(static_cast<unsigned char>(out[i + 1]))
            && std::isxdigit(static_cast<unsigned char>(out[i + 2]))) {
            out[i + 1] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[i + 1])));
            out[i + 2] = static_cast<char>(std::toupper(static_cast<unsigned char>(out[i + 2])));
            i += 2;
        }
    }
    return out;
}

std::string normalize_path(const std::string& path) {
    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(uppercase_escapes(segment));
    }
    return "/" + Text::join(segments, "/");
}

}  // namespace

UrlParsed Url::parse(const std::string& url) {
    UrlParsed parsed;

    if (url.empty()) {
        parsed.path = "/";
        return parsed;
    }

    std::string_view sv = url;

    size_t colon       = sv.find(':');
    size_t first_slash = sv.find('/');
    size_t first_q     = sv.find('?');
    size_t first_h     = sv.find('#');
    bool   has_scheme  = (colon != std::string_view::npos);
    if (has_scheme && first_slash != std::string_view::npos && colon > first_slash)
        has_scheme = false;
    if (has_scheme && first_q != std::string_view::npos && colon > first_q)
        has_scheme = false;
    if (has_scheme && first_h != std::string_view::npos && colon > first_h)
        has_scheme = false;

    if (has_scheme) {
        parsed.scheme = std::string(sv.substr(0, colon));
        sv.remove_prefix(colon + 1);
    }

    if (sv.size() >= 2 && sv[0] == '/' && sv[1] == '/') {
        sv.remove_prefix(2);
        size_t      end_auth  = sv.find_first_of("/?#");
        std::string authority = std::string(sv.substr(0, end_auth));

        if (end_auth != std::string_view::npos) {
            sv.remove_prefix(end_auth);
        }
        else {
            sv = "";
        }

        if (!authority.empty()) {
            size_t      at = authority.find_last_of('@');
            std::string host_port =
                (at != std::string::npos) ? authority.substr(at + 1) : authority;

            if (!host_port.empty() && host_port[0] == '[') {
                size_t end_bracket = host_port.find(']');
                if (end_bracket != std::string::npos) {
                    parsed.host    = host_port.substr(0, end_bracket + 1);
                    size_t p_colon = host_port.find(':', end_bracket + 1);
                    if (p_colon != std::string::npos) {
                        parsed.port = host_port.substr(p_colon + 1);
                    }
                }
                else {
                    parsed.host = host_port;
                }
            }
            else {
                size_t p_colon = host_port.find_last_of(':');
                if (p_colon != std::string::npos) {
                    parsed.host = host_port.substr(0, p_colon);
                    parsed.port = host_port.substr(p_colon + 1);
                }
                else {
                    parsed.host = host_port;
                }
            }
        }
    }

    size_t h_pos = sv.find('#');
    if (h_pos != std::string_view::npos) {
        parsed.fragment = std::string(sv.substr(h_pos + 1));
        sv              = sv.substr(0, h_pos);
    }

    size_t q_pos = sv.find('?');
    if (q_pos != std::string_view::npos) {
        parsed.query = std::string(sv.substr(q_pos + 1));
        sv           = sv.substr(0, q_pos);
    }

    parsed.path = std::string(sv);

    if (parsed.path.empty())
        parsed.path = "/";
    return parsed;
}

std::string Url::resolve(const std::string& base, const std::string& relative) {
    if (relative.empty())
        return base;

    if (relative[0] == '#') {
        size_t frag = base.find('#');
        if (frag == std::string::npos)
            return base + relative;
        return base.substr(0, frag) + relative;
    }

    if (relative[0] == '?') {
        size_t q = base.find('?');
        size_t f = base.find('#');
        if (q != std::string::npos)
            return base.substr(0, q) + relative;
        if (f != std::string::npos)
            return base.substr(0, f) + relative;
        return base + relative;
    }

    // A scheme only counts when it precedes the first '/', '?' or '#', so
    // "/share?u=https://b.test/" stays relative.
    size_t colon_pos = relative.find(':');
    if (colon_pos != std::string::npos && colon_pos > 0
        && relative.find_first_of("/?#") > colon_pos
        && std::isalpha(static_cast<unsigned char>(relative[0]))
        && std::all_of(relative.begin(), relative.begin() + colon_pos, [](char c) {
               return is_scheme_char(static_cast<unsigned char>(c));
           })) {
        if (relative.compare(colon_pos + 1, 2, "//") == 0)
            return relative;
        // mailto:, javascript:, tel: and friends
        return "";
    }

    UrlParsed baseParsed = parse(base);
    if (baseParsed.scheme.empty() || baseParsed.host.empty())
        return "";

    if (relative.substr(0, 2) == "//") {
        return baseParsed.scheme + ":" + relative;
    }

    std::string auth = baseParsed.host;
    if (!baseParsed.port.empty())
        auth += ":" + baseParsed.port;

    std::string result;
    if (relative[0] == '/') {
        result = baseParsed.scheme + "://" + auth + relative;
    }
    else {
        std::string dir       = baseParsed.path;
        size_t      lastSlash = dir.find_last_of('/');
        if (lastSlash != std::string::npos) {
            dir = dir.substr(0, lastSlash + 1);
        }
        else {
            dir = "/";
        }
        result = baseParsed.scheme + "://" + auth + dir + relative;
    }

    size_t scheme_end = result.find("://");
    size_t domain_end = (scheme_end == std::string::npos) ? 0 : result.find('/', scheme_end + 3);
    if (domain_end == std::string::npos)
        domain_end = result.length();

    std::string path = result.substr(domain_end);
    std::string query_frag;
    size_t      qf = path.find_first_of("?#");
    if (qf != std::string::npos) {
        query_frag = path.substr(qf);
        path       = path.substr(0, qf);
    }

    std::vector<std::string> segments;
    std::stringstream        ss(path);
    std::string              segment;
    while (std::getline(ss, segment, '/')) {
        if (segment == "." || segment.empty())
            continue;
        if (segment == "..") {
            if (!segments.empty())
                segments.pop_back();
            continue;
        }
        segments.push_back(segment);
    }

    std::string normalized_path = "/" + Text::join(segments, "/");
    if (path.length() > 1 && path.back() == '/' && normalized_path.back() != '/') {
        normalized_path += "/";
    }

    return result.substr(0, domain_end) + normalized_path + query_frag;
}

std::string Url::normalize(const std::string& raw) {
    std::string url = Text::trim(raw);
    if (url.empty())
        throw InvalidUrl(raw, "empty");

    size_t colon = url.find(':');
    if (colon == std::string::npos || colon == 0)
        throw InvalidUrl(raw, "missing scheme");
    if (!std::isalpha(static_cast<unsigned char>(url[0])))
        throw InvalidUrl(raw, "malformed scheme");
    for (size_t i = 0; i < colon; ++i) {
        if (!is_scheme_char(static_cast<unsigned char>(url[i])))
            throw InvalidUrl(raw, "malformed scheme");
    }

    std::string scheme = Text::to_lower(url.substr(0, colon));
    if (scheme != "http" && scheme != "https")
        throw InvalidUrl(raw, "unsupported scheme '" + scheme + "'");
    if (url.compare(colon + 1, 2, "//") != 0)
        throw InvalidUrl(raw, "missing authority");

    std::string rest      = url.substr(colon + 3);
    size_t      end_auth  = rest.find_first_of("/?#");
    std::string authority = rest.substr(0, end_auth);
    std::string tail      = (end_auth == std::string::npos) ? "" : rest.substr(end_auth);

    std::string userinfo;
    size_t      at = authority.find_last_of('@');
    if (at != std::string::npos) {
        userinfo  = authority.substr(0, at + 1);
        authority = authority.substr(at + 1);
    }

    std::string host;
    std::string port;
    if (!authority.empty() && authority[0] == '[') {
        size_t end_bracket = authority.find(']');
        if (end_bracket == std::string::npos)
            throw InvalidUrl(raw, "unterminated IPv6 host");
        host              = authority.substr(0, end_bracket + 1);
        std::string after = authority.substr(end_bracket + 1);
        if (!after.empty()) {
            if (after[0] != ':')
                throw InvalidUrl(raw, "unexpected characters after host");
            port = after.substr(1);
        }
    }
    else {
        size_t p_colon = authority.find_last_of(':');
        if (p_colon != std::string::npos) {
            host = authority.substr(0, p_colon);
            port = authority.substr(p_colon + 1);
        }
        else {
            host = authority;
        }
        if (host.find_first_of(FORBIDDEN_HOST_CHARS) != std::string::npos)
            throw InvalidUrl(raw, "illegal character in host");
        for (unsigned char c : host) {
            if (std::iscntrl(c))
                throw InvalidUrl(raw, "illegal character in host");
        }
    }

    host = Text::to_lower(host);
    if (!host.empty() && host.back() == '.')
        host.pop_back();
    if (host.empty() || host == "[]")
        throw InvalidUrl(raw, "missing host");
    if (host[0] != '[' && (host.front() == '.' || host.back() == '.'
                           || host.find("..") != std::string::npos))
        throw InvalidUrl(raw, "empty label in host");

    if (!port.empty()) {
        if (port.size() > 5)
            throw InvalidUrl(raw, "invalid port");
        for (unsigned char c : port) {
            if (!std::isdigit(c))
                throw InvalidUrl(raw, "invalid port");
        }
        int number = std::stoi(port);
        if (number < 1 || number > 65535)
            throw InvalidUrl(raw, "port out of range");
        port = std::to_string(number);
        if ((scheme == "http" && number == 80) || (scheme == "https" && number == 443))
            port.clear();
    }

    size_t hash = tail.find('#');
    if (hash != std::string::npos)
        tail.resize(hash);

    std::string query;
    size_t      q = tail.find('?');
    if (q != std::string::npos) {
        query = tail.substr(q + 1);
        tail.resize(q);
    }

    std::string key = scheme + "://" + userinfo + host;
    if (!port.empty())
        key += ":" + port;
    key += normalize_path(tail);
    if (!query.empty())
        key += "?" + query;
    return key;
}

std::string Url::ensure_scheme(const std::string& url) {
    std::string trimmed = Text::trim(url);
    if (trimmed.empty() || trimmed.find("://") != std::string::npos)
        return trimmed;
    if (Text::starts_with(trimmed, "//"))
        return "https:" + trimmed;
    return "https://" + trimmed;
}

std::string Url::to_flat_filename(const std::string& url) {
    UrlParsed   p    = parse(url);
    std::string path = p.host;
    if (!p.port.empty())
        path += "_" + p.port;
    path += p.path;
    if (!p.query.empty())
        path += "_" + p.query;

    for (char& c : path) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!(std::isalnum(u) || c == '.' || c == '-' || u >= 0x80))
            c = '_';
    }

    if (!Text::ends_with(path, ".html")) {
        path += ".html";
    }

    return path;
}

}  // namespace Utils
}  // namespace Strider

#pragma once
#include <iostream>
#include <string>
#include <vector>
#include "config.hpp"

namespace Strider {
namespace Core {

class SeedLoader {
public:
    // Non-empty lines that do not start with '#', trimmed.
    static std::vector<std::string> read_lines(std::istream& in);

    // Seeds from config.urls and config.url_file ('-' reads `in`), with a scheme
    // added where missing, normalized and deduplicated in input order. Invalid
    // entries are logged and skipped. Throws ConfigError when the file is
    // missing or empty, or when no valid seed remains.
    static std::vector<std::string> load(const Config& config, std::istream& in = std::cin);
};

}  // namespace Core
}  // namespace Strider

#include "seeds.hpp"
#include <fstream>
#include <unordered_set>
#include "strider/errors.hpp"
#include "../logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"
#include "../../utils/url/url.hpp"

namespace Strider {
namespace Core {

std::vector<std::string> SeedLoader::read_lines(std::istream& in) {
    std::vector<std::string> lines;
    std::string              line;
    while (std::getline(in, line)) {
        line = Utils::Text::trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::string> SeedLoader::load(const Config& config, std::istream& in) {
    std::vector<std::string> candidates = config.urls;

    if (!config.url_file.empty()) {
        std::vector<std::string> lines;
        if (config.url_file == "-") {
            lines = read_lines(in);
        }
        else {
            std::ifstream file(config.url_file);
            if (!file.is_open())
                throw ConfigError("URL file not found: " + config.url_file);
            lines = read_lines(file);
        }
        if (lines.empty())
            throw ConfigError("URL file is empty: " + config.url_file);
        candidates.insert(candidates.end(), lines.begin(), lines.end());
    }

    if (candidates.empty())
        throw ConfigError("no seed URLs given");

    std::vector<std::string>        seeds;
    std::unordered_set<std::string> seen;
    for (const auto& candidate : candidates) {
        try {
            std::string key = Utils::Url::normalize(Utils::Url::ensure_scheme(candidate));
            if (seen.insert(key).second)
                seeds.push_back(key);
        } catch (const InvalidUrl& e) {
            Logger::warn(std::string("Ignoring seed. ") + e.what());
        }
    }

    if (seeds.empty())
        throw ConfigError("no valid seed URLs");
    return seeds;
}

}  // namespace Core
}  // namespace Strider

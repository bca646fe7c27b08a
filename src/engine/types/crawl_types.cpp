#include "crawl_types.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace Strider {
namespace Engine {

const char* to_string(CrawlState state) {
    switch (state) {
        case CrawlState::Seeding: return "seeding";
        case CrawlState::Running: return "running";
        case CrawlState::Draining: return "draining";
        case CrawlState::Completed: return "completed";
        case CrawlState::Aborted: return "aborted";
        case CrawlState::Paused: return "paused";
    }
    return "unknown";
}

const char* to_string(FetchOutcome outcome) {
    switch (outcome) {
        case FetchOutcome::Success: return "success";
        case FetchOutcome::Timeout: return "timeout";
        case FetchOutcome::TransportError: return "transport_error";
    }
    return "unknown";
}

Fingerprint Fingerprint::make(std::vector<std::string> seed_keys, int max_depth, double percentage) {
    std::sort(seed_keys.begin(), seed_keys.end());
    seed_keys.erase(std::unique(seed_keys.begin(), seed_keys.end()), seed_keys.end());
    return Fingerprint{std::move(seed_keys), max_depth, percentage};
}

std::optional<std::string> Fingerprint::mismatch(const Fingerprint& other) const {
    if (max_depth != other.max_depth) {
        return "depth " + std::to_string(max_depth) + " vs " + std::to_string(other.max_depth);
    }
    if (std::fabs(percentage - other.percentage) > 1e-9) {
        std::ostringstream out;
        out << "percentage " << percentage << " vs " << other.percentage;
        return out.str();
    }
    if (seeds != other.seeds) {
        return "seed URLs differ (" + std::to_string(seeds.size()) + " vs "
               + std::to_string(other.seeds.size()) + " seeds)";
    }
    return std::nullopt;
}

}  // namespace Engine
}  // namespace Strider

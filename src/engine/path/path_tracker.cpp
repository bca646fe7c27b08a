#include "path_tracker.hpp"
#include <algorithm>

namespace Strider {
namespace Engine {

void PathTracker::consider(const std::string& key, int length) {
    if (!longest_tail_ || length > longest_length_) {
        longest_length_ = length;
        longest_tail_   = key;
    }
}

int PathTracker::record(const std::string& key, const std::optional<std::string>& parent) {
    auto existing = states_.find(key);
    if (existing != states_.end())
        return existing->second.chain_length;

    PathState state;
    if (parent) {
        auto it            = states_.find(*parent);
        state.chain_length = (it != states_.end() ? it->second.chain_length : 0) + 1;
        state.predecessor  = parent;
    }

    int length = state.chain_length;
    states_.emplace(key, std::move(state));
    consider(key, length);
    return length;
}

std::optional<PathState> PathTracker::state(const std::string& key) const {
    auto it = states_.find(key);
    if (it == states_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> PathTracker::longest_chain() const {
    std::vector<std::string> chain;
    if (!longest_tail_)
        return chain;

    std::optional<std::string> cursor = longest_tail_;
    while (cursor && chain.size() <= states_.size()) {
        chain.push_back(*cursor);
        auto it = states_.find(*cursor);
        if (it == states_.end())
            break;
        cursor = it->second.predecessor;
    }
    std::reverse(chain.begin(), chain.end());
    return chain;
}

std::vector<PathRecord> PathTracker::records() const {
    std::vector<PathRecord> out;
    out.reserve(states_.size());
    for (const auto& [key, state] : states_) {
        out.push_back(PathRecord{key, state});
    }
    return out;
}

void PathTracker::restore(const std::vector<PathRecord>& records) {
    for (const auto& record : records) {
        states_.emplace(record.key, record.state);
        consider(record.key, record.state.chain_length);
    }
}

}  // namespace Engine
}  // namespace Strider

#pragma once
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "../types/crawl_types.hpp"

namespace Strider {
namespace Engine {

// Exfiltration mode: chain length of every first-claimed key and the longest
// chain seen. The recorded predecessor is the first discoverer, so lengths are
// first-discovery-wins rather than shortest paths. Not synchronized.
class PathTracker {
public:
    // Seeds pass no parent and get length 0. Returns the recorded length; a key
    // that is already tracked keeps its first state.
    int record(const std::string& key, const std::optional<std::string>& parent);

    std::optional<PathState> state(const std::string& key) const;

    int longest_length() const {
        return longest_length_;
    }

    // Keys from the seed to the tail of the longest chain, empty before any record.
    std::vector<std::string> longest_chain() const;

    std::vector<PathRecord> records() const;
    void                    restore(const std::vector<PathRecord>& records);

private:
    std::unordered_map<std::string, PathState> states_;
    int                                        longest_length_ = 0;
    std::optional<std::string>                 longest_tail_;

    void consider(const std::string& key, int length);
};

}  // namespace Engine
}  // namespace Strider

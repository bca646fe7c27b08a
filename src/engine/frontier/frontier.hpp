#pragma once
#include <deque>
#include <optional>
#include <vector>
#include "../types/crawl_types.hpp"

namespace Strider {
namespace Engine {

// FIFO work queue bounded by depth. Not synchronized; the Coordinator owns it.
class Frontier {
public:
    explicit Frontier(int max_depth);

    // No-op returning false when entry.depth exceeds the maximum.
    bool                         push(FrontierEntry entry);
    std::optional<FrontierEntry> pop();

    bool   empty() const;
    size_t size() const;
    int    max_depth() const {
        return max_depth_;
    }

    std::vector<FrontierEntry> entries() const;

private:
    int                       max_depth_;
    std::deque<FrontierEntry> queue_;
};

}  // namespace Engine
}  // namespace Strider

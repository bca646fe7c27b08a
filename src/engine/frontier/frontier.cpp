#include "frontier.hpp"

namespace Strider {
namespace Engine {

Frontier::Frontier(int max_depth) : max_depth_(max_depth) {
}

bool Frontier::push(FrontierEntry entry) {
    if (entry.depth < 0 || entry.depth > max_depth_)
        return false;
    queue_.push_back(std::move(entry));
    return true;
}

std::optional<FrontierEntry> Frontier::pop() {
    if (queue_.empty())
        return std::nullopt;
    FrontierEntry entry = std::move(queue_.front());
    queue_.pop_front();
    return entry;
}

bool Frontier::empty() const {
    return queue_.empty();
}

size_t Frontier::size() const {
    return queue_.size();
}

std::vector<FrontierEntry> Frontier::entries() const {
    return std::vector<FrontierEntry>(queue_.begin(), queue_.end());
}

}  // namespace Engine
}  // namespace Strider

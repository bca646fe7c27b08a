#include "visited_set.hpp"
#include <algorithm>
#include <chrono>

namespace Strider {
namespace Engine {

int64_t VisitedSet::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

bool VisitedSet::try_claim(const std::string& key, int depth) {
    int64_t                     seen = now_ms();
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.emplace(key, Entry{seen, depth}).second;
}

bool VisitedSet::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(key) > 0;
}

size_t VisitedSet::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::vector<VisitedRecord> VisitedSet::records() const {
    std::vector<VisitedRecord> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out.reserve(entries_.size());
        for (const auto& [key, entry] : entries_) {
            out.push_back(VisitedRecord{key, entry.first_seen_ms, entry.depth});
        }
    }
    std::sort(out.begin(), out.end(), [](const VisitedRecord& a, const VisitedRecord& b) {
        if (a.first_seen_ms != b.first_seen_ms)
            return a.first_seen_ms < b.first_seen_ms;
        return a.key < b.key;
    });
    return out;
}

void VisitedSet::restore(const std::vector<VisitedRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records) {
        entries_.emplace(record.key, Entry{record.first_seen_ms, record.depth});
    }
}

}  // namespace Engine
}  // namespace Strider

#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "../types/crawl_types.hpp"

namespace Strider {
namespace Engine {

// Exact deduplication ledger. Entries live for the whole crawl.
class VisitedSet {
public:
    VisitedSet() = default;

    // Records key and returns true only if it was not present. Concurrent calls
    // for the same key yield exactly one true.
    bool try_claim(const std::string& key, int depth);

    bool   contains(const std::string& key) const;
    size_t size() const;

    std::vector<VisitedRecord> records() const;
    void                       restore(const std::vector<VisitedRecord>& records);

private:
    struct Entry {
        int64_t first_seen_ms;
        int     depth;
    };

    std::unordered_map<std::string, Entry> entries_;
    mutable std::mutex                     mutex_;

    static int64_t now_ms();
};

}  // namespace Engine
}  // namespace Strider

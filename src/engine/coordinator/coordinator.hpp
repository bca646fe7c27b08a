#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "../frontier/frontier.hpp"
#include "../path/path_tracker.hpp"
#include "../sampler/link_sampler.hpp"
#include "../types/crawl_types.hpp"
#include "../visited/visited_set.hpp"

namespace Strider {
namespace Engine {

struct CoordinatorOptions {
    int      max_depth   = 1;
    double   percentage  = 100.0;
    uint64_t sample_seed = 0;
    bool     exfiltrate  = false;
};

struct CrawlSummary {
    CrawlState               state              = CrawlState::Seeding;
    size_t                   visited            = 0;
    size_t                   pages_fetched      = 0;
    size_t                   failures           = 0;
    size_t                   frontier_remaining = 0;
    size_t                   in_flight          = 0;
    size_t                   invalid_links      = 0;
    size_t                   keyword_hits       = 0;
    int                      longest_path       = 0;
    std::vector<std::string> longest_chain;
};

// Owns every piece of mutable crawl state. Workers never touch the frontier or
// the visited set directly: they take work with next() and hand results back
// with submit(). All operations are serialized by one mutex.
class Coordinator {
public:
    explicit Coordinator(const CoordinatorOptions&      options,
                         std::optional<Snapshot> resume = std::nullopt);

    // Normalizes, claims and queues seeds at depth 0, then enters Running.
    // Invalid seeds are logged and skipped. Returns the number newly queued.
    size_t seed(const std::vector<std::string>& urls);

    // Next entry to fetch, marked in flight. Empty when the frontier is empty
    // or the crawl was cancelled.
    std::optional<FrontierEntry> next();

    // Single intake point for fetch results. Results arriving after cancel()
    // are dropped and their entries stay in flight.
    void submit(const FrontierEntry& entry, const FetchResult& result);

    // Frontier empty and nothing in flight.
    bool drained() const;

    void cancel();
    void abort();
    bool cancelled() const;

    CrawlState   state() const;
    CrawlSummary summary() const;
    Snapshot     snapshot(const Fingerprint& fingerprint) const;

    std::vector<PageRecord>    pages() const;
    std::vector<FailureRecord> failures() const;
    std::vector<VisitedRecord> visited() const;
    bool                       is_visited(const std::string& key) const;
    size_t                     in_flight() const;

    const CoordinatorOptions& options() const {
        return options_;
    }

private:
    CoordinatorOptions options_;
    Frontier           frontier_;
    VisitedSet         visited_;
    LinkSampler        sampler_;
    PathTracker        paths_;

    std::unordered_map<std::string, FrontierEntry> in_flight_;
    std::vector<FailureRecord>                     failures_;
    std::vector<PageRecord>                        pages_;
    size_t                                         invalid_links_ = 0;
    CrawlState                                     state_         = CrawlState::Seeding;
    bool                                           cancelled_     = false;

    mutable std::mutex mutex_;

    void   rehydrate(const Snapshot& snapshot);
    bool   enqueue(const std::string& key, int depth, const std::optional<std::string>& parent);
    size_t admit_links(const FrontierEntry& parent, const std::vector<std::string>& links);
    void   update_state();
};

}  // namespace Engine
}  // namespace Strider

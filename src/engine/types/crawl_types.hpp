#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Strider {
namespace Engine {

struct FrontierEntry {
    std::string                url;
    int                        depth = 0;
    std::optional<std::string> parent;
};

struct VisitedRecord {
    std::string key;
    int64_t     first_seen_ms = 0;
    int         depth         = 0;
};

struct PathState {
    int                        chain_length = 0;
    std::optional<std::string> predecessor;
};

struct PathRecord {
    std::string key;
    PathState   state;
};

enum class FetchOutcome { Success, Timeout, TransportError };

struct FetchResult {
    FetchOutcome             outcome = FetchOutcome::Success;
    long                     status  = 0;
    std::string              error;
    std::vector<std::string> links;  // absolute, not yet normalized
    double                   elapsed_ms  = 0.0;
    bool                     keyword_hit = false;
};

struct FailureRecord {
    std::string url;
    int         depth = 0;
    std::string reason;
};

struct PageRecord {
    std::string                url;
    int                        depth = 0;
    std::optional<std::string> parent;
    FetchOutcome               outcome        = FetchOutcome::Success;
    long                       status         = 0;
    double                     elapsed_ms     = 0.0;
    bool                       keyword_hit    = false;
    size_t                     links_found    = 0;
    size_t                     links_admitted = 0;
};

enum class CrawlState { Seeding, Running, Draining, Completed, Aborted, Paused };

const char* to_string(CrawlState state);
const char* to_string(FetchOutcome outcome);

// Identifies the invocation a snapshot belongs to.
struct Fingerprint {
    std::vector<std::string> seeds;  // normalized, sorted, unique
    int                      max_depth  = 0;
    double                   percentage = 0.0;

    static Fingerprint make(std::vector<std::string> seed_keys, int max_depth, double percentage);

    // Human readable description of the first difference, or nullopt when equal.
    std::optional<std::string> mismatch(const Fingerprint& other) const;
};

struct Snapshot {
    Fingerprint                fingerprint;
    std::vector<VisitedRecord> visited;
    std::vector<FrontierEntry> frontier;
    std::vector<PathRecord>    paths;
    std::vector<FailureRecord> failures;
    std::vector<PageRecord>    pages;
};

}  // namespace Engine
}  // namespace Strider

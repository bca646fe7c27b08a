#include "coordinator.hpp"
#include <algorithm>
#include "strider/errors.hpp"
#include "../../core/logger/logger.hpp"
#include "../../utils/url/url.hpp"

namespace Strider {
namespace Engine {

using Core::Logger;
using Utils::Url;

Coordinator::Coordinator(const CoordinatorOptions& options, std::optional<Snapshot> resume)
    : options_(options),
      frontier_(options.max_depth),
      sampler_(options.percentage, options.sample_seed) {
    if (resume) {
        rehydrate(*resume);
    }
}

void Coordinator::rehydrate(const Snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    visited_.restore(snapshot.visited);
    for (const auto& entry : snapshot.frontier) {
        if (!frontier_.push(entry)) {
            Logger::warn("Snapshot entry beyond depth limit dropped: " + entry.url);
        }
    }
    if (options_.exfiltrate) {
        paths_.restore(snapshot.paths);
    }
    failures_ = snapshot.failures;
    pages_    = snapshot.pages;
    Logger::info("Resumed: " + std::to_string(snapshot.visited.size()) + " visited, "
                 + std::to_string(frontier_.size()) + " queued.");
}

bool Coordinator::enqueue(const std::string&                key,
                          int                               depth,
                          const std::optional<std::string>& parent) {
    if (depth > frontier_.max_depth())
        return false;
    if (!visited_.try_claim(key, depth))
        return false;

    frontier_.push(FrontierEntry{key, depth, parent});
    if (options_.exfiltrate) {
        paths_.record(key, parent);
    }
    return true;
}

size_t Coordinator::seed(const std::vector<std::string>& urls) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t                      queued = 0;
    for (const auto& url : urls) {
        try {
            std::string key = Url::normalize(url);
            if (enqueue(key, 0, std::nullopt)) {
                ++queued;
                Logger::debug("Seed queued: " + key);
            }
            else {
                Logger::debug("Seed already claimed: " + key);
            }
        } catch (const InvalidUrl& e) {
            ++invalid_links_;
            Logger::warn(std::string("Skipping seed. ") + e.what());
        }
    }
    state_ = CrawlState::Running;
    update_state();
    return queued;
}

std::optional<FrontierEntry> Coordinator::next() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_)
        return std::nullopt;

    auto entry = frontier_.pop();
    if (!entry) {
        update_state();
        return std::nullopt;
    }

    in_flight_.emplace(entry->url, *entry);
    update_state();
    return entry;
}

size_t Coordinator::admit_links(const FrontierEntry&            parent,
                                const std::vector<std::string>& links) {
    if (links.empty() || parent.depth + 1 > frontier_.max_depth())
        return 0;

    size_t admitted = 0;
    for (const auto& link : sampler_.admit(links)) {
        std::string key;
        try {
            key = Url::normalize(link);
        } catch (const InvalidUrl& e) {
            ++invalid_links_;
            Logger::debug(std::string("Dropped link. ") + e.what());
            continue;
        }
        if (enqueue(key, parent.depth + 1, parent.url))
            ++admitted;
    }
    return admitted;
}

void Coordinator::submit(const FrontierEntry& entry, const FetchResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        Logger::debug("Discarding result after cancellation: " + entry.url);
        return;
    }

    auto it = in_flight_.find(entry.url);
    if (it == in_flight_.end()) {
        Logger::warn("Result for an entry that is not in flight: " + entry.url);
        return;
    }
    in_flight_.erase(it);

    PageRecord page;
    page.url         = entry.url;
    page.depth       = entry.depth;
    page.parent      = entry.parent;
    page.outcome     = result.outcome;
    page.status      = result.status;
    page.elapsed_ms  = result.elapsed_ms;
    page.keyword_hit = result.keyword_hit;
    page.links_found = result.links.size();

    switch (result.outcome) {
        case FetchOutcome::Timeout:
            failures_.push_back(FailureRecord{
                entry.url, entry.depth, result.error.empty() ? "timeout" : result.error});
            break;
        case FetchOutcome::TransportError:
            failures_.push_back(FailureRecord{
                entry.url,
                entry.depth,
                result.error.empty() ? "transport error" : result.error});
            break;
        case FetchOutcome::Success:
            if (result.status < 200 || result.status >= 300) {
                failures_.push_back(
                    FailureRecord{entry.url, entry.depth, "HTTP " + std::to_string(result.status)});
            }
            else {
                page.links_admitted = admit_links(entry, result.links);
            }
            break;
    }

    pages_.push_back(std::move(page));
    update_state();
}

void Coordinator::update_state() {
    if (cancelled_ || state_ == CrawlState::Seeding || state_ == CrawlState::Aborted
        || state_ == CrawlState::Completed)
        return;

    if (!frontier_.empty()) {
        state_ = CrawlState::Running;
    }
    else if (!in_flight_.empty()) {
        state_ = CrawlState::Draining;
    }
    else {
        state_ = CrawlState::Completed;
    }
}

bool Coordinator::drained() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frontier_.empty() && in_flight_.empty();
}

void Coordinator::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_ || state_ == CrawlState::Completed || state_ == CrawlState::Aborted)
        return;
    cancelled_ = true;
    state_     = CrawlState::Paused;
}

void Coordinator::abort() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
    state_     = CrawlState::Aborted;
}

bool Coordinator::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

CrawlState Coordinator::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CrawlSummary Coordinator::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CrawlSummary                summary;
    summary.state              = state_;
    summary.visited            = visited_.size();
    summary.pages_fetched      = pages_.size();
    summary.failures           = failures_.size();
    summary.frontier_remaining = frontier_.size();
    summary.in_flight          = in_flight_.size();
    summary.invalid_links      = invalid_links_;
    summary.keyword_hits       = static_cast<size_t>(std::count_if(
        pages_.begin(), pages_.end(), [](const PageRecord& p) { return p.keyword_hit; }));
    if (options_.exfiltrate) {
        summary.longest_path  = paths_.longest_length();
        summary.longest_chain = paths_.longest_chain();
    }
    return summary;
}

Snapshot Coordinator::snapshot(const Fingerprint& fingerprint) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Snapshot                    snapshot;
    snapshot.fingerprint = fingerprint;
    snapshot.visited     = visited_.records();

    // In-flight entries go back to the head of the queue so a resume refetches them.
    for (const auto& [url, entry] : in_flight_) {
        snapshot.frontier.push_back(entry);
    }
    std::sort(snapshot.frontier.begin(),
              snapshot.frontier.end(),
              [](const FrontierEntry& a, const FrontierEntry& b) {
                  if (a.depth != b.depth)
                      return a.depth < b.depth;
                  return a.url < b.url;
              });
    for (auto& entry : frontier_.entries()) {
        snapshot.frontier.push_back(std::move(entry));
    }

    if (options_.exfiltrate) {
        snapshot.paths = paths_.records();
    }
    snapshot.failures = failures_;
    snapshot.pages    = pages_;
    return snapshot;
}

std::vector<PageRecord> Coordinator::pages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pages_;
}

std::vector<FailureRecord> Coordinator::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

std::vector<VisitedRecord> Coordinator::visited() const {
    return visited_.records();
}

bool Coordinator::is_visited(const std::string& key) const {
    return visited_.contains(key);
}

size_t Coordinator::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

}  // namespace Engine
}  // namespace Strider

#pragma once
#include <atomic>
#include <utility>
#include <boost/asio.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "strider/http_client.hpp"
#include "../../core/types/constants.hpp"
#include "../../storage/disk_storage.hpp"
#include "../../storage/snapshot_store.hpp"
#include "../coordinator/coordinator.hpp"
#include "../types/crawl_types.hpp"

class CrawlerTest_ConfigMapping_Test;
class CrawlerTest_RoundRobinUserAgents_Test;

namespace Strider {
namespace Engine {

using namespace Strider::Core;
using namespace Strider::Network::Http;

struct CrawlerConfig {
    std::vector<std::string> seeds;  // normalized
    int                      max_depth   = Constants::DEFAULT_DEPTH;
    double                   percentage  = Constants::DEFAULT_PERCENTAGE;
    uint64_t                 sample_seed = 0;
    bool                     exfiltrate  = false;

    int threads        = Constants::DEFAULT_THREADS;
    int connections    = Constants::DEFAULT_CONNECTIONS;
    int worker_threads = Constants::DEFAULT_WORKER_THREADS;

    int                      timeout_seconds  = Constants::DEFAULT_TIMEOUT_SECONDS;
    bool                     follow_redirects = true;
    bool                     search_links     = true;
    std::vector<std::string> user_agents      = get_default_user_agents();
    std::string              backend          = Constants::DEFAULT_BACKEND;
    int                      max_retries      = Constants::DEFAULT_MAX_RETRIES;

    std::string output_dir = Constants::DEFAULT_OUTPUT_DIR;
    std::string report_path;  // empty = no report
    bool        resume              = false;
    int         checkpoint_interval = Constants::DEFAULT_CHECKPOINT_SECS;
    std::string keyword;
    bool        save_pages = false;
};

// Builds the transport for one worker. Called once per worker coroutine.
using ClientFactory = std::function<std::unique_ptr<HttpClient>(boost::asio::io_context&)>;

class Crawler {
#ifndef CPPCHECK
    friend class ::CrawlerTest_ConfigMapping_Test;
    friend class ::CrawlerTest_RoundRobinUserAgents_Test;
#endif

public:
    explicit Crawler(const CrawlerConfig& config, ClientFactory client_factory = nullptr);
    ~Crawler();

    // Crawls until the frontier is empty with nothing in flight, or until stop()
    // or a signal interrupts it. Throws IncompatibleSnapshot when resuming
    // against a snapshot of another invocation.
    CrawlSummary run();

    // Pause request; safe from any thread, including worker coroutines.
    void stop();
    void shutdown();
    void trigger_done();

    const Coordinator* coordinator() const {
        return coordinator_.get();
    }

#ifdef CPPCHECK
public:
#else
private:
#endif
    std::vector<std::string> seeds_;
    int                      max_depth_;
    double                   percentage_;
    uint64_t                 sample_seed_;
    bool                     exfiltrate_;
    int                      num_threads_;
    int                      num_connections_;
    int                      num_worker_threads_;
    int                      timeout_seconds_;
    bool                     follow_redirects_;
    bool                     search_links_;
    std::vector<std::string> user_agents_;
    std::string              backend_;
    int                      max_retries_;
    std::string              output_dir_;
    std::string              report_path_;
    bool                     resume_;
    int                      checkpoint_interval_;
    std::string              keyword_;
    bool                     save_pages_;
    ClientFactory            client_factory_;

    std::unique_ptr<boost::asio::thread_pool> blocking_pool_;  // curl backend only

    boost::asio::io_context ioc_;
    std::unique_ptr<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
                             work_guard_;
    std::vector<std::thread> io_threads_;
    boost::asio::thread_pool worker_pool_;
    boost::asio::signal_set  signals_{ioc_};

    std::unique_ptr<Coordinator>              coordinator_;
    Fingerprint                               fingerprint_;
    std::shared_ptr<Storage::DiskStorage>     storage_;
    std::unique_ptr<Storage::DiskStorage>     page_storage_;
    std::unique_ptr<Storage::SnapshotStore>   snapshots_;
    std::chrono::steady_clock::time_point     started_at_;

    std::atomic<int>        live_workers_{0};
    std::atomic<bool>       checkpoint_running_{false};
    std::atomic<uint64_t>   user_agent_counter_{0};
    std::atomic<bool>       done_{false};
    std::condition_variable done_cv_;
    std::mutex              done_mutex_;
    std::atomic<bool>       is_shutdown_{false};

    void init_storage();
    void init_io_services();
    void init_signals();
    void spawn_workers();
    void await_completion();
    CrawlSummary finish();

    std::optional<Snapshot>     load_resume_snapshot();
    std::unique_ptr<HttpClient> create_client();
    const std::string&          next_user_agent();
    bool                        should_stop_worker();

    boost::asio::awaitable<void>        worker_loop();
    boost::asio::awaitable<FetchResult> fetch_page(HttpClient& client, const FrontierEntry& entry);
    boost::asio::awaitable<void>        checkpoint_loop();

    void process_body(const FrontierEntry& entry, const Response& res, FetchResult& result);
    void save_page(const std::string& url, std::string content);

    void schedule_checkpoint();
    void write_checkpoint();
    void write_report(const CrawlSummary& summary);
};

}  // namespace Engine
}  // namespace Strider

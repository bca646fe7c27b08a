#include "strider/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../crawler.hpp"

namespace Strider {
namespace Engine {

Crawler::~Crawler() {
    shutdown();
}

CrawlSummary Crawler::run() {
    done_ = false;

    init_storage();

    CoordinatorOptions options;
    options.max_depth   = max_depth_;
    options.percentage  = percentage_;
    options.sample_seed = sample_seed_;
    options.exfiltrate  = exfiltrate_;

    coordinator_ = std::make_unique<Coordinator>(options, load_resume_snapshot());
    size_t queued = coordinator_->seed(seeds_);
    Logger::info("Crawler: " + std::to_string(queued) + " seed(s) queued, max depth "
                 + std::to_string(max_depth_) + ", following "
                 + std::to_string(static_cast<int>(percentage_)) + "% of links");

    started_at_ = std::chrono::steady_clock::now();

    if (!coordinator_->drained()) {
        init_io_services();
        init_signals();
        spawn_workers();
        Logger::info("Crawler: Workers spawned, awaiting completion...");
        await_completion();
    }
    shutdown();
    return finish();
}

void Crawler::init_storage() {
    storage_   = std::make_shared<Storage::DiskStorage>(output_dir_);
    snapshots_ = std::make_unique<Storage::SnapshotStore>(storage_, Constants::SNAPSHOT_FILE);
    if (save_pages_) {
        page_storage_ = std::make_unique<Storage::DiskStorage>(
            storage_->path_for(Constants::PAGES_DIR).string());
    }
}

std::optional<Snapshot> Crawler::load_resume_snapshot() {
    if (!resume_) {
        if (snapshots_->exists())
            Logger::warn("Existing snapshot will be overwritten. Use --resume to continue it.");
        return std::nullopt;
    }
    return snapshots_->load_if_resuming(fingerprint_);
}

void Crawler::init_io_services() {
    if (ioc_.stopped())
        ioc_.restart();
    work_guard_ =
        std::make_unique<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
            ioc_.get_executor());
    for (int i = 0; i < num_threads_; ++i) {
        io_threads_.emplace_back([this]() {
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                Logger::error("IO Thread Exception: " + std::string(e.what()));
                coordinator_->abort();
                trigger_done();
            }
        });
    }
    if (backend_ == "curl" && !client_factory_) {
        blocking_pool_ = std::make_unique<boost::asio::thread_pool>(num_connections_);
    }
    Logger::info("Started " + std::to_string(num_threads_) + " IO threads.");
    Logger::info("Concurrency: " + std::to_string(num_connections_) + " connections, "
                 + std::to_string(num_worker_threads_) + " disk threads.");
}

void Crawler::await_completion() {
    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_.load(); });
}

void Crawler::trigger_done() {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

void Crawler::stop() {
    if (coordinator_)
        coordinator_->cancel();
    trigger_done();
}

void Crawler::init_signals() {
    signals_.clear();
    signals_.add(SIGINT);
    signals_.add(SIGTERM);
    signals_.async_wait([this](const boost::system::error_code& error, int signal_number) {
        if (!error) {
            Logger::warn("Signal " + std::to_string(signal_number)
                         + " received. Pausing crawl...");
            stop();
        }
    });
}

void Crawler::spawn_workers() {
    live_workers_ = num_connections_;
    for (int i = 0; i < num_connections_; ++i) {
        boost::asio::co_spawn(ioc_, worker_loop(), boost::asio::detached);
    }
    if (checkpoint_interval_ > 0) {
        boost::asio::co_spawn(ioc_, checkpoint_loop(), boost::asio::detached);
    }
}

void Crawler::shutdown() {
    if (is_shutdown_.exchange(true))
        return;

    done_ = true;
    Logger::debug("Shutting down resources...");

    boost::system::error_code ec;
    signals_.cancel(ec);

    work_guard_.reset();
    ioc_.stop();

    for (auto& t : io_threads_) {
        if (t.get_id() == std::this_thread::get_id())
            continue;
        if (t.joinable())
            t.join();
    }
    io_threads_.clear();

    if (blocking_pool_) {
        blocking_pool_->stop();
        blocking_pool_->join();
    }

    // Pending page saves and checkpoint writes run to completion.
    worker_pool_.join();
}

CrawlSummary Crawler::finish() {
    CrawlState state = coordinator_->state();

    if (state == CrawlState::Completed) {
        snapshots_->discard();
        Logger::success("Crawl completed.");
    }
    else {
        write_checkpoint();
        Logger::warn(std::string("Crawl ") + to_string(state)
                     + ". Run again with --resume to continue.");
    }

    CrawlSummary summary = coordinator_->summary();
    write_report(summary);
    return summary;
}

}  // namespace Engine
}  // namespace Strider

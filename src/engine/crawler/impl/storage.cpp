#include <utility>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include "strider/errors.hpp"
#include "../../../core/logger/logger.hpp"
#include "../../../storage/report_writer.hpp"
#include "../../../utils/url/url.hpp"
#include "../crawler.hpp"

namespace Strider {
namespace Engine {

void Crawler::save_page(const std::string& url, std::string content) {
    if (!page_storage_)
        return;

    boost::asio::post(worker_pool_, [this, url, content = std::move(content)]() {
        if (page_storage_->save(Utils::Url::to_flat_filename(url), content))
            Logger::debug("Saved page: " + url);
    });
}

boost::asio::awaitable<void> Crawler::checkpoint_loop() {
    boost::asio::steady_timer timer(ioc_);
    while (!done_) {
        timer.expires_after(std::chrono::seconds(checkpoint_interval_));
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        if (ec || done_ || coordinator_->cancelled())
            co_return;
        schedule_checkpoint();
    }
}

void Crawler::schedule_checkpoint() {
    if (checkpoint_running_.exchange(true)) {
        Logger::debug("Checkpoint still being written, skipping this one.");
        return;
    }

    Snapshot snapshot = coordinator_->snapshot(fingerprint_);
    boost::asio::post(worker_pool_, [this, snapshot = std::move(snapshot)]() {
        try {
            snapshots_->checkpoint(snapshot);
        } catch (const StorageError& e) {
            Logger::error(e.what());
        }
        checkpoint_running_ = false;
    });
}

void Crawler::write_checkpoint() {
    try {
        Snapshot snapshot = coordinator_->snapshot(fingerprint_);
        snapshots_->checkpoint(snapshot);
        Logger::info("Checkpoint saved to " + storage_->path_for(Constants::SNAPSHOT_FILE).string()
                     + " (" + std::to_string(snapshot.frontier.size()) + " entries pending).");
    } catch (const StorageError& e) {
        Logger::error(e.what());
    }
}

void Crawler::write_report(const CrawlSummary& summary) {
    if (report_path_.empty())
        return;

    Storage::CrawlReport report;
    report.summary         = summary;
    report.pages           = coordinator_->pages();
    report.failures        = coordinator_->failures();
    report.visited         = coordinator_->visited();
    report.elapsed_seconds = std::chrono::duration<double>(
                                 std::chrono::steady_clock::now() - started_at_)
                                 .count();
    report.exfiltrate = exfiltrate_;
    report.keyword    = keyword_;

    try {
        Storage::ReportWriter::write(report_path_, report);
        Logger::success("Report written: " + report_path_);
    } catch (const StorageError& e) {
        Logger::error(e.what());
    }
}

}  // namespace Engine
}  // namespace Strider

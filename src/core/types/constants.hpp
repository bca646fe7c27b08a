#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace Strider {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_DEPTH           = 1;
    static constexpr double      DEFAULT_PERCENTAGE      = 100.0;
    static constexpr int         DEFAULT_CONNECTIONS     = 10;   // In-flight fetches
    static constexpr int         DEFAULT_THREADS         = 2;    // IO Threads
    static constexpr int         DEFAULT_WORKER_THREADS  = 1;    // Disk Threads
    static constexpr int         DEFAULT_TIMEOUT_SECONDS = 10;
    static constexpr int         DEFAULT_CHECKPOINT_SECS = 30;
    static constexpr int         DEFAULT_MAX_RETRIES     = 0;
    static constexpr const char* DEFAULT_OUTPUT_DIR      = "output";
    static constexpr const char* DEFAULT_BACKEND         = "beast";
    static constexpr const char* DEFAULT_LOG_LEVEL       = "info";
    static constexpr const char* VERSION                 = "0.3.0";

    static constexpr int         MAX_CONNECTIONS = 10000;
    static constexpr int         MAX_REDIRECTS   = 5;
    static constexpr const char* USER_AGENT      = "Strider-Crawler/0.3";

    static constexpr const char* SNAPSHOT_FILE = "crawl.snapshot";
    static constexpr const char* REPORT_FILE   = "crawl_report.yaml";
    static constexpr const char* LOG_FILE      = "crawler.log";
    static constexpr const char* PAGES_DIR     = "pages";
};

inline const std::vector<std::string>& get_default_user_agents() {
    static const std::vector<std::string> agents = {
        Constants::USER_AGENT,
        "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
        "Chrome/91.0.4472.124 Safari/537.36",
        "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like "
        "Gecko) Version/14.1.1 Safari/605.1.15"};
    return agents;
}

inline std::chrono::milliseconds get_backoff_time(int attempt) {
    if (attempt <= 0)
        return std::chrono::milliseconds(0);
    return std::chrono::milliseconds(1000 * (1 << (attempt - 1)));
}

}  // namespace Core
}  // namespace Strider

#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "../types/constants.hpp"

namespace Strider {
namespace Core {

struct Config {
    std::vector<std::string> urls;
    std::string              url_file;
    double                   percentage = Constants::DEFAULT_PERCENTAGE;
    bool                     exfiltrate = false;
    int                      depth      = Constants::DEFAULT_DEPTH;

    int connections    = Constants::DEFAULT_CONNECTIONS;
    int threads        = Constants::DEFAULT_THREADS;
    int worker_threads = Constants::DEFAULT_WORKER_THREADS;

    std::string output;  // report path, empty = <output_dir>/crawl_report.yaml
    std::string output_dir = Constants::DEFAULT_OUTPUT_DIR;
    std::string config_path;

    int                      timeout          = Constants::DEFAULT_TIMEOUT_SECONDS;  // seconds
    bool                     follow_redirects = true;
    bool                     search_links     = true;
    std::vector<std::string> user_agents      = get_default_user_agents();
    std::string              user_agent;  // overrides the rotation when set
    std::string              backend   = Constants::DEFAULT_BACKEND;
    std::string              log_level = Constants::DEFAULT_LOG_LEVEL;

    bool        resume              = false;
    int         checkpoint_interval = Constants::DEFAULT_CHECKPOINT_SECS;  // seconds, 0 = off
    std::string keyword;
    uint64_t    sample_seed = 0;
    bool        save_pages  = false;
    int         max_retries = Constants::DEFAULT_MAX_RETRIES;

    bool show_help = false;

    // CLI first, then the YAML file named by --config, then the CLI again so that
    // command-line values win. Throws ConfigError on any invalid input.
    static Config parse(int argc, char* argv[]);

    void validate() const;

    std::string              report_path() const;
    std::vector<std::string> effective_user_agents() const;
};

void load_yaml(Config& config, const std::string& path);

}  // namespace Core
}  // namespace Strider

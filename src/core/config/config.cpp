#include "config.hpp"
#include <CLI/CLI.hpp>
#include <cmath>
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include "strider/errors.hpp"
#include "../logger/logger.hpp"
#include "../../utils/text/string_utils.hpp"

namespace Strider {
namespace Core {

void load_yaml(Config& config, const std::string& path) {
    try {
        YAML::Node yaml = YAML::LoadFile(path);
        if (yaml["url"])
            config.urls.push_back(yaml["url"].as<std::string>());
        if (yaml["urls"] && yaml["urls"].IsSequence()) {
            for (const auto& node : yaml["urls"])
                config.urls.push_back(node.as<std::string>());
        }
        if (yaml["url_file"])
            config.url_file = yaml["url_file"].as<std::string>();
        if (yaml["percentage"])
            config.percentage = yaml["percentage"].as<double>();
        if (yaml["exfiltrate"])
            config.exfiltrate = yaml["exfiltrate"].as<bool>();
        if (yaml["depth"])
            config.depth = yaml["depth"].as<int>();
        if (yaml["max_depth"])
            config.depth = yaml["max_depth"].as<int>();
        if (yaml["connections"])
            config.connections = yaml["connections"].as<int>();
        if (yaml["threads"])
            config.threads = yaml["threads"].as<int>();
        if (yaml["worker_threads"])
            config.worker_threads = yaml["worker_threads"].as<int>();
        if (yaml["output"])
            config.output = yaml["output"].as<std::string>();
        if (yaml["output_dir"])
            config.output_dir = yaml["output_dir"].as<std::string>();
        if (yaml["timeout"])
            config.timeout = yaml["timeout"].as<int>();
        if (yaml["follow_redirects"])
            config.follow_redirects = yaml["follow_redirects"].as<bool>();
        if (yaml["search_links"])
            config.search_links = yaml["search_links"].as<bool>();
        if (yaml["user_agent"])
            config.user_agent = yaml["user_agent"].as<std::string>();
        if (yaml["backend"])
            config.backend = yaml["backend"].as<std::string>();
        if (yaml["log_level"])
            config.log_level = yaml["log_level"].as<std::string>();
        if (yaml["resume"])
            config.resume = yaml["resume"].as<bool>();
        if (yaml["checkpoint_interval"])
            config.checkpoint_interval = yaml["checkpoint_interval"].as<int>();
        if (yaml["keyword"])
            config.keyword = yaml["keyword"].as<std::string>();
        if (yaml["sample_seed"])
            config.sample_seed = yaml["sample_seed"].as<uint64_t>();
        if (yaml["save_pages"])
            config.save_pages = yaml["save_pages"].as<bool>();
        if (yaml["max_retries"])
            config.max_retries = yaml["max_retries"].as<int>();

        if (yaml["user_agents"]) {
            if (!yaml["user_agents"].IsSequence())
                throw ConfigError("user_agents must be a sequence");
            config.user_agents.clear();
            for (const auto& node : yaml["user_agents"])
                config.user_agents.push_back(node.as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("cannot read " + path + ": " + std::string(e.what()));
    }
}

Config Config::parse(int argc, char* argv[]) {
    Config   config;
    CLI::App app{"Strider - resumable, depth-bounded web crawler"};
    app.set_version_flag("--version", Constants::VERSION);

    app.add_option("urls,-u,--url", config.urls, "Seed URLs");
    app.add_option("-f,--url-file", config.url_file, "File with one URL per line, '-' for stdin");
    app.add_option("-p,--percentage", config.percentage, "Percentage of links followed per page")
        ->check(CLI::Range(0.0, 100.0));
    app.add_flag("-x,--exfiltrate", config.exfiltrate, "Track the longest chain of unique links");
    app.add_option("-d,--depth", config.depth, "Maximum crawl depth")
        ->check(CLI::NonNegativeNumber);
    app.add_option("-c,--connections", config.connections, "Concurrent fetches")
        ->check(CLI::Range(1, Constants::MAX_CONNECTIONS));
    app.add_option("-t,--threads", config.threads, "IO threads")->check(CLI::PositiveNumber);
    app.add_option("--worker-threads", config.worker_threads, "Disk threads")
        ->check(CLI::PositiveNumber);
    app.add_option("-o,--output", config.output, "Report file path");
    app.add_option("--output-dir", config.output_dir, "Directory for snapshot, log and pages");
    app.add_option("--timeout", config.timeout, "Seconds per fetch")->check(CLI::PositiveNumber);
    app.add_flag("--follow-redirects,!--no-follow-redirects",
                 config.follow_redirects,
                 "Follow HTTP redirects");
    app.add_flag("--search-links,!--no-search-links",
                 config.search_links,
                 "Extract and follow links from fetched pages");
    app.add_option("-A,--user-agent", config.user_agent, "Use a single user agent");
    app.add_option("--log-level", config.log_level, "none, error, warn, info, debug");
    app.add_flag("--resume", config.resume, "Resume from the snapshot in the output directory");
    app.add_option("--checkpoint-interval", config.checkpoint_interval, "Seconds, 0 disables")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--keyword", config.keyword, "Flag pages containing this keyword");
    app.add_option("--sample-seed", config.sample_seed, "Link sampler seed, 0 = random");
    app.add_flag("--save-pages", config.save_pages, "Store fetched bodies in the output directory");
    app.add_option("--backend", config.backend, "HTTP backend")
        ->check(CLI::IsMember({"beast", "curl"}));
    app.add_option("--max-retries", config.max_retries, "Retries after a failed fetch")
        ->check(CLI::NonNegativeNumber);
    app.add_option("--config", config.config_path, "Path to YAML configuration file");

    try {
        app.parse(argc, argv);
    } catch (const CLI::Success& e) {
        app.exit(e);
        config.show_help = true;
        return config;
    } catch (const CLI::ParseError& e) {
        throw ConfigError(e.what());
    }

    if (!config.config_path.empty()) {
        load_yaml(config, config.config_path);

        try {
            app.parse(argc, argv);
        } catch (const CLI::ParseError& e) {
            throw ConfigError(e.what());
        }
    }

    config.validate();
    return config;
}

void Config::validate() const {
    if (depth < 0)
        throw ConfigError("depth must be >= 0");
    if (std::isnan(percentage) || percentage < 0.0 || percentage > 100.0)
        throw ConfigError("percentage must be within 0-100");
    if (connections < 1 || connections > Constants::MAX_CONNECTIONS)
        throw ConfigError("connections must be within 1-"
                          + std::to_string(Constants::MAX_CONNECTIONS));
    if (threads < 1)
        throw ConfigError("threads must be >= 1");
    if (worker_threads < 1)
        throw ConfigError("worker_threads must be >= 1");
    if (timeout < 1)
        throw ConfigError("timeout must be >= 1 second");
    if (checkpoint_interval < 0)
        throw ConfigError("checkpoint_interval must be >= 0");
    if (max_retries < 0)
        throw ConfigError("max_retries must be >= 0");
    if (backend != "beast" && backend != "curl")
        throw ConfigError("unknown backend '" + backend + "'");
    if (output_dir.empty())
        throw ConfigError("output_dir must not be empty");
    if (effective_user_agents().empty())
        throw ConfigError("no user agent configured");
    Logger::parse_level(log_level);
}

std::string Config::report_path() const {
    if (!output.empty())
        return output;
    return (std::filesystem::path(output_dir) / Constants::REPORT_FILE).string();
}

std::vector<std::string> Config::effective_user_agents() const {
    if (!Utils::Text::trim(user_agent).empty())
        return {Utils::Text::trim(user_agent)};

    std::vector<std::string> agents;
    for (const auto& agent : user_agents) {
        std::string trimmed = Utils::Text::trim(agent);
        if (!trimmed.empty())
            agents.push_back(trimmed);
    }
    return agents;
}

}  // namespace Core
}  // namespace Strider

#include "report_writer.hpp"
#include <filesystem>
#include <yaml-cpp/yaml.h>
#include "disk_storage.hpp"

namespace Strider {
namespace Storage {

using namespace Strider::Engine;

std::string ReportWriter::render(const CrawlReport& report) {
    const auto&   s = report.summary;
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "summary" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "state" << YAML::Value << to_string(s.state);
    out << YAML::Key << "pages_fetched" << YAML::Value << s.pages_fetched;
    out << YAML::Key << "visited" << YAML::Value << s.visited;
    out << YAML::Key << "failures" << YAML::Value << s.failures;
    out << YAML::Key << "invalid_links" << YAML::Value << s.invalid_links;
    out << YAML::Key << "frontier_remaining" << YAML::Value << s.frontier_remaining + s.in_flight;
    out << YAML::Key << "elapsed_seconds" << YAML::Value << report.elapsed_seconds;
    out << YAML::EndMap;

    if (report.exfiltrate) {
        out << YAML::Key << "longest_path" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "length" << YAML::Value << s.longest_path;
        out << YAML::Key << "chain" << YAML::Value << YAML::BeginSeq;
        for (const auto& key : s.longest_chain)
            out << key;
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }

    if (!report.keyword.empty()) {
        out << YAML::Key << "keyword" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "term" << YAML::Value << report.keyword;
        out << YAML::Key << "matches" << YAML::Value << YAML::BeginSeq;
        for (const auto& page : report.pages) {
            if (page.keyword_hit)
                out << page.url;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }

    out << YAML::Key << "failed" << YAML::Value << YAML::BeginSeq;
    for (const auto& failure : report.failures) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "url" << YAML::Value << failure.url;
        out << YAML::Key << "depth" << YAML::Value << failure.depth;
        out << YAML::Key << "reason" << YAML::Value << failure.reason;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "pages" << YAML::Value << YAML::BeginSeq;
    for (const auto& page : report.pages) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "url" << YAML::Value << page.url;
        out << YAML::Key << "depth" << YAML::Value << page.depth;
        if (page.parent)
            out << YAML::Key << "parent" << YAML::Value << *page.parent;
        out << YAML::Key << "outcome" << YAML::Value << to_string(page.outcome);
        out << YAML::Key << "status" << YAML::Value << page.status;
        out << YAML::Key << "ms" << YAML::Value << static_cast<long long>(page.elapsed_ms);
        out << YAML::Key << "links" << YAML::Value << page.links_found;
        out << YAML::Key << "admitted" << YAML::Value << page.links_admitted;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "visited" << YAML::Value << YAML::BeginSeq;
    for (const auto& record : report.visited) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "url" << YAML::Value << record.key;
        out << YAML::Key << "depth" << YAML::Value << record.depth;
        out << YAML::Key << "first_seen_ms" << YAML::Value << record.first_seen_ms;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

void ReportWriter::write(const std::string& path, const CrawlReport& report) {
    std::filesystem::path target(path);
    std::string           dir = target.has_parent_path() ? target.parent_path().string() : ".";
    DiskStorage           storage(dir);
    storage.save_atomic(target.filename().string(), render(report));
}

}  // namespace Storage
}  // namespace Strider

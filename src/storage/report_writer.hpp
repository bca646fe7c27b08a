#pragma once
#include <string>
#include <vector>
#include "../engine/coordinator/coordinator.hpp"
#include "../engine/types/crawl_types.hpp"

namespace Strider {
namespace Storage {

struct CrawlReport {
    Engine::CrawlSummary               summary;
    std::vector<Engine::PageRecord>    pages;
    std::vector<Engine::FailureRecord> failures;
    std::vector<Engine::VisitedRecord> visited;
    double                             elapsed_seconds = 0.0;
    bool                               exfiltrate      = false;
    std::string                        keyword;
};

class ReportWriter {
public:
    static std::string render(const CrawlReport& report);

    // Writes the rendered report to path with atomic replace. Throws StorageError.
    static void write(const std::string& path, const CrawlReport& report);
};

}  // namespace Storage
}  // namespace Strider

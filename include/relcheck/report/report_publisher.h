#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <relcheck/config/app_config.h>
#include <relcheck/report/run_summary.h>

namespace relcheck::report {

inline constexpr const char* kReportPrefix = "relcheck_report_";

/// "relcheck_report_<runId>.json" / ".csv"
std::string reportFileName(const std::string& runId, config::ReportFormat format);

struct ReportEntry {
    std::filesystem::path path;
    std::string runId;
    config::ReportFormat format = config::ReportFormat::Json;
    std::filesystem::file_time_type modified{};
    std::uintmax_t size = 0;
};

/**
 * @brief Report files in @p dir, newest first.
 *
 * Only files following the relcheck_report_<runId>.<ext> naming are listed. A missing
 * directory yields an empty list.
 */
Result<std::vector<ReportEntry>> listReports(const std::filesystem::path& dir);

/// Read a JSON report written by ReportPublisher back into a summary.
Result<RunSummary> loadSummary(const std::filesystem::path& path);

/**
 * @brief Delete report files older than @p retentionDays.
 *
 * Best effort: individual failures are logged and skipped. 0 disables pruning.
 * @return number of files removed
 */
std::size_t pruneReports(const std::filesystem::path& dir, int retentionDays,
                         std::filesystem::file_time_type now =
                             std::filesystem::file_time_type::clock::now());

/**
 * @brief Writes the reports of a finished run and applies retention.
 */
class ReportPublisher {
public:
    explicit ReportPublisher(config::ReportConfig config,
                             nlohmann::json configSnapshot = nlohmann::json());

    /**
     * Write one file per configured format, each via temp file + rename, then prune
     * expired reports.
     * @return paths written, in format order
     */
    Result<std::vector<std::filesystem::path>> publish(const RunSummary& summary) const;

    const config::ReportConfig& config() const { return config_; }

private:
    config::ReportConfig config_;
    nlohmann::json configSnapshot_;
};

} // namespace relcheck::report

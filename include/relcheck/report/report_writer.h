#pragma once

#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include <relcheck/config/app_config.h>
#include <relcheck/report/run_summary.h>

namespace relcheck::report {

/// Column order of the CSV report.
inline constexpr const char* kCsvHeader =
    "test_id,category,query,outcome,rank,score,matched_id,duration_ms,message,error";

/**
 * Run configuration as recorded in the JSON report. API keys are never written,
 * only whether one was set.
 */
nlohmann::json configSnapshot(const config::AppConfig& cfg);

nlohmann::json caseResultToJson(const validation::CaseResult& result);

/// Full JSON report document; @p config is embedded verbatim under "config" when not null.
nlohmann::json summaryToJson(const RunSummary& summary,
                             const nlohmann::json& config = nlohmann::json());

/// Read a JSON report back. Counts are recomputed from the results.
Result<RunSummary> summaryFromJson(const nlohmann::json& doc);

std::string renderJson(const RunSummary& summary, const nlohmann::json& config = nlohmann::json());

/// One row per case under kCsvHeader, RFC 4180 quoting, CRLF line ends.
std::string renderCsv(const RunSummary& summary);

/// Quote a CSV field when it holds a comma, quote, CR or LF.
std::string csvEscape(std::string_view field);

} // namespace relcheck::report

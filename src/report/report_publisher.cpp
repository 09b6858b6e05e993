#include <relcheck/report/report_publisher.h>

#include <relcheck/core/file_utils.h>
#include <relcheck/report/report_writer.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace relcheck::report {

namespace fs = std::filesystem;

namespace {

const char* extensionFor(config::ReportFormat format) {
    return format == config::ReportFormat::Csv ? ".csv" : ".json";
}

// Split "relcheck_report_<runId>.<ext>"; false for anything else.
bool parseReportName(const fs::path& p, ReportEntry& entry) {
    const std::string name = p.filename().string();
    const std::string prefix = kReportPrefix;
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0)
        return false;
    const std::string ext = p.extension().string();
    if (ext == ".json")
        entry.format = config::ReportFormat::Json;
    else if (ext == ".csv")
        entry.format = config::ReportFormat::Csv;
    else
        return false;
    entry.runId = p.stem().string().substr(prefix.size());
    return !entry.runId.empty();
}

} // namespace

std::string reportFileName(const std::string& runId, config::ReportFormat format) {
    return std::string(kReportPrefix) + runId + extensionFor(format);
}

Result<std::vector<ReportEntry>> listReports(const fs::path& dir) {
    std::vector<ReportEntry> out;
    std::error_code ec;
    if (!fs::exists(dir, ec))
        return out;

    fs::directory_iterator it(dir, ec);
    if (ec) {
        return Error{ErrorCode::PermissionDenied,
                     "Cannot list " + dir.string() + ": " + ec.message()};
    }
    for (const auto& de : it) {
        if (!de.is_regular_file(ec))
            continue;
        ReportEntry entry;
        if (!parseReportName(de.path(), entry))
            continue;
        entry.path = de.path();
        entry.modified = de.last_write_time(ec);
        if (ec) {
            spdlog::debug("Skipping report {}: {}", de.path().string(), ec.message());
            continue;
        }
        entry.size = de.file_size(ec);
        if (ec)
            entry.size = 0;
        out.push_back(std::move(entry));
    }
    std::sort(out.begin(), out.end(), [](const ReportEntry& a, const ReportEntry& b) {
        if (a.modified != b.modified)
            return a.modified > b.modified;
        return a.path.filename() > b.path.filename();
    });
    return out;
}

Result<RunSummary> loadSummary(const fs::path& path) {
    auto content = readFile(path);
    if (!content)
        return content.error();
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(content.value());
    } catch (const nlohmann::json::exception& e) {
        return Error{ErrorCode::InvalidData, path.string() + ": " + e.what()};
    }
    return summaryFromJson(doc);
}

std::size_t pruneReports(const fs::path& dir, int retentionDays, fs::file_time_type now) {
    if (retentionDays <= 0)
        return 0;

    auto reports = listReports(dir);
    if (!reports) {
        spdlog::warn("Report retention skipped: {}", reports.error().message);
        return 0;
    }

    const auto cutoff = now - std::chrono::hours(24) * retentionDays;
    std::size_t removed = 0;
    for (const auto& entry : reports.value()) {
        if (entry.modified >= cutoff)
            continue;
        std::error_code ec;
        if (fs::remove(entry.path, ec)) {
            ++removed;
            spdlog::debug("Removed expired report {}", entry.path.string());
        } else if (ec) {
            spdlog::warn("Failed to remove expired report {}: {}", entry.path.string(),
                         ec.message());
        }
    }
    if (removed > 0)
        spdlog::info("Removed {} report(s) older than {} days", removed, retentionDays);
    return removed;
}

ReportPublisher::ReportPublisher(config::ReportConfig config, nlohmann::json configSnapshot)
    : config_(std::move(config)), configSnapshot_(std::move(configSnapshot)) {}

Result<std::vector<fs::path>> ReportPublisher::publish(const RunSummary& summary) const {
    std::vector<fs::path> written;
    for (auto format : config_.formats) {
        const auto path = config_.dir / reportFileName(summary.runId, format);
        const std::string content = format == config::ReportFormat::Csv
                                        ? renderCsv(summary)
                                        : renderJson(summary, configSnapshot_);
        auto ok = writeFileAtomic(path, content);
        if (!ok) {
            return ok.error();
        }
        spdlog::info("Report written: {}", path.string());
        written.push_back(path);
    }

    pruneReports(config_.dir, config_.retentionDays);
    return written;
}

} // namespace relcheck::report

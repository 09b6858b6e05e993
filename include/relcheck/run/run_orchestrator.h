#pragma once

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <vector>
#include <relcheck/config/app_config.h>
#include <relcheck/core/cancellation.h>
#include <relcheck/core/types.h>
#include <relcheck/ml/provider.h>
#include <relcheck/net/http_client.h>
#include <relcheck/registry/test_case.h>
#include <relcheck/report/report_publisher.h>
#include <relcheck/report/run_summary.h>
#include <relcheck/search/search_backend.h>
#include <relcheck/validation/case_result.h>

namespace relcheck::run {

/// Detail recorded for every case still outstanding when the run deadline passes.
inline constexpr const char* kRunTimeoutDetail = "run timeout exceeded";

struct PreflightReport {
    search::CollectionInfo collection;
    std::size_t embeddingDimension = 0;
};

struct RunOutcome {
    report::RunSummary summary;
    std::vector<std::filesystem::path> reports;
    PreflightReport preflight;

    report::RunStatus status() const { return summary.status(); }
};

/// Invoked from worker threads after each case is recorded.
using ProgressCallback =
    std::function<void(const validation::CaseResult& result, std::size_t done, std::size_t total)>;

/// Retry policy for the HTTP transport from the [run] settings.
net::RetryPolicy makeRetryPolicy(const config::RunSettings& run);

/**
 * Provider and backend wired from configuration. The HTTP client is shared by both.
 */
struct RunContext {
    std::shared_ptr<net::IHttpClient> http;
    std::unique_ptr<ml::IEmbeddingProvider> embedder;
    std::unique_ptr<search::ISearchBackend> backend;
};

/// Build the production context; @p http defaults to the libcurl client.
Result<RunContext> buildRunContext(const config::AppConfig& cfg,
                                   std::shared_ptr<net::IHttpClient> http = nullptr);

/**
 * @brief Sequences a validation run.
 *
 * preflight() checks the backend before any case runs; run() evaluates the cases on
 * a bounded Boost.Asio thread pool under a run deadline; execute() chains both and
 * publishes the reports.
 *
 * Fatal errors (Unauthorized, BackendUnavailable, DimensionMismatch, a tripped
 * failure monitor) cancel in-flight work and are returned without a summary. When
 * the deadline passes, outstanding cases are recorded as Error and the summary is
 * still returned.
 */
class RunOrchestrator {
public:
    RunOrchestrator(const config::AppConfig& cfg, ml::IEmbeddingProvider& embedder,
                    search::ISearchBackend& backend);

    Result<PreflightReport> preflight();

    Result<report::RunSummary> run(const std::vector<registry::TestCase>& cases,
                                   int concurrency, std::chrono::milliseconds runTimeout);

    /// run() with the configured concurrency and run timeout.
    Result<report::RunSummary> run(const std::vector<registry::TestCase>& cases);

    /// preflight, run, publish. @p publisher may be null to skip report files.
    Result<RunOutcome> execute(const std::vector<registry::TestCase>& cases,
                               const report::ReportPublisher* publisher,
                               bool runPreflight = true);

    /// Stop the current and any later run; outstanding cases are recorded as Error.
    void cancel(std::string reason = "cancelled by user");

    void setProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

private:
    const config::AppConfig& cfg_;
    ml::IEmbeddingProvider& embedder_;
    search::ISearchBackend& backend_;
    CancellationToken stop_;
    ProgressCallback progress_;
};

} // namespace relcheck::run

#include <relcheck/run/run_orchestrator.h>

#include <relcheck/registry/test_case_registry.h>
#include <relcheck/report/run_aggregator.h>
#include <relcheck/search/qdrant_backend.h>
#include <relcheck/validation/failure_monitor.h>
#include <relcheck/validation/validation_engine.h>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace relcheck::run {

namespace {

// Poll interval of the coordinating thread while waiting for workers.
constexpr auto kWaitSlice = std::chrono::milliseconds(50);

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

Error asUnavailable(const Error& err, const std::string& what) {
    if (isFatal(err.code))
        return err;
    return Error{ErrorCode::BackendUnavailable, what + ": " + err.message};
}

} // namespace

net::RetryPolicy makeRetryPolicy(const config::RunSettings& run) {
    net::RetryPolicy policy;
    policy.maxAttempts = std::max(0, run.maxRetries) + 1;
    policy.initialBackoff = run.retryBase;
    policy.maxBackoff = run.retryMax;
    return policy;
}

Result<RunContext> buildRunContext(const config::AppConfig& cfg,
                                   std::shared_ptr<net::IHttpClient> http) {
    RunContext ctx;
    ctx.http = http ? std::move(http) : std::shared_ptr<net::IHttpClient>(net::makeCurlHttpClient());
    const auto retry = makeRetryPolicy(cfg.run);

    auto embedder = ml::createEmbeddingProvider(ml::ProviderContext{cfg.embedding, ctx.http, retry});
    if (!embedder)
        return embedder.error();
    ctx.embedder = std::move(embedder).value();
    ctx.backend = search::makeQdrantBackend(cfg.backend, ctx.http, retry);
    return Result<RunContext>(std::move(ctx));
}

RunOrchestrator::RunOrchestrator(const config::AppConfig& cfg, ml::IEmbeddingProvider& embedder,
                                 search::ISearchBackend& backend)
    : cfg_(cfg), embedder_(embedder), backend_(backend) {}

void RunOrchestrator::cancel(std::string reason) {
    spdlog::warn("Run cancellation requested: {}", reason);
    stop_.cancel(std::move(reason));
}

Result<PreflightReport> RunOrchestrator::preflight() {
    const auto token = stop_.withTimeout(cfg_.run.testTimeout);

    if (auto health = backend_.healthCheck(token); !health) {
        return asUnavailable(health.error(), backend_.name());
    }

    auto info = backend_.getCollectionInfo(token);
    if (!info) {
        return asUnavailable(info.error(), "collection '" + cfg_.backend.collection + "'");
    }

    PreflightReport report;
    report.collection = info.value();
    report.embeddingDimension = embedder_.dimension();
    const auto vectorSize = report.collection.vectorSize;

    if (cfg_.backend.vectorSize != 0 && cfg_.backend.vectorSize != vectorSize) {
        return Error{ErrorCode::DimensionMismatch,
                     fmt::format("Collection '{}' stores {}-d vectors, configured vector_size is {}",
                                 cfg_.backend.collection, vectorSize, cfg_.backend.vectorSize)};
    }
    if (report.embeddingDimension != 0 && report.embeddingDimension != vectorSize) {
        return Error{ErrorCode::DimensionMismatch,
                     fmt::format("Embedding model {} produces {}-d vectors, collection '{}' "
                                 "stores {}-d vectors",
                                 embedder_.modelName(), report.embeddingDimension,
                                 cfg_.backend.collection, vectorSize)};
    }
    if (!cfg_.backend.distance.empty() &&
        lower(cfg_.backend.distance) != lower(report.collection.distance)) {
        return Error{ErrorCode::ConfigurationError,
                     fmt::format("Collection '{}' uses {} distance, configured {}",
                                 cfg_.backend.collection, report.collection.distance,
                                 cfg_.backend.distance)};
    }

    spdlog::info("Preflight ok: collection '{}' ({} points, {}-d, {}), status {}",
                 cfg_.backend.collection, report.collection.pointCount, vectorSize,
                 report.collection.distance, report.collection.status);
    return report;
}

Result<report::RunSummary> RunOrchestrator::run(const std::vector<registry::TestCase>& cases) {
    return run(cases, cfg_.run.concurrency,
               std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.run.runTimeout));
}

Result<report::RunSummary> RunOrchestrator::run(const std::vector<registry::TestCase>& cases,
                                                int concurrency,
                                                std::chrono::milliseconds runTimeout) {
    if (auto unique = registry::checkUniqueIds(cases); !unique) {
        return unique.error();
    }
    if (concurrency < 1) {
        return Error{ErrorCode::ConfigurationError, "concurrency must be >= 1"};
    }

    const auto startedAt = std::chrono::system_clock::now();
    const auto runId = report::generateRunId(startedAt);
    report::RunAggregator aggregator(runId, cases, startedAt);

    const validation::ValidationEngine engine(
        embedder_, backend_,
        validation::EngineSettings{
            cfg_.run.maxAllowedRank, cfg_.run.minScoreThreshold, cfg_.run.topK,
            std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.run.testTimeout)});
    validation::FailureMonitor monitor(validation::FailureMonitor::Config{
        static_cast<std::size_t>(std::max(0, cfg_.run.escalationThreshold)),
        cfg_.run.escalationWindow});

    auto runToken = stop_.withTimeout(runTimeout);

    std::mutex stateMutex;
    std::condition_variable stateCv;
    std::size_t finished = 0;
    std::optional<Error> fatal;

    auto abortRun = [&](Error err) {
        {
            std::lock_guard<std::mutex> lock(stateMutex);
            if (fatal)
                return;
            fatal = std::move(err);
        }
        runToken.cancel("aborted: " + fatal->message);
        stateCv.notify_all();
    };

    spdlog::info("Run {}: {} cases, concurrency {}, timeout {}s", runId, cases.size(),
                 concurrency,
                 std::chrono::duration_cast<std::chrono::seconds>(runTimeout).count());

    const auto workers =
        std::clamp<std::size_t>(cases.size(), 1, static_cast<std::size_t>(concurrency));
    boost::asio::thread_pool pool(workers);

    for (const auto& testCase : cases) {
        boost::asio::post(pool, [&, tc = &testCase]() {
            if (!runToken.isCancelled()) {
                auto evaluated = engine.evaluate(*tc, runToken);
                if (!evaluated) {
                    spdlog::error("[{}] fatal: {}", tc->id, evaluated.error().message);
                    abortRun(evaluated.error());
                } else {
                    const auto& result = evaluated.value();
                    if (result.outcome == validation::Outcome::Error && !runToken.isCancelled()) {
                        if (monitor.recordFailure()) {
                            abortRun(Error{ErrorCode::BackendUnavailable, monitor.describe()});
                        }
                    } else if (result.outcome != validation::Outcome::Error) {
                        monitor.recordSuccess();
                    }

                    auto recorded = aggregator.record(result);
                    if (!recorded) {
                        spdlog::debug("Ignoring result: {}", recorded.error().message);
                    } else if (progress_) {
                        progress_(result, aggregator.reportedCount(), cases.size());
                    }
                }
            }
            {
                std::lock_guard<std::mutex> lock(stateMutex);
                ++finished;
            }
            stateCv.notify_all();
        });
    }

    {
        std::unique_lock<std::mutex> lock(stateMutex);
        while (finished < cases.size() && !fatal && !runToken.isCancelled()) {
            stateCv.wait_for(lock, kWaitSlice);
        }
    }

    std::optional<Error> fatalError;
    {
        std::lock_guard<std::mutex> lock(stateMutex);
        fatalError = fatal;
    }
    if (fatalError) {
        pool.stop();
        pool.join();
        spdlog::error("Run {} aborted: {}", runId, fatalError->message);
        return *fatalError;
    }

    if (aggregator.reportedCount() < cases.size()) {
        const bool deadline = runToken.state() == CancellationToken::State::DeadlineExceeded;
        const std::string detail =
            deadline ? std::string(kRunTimeoutDetail) : "run cancelled: " + runToken.reason();
        const auto filled = aggregator.fillMissing(detail);
        spdlog::warn("Run {}: {} of {} cases recorded as error ({})", runId, filled,
                     cases.size(), detail);
    }

    auto summary = aggregator.seal(std::chrono::system_clock::now());

    // Workers observe the expired token and return promptly; their reports are rejected.
    pool.stop();
    pool.join();

    if (!summary)
        return summary.error();
    const auto& s = summary.value();
    spdlog::info("Run {} finished: {}/{} passed ({:.1f}%)", s.runId, s.passCount, s.totalCases,
                 s.successRate());
    return summary;
}

Result<RunOutcome> RunOrchestrator::execute(const std::vector<registry::TestCase>& cases,
                                            const report::ReportPublisher* publisher,
                                            bool runPreflight) {
    if (auto unique = registry::checkUniqueIds(cases); !unique) {
        return unique.error();
    }

    RunOutcome outcome;
    if (runPreflight) {
        auto pre = preflight();
        if (!pre)
            return pre.error();
        outcome.preflight = pre.value();
    } else {
        spdlog::warn("Preflight skipped; dimension mismatches surface per case");
    }

    auto summary = run(cases);
    if (!summary)
        return summary.error();

    outcome.summary = std::move(summary).value();

    if (publisher) {
        auto written = publisher->publish(outcome.summary);
        if (written) {
            outcome.reports = std::move(written).value();
        } else {
            spdlog::error("Failed to write reports: {}", written.error().message);
        }
    }
    return outcome;
}

} // namespace relcheck::run

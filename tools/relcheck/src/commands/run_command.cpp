#include <relcheck/tools/command.h>
#include <relcheck/tools/summary_view.h>

#include <relcheck/registry/test_case_registry.h>
#include <relcheck/report/report_publisher.h>
#include <relcheck/report/report_writer.h>
#include <relcheck/run/run_orchestrator.h>

#include <spdlog/spdlog.h>

#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace relcheck::tools {

class RunCommand : public Command {
public:
    RunCommand() : Command("run", "Run the relevance test suite against the search backend") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand("run", getDescription());

        cmd->add_option("-t,--tests", testsFile_, "Test case file (JSON, JSON array or JSONL)")
            ->default_val("tests.json");
        cmd->add_option("--id", ids_, "Only run these test ids (repeatable)");
        cmd->add_option("--category", categories_, "Only run these categories (repeatable)");

        concurrencyOpt_ = cmd->add_option("-j,--concurrency", concurrency_,
                                          "Cases evaluated in parallel");
        timeoutOpt_ = cmd->add_option("--timeout", runTimeoutSeconds_,
                                      "Run timeout in seconds");
        testTimeoutOpt_ = cmd->add_option("--test-timeout", testTimeoutSeconds_,
                                          "Per-case timeout in seconds");
        topKOpt_ = cmd->add_option("-k,--top-k", topK_, "Results requested per search");
        maxRankOpt_ =
            cmd->add_option("--max-rank", maxRank_, "Default maximum allowed rank");
        minScoreOpt_ =
            cmd->add_option("--min-score", minScore_, "Default minimum score threshold");
        collectionOpt_ = cmd->add_option("--collection", collection_, "Collection name");
        modelOpt_ = cmd->add_option("--model", model_, "Embedding model (bgm-m3, openai, hash)");
        reportDirOpt_ = cmd->add_option("-o,--report-dir", reportDir_, "Report directory");
        formatsOpt_ = cmd->add_option("--format", formats_, "Report formats (json, csv)")
                          ->delimiter(',');

        cmd->add_flag("--no-reports", noReports_, "Do not write report files");
        cmd->add_flag("--skip-preflight", skipPreflight_,
                      "Skip the backend health and dimension checks");
        cmd->add_flag("--details", details_, "Print failing cases with their top candidates");
        cmd->add_flag("--json", printJson_, "Print the JSON report to stdout");

        addCommonOptions(*cmd);
        cmd->callback([this]() { shouldExecute_ = true; });
    }

    int execute() override {
        if (!shouldExecute_)
            return kExitOk;

        auto cfgResult = loadConfig();
        if (!cfgResult)
            return fail("Configuration error", cfgResult.error());
        if (overrideError_)
            return fail("Invalid option", *overrideError_);
        const config::AppConfig cfg = std::move(cfgResult).value();

        auto loaded = registry::loadTestCases(testsFile_);
        if (!loaded)
            return fail("Cannot load test cases", loaded.error());
        auto selected = registry::selectTestCases(loaded.value(), ids_, categories_);
        if (!selected)
            return fail("Invalid selection", selected.error());
        const auto& cases = selected.value();
        if (cases.empty()) {
            logError("No test cases selected");
            return kExitConfigError;
        }

        auto ctx = run::buildRunContext(cfg);
        if (!ctx)
            return fail("Cannot set up the run", ctx.error());
        auto& context = ctx.value();

        run::RunOrchestrator orchestrator(cfg, *context.embedder, *context.backend);

        std::mutex outMutex;
        if (!isQuiet() && !printJson_) {
            orchestrator.setProgressCallback(
                [&](const validation::CaseResult& r, std::size_t done, std::size_t total) {
                    std::lock_guard<std::mutex> lock(outMutex);
                    std::cout << formatCaseLine(r, done, total) << std::endl;
                });
        }

        // Stopped and joined on scope exit, including when rendering throws.
        std::jthread interruptWatcher([&](std::stop_token stop) {
            while (!stop.stop_requested()) {
                if (interrupted()) {
                    orchestrator.cancel("interrupted");
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        });

        std::optional<report::ReportPublisher> publisher;
        if (!noReports_)
            publisher.emplace(cfg.report, report::configSnapshot(cfg));

        auto outcome = orchestrator.execute(cases, publisher ? &*publisher : nullptr,
                                            !skipPreflight_);

        interruptWatcher.request_stop();
        interruptWatcher.join();

        if (!outcome)
            return fail("Run aborted", outcome.error());

        const auto& result = outcome.value();
        if (printJson_) {
            std::cout << report::renderJson(result.summary, report::configSnapshot(cfg))
                      << std::endl;
        } else if (!isQuiet()) {
            printSummary(std::cout, result.summary, details_);
            for (const auto& p : result.reports)
                std::cout << "Report: " << p.string() << "\n";
        }
        return result.status() == report::RunStatus::Success ? kExitOk : kExitFailures;
    }

protected:
    void applyOverrides(config::AppConfig& cfg) override {
        if (concurrencyOpt_->count())
            cfg.run.concurrency = concurrency_;
        if (timeoutOpt_->count())
            cfg.run.runTimeout = std::chrono::seconds(runTimeoutSeconds_);
        if (testTimeoutOpt_->count())
            cfg.run.testTimeout = std::chrono::seconds(testTimeoutSeconds_);
        if (topKOpt_->count())
            cfg.run.topK = topK_;
        if (maxRankOpt_->count())
            cfg.run.maxAllowedRank = maxRank_;
        if (minScoreOpt_->count())
            cfg.run.minScoreThreshold = minScore_;
        if (collectionOpt_->count())
            cfg.backend.collection = collection_;
        if (modelOpt_->count())
            cfg.embedding.model = model_;
        if (reportDirOpt_->count())
            cfg.report.dir = reportDir_;
        if (formatsOpt_->count()) {
            cfg.report.formats.clear();
            for (const auto& f : formats_) {
                auto parsed = config::parseReportFormat(f);
                if (parsed)
                    cfg.report.formats.insert(parsed.value());
                else
                    overrideError_ = parsed.error();
            }
        }
    }

private:
    bool shouldExecute_ = false;
    std::filesystem::path testsFile_;
    std::vector<std::string> ids_;
    std::vector<std::string> categories_;

    int concurrency_ = 0;
    int runTimeoutSeconds_ = 0;
    int testTimeoutSeconds_ = 0;
    int topK_ = 0;
    int maxRank_ = 0;
    double minScore_ = 0.0;
    std::string collection_;
    std::string model_;
    std::filesystem::path reportDir_;
    std::vector<std::string> formats_;
    bool noReports_ = false;
    bool skipPreflight_ = false;
    bool details_ = false;
    bool printJson_ = false;

    CLI::Option* concurrencyOpt_ = nullptr;
    CLI::Option* timeoutOpt_ = nullptr;
    CLI::Option* testTimeoutOpt_ = nullptr;
    CLI::Option* topKOpt_ = nullptr;
    CLI::Option* maxRankOpt_ = nullptr;
    CLI::Option* minScoreOpt_ = nullptr;
    CLI::Option* collectionOpt_ = nullptr;
    CLI::Option* modelOpt_ = nullptr;
    CLI::Option* reportDirOpt_ = nullptr;
    CLI::Option* formatsOpt_ = nullptr;
    std::optional<Error> overrideError_;
};

std::unique_ptr<Command> createRunCommand() {
    return std::make_unique<RunCommand>();
}

} // namespace relcheck::tools

#include <relcheck/tools/command.h>
#include <relcheck/tools/summary_view.h>

#include <relcheck/report/report_publisher.h>

#include <fmt/format.h>

namespace relcheck::tools {

class ReportsCommand : public Command {
public:
    ReportsCommand() : Command("reports", "List, show and prune run reports") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand("reports", getDescription());
        cmd->require_subcommand(1);
        dirOpt_ = cmd->add_option("-d,--dir", dir_, "Report directory (default from config)");
        addCommonOptions(*cmd);

        auto* list = cmd->add_subcommand("list", "List reports, newest first");
        list->add_option("-n,--limit", limit_, "Show at most N reports")->default_val(20);
        list->callback([this]() { action_ = Action::List; });

        auto* show = cmd->add_subcommand("show", "Print the summary of a JSON report");
        show->add_option("report", target_, "Run id or path (default: latest)");
        show->add_flag("--details", details_, "Include failing cases");
        show->callback([this]() { action_ = Action::Show; });

        auto* prune = cmd->add_subcommand("prune", "Delete reports past the retention period");
        daysOpt_ = prune->add_option("--days", days_, "Retention in days (default from config)")
                       ->check(CLI::NonNegativeNumber);
        prune->callback([this]() { action_ = Action::Prune; });
    }

    int execute() override {
        if (action_ == Action::None)
            return kExitOk;

        auto cfgResult = loadConfig();
        if (!cfgResult)
            return fail("Configuration error", cfgResult.error());
        const auto& cfg = cfgResult.value();
        const std::filesystem::path dir = dirOpt_->count() ? dir_ : cfg.report.dir;

        switch (action_) {
            case Action::List:
                return list(dir);
            case Action::Show:
                return show(dir);
            case Action::Prune: {
                const int days = daysOpt_->count() ? days_ : cfg.report.retentionDays;
                auto removed = report::pruneReports(dir, days);
                log(fmt::format("Removed {} report file(s) from {}", removed, dir.string()));
                return kExitOk;
            }
            case Action::None:
                break;
        }
        return kExitOk;
    }

private:
    enum class Action { None, List, Show, Prune };

    int list(const std::filesystem::path& dir) const {
        auto reports = report::listReports(dir);
        if (!reports)
            return fail("Cannot list reports", reports.error());

        std::size_t shown = 0;
        for (const auto& r : reports.value()) {
            if (shown++ >= limit_)
                break;
            std::cout << fmt::format("{:<26} {:<5} {:>9}  {}\n", r.runId,
                                     config::reportFormatName(r.format), r.size,
                                     r.path.string());
        }
        if (reports.value().empty())
            log("No reports in " + dir.string());
        return kExitOk;
    }

    int show(const std::filesystem::path& dir) const {
        std::filesystem::path path;
        if (target_.empty()) {
            auto reports = report::listReports(dir);
            if (!reports)
                return fail("Cannot list reports", reports.error());
            for (const auto& r : reports.value()) {
                if (r.format == config::ReportFormat::Json) {
                    path = r.path;
                    break;
                }
            }
            if (path.empty()) {
                logError("No JSON reports in " + dir.string());
                return kExitFailures;
            }
        } else if (std::filesystem::exists(target_)) {
            path = target_;
        } else {
            path = dir / report::reportFileName(target_, config::ReportFormat::Json);
        }

        auto summary = report::loadSummary(path);
        if (!summary)
            return fail("Cannot read " + path.string(), summary.error());
        printSummary(std::cout, summary.value(), details_);
        return kExitOk;
    }

    Action action_ = Action::None;
    std::filesystem::path dir_;
    std::size_t limit_ = 20;
    std::string target_;
    bool details_ = false;
    int days_ = 0;
    CLI::Option* dirOpt_ = nullptr;
    CLI::Option* daysOpt_ = nullptr;
};

std::unique_ptr<Command> createReportsCommand() {
    return std::make_unique<ReportsCommand>();
}

} // namespace relcheck::tools

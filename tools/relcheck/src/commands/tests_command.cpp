#include <relcheck/tools/command.h>

#include <relcheck/registry/test_case_registry.h>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace relcheck::tools {

/**
 * Manage the test case file: list, show, add, remove.
 */
class TestsCommand : public Command {
public:
    TestsCommand() : Command("tests", "List and edit test cases") {}

    void setupOptions(CLI::App& app) override {
        auto* cmd = app.add_subcommand("tests", getDescription());
        cmd->require_subcommand(1);
        cmd->add_option("-t,--tests", testsFile_, "Test case file")->default_val("tests.json");
        addCommonOptions(*cmd);

        auto* list = cmd->add_subcommand("list", "List test cases");
        list->add_option("--category", listCategory_, "Only this category");
        list->callback([this]() { action_ = Action::List; });

        auto* show = cmd->add_subcommand("show", "Print one test case as JSON");
        show->add_option("id", id_, "Test id")->required();
        show->callback([this]() { action_ = Action::Show; });

        auto* add = cmd->add_subcommand("add", "Add a test case");
        add->add_option("--id", draft_.id, "Test id (generated when omitted)");
        add->add_option("--name", draft_.name, "Display name");
        add->add_option("--query", draft_.queryText, "Query text")->required();
        add->add_option("--expected", draft_.expectedDocumentId, "Expected document id")
            ->required();
        add->add_option("--alternate", draft_.alternateDocumentIds,
                        "Additional acceptable document ids");
        add->add_option("--description", draft_.description, "Description");
        categoryOpt_ = add->add_option("--category", category_, "Category");
        maxRankOpt_ = add->add_option("--max-rank", maxRank_, "Maximum allowed rank")
                          ->check(CLI::PositiveNumber);
        minScoreOpt_ = add->add_option("--min-score", minScore_, "Minimum score threshold");
        add->callback([this]() { action_ = Action::Add; });

        auto* remove = cmd->add_subcommand("remove", "Remove a test case");
        remove->add_option("id", id_, "Test id")->required();
        remove->callback([this]() { action_ = Action::Remove; });
    }

    int execute() override {
        if (action_ == Action::None)
            return kExitOk;

        setupLogging(config::LoggingConfig{}, isVerbose(), isQuiet());

        auto opened = registry::TestCaseRegistry::open(testsFile_);
        if (!opened)
            return fail("Cannot open " + testsFile_.string(), opened.error());
        auto reg = std::move(opened).value();

        switch (action_) {
            case Action::List:
                return list(reg);
            case Action::Show:
                return show(reg);
            case Action::Add:
                return add(reg);
            case Action::Remove:
                return remove(reg);
            case Action::None:
                break;
        }
        return kExitOk;
    }

private:
    enum class Action { None, List, Show, Add, Remove };

    int list(const registry::TestCaseRegistry& reg) const {
        std::size_t shown = 0;
        for (const auto& tc : reg.cases()) {
            if (!listCategory_.empty() && tc.category.value_or("") != listCategory_)
                continue;
            ++shown;
            std::cout << fmt::format("{:<24} {:<16} {:<12} {}\n", tc.id,
                                     tc.category.value_or("-"), tc.expectedDocumentId,
                                     tc.queryText);
        }
        log(fmt::format("{} test case(s)", shown));
        return kExitOk;
    }

    int show(const registry::TestCaseRegistry& reg) const {
        auto tc = reg.find(id_);
        if (!tc) {
            logError("Test '" + id_ + "' not found");
            return kExitFailures;
        }
        std::cout << registry::testCaseToJson(*tc).dump(
                         2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return kExitOk;
    }

    int add(registry::TestCaseRegistry& reg) {
        registry::TestCase tc = draft_;
        if (categoryOpt_->count())
            tc.category = category_;
        if (maxRankOpt_->count())
            tc.maxAllowedRank = maxRank_;
        if (minScoreOpt_->count())
            tc.minScoreThreshold = minScore_;

        auto added = reg.add(std::move(tc));
        if (!added)
            return fail("Cannot add test", added.error());
        if (auto saved = reg.save(testsFile_); !saved)
            return fail("Cannot save " + testsFile_.string(), saved.error());
        log("Added test '" + added.value() + "'");
        return kExitOk;
    }

    int remove(registry::TestCaseRegistry& reg) {
        if (auto removed = reg.remove(id_); !removed)
            return fail("Cannot remove test", removed.error());
        if (auto saved = reg.save(testsFile_); !saved)
            return fail("Cannot save " + testsFile_.string(), saved.error());
        log("Removed test '" + id_ + "'");
        return kExitOk;
    }

    Action action_ = Action::None;
    std::filesystem::path testsFile_;
    std::string listCategory_;
    std::string id_;

    registry::TestCase draft_;
    std::string category_;
    int maxRank_ = 0;
    double minScore_ = 0.0;
    CLI::Option* categoryOpt_ = nullptr;
    CLI::Option* maxRankOpt_ = nullptr;
    CLI::Option* minScoreOpt_ = nullptr;
};

std::unique_ptr<Command> createTestsCommand() {
    return std::make_unique<TestsCommand>();
}

} // namespace relcheck::tools

#include <relcheck/tools/command.h>
#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <csignal>
#include <iostream>
#include <map>
#include <memory>

namespace {
void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        relcheck::tools::requestInterrupt();
    }
}
} // namespace

namespace relcheck::tools {

class RelcheckTools {
public:
    RelcheckTools() : app_("relcheck", "Vector search relevance validation") {
        setupApp();
        registerCommands();
    }

    int run(int argc, char** argv) {
        try {
            app_.parse(argc, argv);

            for (auto& [name, cmd] : commands_) {
                if (app_.got_subcommand(name)) {
                    return cmd->execute();
                }
            }

            // No subcommand specified, show help
            std::cout << app_.help() << std::endl;
            return kExitOk;

        } catch (const CLI::ParseError& e) {
            return app_.exit(e);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return kExitFailures;
        }
    }

private:
    void setupApp() {
        app_.set_version_flag("-V,--version", RELCHECK_VERSION);
        app_.require_subcommand(0, 1);
    }

    void registerCommands() {
        registerCommand(createRunCommand());
        registerCommand(createCheckCommand());
        registerCommand(createTestsCommand());
        registerCommand(createReportsCommand());
    }

    void registerCommand(std::unique_ptr<Command> cmd) {
        if (!cmd)
            return;

        const std::string& name = cmd->getName();
        cmd->setupOptions(app_);
        commands_[name] = std::move(cmd);
    }

    CLI::App app_;
    std::map<std::string, std::unique_ptr<Command>> commands_;
};

} // namespace relcheck::tools

int main(int argc, char** argv) {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    relcheck::tools::RelcheckTools app;
    return app.run(argc, argv);
}

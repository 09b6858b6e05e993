#pragma once

#include <relcheck/config/app_config.h>
#include <relcheck/core/types.h>
#include <CLI/CLI.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

namespace relcheck::tools {

// Process exit codes
constexpr int kExitOk = 0;
constexpr int kExitFailures = 1;
constexpr int kExitConfigError = 2;
constexpr int kExitBackendError = 3;

/// Map an error that ended a command to its exit code.
int exitCodeFor(const Error& error);

/**
 * Install the console sink (stderr) and, when configured, a rotating file sink
 * as the default spdlog logger.
 */
void setupLogging(const config::LoggingConfig& logging, bool verbose, bool quiet);

/**
 * Base class for all CLI commands
 *
 * Provides the shared options (config file, log level, verbosity) and the
 * configuration loading every command starts with.
 */
class Command {
public:
    Command(std::string name, std::string description)
        : name_(std::move(name)), description_(std::move(description)) {}

    virtual ~Command() = default;

    // Setup command-specific options
    virtual void setupOptions(CLI::App& app) = 0;

    // Execute the command
    virtual int execute() = 0;

    const std::string& getName() const { return name_; }

    const std::string& getDescription() const { return description_; }

protected:
    struct CommonOptions {
        bool verbose = false;
        bool quiet = false;
        std::filesystem::path configFile;
        std::string logLevel;
    };

    void addCommonOptions(CLI::App& app) {
        app.add_flag("-v,--verbose", options_.verbose, "Enable debug logging");
        app.add_flag("-q,--quiet", options_.quiet, "Only log errors");
        app.add_option("-c,--config", options_.configFile,
                       "Path to configuration file (default: ~/.config/relcheck/config.toml)");
        app.add_option("--log-level", options_.logLevel,
                       "Log level: trace, debug, info, warn, error, off");
    }

    /**
     * Load defaults < config file < environment, then let the command apply its own
     * flags via applyOverrides() and validate the result. Logging is set up here.
     */
    Result<config::AppConfig> loadConfig();

    // Command-line flags have the last word over file and environment
    virtual void applyOverrides(config::AppConfig&) {}

    bool isVerbose() const { return options_.verbose && !options_.quiet; }

    bool isQuiet() const { return options_.quiet; }

    void log(const std::string& message) const {
        if (!isQuiet()) {
            std::cout << message << std::endl;
        }
    }

    void logError(const std::string& message) const {
        std::cerr << "[ERROR] " << message << std::endl;
    }

    /// Report @p error on stderr and return its exit code.
    int fail(const std::string& what, const Error& error) const {
        logError(what + ": " + error.message);
        return exitCodeFor(error);
    }

private:
    std::string name_;
    std::string description_;
    CommonOptions options_;
};

std::unique_ptr<Command> createRunCommand();
std::unique_ptr<Command> createCheckCommand();
std::unique_ptr<Command> createTestsCommand();
std::unique_ptr<Command> createReportsCommand();

/// Set from the SIGINT/SIGTERM handler; polled by long-running commands.
void requestInterrupt();
bool interrupted();

} // namespace relcheck::tools

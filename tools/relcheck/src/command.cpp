#include <relcheck/tools/command.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <vector>

namespace relcheck::tools {

namespace {
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] %v";
constexpr std::size_t kLogFileMaxSize = 10 * 1024 * 1024; // 10MB per file
constexpr std::size_t kLogFileCount = 5;

std::atomic<bool> g_interrupted{false};
} // namespace

void requestInterrupt() {
    g_interrupted = true;
}

bool interrupted() {
    return g_interrupted.load();
}

int exitCodeFor(const Error& error) {
    switch (error.code) {
        case ErrorCode::ConfigurationError:
        case ErrorCode::DuplicateTestCase:
        case ErrorCode::InvalidArgument:
        case ErrorCode::FileNotFound:
            return kExitConfigError;
        case ErrorCode::BackendUnavailable:
        case ErrorCode::Unauthorized:
        case ErrorCode::DimensionMismatch:
            return kExitBackendError;
        default:
            return kExitFailures;
    }
}

void setupLogging(const config::LoggingConfig& logging, bool verbose, bool quiet) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    std::string fileError;
    if (!logging.file.empty()) {
        try {
            std::error_code ec;
            if (logging.file.has_parent_path())
                std::filesystem::create_directories(logging.file.parent_path(), ec);
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logging.file.string(), kLogFileMaxSize, kLogFileCount));
        } catch (const spdlog::spdlog_ex& e) {
            fileError = e.what();
        }
    }

    auto logger = std::make_shared<spdlog::logger>("relcheck", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(kLogPattern);

    auto level = spdlog::level::from_str(logging.level);
    if (verbose)
        level = spdlog::level::debug;
    if (quiet)
        level = spdlog::level::err;
    spdlog::set_level(level);
    spdlog::flush_on(spdlog::level::warn);

    if (!fileError.empty())
        spdlog::warn("Log file {} unavailable: {}", logging.file.string(), fileError);
}

Result<config::AppConfig> Command::loadConfig() {
    const bool explicitPath = !options_.configFile.empty();
    const auto path = config::get_config_path(options_.configFile.string());

    auto cfg = config::loadAppConfig(path, explicitPath, config::processEnvironment());
    if (!cfg)
        return cfg;

    config::AppConfig resolved = std::move(cfg).value();
    if (!options_.logLevel.empty())
        resolved.logging.level = options_.logLevel;
    applyOverrides(resolved);

    setupLogging(resolved.logging, isVerbose(), isQuiet());

    if (auto ok = config::validateConfig(resolved); !ok)
        return ok.error();
    spdlog::debug("Configuration loaded (file: {})", path.string());
    return resolved;
}

} // namespace relcheck::tools

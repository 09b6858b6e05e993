#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <relcheck/config/config_helpers.h>
#include <relcheck/core/types.h>

namespace relcheck::config {

/**
 * @brief Connection identity of the vector-search backend.
 *
 * Either url (+ apiKey) for a remote instance or host/port for a local one;
 * url wins when both are set.
 */
struct BackendConfig {
    std::string url;
    std::string host = "localhost";
    int port = 6333;
    std::string apiKey;
    std::string collection = "distill_hybrid";
    std::size_t vectorSize = 0; // 0 = take from the embedding provider
    std::string distance;       // empty = not checked
    std::string vectorName;     // named vector ("dense"); empty = unnamed
    std::vector<std::string> idFields{"recipe_id", "id"};
    std::vector<std::string> labelFields{"recipe_name", "name"};
    std::chrono::milliseconds requestTimeout{30000};

    /// Base URL without trailing slash.
    std::string endpoint() const;
};

struct EmbeddingConfig {
    std::string model = "bgm-m3"; // provider id: bgm-m3 | openai | hash
    std::string url; // empty = provider default
    std::string endpoint = "/embed";
    std::string apiKey;
    std::string modelName;     // provider-side model override
    std::size_t dimension = 0; // 0 = known default for model
    std::chrono::milliseconds timeout{60000};
    std::string proxy;
};

enum class ReportFormat { Json, Csv };

const char* reportFormatName(ReportFormat format);
Result<ReportFormat> parseReportFormat(std::string_view name);

struct RunSettings {
    int maxAllowedRank = 3;
    double minScoreThreshold = 0.3;
    int topK = 10;
    std::chrono::seconds testTimeout{60};
    std::chrono::seconds runTimeout{600};
    int concurrency = 4;
    int maxRetries = 3;
    std::chrono::milliseconds retryBase{200};
    std::chrono::milliseconds retryMax{5000};
    int escalationThreshold = 10;
    std::chrono::seconds escalationWindow{30};
};

struct ReportConfig {
    std::set<ReportFormat> formats{ReportFormat::Json, ReportFormat::Csv};
    std::filesystem::path dir = "reports";
    int retentionDays = 30; // 0 disables pruning
};

struct LoggingConfig {
    std::string level = "info";
    std::filesystem::path file;
};

/// Complete configuration, built once at startup and passed to every component.
struct AppConfig {
    BackendConfig backend;
    EmbeddingConfig embedding;
    RunSettings run;
    ReportConfig report;
    LoggingConfig logging;
};

/// Environment lookup; returns nullopt for unset or empty variables.
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Reads the process environment.
EnvLookup processEnvironment();

/// Apply a parsed TOML table on top of @p cfg. Unknown keys are logged and ignored.
Result<void> applyToml(AppConfig& cfg, const TomlTable& table);

/// Apply the recognised environment variables (QDRANT_*, EMBEDDING_MODEL, BGM_M3_*, ...).
Result<void> applyEnvironment(AppConfig& cfg, const EnvLookup& env);

/// Reject values no run could use (non-positive concurrency, empty collection, ...).
Result<void> validateConfig(const AppConfig& cfg);

/**
 * @brief Build the configuration: defaults < config file < environment.
 *
 * A missing file is only an error when @p configPath was given explicitly
 * (@p required); otherwise defaults are used.
 */
Result<AppConfig> loadAppConfig(const std::filesystem::path& configPath, bool required,
                                const EnvLookup& env);

} // namespace relcheck::config

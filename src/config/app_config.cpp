#include <relcheck/config/app_config.h>

#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdlib>

namespace relcheck::config {

namespace {

std::string lower(std::string s) {
    for (auto& c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string stripTrailingSlash(std::string s) {
    while (!s.empty() && s.back() == '/')
        s.pop_back();
    return s;
}

// "http://host:8000/x" -> true, "http://host/x" -> false
bool hasExplicitPort(const std::string& url) {
    auto scheme = url.find("://");
    auto hostStart = scheme == std::string::npos ? 0 : scheme + 3;
    auto hostEnd = url.find('/', hostStart);
    auto host = url.substr(hostStart, hostEnd == std::string::npos ? std::string::npos
                                                                    : hostEnd - hostStart);
    return host.find(':') != std::string::npos;
}

Error keyError(const std::string& section, const std::string& key, const Error& cause) {
    return Error{ErrorCode::ConfigurationError,
                 "[" + section + "] " + key + ": " + cause.message};
}

// Typed setters that report the offending key.
Result<void> setInt(int& out, const std::string& section, const std::string& key,
                    const std::string& raw) {
    auto v = parse_int(raw);
    if (!v)
        return keyError(section, key, v.error());
    out = static_cast<int>(v.value());
    return Result<void>();
}

Result<void> setSize(std::size_t& out, const std::string& section, const std::string& key,
                     const std::string& raw) {
    auto v = parse_int(raw);
    if (!v)
        return keyError(section, key, v.error());
    if (v.value() < 0)
        return Error{ErrorCode::ConfigurationError, "[" + section + "] " + key + " must be >= 0"};
    out = static_cast<std::size_t>(v.value());
    return Result<void>();
}

Result<void> setDouble(double& out, const std::string& section, const std::string& key,
                       const std::string& raw) {
    auto v = parse_double(raw);
    if (!v)
        return keyError(section, key, v.error());
    out = v.value();
    return Result<void>();
}

template <typename Dur>
Result<void> setDuration(Dur& out, const std::string& section, const std::string& key,
                         const std::string& raw) {
    auto v = parse_int(raw);
    if (!v)
        return keyError(section, key, v.error());
    out = Dur(v.value());
    return Result<void>();
}

Result<void> applyBackend(BackendConfig& b, const std::map<std::string, std::string>& kv) {
    const std::string s = "backend";
    for (const auto& [key, raw] : kv) {
        Result<void> r;
        if (key == "url")
            b.url = stripTrailingSlash(raw);
        else if (key == "host")
            b.host = raw;
        else if (key == "port")
            r = setInt(b.port, s, key, raw);
        else if (key == "api_key")
            b.apiKey = raw;
        else if (key == "collection")
            b.collection = raw;
        else if (key == "vector_size")
            r = setSize(b.vectorSize, s, key, raw);
        else if (key == "distance")
            b.distance = raw;
        else if (key == "vector_name")
            b.vectorName = raw;
        else if (key == "id_fields")
            b.idFields = parse_list(raw);
        else if (key == "label_fields")
            b.labelFields = parse_list(raw);
        else if (key == "request_timeout_ms")
            r = setDuration(b.requestTimeout, s, key, raw);
        else
            spdlog::warn("Ignoring unknown config key [{}] {}", s, key);
        if (!r)
            return r;
    }
    return Result<void>();
}

Result<void> applyEmbedding(EmbeddingConfig& e, const std::map<std::string, std::string>& kv) {
    const std::string s = "embedding";
    for (const auto& [key, raw] : kv) {
        Result<void> r;
        if (key == "model")
            e.model = lower(raw);
        else if (key == "url")
            e.url = stripTrailingSlash(raw);
        else if (key == "endpoint")
            e.endpoint = raw;
        else if (key == "api_key")
            e.apiKey = raw;
        else if (key == "model_name")
            e.modelName = raw;
        else if (key == "dimension")
            r = setSize(e.dimension, s, key, raw);
        else if (key == "timeout_ms")
            r = setDuration(e.timeout, s, key, raw);
        else if (key == "proxy")
            e.proxy = raw;
        else
            spdlog::warn("Ignoring unknown config key [{}] {}", s, key);
        if (!r)
            return r;
    }
    return Result<void>();
}

Result<void> applyRun(RunSettings& run, const std::map<std::string, std::string>& kv) {
    const std::string s = "run";
    for (const auto& [key, raw] : kv) {
        Result<void> r;
        if (key == "max_allowed_rank")
            r = setInt(run.maxAllowedRank, s, key, raw);
        else if (key == "min_score_threshold")
            r = setDouble(run.minScoreThreshold, s, key, raw);
        else if (key == "top_k")
            r = setInt(run.topK, s, key, raw);
        else if (key == "test_timeout_seconds")
            r = setDuration(run.testTimeout, s, key, raw);
        else if (key == "run_timeout_seconds")
            r = setDuration(run.runTimeout, s, key, raw);
        else if (key == "concurrency")
            r = setInt(run.concurrency, s, key, raw);
        else if (key == "max_retries")
            r = setInt(run.maxRetries, s, key, raw);
        else if (key == "retry_base_ms")
            r = setDuration(run.retryBase, s, key, raw);
        else if (key == "retry_max_ms")
            r = setDuration(run.retryMax, s, key, raw);
        else if (key == "escalation_threshold")
            r = setInt(run.escalationThreshold, s, key, raw);
        else if (key == "escalation_window_seconds")
            r = setDuration(run.escalationWindow, s, key, raw);
        else
            spdlog::warn("Ignoring unknown config key [{}] {}", s, key);
        if (!r)
            return r;
    }
    return Result<void>();
}

Result<void> applyReport(ReportConfig& rep, const std::map<std::string, std::string>& kv) {
    const std::string s = "report";
    for (const auto& [key, raw] : kv) {
        Result<void> r;
        if (key == "formats") {
            std::set<ReportFormat> formats;
            for (const auto& name : parse_list(raw)) {
                auto f = parseReportFormat(name);
                if (!f)
                    return keyError(s, key, f.error());
                formats.insert(f.value());
            }
            rep.formats = std::move(formats);
        } else if (key == "dir") {
            rep.dir = expand_tilde(raw);
        } else if (key == "retention_days") {
            r = setInt(rep.retentionDays, s, key, raw);
        } else {
            spdlog::warn("Ignoring unknown config key [{}] {}", s, key);
        }
        if (!r)
            return r;
    }
    return Result<void>();
}

} // namespace

std::string BackendConfig::endpoint() const {
    if (!url.empty())
        return stripTrailingSlash(url);
    return "http://" + host + ":" + std::to_string(port);
}

const char* reportFormatName(ReportFormat format) {
    switch (format) {
        case ReportFormat::Json:
            return "json";
        case ReportFormat::Csv:
            return "csv";
    }
    return "json";
}

Result<ReportFormat> parseReportFormat(std::string_view name) {
    auto n = lower(std::string(name));
    if (n == "json")
        return ReportFormat::Json;
    if (n == "csv")
        return ReportFormat::Csv;
    return Error{ErrorCode::ConfigurationError, "Unknown report format '" + std::string(name) +
                                                    "' (expected json or csv)"};
}

EnvLookup processEnvironment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* v = std::getenv(name.c_str());
        if (v == nullptr || *v == '\0')
            return std::nullopt;
        std::string s(v);
        trim(s);
        if (s.empty())
            return std::nullopt;
        return s;
    };
}

Result<void> applyToml(AppConfig& cfg, const TomlTable& table) {
    for (const auto& [section, kv] : table) {
        Result<void> r;
        if (section == "backend")
            r = applyBackend(cfg.backend, kv);
        else if (section == "embedding")
            r = applyEmbedding(cfg.embedding, kv);
        else if (section == "run")
            r = applyRun(cfg.run, kv);
        else if (section == "report")
            r = applyReport(cfg.report, kv);
        else if (section == "logging") {
            for (const auto& [key, raw] : kv) {
                if (key == "level")
                    cfg.logging.level = lower(raw);
                else if (key == "file")
                    cfg.logging.file = expand_tilde(raw);
                else
                    spdlog::warn("Ignoring unknown config key [logging] {}", key);
            }
        } else {
            spdlog::warn("Ignoring unknown config section [{}]", section);
        }
        if (!r)
            return r;
    }
    return Result<void>();
}

Result<void> applyEnvironment(AppConfig& cfg, const EnvLookup& env) {
    auto& b = cfg.backend;
    auto& e = cfg.embedding;

    if (auto v = env("QDRANT_URL"))
        b.url = stripTrailingSlash(*v);
    if (auto v = env("QDRANT_HOST"))
        b.host = *v;
    if (auto v = env("QDRANT_PORT")) {
        if (auto r = setInt(b.port, "env", "QDRANT_PORT", *v); !r)
            return r;
    }
    if (auto v = env("QDRANT_API_KEY"))
        b.apiKey = *v;
    if (auto v = env("COLLECTION_NAME"))
        b.collection = *v;

    if (auto v = env("EMBEDDING_MODEL"))
        e.model = lower(*v);

    if (e.model == "bgm-m3") {
        if (auto v = env("BGM_M3_URL"))
            e.url = stripTrailingSlash(*v);
        if (auto v = env("BGM_M3_PORT")) {
            if (e.url.empty())
                e.url = "http://localhost";
            if (!hasExplicitPort(e.url))
                e.url += ":" + *v;
        }
        if (auto v = env("BGM_M3_ENDPOINT"))
            e.endpoint = *v;
        if (auto v = env("BGM_M3_TIMEOUT")) {
            auto secs = parse_double(*v);
            if (!secs)
                return keyError("env", "BGM_M3_TIMEOUT", secs.error());
            e.timeout = std::chrono::milliseconds(static_cast<long long>(secs.value() * 1000.0));
        }
    } else if (e.model == "openai") {
        if (auto v = env("OPENAI_API_KEY"))
            e.apiKey = *v;
        if (auto v = env("OPENAI_BASE_URL"))
            e.url = stripTrailingSlash(*v);
    }

    if (auto v = env("HTTP_PROXY"))
        e.proxy = *v;
    else if (auto v2 = env("HTTPS_PROXY"))
        e.proxy = *v2;

    return Result<void>();
}

Result<void> validateConfig(const AppConfig& cfg) {
    auto fail = [](const std::string& msg) { return Error{ErrorCode::ConfigurationError, msg}; };

    if (cfg.backend.url.empty() && cfg.backend.host.empty())
        return fail("backend: either url or host must be set");
    if (cfg.backend.url.empty() && (cfg.backend.port <= 0 || cfg.backend.port > 65535))
        return fail("backend.port out of range: " + std::to_string(cfg.backend.port));
    if (cfg.backend.collection.empty())
        return fail("backend.collection must not be empty");
    if (cfg.backend.idFields.empty())
        return fail("backend.id_fields must name at least one payload field");
    if (cfg.backend.requestTimeout.count() <= 0)
        return fail("backend.request_timeout_ms must be positive");

    if (cfg.embedding.model.empty())
        return fail("embedding.model must not be empty");
    if (cfg.embedding.model == "openai" && cfg.embedding.apiKey.empty())
        return fail("embedding.api_key (or OPENAI_API_KEY) is required for the openai model");
    if (cfg.embedding.timeout.count() <= 0)
        return fail("embedding.timeout_ms must be positive");

    const auto& run = cfg.run;
    if (run.maxAllowedRank < 1)
        return fail("run.max_allowed_rank must be >= 1");
    if (!std::isfinite(run.minScoreThreshold))
        return fail("run.min_score_threshold must be a finite number");
    if (run.topK < 1)
        return fail("run.top_k must be >= 1");
    if (run.concurrency < 1)
        return fail("run.concurrency must be >= 1");
    if (run.testTimeout.count() <= 0)
        return fail("run.test_timeout_seconds must be positive");
    if (run.runTimeout.count() <= 0)
        return fail("run.run_timeout_seconds must be positive");
    if (run.maxRetries < 0)
        return fail("run.max_retries must be >= 0");
    if (run.escalationThreshold < 0)
        return fail("run.escalation_threshold must be >= 0 (0 disables escalation)");

    if (cfg.report.formats.empty())
        return fail("report.formats must list at least one format");
    if (cfg.report.retentionDays < 0)
        return fail("report.retention_days must be >= 0");

    static const std::set<std::string> kLevels = {"trace", "debug", "info", "warn",
                                                  "warning", "error", "err", "critical", "off"};
    if (!kLevels.count(cfg.logging.level))
        return fail("logging.level '" + cfg.logging.level + "' is not a log level");

    return Result<void>();
}

Result<AppConfig> loadAppConfig(const std::filesystem::path& configPath, bool required,
                                const EnvLookup& env) {
    AppConfig cfg;

    std::error_code ec;
    if (!configPath.empty() && std::filesystem::exists(configPath, ec)) {
        auto table = parseTomlFile(configPath);
        if (!table)
            return Error{ErrorCode::ConfigurationError, table.error().message};
        if (auto r = applyToml(cfg, table.value()); !r)
            return r.error();
        spdlog::debug("Loaded config from {}", configPath.string());
    } else if (required) {
        return Error{ErrorCode::ConfigurationError,
                     "Config file not found: " + configPath.string()};
    } else {
        spdlog::debug("No config file at {}, using defaults", configPath.string());
    }

    if (env) {
        if (auto r = applyEnvironment(cfg, env); !r)
            return r.error();
    }

    return cfg;
}

} // namespace relcheck::config

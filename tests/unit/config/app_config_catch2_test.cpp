#include <catch2/catch_test_macros.hpp>

#include <relcheck/config/app_config.h>
#include <relcheck/config/config_helpers.h>

#include "../../common/test_helpers_catch2.h"
#include "../../support/temp_dir_scope.hpp"

#include <map>

using namespace relcheck;
using namespace relcheck::config;
using relcheck::test_support::TempDirScope;

namespace {

EnvLookup envFrom(std::map<std::string, std::string> vars) {
    return [vars = std::move(vars)](const std::string& name) -> std::optional<std::string> {
        auto it = vars.find(name);
        if (it == vars.end() || it->second.empty())
            return std::nullopt;
        return it->second;
    };
}

EnvLookup noEnv() {
    return envFrom({});
}

} // namespace

TEST_CASE("parseTomlString reads sections, comments and arrays", "[config][toml]") {
    auto table = parseTomlString(R"(
# comment
[backend]
collection = "recipes"   # inline comment
port = 6334
id_fields = ["recipe_id", "id"]

[run]
min_score_threshold = 0.45
)");
    REQUIRE(table);
    const auto& t = table.value();
    CHECK(t.at("backend").at("collection") == "recipes");
    CHECK(t.at("backend").at("port") == "6334");
    CHECK(parse_list(t.at("backend").at("id_fields")) ==
          std::vector<std::string>{"recipe_id", "id"});
    CHECK(t.at("run").at("min_score_threshold") == "0.45");
}

TEST_CASE("scalar parsers", "[config][toml]") {
    CHECK(parse_bool("Yes").value());
    CHECK_FALSE(parse_bool("0").value());
    CHECK_FALSE(parse_bool("maybe"));
    CHECK(parse_int("42").value() == 42);
    CHECK_FALSE(parse_int("4x2"));
    CHECK(parse_double("0.25").value() == 0.25);
    CHECK(parse_list("json, csv") == std::vector<std::string>{"json", "csv"});
}

TEST_CASE("defaults are valid", "[config]") {
    AppConfig cfg;
    CHECK(validateConfig(cfg));
    CHECK(cfg.run.maxAllowedRank == 3);
    CHECK(cfg.run.minScoreThreshold == 0.3);
    CHECK(cfg.run.topK == 10);
    CHECK(cfg.backend.collection == "distill_hybrid");
    CHECK(cfg.backend.endpoint() == "http://localhost:6333");
}

TEST_CASE("applyToml maps keys onto the configuration", "[config]") {
    AppConfig cfg;
    auto table = parseTomlString(R"(
[backend]
url = "https://qdrant.example.com/"
collection = "recipes"
vector_name = "dense"

[embedding]
model = "hash"
dimension = 16

[run]
max_allowed_rank = 5
concurrency = 8
test_timeout_seconds = 15

[report]
formats = ["csv"]
retention_days = 7
)");
    REQUIRE(table);
    REQUIRE(applyToml(cfg, table.value()));

    CHECK(cfg.backend.endpoint() == "https://qdrant.example.com");
    CHECK(cfg.backend.collection == "recipes");
    CHECK(cfg.backend.vectorName == "dense");
    CHECK(cfg.embedding.model == "hash");
    CHECK(cfg.embedding.dimension == 16);
    CHECK(cfg.run.maxAllowedRank == 5);
    CHECK(cfg.run.concurrency == 8);
    CHECK(cfg.run.testTimeout == std::chrono::seconds(15));
    CHECK(cfg.report.formats == std::set<ReportFormat>{ReportFormat::Csv});
    CHECK(cfg.report.retentionDays == 7);
}

TEST_CASE("applyToml reports the offending key", "[config]") {
    AppConfig cfg;
    auto table = parseTomlString("[run]\ntop_k = ten\n");
    REQUIRE(table);
    auto r = applyToml(cfg, table.value());
    REQUIRE_FALSE(r);
    CHECK(r.error().code == ErrorCode::ConfigurationError);
    CHECK(r.error().message.find("top_k") != std::string::npos);
}

TEST_CASE("environment overrides the backend and embedding service", "[config][env]") {
    AppConfig cfg;
    REQUIRE(applyEnvironment(cfg, envFrom({{"QDRANT_URL", "http://q:7000/"},
                                           {"QDRANT_API_KEY", "secret"},
                                           {"COLLECTION_NAME", "alt"},
                                           {"BGM_M3_URL", "http://embed"},
                                           {"BGM_M3_PORT", "9000"},
                                           {"BGM_M3_TIMEOUT", "2.5"}})));
    CHECK(cfg.backend.endpoint() == "http://q:7000");
    CHECK(cfg.backend.apiKey == "secret");
    CHECK(cfg.backend.collection == "alt");
    CHECK(cfg.embedding.url == "http://embed:9000");
    CHECK(cfg.embedding.timeout == std::chrono::milliseconds(2500));
}

TEST_CASE("OpenAI settings apply only to the openai model", "[config][env]") {
    AppConfig cfg;
    REQUIRE(applyEnvironment(cfg, envFrom({{"EMBEDDING_MODEL", "OpenAI"},
                                           {"OPENAI_API_KEY", "sk-test"},
                                           {"BGM_M3_URL", "http://ignored"}})));
    CHECK(cfg.embedding.model == "openai");
    CHECK(cfg.embedding.apiKey == "sk-test");
    CHECK(cfg.embedding.url != "http://ignored");
}

TEST_CASE("loadAppConfig layers defaults, file and environment", "[config]") {
    auto tmp = TempDirScope::unique_under("relcheck-config");
    const auto path = relcheck::test::write_file(tmp.path() / "config.toml",
                                                 "[backend]\ncollection = \"from_file\"\n"
                                                 "port = 7001\n");

    SECTION("file over defaults") {
        auto cfg = loadAppConfig(path, true, noEnv());
        REQUIRE(cfg);
        CHECK(cfg.value().backend.collection == "from_file");
        CHECK(cfg.value().backend.port == 7001);
        CHECK(cfg.value().run.topK == 10);
    }

    SECTION("environment over file") {
        auto cfg = loadAppConfig(path, true, envFrom({{"COLLECTION_NAME", "from_env"}}));
        REQUIRE(cfg);
        CHECK(cfg.value().backend.collection == "from_env");
        CHECK(cfg.value().backend.port == 7001);
    }

    SECTION("missing explicit file is an error") {
        auto cfg = loadAppConfig(tmp.path() / "absent.toml", true, noEnv());
        REQUIRE_FALSE(cfg);
        CHECK(cfg.error().code == ErrorCode::ConfigurationError);
    }

    SECTION("missing default file falls back to defaults") {
        auto cfg = loadAppConfig(tmp.path() / "absent.toml", false, noEnv());
        REQUIRE(cfg);
        CHECK(cfg.value().backend.collection == "distill_hybrid");
    }
}

TEST_CASE("escalation threshold 0 disables escalation", "[config]") {
    AppConfig cfg;
    auto table = parseTomlString("[run]\nescalation_threshold = 0\n");
    REQUIRE(table);
    REQUIRE(applyToml(cfg, table.value()));
    CHECK(cfg.run.escalationThreshold == 0);
    CHECK(validateConfig(cfg));
}

TEST_CASE("validateConfig rejects unusable values", "[config]") {
    AppConfig cfg;

    SECTION("concurrency") {
        cfg.run.concurrency = 0;
        CHECK_FALSE(validateConfig(cfg));
    }
    SECTION("rank") {
        cfg.run.maxAllowedRank = 0;
        CHECK_FALSE(validateConfig(cfg));
    }
    SECTION("negative escalation threshold") {
        cfg.run.escalationThreshold = -1;
        CHECK_FALSE(validateConfig(cfg));
    }
    SECTION("collection") {
        cfg.backend.collection.clear();
        CHECK_FALSE(validateConfig(cfg));
    }
    SECTION("openai without key") {
        cfg.embedding.model = "openai";
        CHECK_FALSE(validateConfig(cfg));
    }
    SECTION("formats") {
        cfg.report.formats.clear();
        CHECK_FALSE(validateConfig(cfg));
    }
    SECTION("log level") {
        cfg.logging.level = "loud";
        auto r = validateConfig(cfg);
        REQUIRE_FALSE(r);
        CHECK(r.error().code == ErrorCode::ConfigurationError);
    }
}

TEST_CASE("report formats parse by name", "[config]") {
    CHECK(parseReportFormat("JSON").value() == ReportFormat::Json);
    CHECK(parseReportFormat("csv").value() == ReportFormat::Csv);
    CHECK_FALSE(parseReportFormat("xml"));
}

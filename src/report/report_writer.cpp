#include <relcheck/report/report_writer.h>

#include <relcheck/core/time_utils.h>
#include <relcheck/report/run_aggregator.h>

#include <fmt/format.h>

namespace relcheck::report {

using nlohmann::json;

namespace {

template <typename T> json optionalToJson(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

template <typename T> std::optional<T> optionalFromJson(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return std::nullopt;
    return it->get<T>();
}

std::string joinList(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& s : items) {
        if (!out.empty())
            out += ",";
        out += s;
    }
    return out;
}

Result<validation::CaseResult> caseResultFromJson(const json& j) {
    validation::CaseResult r;
    r.testCaseId = j.value("test_id", std::string{});
    if (r.testCaseId.empty()) {
        return Error{ErrorCode::InvalidData, "Report result without 'test_id'"};
    }
    auto outcome = validation::parseOutcome(j.value("outcome", std::string{}));
    if (!outcome) {
        return Error{ErrorCode::InvalidData,
                     "Report result '" + r.testCaseId + "' has an unknown outcome"};
    }
    r.outcome = *outcome;
    r.testName = j.value("name", r.testCaseId);
    r.category = optionalFromJson<std::string>(j, "category");
    r.queryText = j.value("query", std::string{});
    r.expectedDocumentId = j.value("expected_id", std::string{});
    r.observedRank = optionalFromJson<int>(j, "rank");
    r.observedScore = optionalFromJson<double>(j, "score");
    r.matchedDocumentId = optionalFromJson<std::string>(j, "matched_id");
    r.message = j.value("message", std::string{});
    r.errorDetail = optionalFromJson<std::string>(j, "error");
    r.durationMs = j.value("duration_ms", 0.0);
    if (auto top = j.find("top_results"); top != j.end() && top->is_array()) {
        for (const auto& t : *top) {
            search::SearchCandidate c;
            c.rank = t.value("rank", 0);
            c.documentId = t.value("id", std::string{});
            c.label = t.value("name", std::string{});
            c.score = t.value("score", 0.0);
            r.topCandidates.push_back(std::move(c));
        }
    }
    return r;
}

} // namespace

json configSnapshot(const config::AppConfig& cfg) {
    json formats = json::array();
    for (auto f : cfg.report.formats)
        formats.push_back(config::reportFormatName(f));

    return json{
        {"backend",
         {{"endpoint", cfg.backend.endpoint()},
          {"collection", cfg.backend.collection},
          {"vector_name", cfg.backend.vectorName},
          {"id_fields", joinList(cfg.backend.idFields)},
          {"api_key_set", !cfg.backend.apiKey.empty()}}},
        {"embedding",
         {{"model", cfg.embedding.model},
          {"url", cfg.embedding.url},
          {"endpoint", cfg.embedding.endpoint},
          {"model_name", cfg.embedding.modelName},
          {"dimension", cfg.embedding.dimension},
          {"api_key_set", !cfg.embedding.apiKey.empty()}}},
        {"run",
         {{"max_allowed_rank", cfg.run.maxAllowedRank},
          {"min_score_threshold", cfg.run.minScoreThreshold},
          {"top_k", cfg.run.topK},
          {"concurrency", cfg.run.concurrency},
          {"test_timeout_seconds", cfg.run.testTimeout.count()},
          {"run_timeout_seconds", cfg.run.runTimeout.count()},
          {"max_retries", cfg.run.maxRetries}}},
        {"report", {{"formats", formats}, {"retention_days", cfg.report.retentionDays}}},
    };
}

json caseResultToJson(const validation::CaseResult& r) {
    json top = json::array();
    for (const auto& c : r.topCandidates) {
        top.push_back({{"rank", c.rank}, {"id", c.documentId}, {"name", c.label}, {"score", c.score}});
    }
    return json{
        {"test_id", r.testCaseId},
        {"name", r.testName},
        {"category", optionalToJson(r.category)},
        {"query", r.queryText},
        {"expected_id", r.expectedDocumentId},
        {"outcome", validation::outcomeName(r.outcome)},
        {"passed", r.passed()},
        {"rank", optionalToJson(r.observedRank)},
        {"score", optionalToJson(r.observedScore)},
        {"matched_id", optionalToJson(r.matchedDocumentId)},
        {"message", r.message},
        {"error", optionalToJson(r.errorDetail)},
        {"duration_ms", r.durationMs},
        {"top_results", top},
    };
}

json summaryToJson(const RunSummary& summary, const json& config) {
    json failCounts = json::object();
    for (const auto& [outcome, n] : summary.failCounts)
        failCounts[validation::outcomeName(outcome)] = n;

    json categories = json::object();
    for (const auto& [name, stats] : summary.perCategoryStats) {
        categories[name] = {
            {"total", stats.total}, {"passed", stats.passed}, {"pass_rate", stats.passRate()}};
    }

    json results = json::array();
    for (const auto& r : summary.results)
        results.push_back(caseResultToJson(r));

    json doc;
    doc["run_id"] = summary.runId;
    doc["started_at"] = toIsoString(summary.startedAt);
    doc["finished_at"] = toIsoString(summary.finishedAt);
    doc["status"] = runStatusName(summary.status());
    doc["summary"] = {{"total", summary.totalCases},
                      {"passed", summary.passCount},
                      {"failed", summary.totalCases - summary.passCount},
                      {"success_rate", summary.successRate()},
                      {"fail_counts", failCounts},
                      {"categories", categories}};
    if (!config.is_null())
        doc["config"] = config;
    doc["results"] = results;
    return doc;
}

Result<RunSummary> summaryFromJson(const json& doc) {
    if (!doc.is_object() || !doc.contains("run_id") || !doc.contains("results")) {
        return Error{ErrorCode::InvalidData, "Not a relcheck report (missing run_id/results)"};
    }
    try {
        auto started = parseIsoString(doc.at("started_at").get<std::string>());
        if (!started)
            return started.error();
        auto finished = parseIsoString(doc.at("finished_at").get<std::string>());
        if (!finished)
            return finished.error();

        std::vector<validation::CaseResult> results;
        for (const auto& j : doc.at("results")) {
            auto r = caseResultFromJson(j);
            if (!r)
                return r.error();
            results.push_back(std::move(r).value());
        }
        return summarize(doc.at("run_id").get<std::string>(), started.value(), finished.value(),
                         std::move(results));
    } catch (const json::exception& e) {
        return Error{ErrorCode::InvalidData, std::string("Malformed report: ") + e.what()};
    }
}

std::string renderJson(const RunSummary& summary, const json& config) {
    return summaryToJson(summary, config).dump(2, ' ', false, json::error_handler_t::replace);
}

std::string csvEscape(std::string_view field) {
    if (field.find_first_of(",\"\r\n") == std::string_view::npos)
        return std::string(field);
    std::string out;
    out.reserve(field.size() + 2);
    out.push_back('"');
    for (char c : field) {
        if (c == '"')
            out.push_back('"');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string renderCsv(const RunSummary& summary) {
    std::string out = kCsvHeader;
    out += "\r\n";
    for (const auto& r : summary.results) {
        const std::string fields[] = {
            r.testCaseId,
            r.category.value_or(""),
            r.queryText,
            validation::outcomeName(r.outcome),
            r.observedRank ? std::to_string(*r.observedRank) : std::string{},
            r.observedScore ? fmt::format("{:.4f}", *r.observedScore) : std::string{},
            r.matchedDocumentId.value_or(""),
            fmt::format("{:.1f}", r.durationMs),
            r.message,
            r.errorDetail.value_or(""),
        };
        bool first = true;
        for (const auto& f : fields) {
            if (!first)
                out.push_back(',');
            out += csvEscape(f);
            first = false;
        }
        out += "\r\n";
    }
    return out;
}

} // namespace relcheck::report

#include <catch2/catch_test_macros.hpp>

#include <relcheck/tools/command.h>
#include <relcheck/tools/summary_view.h>

#include <sstream>
#include <string>

using namespace relcheck;
using relcheck::validation::CaseResult;
using relcheck::validation::Outcome;

namespace {

CaseResult result(std::string id, Outcome outcome, std::string message) {
    CaseResult r;
    r.testCaseId = std::move(id);
    r.outcome = outcome;
    r.message = std::move(message);
    r.durationMs = 12.0;
    return r;
}

report::RunSummary twoCaseSummary() {
    report::RunSummary s;
    s.runId = "20240501_123000_abcdef";
    s.totalCases = 2;
    s.passCount = 1;
    s.failCounts[Outcome::FailNotFound] = 1;
    s.failCounts[Outcome::FailRankExceeded] = 0;
    s.perCategoryStats["desserts"] = report::CategoryStats{2, 1};

    auto miss = result("q2", Outcome::FailNotFound, "doc-7 not in top 10");
    search::SearchCandidate c;
    c.documentId = "doc-3";
    c.label = "Lemon tart";
    c.score = 0.812;
    c.rank = 1;
    miss.topCandidates.push_back(c);

    s.results = {result("q1", Outcome::Pass, "rank 1"), miss};
    return s;
}

} // namespace

TEST_CASE("exit codes follow the error class", "[tools]") {
    using tools::exitCodeFor;
    CHECK(exitCodeFor(Error{ErrorCode::ConfigurationError, ""}) == tools::kExitConfigError);
    CHECK(exitCodeFor(Error{ErrorCode::DuplicateTestCase, ""}) == tools::kExitConfigError);
    CHECK(exitCodeFor(Error{ErrorCode::FileNotFound, ""}) == tools::kExitConfigError);
    CHECK(exitCodeFor(Error{ErrorCode::BackendUnavailable, ""}) == tools::kExitBackendError);
    CHECK(exitCodeFor(Error{ErrorCode::Unauthorized, ""}) == tools::kExitBackendError);
    CHECK(exitCodeFor(Error{ErrorCode::DimensionMismatch, ""}) == tools::kExitBackendError);
    CHECK(exitCodeFor(Error{ErrorCode::NetworkError, ""}) == tools::kExitFailures);
}

TEST_CASE("case lines carry progress, tag and message", "[tools]") {
    const auto line = tools::formatCaseLine(result("q1", Outcome::Pass, "rank 1"), 3, 10);
    CHECK(line == "[ 3/10] PASS      q1 (12 ms) rank 1");

    const auto err = tools::formatCaseLine(result("q9", Outcome::Error, "timeout"), 1, 1);
    CHECK(err.rfind("[1/1] ERROR", 0) == 0);
}

TEST_CASE("summary view lists counts and categories", "[tools]") {
    const auto summary = twoCaseSummary();

    std::ostringstream plain;
    tools::printSummary(plain, summary, false);
    const auto text = plain.str();
    CHECK(text.find("Run 20240501_123000_abcdef") != std::string::npos);
    CHECK(text.find("Passed:       1 (50.0%)") != std::string::npos);
    CHECK(text.find("NOT FOUND:") != std::string::npos);
    CHECK(text.find("RANK:") == std::string::npos);
    CHECK(text.find("desserts") != std::string::npos);
    CHECK(text.find("Failing cases") == std::string::npos);
    CHECK(text.find("Status: failed") != std::string::npos);

    std::ostringstream detailed;
    tools::printSummary(detailed, summary, true);
    const auto full = detailed.str();
    CHECK(full.find("Failing cases") != std::string::npos);
    CHECK(full.find("q2 : doc-7 not in top 10") != std::string::npos);
    CHECK(full.find("#1 doc-3 Lemon tart (0.812)") != std::string::npos);
    CHECK(full.find("q1 :") == std::string::npos);
}

#include <catch2/catch_test_macros.hpp>

#include <relcheck/report/run_aggregator.h>
#include <relcheck/validation/validation_engine.h>

#include "../../common/test_helpers_catch2.h"

#include <algorithm>
#include <random>
#include <thread>

using namespace relcheck;
using namespace relcheck::report;
using relcheck::validation::CaseResult;
using relcheck::validation::Outcome;
using relcheck::test::make_case;

namespace {

CaseResult resultFor(const registry::TestCase& tc, Outcome outcome) {
    auto r = validation::makeCaseResult(tc);
    r.outcome = outcome;
    return r;
}

std::vector<registry::TestCase> mixedCases() {
    return {make_case("a", "1", std::string("pasta")), make_case("b", "2", std::string("pasta")),
            make_case("c", "3", std::string("soup")), make_case("d", "4"),
            make_case("e", "5")};
}

const Outcome kOutcomes[] = {Outcome::Pass, Outcome::FailRankExceeded, Outcome::Pass,
                             Outcome::FailNotFound, Outcome::Error};

} // namespace

TEST_CASE("summary counts follow the outcomes", "[report][aggregator]") {
    const auto cases = mixedCases();
    const auto t0 = std::chrono::system_clock::now();
    RunAggregator agg("run-1", cases, t0);

    for (std::size_t i = 0; i < cases.size(); ++i)
        REQUIRE(agg.record(resultFor(cases[i], kOutcomes[i])));

    auto sealed = agg.seal(t0 + std::chrono::seconds(3));
    REQUIRE(sealed);
    const auto& s = sealed.value();
    CHECK(s.totalCases == 5);
    CHECK(s.passCount == 2);
    CHECK(s.count(Outcome::FailRankExceeded) == 1);
    CHECK(s.count(Outcome::FailNotFound) == 1);
    CHECK(s.count(Outcome::FailScoreBelowThreshold) == 0);
    CHECK(s.count(Outcome::Error) == 1);
    CHECK(s.successRate() == 40.0);
    CHECK(s.status() == RunStatus::Failed);

    std::size_t sum = s.passCount;
    for (const auto& [outcome, n] : s.failCounts)
        sum += n;
    CHECK(sum == s.totalCases);

    CHECK(s.perCategoryStats.at("pasta").total == 2);
    CHECK(s.perCategoryStats.at("pasta").passed == 1);
    CHECK(s.perCategoryStats.at("soup").passRate() == 1.0);
    CHECK(s.perCategoryStats.at(kUncategorized).total == 2);
}

TEST_CASE("summary does not depend on completion order", "[report][aggregator]") {
    const auto cases = mixedCases();
    const auto t0 = std::chrono::system_clock::now();

    std::vector<std::size_t> order(cases.size());
    for (std::size_t i = 0; i < order.size(); ++i)
        order[i] = i;

    RunAggregator reference("run", cases, t0);
    for (auto i : order)
        REQUIRE(reference.record(resultFor(cases[i], kOutcomes[i])));
    const auto expected = reference.seal(t0).value();

    std::mt19937 rng(7);
    for (int round = 0; round < 10; ++round) {
        std::shuffle(order.begin(), order.end(), rng);
        RunAggregator agg("run", cases, t0);
        for (auto i : order)
            REQUIRE(agg.record(resultFor(cases[i], kOutcomes[i])));
        const auto s = agg.seal(t0).value();

        CHECK(s.passCount == expected.passCount);
        CHECK(s.failCounts == expected.failCounts);
        REQUIRE(s.results.size() == cases.size());
        for (std::size_t i = 0; i < cases.size(); ++i)
            CHECK(s.results[i].testCaseId == cases[i].id);
    }
}

TEST_CASE("aggregator rejects unknown, duplicate and late results", "[report][aggregator]") {
    const auto cases = mixedCases();
    const auto t0 = std::chrono::system_clock::now();
    RunAggregator agg("run", cases, t0);

    auto unknown = agg.record(resultFor(make_case("zzz", "9"), Outcome::Pass));
    REQUIRE_FALSE(unknown);
    CHECK(unknown.error().code == ErrorCode::InvalidArgument);

    REQUIRE(agg.record(resultFor(cases[0], Outcome::Pass)));
    auto dup = agg.record(resultFor(cases[0], Outcome::FailNotFound));
    REQUIRE_FALSE(dup);
    CHECK(dup.error().code == ErrorCode::InvalidState);
    CHECK(agg.reportedCount() == 1);

    auto early = agg.seal(t0);
    REQUIRE_FALSE(early);
    CHECK(early.error().code == ErrorCode::InvalidState);

    CHECK(agg.fillMissing("run timeout exceeded") == cases.size() - 1);
    auto sealed = agg.seal(t0);
    REQUIRE(sealed);
    CHECK(sealed.value().results[0].outcome == Outcome::Pass);
    CHECK(sealed.value().count(Outcome::Error) == cases.size() - 1);
    CHECK(*sealed.value().results[1].errorDetail == "run timeout exceeded");

    auto late = agg.record(resultFor(cases[1], Outcome::Pass));
    REQUIRE_FALSE(late);
    CHECK(late.error().code == ErrorCode::InvalidState);
}

TEST_CASE("concurrent recording keeps every result", "[report][aggregator]") {
    const auto cases = relcheck::test::make_cases(200);
    RunAggregator agg("run", cases, std::chrono::system_clock::now());

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&, t]() {
            for (std::size_t i = static_cast<std::size_t>(t); i < cases.size(); i += 8)
                (void)agg.record(resultFor(cases[i], i % 3 == 0 ? Outcome::Pass
                                                                : Outcome::FailNotFound));
        });
    }
    for (auto& th : threads)
        th.join();

    auto s = agg.seal(std::chrono::system_clock::now());
    REQUIRE(s);
    CHECK(s.value().totalCases == 200);
    CHECK(s.value().passCount == 67);
}

TEST_CASE("empty run is not a success", "[report][summary]") {
    auto s = summarize("r", {}, {}, {});
    CHECK(s.totalCases == 0);
    CHECK(s.successRate() == 0.0);
    CHECK(s.status() == RunStatus::Failed);
}

TEST_CASE("run ids start with the compact stamp", "[report][summary]") {
    const auto now = std::chrono::system_clock::now();
    auto a = generateRunId(now);
    auto b = generateRunId(now);
    CHECK(a.size() == 22);
    CHECK(a.substr(0, 15) == b.substr(0, 15));
}

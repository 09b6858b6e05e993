#include <catch2/catch_test_macros.hpp>

#include <relcheck/validation/validation_engine.h>

#include "../../common/fakes.h"
#include "../../common/test_helpers_catch2.h"

using namespace relcheck;
using namespace relcheck::validation;
using relcheck::test::make_case;
using relcheck::test::ranked;

TEST_CASE("classifyCandidates applies rank and score thresholds", "[validation][classify]") {
    const auto tc = make_case("t1", "doc-42");

    SECTION("match within rank and above score passes") {
        auto hits = ranked({{"doc-7", 0.91}, {"doc-42", 0.55}, {"doc-3", 0.40}});
        auto c = classifyCandidates(tc, hits, 3, 0.3);
        CHECK(c.outcome == Outcome::Pass);
        REQUIRE(c.rank.has_value());
        CHECK(*c.rank == 2);
        CHECK(*c.score == 0.55);
        CHECK(*c.matchedDocumentId == "doc-42");
    }

    SECTION("match beyond the allowed rank fails on rank") {
        auto hits = ranked({{"a", 0.9}, {"b", 0.8}, {"c", 0.7}, {"d", 0.6}, {"doc-42", 0.5}});
        auto c = classifyCandidates(tc, hits, 3, 0.3);
        CHECK(c.outcome == Outcome::FailRankExceeded);
        CHECK(*c.rank == 5);
    }

    SECTION("top hit with a low score fails on score") {
        auto hits = ranked({{"doc-42", 0.2}, {"b", 0.1}});
        auto c = classifyCandidates(tc, hits, 3, 0.3);
        CHECK(c.outcome == Outcome::FailScoreBelowThreshold);
        CHECK(*c.rank == 1);
    }

    SECTION("absent document is not found") {
        auto hits = ranked({{"a", 0.9}, {"b", 0.8}});
        auto c = classifyCandidates(tc, hits, 3, 0.3);
        CHECK(c.outcome == Outcome::FailNotFound);
        CHECK_FALSE(c.rank.has_value());
        CHECK_FALSE(c.score.has_value());
    }

    SECTION("empty candidate list is not found") {
        auto c = classifyCandidates(tc, {}, 3, 0.3);
        CHECK(c.outcome == Outcome::FailNotFound);
    }

    SECTION("rank is checked before score") {
        auto hits = ranked({{"a", 0.9}, {"b", 0.8}, {"c", 0.7}, {"doc-42", 0.05}});
        auto c = classifyCandidates(tc, hits, 3, 0.3);
        CHECK(c.outcome == Outcome::FailRankExceeded);
    }

    SECTION("boundaries are inclusive") {
        auto hits = ranked({{"a", 0.9}, {"b", 0.8}, {"doc-42", 0.3}});
        auto c = classifyCandidates(tc, hits, 3, 0.3);
        CHECK(c.outcome == Outcome::Pass);
    }

    SECTION("first occurrence wins") {
        auto hits = ranked({{"doc-42", 0.1}, {"doc-42", 0.9}});
        auto c = classifyCandidates(tc, hits, 3, 0.3);
        CHECK(c.outcome == Outcome::FailScoreBelowThreshold);
        CHECK(*c.rank == 1);
    }
}

TEST_CASE("alternate document ids are accepted as the match", "[validation][classify]") {
    auto tc = make_case("t1", "doc-42");
    tc.alternateDocumentIds = {"doc-42-v2"};

    auto hits = ranked({{"x", 0.9}, {"doc-42-v2", 0.8}});
    auto c = classifyCandidates(tc, hits, 3, 0.3);
    CHECK(c.outcome == Outcome::Pass);
    CHECK(*c.matchedDocumentId == "doc-42-v2");
}

TEST_CASE("outcome names round-trip", "[validation][outcome]") {
    for (auto o : kAllOutcomes) {
        auto parsed = parseOutcome(outcomeName(o));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == o);
    }
    CHECK(std::string(outcomeName(Outcome::FailScoreBelowThreshold)) ==
          "fail_score_below_threshold");
    CHECK_FALSE(parseOutcome("bogus").has_value());
}

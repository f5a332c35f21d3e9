/*
 * File: tests/test_scoring_engine.cpp
 * Project: Pose Score Engine
 * Purpose: End-to-end scoring with an in-memory analyzer
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <memory>
#include "posescore/scoring_engine.hpp"
#include "pose_fixtures.hpp"

namespace {

struct FixedAnalyzer : TemporalAnalyzer {
TemporalResult result;
int calls = 0;
std::size_t captured_seen = 0;
std::size_t reference_seen = 0;
TemporalResult analyze(const CapturedSequence& c, const ReferenceSequence& r) override {
    ++calls; captured_seen = c.size(); reference_seen = r.size();
    return result;
}
};

}


TEST_CASE("two frames of origin points against a 120-frame reference"){
auto analyzer = std::make_shared<FixedAnalyzer>();
ScoringEngine engine{analyzer};
ScoreRequest req;
req.captured = {captured_at(uniform_frame(12, 0, 0), 0), captured_at(uniform_frame(12, 0, 0), 1000)};
req.reference = ReferenceSequence(120, diagonal_frame(12, 5, 5));
req.reference[0] = uniform_frame(12, 0, 0);
req.reference[60] = uniform_frame(12, 0, 0);

auto r = engine.score(req);
REQUIRE(r.spatial == 100.0);
REQUIRE(r.frames_compared == 2);
REQUIRE(r.frames_skipped == 0);
REQUIRE(r.overall == 40.0);
REQUIRE(r.timing == 0.0);
REQUIRE(r.rhythm == 0.0);
REQUIRE(r.feedback.empty());
}


TEST_CASE("analyzer sees the full sequences, skipped frames included"){
auto analyzer = std::make_shared<FixedAnalyzer>();
analyzer->result = TemporalResult{90, 80, "Excellent dancing! Great job!"};
ScoringEngine engine{analyzer};
ScoreRequest req;
req.captured = {captured_at(diagonal_frame(5), 0), captured_at(diagonal_frame(5), 9000)};
req.reference = ReferenceSequence(30, diagonal_frame(5));

auto r = engine.score(req);
REQUIRE(analyzer->calls == 1);
REQUIRE(analyzer->captured_seen == 2);
REQUIRE(analyzer->reference_seen == 30);
REQUIRE(r.frames_skipped == 1);
REQUIRE(r.overall == Catch::Detail::Approx(100 * 0.4 + 90 * 0.3 + 80 * 0.3));
REQUIRE(r.feedback == "Excellent dancing! Great job!");
REQUIRE(r.grade == "A+");
}


TEST_CASE("nothing aligned fails before the analyzer runs"){
auto analyzer = std::make_shared<FixedAnalyzer>();
ScoringEngine engine{analyzer};
ScoreRequest req;
req.captured = {captured_at(diagonal_frame(5), 1000)};
req.reference = ReferenceSequence(30, diagonal_frame(5));
REQUIRE_THROWS_AS(engine.score(req), NoAlignedFramesError);
REQUIRE(analyzer->calls == 0);
}


TEST_CASE("empty sequences are invalid requests"){
auto analyzer = std::make_shared<FixedAnalyzer>();
ScoringEngine engine{analyzer};
ScoreRequest no_capture;
no_capture.reference = ReferenceSequence(3, diagonal_frame(5));
REQUIRE_THROWS_AS(engine.score(no_capture), InvalidRequestError);
ScoreRequest no_reference;
no_reference.captured = {captured_at(diagonal_frame(5), 0)};
REQUIRE_THROWS_AS(engine.score(no_reference), InvalidRequestError);
REQUIRE(analyzer->calls == 0);
}


TEST_CASE("engine requires an analyzer"){
REQUIRE_THROWS_AS(ScoringEngine{nullptr}, std::invalid_argument);
}


TEST_CASE("request JSON maps onto sequences"){
using nlohmann::json;
json body{
    {"captured", json::array({{{"landmarks", json::array({{{"x", 1}, {"y", 2}}})}, {"elapsed_ms", 0}}})},
    {"reference", json::array({json::array({{{"x", 3}, {"y", 4}}})})}};
auto req = score_request_from_json(body);
REQUIRE(req.captured.size() == 1);
REQUIRE(req.reference.size() == 1);
REQUIRE(req.reference[0][0].y == 4.0);
REQUIRE_THROWS_AS(score_request_from_json(json{{"captured", json::array()}}), InvalidRequestError);
}

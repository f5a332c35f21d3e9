/*
 * File: tests/test_http_endpoints.cpp
 * Project: Pose Score Engine
 * Purpose: HTTP handlers: status codes and bodies
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include "score_http.hpp"
#include "pose_fixtures.hpp"

using nlohmann::json;

namespace {

struct StubAnalyzer : TemporalAnalyzer {
bool time_out = false;
TemporalResult analyze(const CapturedSequence&, const ReferenceSequence&) override {
    if (time_out) throw AnalysisTimeoutError("stub timeout");
    return TemporalResult{50, 50, "Keep practicing to improve your performance!"};
}
};

json frame_json(const PoseFrame& f){ return frame_to_json(f); }

std::string score_body(double elapsed_ms){
json reference = json::array();
for (int i = 0; i < 60; ++i) reference.push_back(frame_json(diagonal_frame(6)));
json captured = json::array({{{"landmarks", frame_json(diagonal_frame(6))}, {"elapsed_ms", elapsed_ms}}});
return json{{"captured", captured}, {"reference", reference}}.dump();
}

}


TEST_CASE("score endpoint returns the result payload"){
ScoringEngine engine{std::make_shared<StubAnalyzer>()};
auto reply = score_reply(score_body(250), engine);
REQUIRE(reply.status == http::status::ok);
REQUIRE(reply.body["spatial"] == 100.0);
REQUIRE(reply.body["overall"].get<double>() == Catch::Detail::Approx(70.0));
REQUIRE(reply.body["feedback"] == "Keep practicing to improve your performance!");
REQUIRE(reply.body["grade"] == "B");
REQUIRE(reply.body["frames_compared"] == 1);
}


TEST_CASE("malformed JSON is a 400"){
ScoringEngine engine{std::make_shared<StubAnalyzer>()};
auto reply = score_reply("{\"captured\": [", engine);
REQUIRE(reply.status == http::status::bad_request);
REQUIRE(reply.body["error"] == "bad json");
}


TEST_CASE("request without reference is a 400"){
ScoringEngine engine{std::make_shared<StubAnalyzer>()};
auto reply = score_reply(R"({"captured":[]})", engine);
REQUIRE(reply.status == http::status::bad_request);
REQUIRE(reply.body["error"] == "invalid request");
}


TEST_CASE("no aligned frames is a 422"){
ScoringEngine engine{std::make_shared<StubAnalyzer>()};
auto reply = score_reply(score_body(5000), engine);
REQUIRE(reply.status == http::status::unprocessable_entity);
REQUIRE(reply.body["error"] == "no aligned frames");
}


TEST_CASE("analyzer timeout is a 504"){
auto stub = std::make_shared<StubAnalyzer>();
stub->time_out = true;
ScoringEngine engine{stub};
auto reply = score_reply(score_body(0), engine);
REQUIRE(reply.status == http::status::gateway_timeout);
REQUIRE(reply.body["error"] == "analysis timeout");
}


TEST_CASE("reference normalize endpoint shares one box"){
json body{{"reference", json::array({
    json::array({{{"x", 0}, {"y", 0}}, {{"x", 200}, {"y", 100}}}),
    json::array({{{"x", 100}, {"y", 50}}})})}};
auto reply = normalize_reply(body.dump());
REQUIRE(reply.status == http::status::ok);
REQUIRE(reply.body["frames"] == 2);
REQUIRE(reply.body["reference"][1][0]["x"] == 0.5);
REQUIRE(reply.body["reference"][1][0]["y"] == 0.5);
REQUIRE(reply.body["reference"][1][0]["visibility"] == 1.0);
}


TEST_CASE("reference normalize rejects bad bodies"){
REQUIRE(normalize_reply("[]").status == http::status::bad_request);
REQUIRE(normalize_reply("nope").status == http::status::bad_request);
}


TEST_CASE("non UTF-8 request bytes still produce a JSON body"){
ScoringEngine engine{std::make_shared<StubAnalyzer>()};
auto reply = score_reply("{\"captured\": \xff", engine);
REQUIRE(reply.status == http::status::bad_request);
std::string out;
REQUIRE_NOTHROW(out = json_body(reply.body));
REQUIRE(json::parse(out)["error"] == "bad json");

auto normalized = normalize_reply("{\"reference\":\xff}");
REQUIRE(normalized.status == http::status::bad_request);
REQUIRE_NOTHROW(json::parse(json_body(normalized.body)));
}

/*
 * File: tests/test_spatial_scorer.cpp
 * Project: Pose Score Engine
 * Purpose: Spatial sub-score over aligned frames
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include "posescore/spatial_scorer.hpp"
#include "pose_fixtures.hpp"

using Catch::Detail::Approx;

static ReferenceSequence repeated(const PoseFrame& f, std::size_t n){ return ReferenceSequence(n, f); }


TEST_CASE("identical aligned sequences score 100"){
ReferenceSequence ref = repeated(diagonal_frame(12), 120);
CapturedSequence cap{captured_at(diagonal_frame(12), 0), captured_at(diagonal_frame(12), 500), captured_at(diagonal_frame(12), 1000)};
auto s = score_spatial(cap, ref);
REQUIRE(s.score == 100.0);
REQUIRE(s.frames_compared == 3);
REQUIRE(s.comparisons == 36);
}


TEST_CASE("score ignores performer position and distance from camera"){
ReferenceSequence ref = repeated(diagonal_frame(8), 60);
CapturedSequence cap{captured_at(diagonal_frame(8, 300, 120, 25), 100)};
REQUIRE(score_spatial(cap, ref).score == Approx(100.0));
}


TEST_CASE("points a full unit apart score 0"){
ReferenceSequence ref{make_frame({{1, 0}, {0, 0}})};
CapturedSequence cap{captured_at(make_frame({{0, 0}, {1, 0}}), 0)};
auto s = score_spatial(cap, ref);
REQUIRE(s.distance_sum == 2.0);
REQUIRE(s.score == 0.0);
}


TEST_CASE("distances beyond 1 are clamped"){
REQUIRE(landmark_distance(Landmark{0, 0}, Landmark{1, 1}) == 1.0);
REQUIRE(landmark_distance(Landmark{0, 0}, Landmark{0.6, 0.8}) == Approx(1.0));
REQUIRE(landmark_distance(Landmark{0, 0}, Landmark{0.3, 0.4}) == Approx(0.5));

ReferenceSequence ref{make_frame({{1, 1}, {0, 0}})};
CapturedSequence cap{captured_at(make_frame({{0, 0}, {1, 1}}), 0)};
auto s = score_spatial(cap, ref);
REQUIRE(s.distance_sum == 2.0); // two diagonals of sqrt(2), each saturated
REQUIRE(s.score == 0.0);
}


TEST_CASE("landmark count mismatch compares the shorter prefix"){
ReferenceSequence ref{diagonal_frame(12)};
CapturedSequence cap{captured_at(diagonal_frame(10), 0)};
auto s = score_spatial(cap, ref);
REQUIRE(s.comparisons == 10);
REQUIRE(s.frames_compared == 1);
}


TEST_CASE("spatial score falls as the pose drifts"){
ReferenceSequence ref{make_frame({{0, 0}, {1, 0}, {0, 1}})};
CapturedSequence close{captured_at(make_frame({{0, 0}, {1, 0}, {0.2, 1}}), 0)};
CapturedSequence far{captured_at(make_frame({{0, 0}, {1, 0}, {0.4, 1}}), 0)};
double a = score_spatial(close, ref).score;
double b = score_spatial(far, ref).score;
REQUIRE(a == Approx(100.0 - 0.2 / 3 * 100));
REQUIRE(b == Approx(100.0 - 0.4 / 3 * 100));
REQUIRE(a > b);
}


TEST_CASE("frames beyond the reference do not count"){
ReferenceSequence ref = repeated(diagonal_frame(4), 120);
CapturedSequence cap{captured_at(diagonal_frame(4), 0), captured_at(make_frame({{9, 0}, {0, 9}, {3, 3}, {1, 8}}), 5000)};
auto s = score_spatial(cap, ref);
REQUIRE(s.frames_compared == 1);
REQUIRE(s.frames_skipped == 1);
REQUIRE(s.score == 100.0);
}


TEST_CASE("nothing aligned is an error, not a score"){
ReferenceSequence ref = repeated(diagonal_frame(4), 10);
CapturedSequence cap{captured_at(diagonal_frame(4), 1000), captured_at(diagonal_frame(4), 2000)};
REQUIRE_THROWS_AS(score_spatial(cap, ref), NoAlignedFramesError);
}


TEST_CASE("aligned frames without landmarks are an error too"){
ReferenceSequence ref = repeated(PoseFrame{}, 10);
CapturedSequence cap{captured_at(PoseFrame{}, 0)};
REQUIRE_THROWS_AS(score_spatial(cap, ref), NoAlignedFramesError);
}


TEST_CASE("an axis flat in only one frame of the pair adds no distance"){
// reference spans both axes; the captured frame is a horizontal line
ReferenceSequence ref{make_frame({{0, 0}, {1, 1}, {2, 4}})};
CapturedSequence cap{captured_at(make_frame({{0, 5}, {1, 5}, {2, 5}}), 0)};
auto s = score_spatial(cap, ref);
REQUIRE(s.comparisons == 3);
REQUIRE(s.distance_sum == 0.0);
REQUIRE(s.score == 100.0);

// x still counts: the captured line runs the other way
CapturedSequence reversed{captured_at(make_frame({{2, 5}, {1, 5}, {0, 5}}), 0)};
auto r = score_spatial(reversed, ref);
REQUIRE(r.distance_sum == Approx(2.0));
REQUIRE(r.score == Approx(100.0 - 2.0 / 3 * 100));
}

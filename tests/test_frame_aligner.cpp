/*
 * File: tests/test_frame_aligner.cpp
 * Project: Pose Score Engine
 * Purpose: Timestamp to reference index mapping
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <limits>
#include "posescore/frame_aligner.hpp"
#include "pose_fixtures.hpp"


TEST_CASE("one second maps to frame 60"){
REQUIRE(reference_index_for(1000, 120) == std::optional<std::size_t>(60));
}


TEST_CASE("999 ms rounds up to frame 60"){
REQUIRE(reference_index_for(999, 120) == std::optional<std::size_t>(60));
}


TEST_CASE("rounding around a half frame"){
REQUIRE(reference_index_for(0, 10) == std::optional<std::size_t>(0));
REQUIRE(reference_index_for(8, 10) == std::optional<std::size_t>(0));   // 0.48
REQUIRE(reference_index_for(9, 10) == std::optional<std::size_t>(1));   // 0.54
REQUIRE(reference_index_for(25, 10) == std::optional<std::size_t>(2));  // 1.5
}


TEST_CASE("indices past the reference are skipped, not clamped"){
REQUIRE(reference_index_for(1991, 120) == std::optional<std::size_t>(119));
REQUIRE_FALSE(reference_index_for(2000, 120).has_value());
REQUIRE_FALSE(reference_index_for(60000, 120).has_value());
REQUIRE_FALSE(reference_index_for(0, 0).has_value());
}


TEST_CASE("negative and non-finite times are skipped"){
REQUIRE_FALSE(reference_index_for(-100, 120).has_value());
REQUIRE_FALSE(reference_index_for(std::numeric_limits<double>::infinity(), 120).has_value());
}


TEST_CASE("align_sequence pairs in capture order and counts skips"){
CapturedSequence captured{
    captured_at(uniform_frame(3, 0, 0), 0),
    captured_at(uniform_frame(3, 0, 0), 5000),
    captured_at(uniform_frame(3, 0, 0), 500),
    captured_at(uniform_frame(3, 0, 0), -40)};
auto a = align_sequence(captured, 120);
REQUIRE(a.skipped == 2);
REQUIRE(a.pairs.size() == 2);
REQUIRE(a.pairs[0].captured_index == 0); REQUIRE(a.pairs[0].reference_index == 0);
REQUIRE(a.pairs[1].captured_index == 2); REQUIRE(a.pairs[1].reference_index == 30);
}

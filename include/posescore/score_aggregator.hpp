/*
 * File: include/posescore/score_aggregator.hpp
 * Project: Pose Score Engine
 * Purpose: Weighted combination of sub-scores into the final result
 * Notes:
 *  - Weights are compile-time constants so scores stay comparable
 *    across sessions
 * Last updated: 2026-10-19
 */

#pragma once
#include <string>

#include "common/pose.hpp"
#include "posescore/spatial_scorer.hpp"
#include "posescore/temporal_adapter.hpp"

constexpr double kSpatialWeight = 0.40;
constexpr double kTimingWeight = 0.30;
constexpr double kRhythmWeight = 0.30;

inline double combine_scores(double spatial, double timing, double rhythm)
{
    return spatial * kSpatialWeight + timing * kTimingWeight + rhythm * kRhythmWeight;
}

// Letter grade shown with the score.
inline std::string score_grade(double overall)
{
    if (overall >= 90)
        return "A+";
    if (overall >= 80)
        return "A";
    if (overall >= 70)
        return "B";
    if (overall >= 60)
        return "C";
    return "D";
}

inline ScoreResult aggregate(const SpatialScore &spatial, const TemporalResult &temporal)
{
    ScoreResult r;
    r.spatial = spatial.score;
    r.timing = temporal.timing;
    r.rhythm = temporal.rhythm;
    r.overall = combine_scores(r.spatial, r.timing, r.rhythm);
    r.feedback = temporal.feedback;
    r.grade = score_grade(r.overall);
    r.frames_compared = spatial.frames_compared;
    r.frames_skipped = spatial.frames_skipped;
    return r;
}

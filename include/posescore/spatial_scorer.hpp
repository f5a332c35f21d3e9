/*
 * File: include/posescore/spatial_scorer.hpp
 * Project: Pose Score Engine
 * Purpose: Average per-landmark distance between aligned frames as a 0-100 score
 * Notes:
 *  - Both frames of a pair are normalized independently (per-frame mode)
 *  - Distances saturate at 1
 *  - An axis with no extent in either frame of a pair adds no distance
 *  - Zero comparisons raise NoAlignedFramesError
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>

#include "common/pose.hpp"
#include "posescore/frame_aligner.hpp"
#include "posescore/normalizer.hpp"

struct SpatialScore
{
    double score{0};
    double distance_sum{0};
    std::size_t comparisons{0}; // (frame, landmark) pairs
    std::size_t frames_compared{0};
    std::size_t frames_skipped{0};
};

// Axes that take part in a pair's distance.
struct AxisMask
{
    bool x{true};
    bool y{true};
};

// Euclidean (x, y) distance over the masked axes, clamped to [0, 1].
inline double landmark_distance(const Landmark &a, const Landmark &b, AxisMask axes = AxisMask{})
{
    const double dx = axes.x ? a.x - b.x : 0.0;
    const double dy = axes.y ? a.y - b.y : 0.0;
    return std::clamp(std::hypot(dx, dy), 0.0, 1.0);
}

// Adds one aligned pair to the running sums. Only the common landmark prefix
// is compared when the counts differ.
inline void accumulate_frame_pair(const PoseFrame &captured, const PoseFrame &reference, SpatialScore &acc)
{
    BoundingBox user_box, ref_box;
    user_box.extend(captured);
    ref_box.extend(reference);
    const PoseFrame user = apply_bounding_box(captured, user_box);
    const PoseFrame ref = apply_bounding_box(reference, ref_box);
    const AxisMask axes{!user_box.flat_x() && !ref_box.flat_x(), !user_box.flat_y() && !ref_box.flat_y()};

    const std::size_t n = std::min(user.size(), ref.size());
    for (std::size_t j = 0; j < n; ++j)
    {
        acc.distance_sum += landmark_distance(user[j], ref[j], axes);
        ++acc.comparisons;
    }
    ++acc.frames_compared;
}

inline SpatialScore score_spatial(const CapturedSequence &captured, const ReferenceSequence &reference)
{
    const Alignment alignment = align_sequence(captured, reference.size());

    SpatialScore acc;
    acc.frames_skipped = alignment.skipped;
    for (const auto &pair : alignment.pairs)
        accumulate_frame_pair(captured[pair.captured_index].landmarks, reference[pair.reference_index], acc);

    if (acc.comparisons == 0)
        throw NoAlignedFramesError("no captured frame aligned with the reference (" +
                                   std::to_string(captured.size()) + " captured, " +
                                   std::to_string(reference.size()) + " reference frames)");

    acc.score = 100.0 - (acc.distance_sum / static_cast<double>(acc.comparisons)) * 100.0;
    return acc;
}

/*
 * File: include/posescore/normalizer.hpp
 * Project: Pose Score Engine
 * Purpose: Bounding-box normalization of landmark coordinates
 * Notes:
 *  - Batch mode for reference ingestion, per-frame mode at scoring time
 *  - A zero-extent axis maps to 0, never NaN
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <limits>

#include "common/pose.hpp"

struct BoundingBox
{
    double min_x = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();

    bool empty() const { return min_x > max_x; }
    bool flat_x() const { return !(max_x - min_x > 0.0); }
    bool flat_y() const { return !(max_y - min_y > 0.0); }

    void extend(const Landmark &lm)
    {
        min_x = std::min(min_x, lm.x);
        max_x = std::max(max_x, lm.x);
        min_y = std::min(min_y, lm.y);
        max_y = std::max(max_y, lm.y);
    }

    void extend(const PoseFrame &frame)
    {
        for (const auto &lm : frame)
            extend(lm);
    }
};

// (v - lo) / (hi - lo), or 0 when the axis has no extent.
inline double normalize_axis(double v, double lo, double hi)
{
    const double extent = hi - lo;
    if (!(extent > 0.0))
        return 0.0;
    return (v - lo) / extent;
}

// Remaps x and y into the box; z and visibility pass through.
inline PoseFrame apply_bounding_box(const PoseFrame &frame, const BoundingBox &box)
{
    PoseFrame out;
    out.reserve(frame.size());
    for (const auto &lm : frame)
    {
        Landmark n = lm;
        n.x = normalize_axis(lm.x, box.min_x, box.max_x);
        n.y = normalize_axis(lm.y, box.min_y, box.max_y);
        out.push_back(n);
    }
    return out;
}

// Per-frame mode: the box is the frame's own.
inline PoseFrame normalize_frame(const PoseFrame &frame)
{
    BoundingBox box;
    box.extend(frame);
    return apply_bounding_box(frame, box);
}

// Batch mode: one box shared by every frame so the whole sequence keeps a
// single consistent scale.
inline ReferenceSequence normalize_sequence(const ReferenceSequence &frames)
{
    BoundingBox box;
    for (const auto &f : frames)
        box.extend(f);

    ReferenceSequence out;
    out.reserve(frames.size());
    for (const auto &f : frames)
        out.push_back(apply_bounding_box(f, box));
    return out;
}

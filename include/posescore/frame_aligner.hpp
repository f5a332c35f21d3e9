/*
 * File: include/posescore/frame_aligner.hpp
 * Project: Pose Score Engine
 * Purpose: Map captured timestamps onto reference frame indices
 * Notes:
 *  - Nearest index, half-up rounding, no interpolation
 *  - Out-of-range frames are skipped, never clamped
 * Last updated: 2026-10-19
 */

#pragma once
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

#include "common/pose.hpp"

struct AlignedPair
{
    std::size_t captured_index;
    std::size_t reference_index;
};

struct Alignment
{
    std::vector<AlignedPair> pairs;
    std::size_t skipped{0};
};

// round(elapsed_ms * rate / 1000); nullopt when it falls outside
// [0, reference_length).
inline std::optional<std::size_t> reference_index_for(double elapsed_ms, std::size_t reference_length)
{
    if (!std::isfinite(elapsed_ms))
        return std::nullopt;
    const double slot = std::floor(elapsed_ms * kReferenceRateHz / 1000.0 + 0.5);
    if (slot < 0.0 || slot >= static_cast<double>(reference_length))
        return std::nullopt;
    return static_cast<std::size_t>(slot);
}

inline Alignment align_sequence(const CapturedSequence &captured, std::size_t reference_length)
{
    Alignment a;
    a.pairs.reserve(captured.size());
    for (std::size_t i = 0; i < captured.size(); ++i)
    {
        auto idx = reference_index_for(captured[i].elapsed_ms, reference_length);
        if (idx)
            a.pairs.push_back(AlignedPair{i, *idx});
        else
            ++a.skipped;
    }
    return a;
}

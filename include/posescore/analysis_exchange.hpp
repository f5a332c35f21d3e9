/*
 * File: include/posescore/analysis_exchange.hpp
 * Project: Pose Score Engine
 * Purpose: Files handed to the temporal analyzer process
 * Notes:
 *  - Landmarks are projected to [x, y]; z and visibility are dropped
 *  - Written by ProcessTemporalAnalyzer, read by pose_temporal_analyzer
 * Last updated: 2026-10-19
 */

#pragma once
#include <nlohmann/json.hpp>

#include "common/pose.hpp"

// captured.json:  {"reference_rate":60,"frames":[{"elapsed_ms":N,"points":[[x,y],...]},...]}
// reference.json: {"reference_rate":60,"frames":[[[x,y],...],...]}

inline nlohmann::json points_to_exchange(const PoseFrame &frame)
{
    nlohmann::json pts = nlohmann::json::array();
    for (const auto &lm : frame)
        pts.push_back({lm.x, lm.y});
    return pts;
}

inline PoseFrame points_from_exchange(const nlohmann::json &j)
{
    if (!j.is_array())
        throw InvalidRequestError("exchange frame must be an array of points");
    PoseFrame frame;
    frame.reserve(j.size());
    for (const auto &p : j)
    {
        if (!p.is_array() || p.size() < 2)
            throw InvalidRequestError("exchange point must be [x, y]");
        Landmark lm;
        lm.x = finite_number(p[0], "point.x");
        lm.y = finite_number(p[1], "point.y");
        frame.push_back(lm);
    }
    return frame;
}

inline nlohmann::json captured_to_exchange(const CapturedSequence &captured)
{
    nlohmann::json frames = nlohmann::json::array();
    for (const auto &cf : captured)
        frames.push_back({{"elapsed_ms", cf.elapsed_ms}, {"points", points_to_exchange(cf.landmarks)}});
    return nlohmann::json{{"reference_rate", kReferenceRateHz}, {"frames", frames}};
}

inline nlohmann::json reference_to_exchange(const ReferenceSequence &reference)
{
    nlohmann::json frames = nlohmann::json::array();
    for (const auto &f : reference)
        frames.push_back(points_to_exchange(f));
    return nlohmann::json{{"reference_rate", kReferenceRateHz}, {"frames", frames}};
}

inline CapturedSequence captured_from_exchange(const nlohmann::json &j)
{
    if (!j.is_object() || !j.contains("frames") || !j["frames"].is_array())
        throw InvalidRequestError("captured exchange requires a frames array");
    CapturedSequence seq;
    for (const auto &f : j["frames"])
    {
        if (!f.is_object() || !f.contains("points") || !f.contains("elapsed_ms"))
            throw InvalidRequestError("captured exchange frame requires points and elapsed_ms");
        CapturedFrame cf;
        cf.landmarks = points_from_exchange(f["points"]);
        cf.elapsed_ms = finite_number(f["elapsed_ms"], "elapsed_ms");
        seq.push_back(std::move(cf));
    }
    return seq;
}

inline ReferenceSequence reference_from_exchange(const nlohmann::json &j)
{
    if (!j.is_object() || !j.contains("frames") || !j["frames"].is_array())
        throw InvalidRequestError("reference exchange requires a frames array");
    ReferenceSequence seq;
    for (const auto &f : j["frames"])
        seq.push_back(points_from_exchange(f));
    return seq;
}

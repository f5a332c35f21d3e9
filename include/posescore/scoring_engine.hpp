/*
 * File: include/posescore/scoring_engine.hpp
 * Project: Pose Score Engine
 * Purpose: One scoring request end to end
 * Notes:
 *  - Spatial scoring runs first so a request with nothing aligned never
 *    launches the analyzer
 *  - Request-scoped; one engine serves concurrent requests
 * Last updated: 2026-10-19
 */

#pragma once
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

#include "common/pose.hpp"
#include "posescore/score_aggregator.hpp"
#include "posescore/spatial_scorer.hpp"
#include "posescore/temporal_adapter.hpp"

struct ScoreRequest
{
    CapturedSequence captured;
    ReferenceSequence reference;
};

// Body (JSON): { "captured":[{"landmarks":[...], "elapsed_ms":N}, ...], "reference":[[...], ...] }
inline ScoreRequest score_request_from_json(const nlohmann::json &body)
{
    if (!body.is_object() || !body.contains("captured") || !body.contains("reference"))
        throw InvalidRequestError("request requires captured and reference");
    ScoreRequest req;
    req.captured = captured_from_json(body["captured"]);
    req.reference = reference_from_json(body["reference"]);
    return req;
}

class ScoringEngine
{
    std::shared_ptr<TemporalAnalyzer> analyzer_;

public:
    explicit ScoringEngine(std::shared_ptr<TemporalAnalyzer> analyzer)
        : analyzer_(std::move(analyzer))
    {
        if (!analyzer_)
            throw std::invalid_argument("ScoringEngine requires a temporal analyzer");
    }

    ScoreResult score(const ScoreRequest &req) const
    {
        if (req.captured.empty())
            throw InvalidRequestError("captured sequence is empty");
        if (req.reference.empty())
            throw InvalidRequestError("reference sequence is empty");

        const SpatialScore spatial = score_spatial(req.captured, req.reference);
        std::cout << "[score] spatial=" << spatial.score
                  << " frames_compared=" << spatial.frames_compared
                  << " frames_skipped=" << spatial.frames_skipped
                  << " comparisons=" << spatial.comparisons << "\n";

        const TemporalResult temporal = analyzer_->analyze(req.captured, req.reference);
        ScoreResult result = aggregate(spatial, temporal);
        std::cout << "[score] timing=" << result.timing << " rhythm=" << result.rhythm
                  << " overall=" << result.overall << " grade=" << result.grade << "\n";
        return result;
    }
};

/*
 * File: include/posescore/errors.hpp
 * Project: Pose Score Engine
 * Purpose: Exception types surfaced by the scoring core
 * Notes:
 *  - HTTP status mapping lives in src/score_http.hpp
 *  - Temporal analysis failures degrade to zero sub-scores; only the
 *    timeout is an error
 * Last updated: 2026-10-19
 */

#pragma once
#include <stdexcept>
#include <string>

// Payload does not describe a scorable request (bad shape, non-finite values,
// empty sequences).
struct InvalidRequestError : std::runtime_error
{
    explicit InvalidRequestError(const std::string &what) : std::runtime_error(what) {}
};

// No captured frame landed on a valid reference index, so the spatial
// average has no denominator.
struct NoAlignedFramesError : std::runtime_error
{
    explicit NoAlignedFramesError(const std::string &what) : std::runtime_error(what) {}
};

// The external temporal analyzer did not exit within the configured budget.
struct AnalysisTimeoutError : std::runtime_error
{
    explicit AnalysisTimeoutError(const std::string &what) : std::runtime_error(what) {}
};

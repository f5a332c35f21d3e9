/*
 * File: include/posescore/temporal_adapter.hpp
 * Project: Pose Score Engine
 * Purpose: Timing/rhythm analysis seam and analyzer output parsing
 * Notes:
 *  - First occurrence of each field wins; later ones are progress noise
 *  - Missing fields degrade to 0 / empty feedback
 *  - Process-backed implementation in posescore/process_analyzer.hpp
 * Last updated: 2026-10-19
 */

#pragma once
#include <cmath>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>

#include "common/pose.hpp"

struct TemporalResult
{
    double timing{0};
    double rhythm{0};
    std::string feedback;
};

class TemporalAnalyzer
{
public:
    virtual ~TemporalAnalyzer() = default;

    // Runs on the full sequences, not on the aligned pairs.
    virtual TemporalResult analyze(const CapturedSequence &captured, const ReferenceSequence &reference) = 0;
};

// Fields recovered from analyzer output, each unset until seen.
struct AnalysisOutput
{
    std::optional<double> timing;
    std::optional<double> rhythm;
    std::optional<std::string> feedback;

    bool complete() const { return timing && rhythm && feedback; }

    TemporalResult result() const
    {
        TemporalResult r;
        r.timing = timing.value_or(0.0);
        r.rhythm = rhythm.value_or(0.0);
        r.feedback = feedback.value_or(std::string());
        return r;
    }
};

inline std::string trim(const std::string &s)
{
    const char *ws = " \t\r\n";
    auto b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return std::string();
    auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Leading number of text, if any.
inline std::optional<double> parse_leading_number(const std::string &text)
{
    const std::string t = trim(text);
    if (t.empty())
        return std::nullopt;
    char *end = nullptr;
    double v = std::strtod(t.c_str(), &end);
    if (end == t.c_str() || !std::isfinite(v))
        return std::nullopt;
    return v;
}

// Text following marker on the line, if the marker is present.
inline std::optional<std::string> marker_value(const std::string &line, const char *marker)
{
    auto p = line.find(marker);
    if (p == std::string::npos)
        return std::nullopt;
    return trim(line.substr(p + std::char_traits<char>::length(marker)));
}

// Invalid UTF-8 sequences in text become U+FFFD.
inline std::string utf8_clean(const std::string &text)
{
    const std::string quoted = nlohmann::json(text).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return nlohmann::json::parse(quoted).get<std::string>();
}

// {"timing":..,"rhythm":..,"feedback":..} on a single line.
inline void scan_record_line(const std::string &line, AnalysisOutput &out)
{
    nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        return;
    if (!out.timing && j.contains("timing") && j["timing"].is_number())
        out.timing = j["timing"].get<double>();
    if (!out.rhythm && j.contains("rhythm") && j["rhythm"].is_number())
        out.rhythm = j["rhythm"].get<double>();
    if (!out.feedback && j.contains("feedback") && j["feedback"].is_string())
        out.feedback = j["feedback"].get<std::string>();
}

// Legacy "Timing: 87.5" / "Rhythm: 60" / "Feedback: text" lines.
inline void scan_marker_line(const std::string &line, AnalysisOutput &out)
{
    if (!out.timing)
        if (auto v = marker_value(line, "Timing:"))
            out.timing = parse_leading_number(*v);
    if (!out.rhythm)
        if (auto v = marker_value(line, "Rhythm:"))
            out.rhythm = parse_leading_number(*v);
    if (!out.feedback)
        if (auto v = marker_value(line, "Feedback:"))
            out.feedback = utf8_clean(*v);
}

inline AnalysisOutput parse_analysis_output(const std::string &stdout_text)
{
    AnalysisOutput out;
    std::istringstream in(stdout_text);
    std::string line;
    while (!out.complete() && std::getline(in, line))
    {
        const std::string t = trim(line);
        if (t.empty())
            continue;
        if (t.front() == '{')
            scan_record_line(t, out);
        else
            scan_marker_line(t, out);
    }
    return out;
}

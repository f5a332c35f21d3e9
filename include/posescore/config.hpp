/*
 * File: include/posescore/config.hpp
 * Project: Pose Score Engine
 * Purpose: Server and analyzer configuration
 * Notes:
 *  - JSON file first, command-line flags override
 *  - Reference rate and score weights are not configurable
 * Last updated: 2026-10-19
 */

#pragma once
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "posescore/score_aggregator.hpp"

struct ScoringConfig
{
    std::string http_bind{"0.0.0.0:8080"};
    std::vector<std::string> analyzer_command{"pose_temporal_analyzer"};
    long analysis_timeout_ms{30000};
    unsigned workers{1}; // concurrent scoring requests; 1 queues them
    std::string scratch_dir{(std::filesystem::temp_directory_path() / "posescore").string()};
};

constexpr long long kMaxWorkers = 64;

// Worker count from a signed value; outside [1, kMaxWorkers] is invalid_argument.
inline unsigned workers_from(long long n)
{
    if (n < 1 || n > kMaxWorkers)
        throw std::invalid_argument("config: workers must be between 1 and " + std::to_string(kMaxWorkers));
    return static_cast<unsigned>(n);
}

inline void validate_config(const ScoringConfig &c)
{
    if (c.analyzer_command.empty() || c.analyzer_command.front().empty())
        throw std::invalid_argument("config: analyzer command is empty");
    if (c.analysis_timeout_ms <= 0)
        throw std::invalid_argument("config: analysis_timeout_ms must be positive");
    if (c.workers < 1 || c.workers > kMaxWorkers)
        throw std::invalid_argument("config: workers must be between 1 and " + std::to_string(kMaxWorkers));
    if (c.http_bind.find(':') == std::string::npos)
        throw std::invalid_argument("config: http must be host:port");
}

// Keys absent from j keep their current values in c.
inline void apply_config_json(const nlohmann::json &j, ScoringConfig &c)
{
    if (!j.is_object())
        throw std::invalid_argument("config: top level must be an object");
    c.http_bind = j.value("http", c.http_bind);
    if (j.contains("analyzer"))
    {
        const auto &a = j["analyzer"];
        if (a.is_string())
            c.analyzer_command = {a.get<std::string>()};
        else
            c.analyzer_command = a.get<std::vector<std::string>>();
    }
    c.analysis_timeout_ms = j.value("analysis_timeout_ms", c.analysis_timeout_ms);
    if (j.contains("workers"))
        c.workers = workers_from(j["workers"].get<long long>());
    c.scratch_dir = j.value("scratch_dir", c.scratch_dir);
}

inline void load_config_file(const std::filesystem::path &p, ScoringConfig &c)
{
    std::ifstream f(p);
    if (!f)
        throw std::runtime_error("failed to open config " + p.string());
    nlohmann::json j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded())
        throw std::runtime_error("config " + p.string() + " is not valid JSON");
    apply_config_json(j, c);
}

inline nlohmann::json config_to_json(const ScoringConfig &c)
{
    return nlohmann::json{
        {"http", c.http_bind},
        {"analyzer", c.analyzer_command},
        {"analysis_timeout_ms", c.analysis_timeout_ms},
        {"workers", c.workers},
        {"scratch_dir", c.scratch_dir},
        {"reference_rate", kReferenceRateHz},
        {"weights", {{"spatial", kSpatialWeight}, {"timing", kTimingWeight}, {"rhythm", kRhythmWeight}}}};
}

/*
 * File: services/temporal_analyzer/temporal_analyzer_main.cpp
 * Project: Pose Score Engine
 * Purpose: Out-of-process timing/rhythm analysis
 * Notes:
 *  - Usage: pose_temporal_analyzer <captured.json> <reference.json>
 *  - Progress lines first, then one JSON record line on stdout
 * Last updated: 2026-10-19
 */

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "posescore/analysis_exchange.hpp"
#include "posescore/frame_aligner.hpp"
#include "posescore/temporal_metrics.hpp"

using json = nlohmann::json;
namespace fs = std::filesystem;

static json read_json(const fs::path &p)
{
    std::ifstream f(p);
    if (!f)
        throw std::runtime_error("failed to open " + p.string());
    json j = json::parse(f, nullptr, false);
    if (j.is_discarded())
        throw std::runtime_error(p.string() + " is not valid JSON");
    return j;
}

int main(int argc, char **argv)
{
    if (argc < 3)
    {
        std::cerr << "usage: " << argv[0] << " <captured.json> <reference.json>\n";
        return 2;
    }

    try
    {
        const CapturedSequence captured = captured_from_exchange(read_json(argv[1]));
        const ReferenceSequence reference = reference_from_exchange(read_json(argv[2]));
        std::cout << "[temporal_analyzer] loaded " << captured.size() << " captured, "
                  << reference.size() << " reference frames" << std::endl;

        const Alignment alignment = align_sequence(captured, reference.size());
        TemporalScorer scorer;
        for (const auto &pair : alignment.pairs)
        {
            const auto &cf = captured[pair.captured_index];
            scorer.add(to_pose2(cf.landmarks), to_pose2(reference[pair.reference_index]), cf.elapsed_ms);
        }
        std::cout << "[temporal_analyzer] scored " << alignment.pairs.size() << " poses, skipped "
                  << alignment.skipped << std::endl;

        const TemporalSummary s = scorer.summary();
        json record{
            {"timing", s.timing},
            {"rhythm", s.rhythm},
            {"feedback", s.feedback},
            {"alignment_quality", s.alignment_quality},
            {"total_poses", s.total_poses}};
        std::cout << record.dump() << std::endl;
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "temporal_analyzer error: " << e.what() << "\n";
        return 1;
    }
}

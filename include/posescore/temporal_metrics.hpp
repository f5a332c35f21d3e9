/*
 * File: include/posescore/temporal_metrics.hpp
 * Project: Pose Score Engine
 * Purpose: Timing and rhythm metrics computed by pose_temporal_analyzer
 * Notes:
 *  - Poses are centered and scaled by height, then EWMA-smoothed
 *  - Per-pose scores are averaged over the whole performance
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <deque>
#include <numeric>
#include <string>
#include <vector>

#include "common/pose.hpp"
#include "posescore/score_aggregator.hpp"

struct Point2
{
    double x{0};
    double y{0};
};

using Pose2 = std::vector<Point2>;

inline Pose2 to_pose2(const PoseFrame &frame)
{
    Pose2 out;
    out.reserve(frame.size());
    for (const auto &lm : frame)
        out.push_back(Point2{lm.x, lm.y});
    return out;
}

// Centers on the bounding box of the non-(0,0) points and divides by its
// height. Points at exactly (0,0) are undetected and do not shape the box.
inline Pose2 normalize_by_height(const Pose2 &pose)
{
    double min_x = 0, max_x = 0, min_y = 0, max_y = 0;
    bool any = false;
    for (const auto &p : pose)
    {
        if (p.x == 0.0 && p.y == 0.0)
            continue;
        if (!any)
        {
            min_x = max_x = p.x;
            min_y = max_y = p.y;
            any = true;
            continue;
        }
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }
    if (!any)
        return pose;

    double height = max_y - min_y;
    if (height == 0.0)
        height = 1.0;
    const double cx = (min_x + max_x) / 2.0;
    const double cy = (min_y + max_y) / 2.0;

    Pose2 out;
    out.reserve(pose.size());
    for (const auto &p : pose)
        out.push_back(Point2{(p.x - cx) / height, (p.y - cy) / height});
    return out;
}

// Euclidean norm of the flattened difference over the shared prefix.
inline double pose_distance(const Pose2 &a, const Pose2 &b)
{
    const std::size_t n = std::min(a.size(), b.size());
    double sum = 0;
    for (std::size_t i = 0; i < n; ++i)
    {
        const double dx = a[i].x - b[i].x;
        const double dy = a[i].y - b[i].y;
        sum += dx * dx + dy * dy;
    }
    return std::sqrt(sum);
}

inline double mean_of(const std::vector<double> &v)
{
    if (v.empty())
        return 0.0;
    return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

// Population standard deviation.
inline double stddev_of(const std::vector<double> &v)
{
    if (v.empty())
        return 0.0;
    const double m = mean_of(v);
    double acc = 0;
    for (double x : v)
        acc += (x - m) * (x - m);
    return std::sqrt(acc / static_cast<double>(v.size()));
}

// Pearson correlation; NaN when either side has no variance.
inline double correlation_of(const std::vector<double> &a, const std::vector<double> &b)
{
    const std::size_t n = std::min(a.size(), b.size());
    if (n == 0)
        return std::nan("");
    double ma = 0, mb = 0;
    for (std::size_t i = 0; i < n; ++i)
    {
        ma += a[i];
        mb += b[i];
    }
    ma /= static_cast<double>(n);
    mb /= static_cast<double>(n);
    double num = 0, da = 0, db = 0;
    for (std::size_t i = 0; i < n; ++i)
    {
        num += (a[i] - ma) * (b[i] - mb);
        da += (a[i] - ma) * (a[i] - ma);
        db += (b[i] - mb) * (b[i] - mb);
    }
    if (da == 0.0 || db == 0.0)
        return std::nan("");
    return num / std::sqrt(da * db);
}

inline std::string performance_feedback(double overall, double spatial, double timing, double rhythm)
{
    if (overall >= 90)
        return "Outstanding performance! Perfect execution!";
    if (overall >= 80)
        return "Excellent dancing! Great job!";
    if (overall >= 70)
        return "Good performance! Keep practicing!";
    if (overall >= 60)
        return "Nice effort! Focus on improvement areas below.";

    std::vector<std::string> parts;
    if (spatial < 60)
        parts.emplace_back("improve pose accuracy");
    if (timing < 60)
        parts.emplace_back("work on timing consistency");
    if (rhythm < 60)
        parts.emplace_back("focus on rhythm and flow");
    if (parts.empty())
        return "Keep practicing to improve your performance!";

    std::string out = "Try to " + parts.front();
    for (std::size_t i = 1; i < parts.size(); ++i)
        out += " and " + parts[i];
    return out + ".";
}

struct TemporalSummary
{
    double timing{0};
    double rhythm{0};
    double spatial{0};
    double overall{0};
    double alignment_quality{0};
    std::size_t total_poses{0};
    std::string feedback{"No poses scored"};
};

// Feeds aligned (user, reference) poses in capture order and scores each
// against a bounded history.
class TemporalScorer
{
public:
    static constexpr std::size_t kMaxHistory = 100;
    static constexpr double kSmoothing = 0.3;
    static constexpr double kDistancePenalty = 2.0;
    static constexpr double kExpectedInterval = 1.0 / 30.0; // seconds

    void add(const Pose2 &user, const Pose2 &reference, double elapsed_ms)
    {
        const Pose2 smoothed = smooth(normalize_by_height(user));
        push_bounded(user_poses_, smoothed);
        push_bounded(reference_poses_, normalize_by_height(reference));
        push_bounded(timestamps_, elapsed_ms / 1000.0);

        const double frame = std::clamp(std::exp(-kDistancePenalty * pose_distance(smoothed, reference_poses_.back())), 0.0, 1.0);
        frame_scores_.push_back(frame);
        timing_scores_.push_back(timing_score());
        rhythm_scores_.push_back(rhythm_score());
    }

    TemporalSummary summary() const
    {
        TemporalSummary s;
        if (frame_scores_.empty())
            return s;
        s.total_poses = frame_scores_.size();
        s.spatial = mean_of(frame_scores_) * 100.0;
        s.timing = mean_of(timing_scores_) * 100.0;
        s.rhythm = mean_of(rhythm_scores_) * 100.0;
        s.alignment_quality = s.spatial;
        s.overall = combine_scores(s.spatial, s.timing, s.rhythm);
        s.feedback = performance_feedback(s.overall, s.spatial, s.timing, s.rhythm);
        return s;
    }

private:
    std::deque<Pose2> user_poses_;
    std::deque<Pose2> reference_poses_;
    std::deque<double> timestamps_;
    Pose2 last_smoothed_;
    std::vector<double> frame_scores_;
    std::vector<double> timing_scores_;
    std::vector<double> rhythm_scores_;

    template <typename T>
    static void push_bounded(std::deque<T> &d, T v)
    {
        d.push_back(std::move(v));
        if (d.size() > kMaxHistory)
            d.pop_front();
    }

    Pose2 smooth(const Pose2 &pose)
    {
        if (last_smoothed_.empty() || last_smoothed_.size() != pose.size())
        {
            last_smoothed_ = pose;
            return pose;
        }
        Pose2 out(pose.size());
        for (std::size_t i = 0; i < pose.size(); ++i)
        {
            out[i].x = kSmoothing * pose[i].x + (1.0 - kSmoothing) * last_smoothed_[i].x;
            out[i].y = kSmoothing * pose[i].y + (1.0 - kSmoothing) * last_smoothed_[i].y;
        }
        last_smoothed_ = out;
        return out;
    }

    // 1 - stddev(intervals) / expected interval, floored at 0.
    double timing_score() const
    {
        if (timestamps_.size() < 2)
            return 0.5;
        std::vector<double> diffs;
        for (std::size_t i = 1; i < timestamps_.size(); ++i)
            diffs.push_back(timestamps_[i] - timestamps_[i - 1]);
        return std::max(1.0 - std::min(stddev_of(diffs) / kExpectedInterval, 1.0), 0.0);
    }

    static std::vector<double> velocities(const std::deque<Pose2> &poses)
    {
        std::vector<double> v;
        for (std::size_t i = 1; i < poses.size(); ++i)
            v.push_back(pose_distance(poses[i], poses[i - 1]));
        return v;
    }

    // Correlation of user and reference movement speed; falls back to how
    // steady the user's own speed is.
    double rhythm_score() const
    {
        if (user_poses_.size() < 3)
            return 0.5;
        const std::vector<double> user_vel = velocities(user_poses_);
        const std::vector<double> ref_vel = velocities(reference_poses_);

        if (user_vel.size() >= 3 && ref_vel.size() >= 3 && stddev_of(user_vel) > 0 && stddev_of(ref_vel) > 0)
        {
            const double c = correlation_of(user_vel, ref_vel);
            return std::isnan(c) ? 0.5 : std::clamp(c, 0.0, 1.0);
        }

        if (user_vel.size() >= 2)
            return std::max(1.0 - std::min(stddev_of(user_vel) / (mean_of(user_vel) + 1e-6), 1.0), 0.0);
        return 0.5;
    }
};

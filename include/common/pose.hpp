/*
 * File: include/common/pose.hpp
 * Project: Pose Score Engine
 * Purpose: Landmark, frame and sequence types with their JSON mapping
 * Notes:
 *  - Landmark order is owned by the upstream detector; never reorder
 *  - Reference sequences are sampled at kReferenceRateHz
 *  - Parsing errors are reported as InvalidRequestError
 * Last updated: 2026-10-19
 */

#pragma once
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "posescore/errors.hpp"

// Samples per second of every reference sequence. Frame alignment and the
// reference extraction pipeline both depend on it; never change one alone.
constexpr double kReferenceRateHz = 60.0;


struct Landmark {
double x{0};
double y{0};
double z{0};
double visibility{1};
};

using PoseFrame = std::vector<Landmark>;

struct CapturedFrame {
PoseFrame landmarks;
double elapsed_ms{0}; // since the performance began
};

using CapturedSequence = std::vector<CapturedFrame>;
using ReferenceSequence = std::vector<PoseFrame>;

struct ScoreResult {
double overall{0};
double spatial{0};
double timing{0};
double rhythm{0};
std::string feedback;
std::string grade;
std::size_t frames_compared{0};
std::size_t frames_skipped{0};
};


inline double finite_number(const nlohmann::json& j, const char* what){
if (!j.is_number()) throw InvalidRequestError(std::string(what) + " must be a number");
double v = j.get<double>();
if (!std::isfinite(v)) throw InvalidRequestError(std::string(what) + " must be finite");
return v;
}


// { "x":..., "y":..., "z"?:..., "visibility"?:... }
inline Landmark landmark_from_json(const nlohmann::json& j){
if (!j.is_object() || !j.contains("x") || !j.contains("y"))
    throw InvalidRequestError("landmark requires x and y");
Landmark lm;
lm.x = finite_number(j["x"], "landmark.x");
lm.y = finite_number(j["y"], "landmark.y");
if (j.contains("z")) lm.z = finite_number(j["z"], "landmark.z");
if (j.contains("visibility")) lm.visibility = finite_number(j["visibility"], "landmark.visibility");
return lm;
}


inline nlohmann::json landmark_to_json(const Landmark& lm){
return nlohmann::json{{"x", lm.x}, {"y", lm.y}, {"z", lm.z}, {"visibility", lm.visibility}};
}


inline PoseFrame frame_from_json(const nlohmann::json& j){
if (!j.is_array()) throw InvalidRequestError("pose frame must be an array of landmarks");
PoseFrame frame;
frame.reserve(j.size());
for (const auto& lm : j) frame.push_back(landmark_from_json(lm));
return frame;
}


inline nlohmann::json frame_to_json(const PoseFrame& frame){
nlohmann::json out = nlohmann::json::array();
for (const auto& lm : frame) out.push_back(landmark_to_json(lm));
return out;
}


// [ { "landmarks":[...], "elapsed_ms":N }, ... ]; "timestamp" is accepted
// for elapsed_ms as the capture UI sends it.
inline CapturedSequence captured_from_json(const nlohmann::json& j){
if (!j.is_array()) throw InvalidRequestError("captured must be an array");
CapturedSequence seq;
seq.reserve(j.size());
for (const auto& entry : j){
    if (!entry.is_object() || !entry.contains("landmarks"))
        throw InvalidRequestError("captured frame requires landmarks");
    CapturedFrame cf;
    cf.landmarks = frame_from_json(entry["landmarks"]);
    if (entry.contains("elapsed_ms")) cf.elapsed_ms = finite_number(entry["elapsed_ms"], "elapsed_ms");
    else if (entry.contains("timestamp")) cf.elapsed_ms = finite_number(entry["timestamp"], "timestamp");
    else throw InvalidRequestError("captured frame requires elapsed_ms");
    seq.push_back(std::move(cf));
}
return seq;
}


inline ReferenceSequence reference_from_json(const nlohmann::json& j){
if (!j.is_array()) throw InvalidRequestError("reference must be an array of frames");
ReferenceSequence seq;
seq.reserve(j.size());
for (const auto& f : j) seq.push_back(frame_from_json(f));
return seq;
}


inline nlohmann::json reference_to_json(const ReferenceSequence& seq){
nlohmann::json out = nlohmann::json::array();
for (const auto& f : seq) out.push_back(frame_to_json(f));
return out;
}


inline nlohmann::json score_result_to_json(const ScoreResult& r){
return nlohmann::json{
{"overall", r.overall},
{"spatial", r.spatial},
{"timing", r.timing},
{"rhythm", r.rhythm},
{"feedback", r.feedback},
{"grade", r.grade},
{"frames_compared", r.frames_compared},
{"frames_skipped", r.frames_skipped}
};
}

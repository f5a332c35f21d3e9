/*
 * File: src/score_state.hpp
 * Project: Pose Score Engine
 * Purpose: State shared by the HTTP sessions of one server
 * Notes:
 *  - Read-only after startup; per-request data lives in the session
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <boost/asio/thread_pool.hpp>

#include "posescore/config.hpp"
#include "posescore/scoring_engine.hpp"

// Captured sessions of a few minutes at device frame rates run to tens of MB.
constexpr std::uint64_t kMaxBodyBytes = 50ull * 1024 * 1024;

struct ServerState {
ScoringConfig config;
std::shared_ptr<const ScoringEngine> engine;
boost::asio::thread_pool* workers = nullptr; // scoring runs here, off the io thread
std::uint64_t max_body_bytes = kMaxBodyBytes; // larger bodies get 413
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};

/*
 * File: include/atomic_write.hpp
 * Project: Pose Score Engine
 * Purpose: Atomic file writes and per-request scratch directories
 * Notes:
 *  - Each temporal analysis gets its own directory; concurrent requests
 *    never share exchange files
 * Last updated: 2026-10-19
 */


#pragma once
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <fcntl.h>

namespace fs = std::filesystem;

// Atomic file writer: writes to <path>.tmp, fsyncs, then renames to final.
inline void write_atomic(const fs::path &final_path, const std::string &data)
{
    fs::path tmp = final_path;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw std::runtime_error("Failed to open temp file: " + tmp.string());
        ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
        ofs.flush();
        if (!ofs)
            throw std::runtime_error("Failed to write temp file: " + tmp.string());
    }
    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd >= 0)
    {
        ::fsync(fd);
        ::close(fd);
    }
    std::error_code ec;
    fs::rename(tmp, final_path, ec);
    if (ec)
        throw std::runtime_error("Failed to rename " + tmp.string() + ": " + ec.message());
}

inline std::atomic<uint64_t> g_scratch_seq{1}; // per-process sequence for scratch names

// Owns a fresh directory under root for the lifetime of one request and
// removes it with everything in it on destruction.
class ScratchDir
{
    fs::path path_;

public:
    explicit ScratchDir(const fs::path &root)
    {
        std::error_code ec;
        fs::create_directories(root, ec);
        if (ec)
            throw std::runtime_error("create_directories failed for " + root.string() + ": " + ec.message());

        for (;;)
        {
            std::ostringstream name;
            name << "req_" << ::getpid() << '_' << std::setw(6) << std::setfill('0') << g_scratch_seq.fetch_add(1);
            fs::path candidate = root / name.str();
            if (fs::create_directory(candidate, ec))
            {
                path_ = candidate;
                return;
            }
            if (ec)
                throw std::runtime_error("create_directory failed for " + candidate.string() + ": " + ec.message());
            // left over from an earlier process with the same pid; try the next name
        }
    }

    ~ScratchDir()
    {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec)
            std::cerr << "[scratch] failed to remove " << path_ << ": " << ec.message() << "\n";
    }

    ScratchDir(const ScratchDir &) = delete;
    ScratchDir &operator=(const ScratchDir &) = delete;

    const fs::path &path() const { return path_; }
};

/*
 * File: include/posescore/process_analyzer.hpp
 * Project: Pose Score Engine
 * Purpose: TemporalAnalyzer backed by an external process
 * Notes:
 *  - Input files go to a per-request ScratchDir (include/atomic_write.hpp)
 *  - argv = command..., captured.json, reference.json
 *  - Exit code is advisory; only the timeout fails the request
 * Last updated: 2026-10-19
 */

#pragma once
#include <chrono>
#include <future>
#include <stdexcept>
#include <iostream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/process.hpp>

#include "atomic_write.hpp"
#include "posescore/analysis_exchange.hpp"
#include "posescore/errors.hpp"
#include "posescore/temporal_adapter.hpp"

class ProcessTemporalAnalyzer : public TemporalAnalyzer
{
    std::vector<std::string> command_;
    std::chrono::milliseconds timeout_;
    fs::path scratch_root_;

public:
    ProcessTemporalAnalyzer(std::vector<std::string> command, std::chrono::milliseconds timeout, fs::path scratch_root)
        : command_(std::move(command)), timeout_(timeout), scratch_root_(std::move(scratch_root))
    {
        if (command_.empty())
            throw std::invalid_argument("analyzer command is empty");
    }

    TemporalResult analyze(const CapturedSequence &captured, const ReferenceSequence &reference) override
    {
        ScratchDir scratch{scratch_root_};
        const fs::path captured_path = scratch.path() / "captured.json";
        const fs::path reference_path = scratch.path() / "reference.json";
        write_atomic(captured_path, captured_to_exchange(captured).dump());
        write_atomic(reference_path, reference_to_exchange(reference).dump());

        std::string output;
        int exit_code = -1;
        try
        {
            exit_code = run(captured_path, reference_path, output);
        }
        catch (const std::system_error &e)
        {
            std::cerr << "[temporal] failed to run " << command_.front() << ": " << e.what() << "\n";
            return TemporalResult{};
        }

        if (exit_code != 0)
            std::cerr << "[temporal] analyzer exited with code " << exit_code << "\n";
        else
            std::cout << "[temporal] analyzer exited with code 0\n";

        AnalysisOutput parsed = parse_analysis_output(output);
        if (!parsed.timing)
            std::cerr << "[temporal] no timing in analyzer output, using 0\n";
        if (!parsed.rhythm)
            std::cerr << "[temporal] no rhythm in analyzer output, using 0\n";
        if (!parsed.feedback)
            std::cerr << "[temporal] no feedback in analyzer output\n";
        return parsed.result();
    }

private:
    boost::filesystem::path resolve_executable() const
    {
        const std::string &exe = command_.front();
        if (exe.find('/') != std::string::npos)
            return boost::filesystem::path(exe);
        return boost::process::search_path(exe);
    }

    // Returns the exit code; stdout is collected into output. Throws
    // AnalysisTimeoutError when the process outlives timeout_.
    int run(const fs::path &captured_path, const fs::path &reference_path, std::string &output)
    {
        namespace bp = boost::process;

        const boost::filesystem::path exe = resolve_executable();
        if (exe.empty())
            throw std::system_error(std::make_error_code(std::errc::no_such_file_or_directory),
                                    "executable not found on PATH");

        std::vector<std::string> args(command_.begin() + 1, command_.end());
        args.push_back(captured_path.string());
        args.push_back(reference_path.string());

        boost::asio::io_context ioc;
        std::future<std::string> out;
        int exit_code = -1;
        bp::child child(exe, bp::args(args), bp::std_out > out, ioc,
                        bp::on_exit([&exit_code](int code, const std::error_code &)
                                    { exit_code = code; }));

        ioc.run_for(timeout_);
        if (!ioc.stopped())
        {
            std::error_code ec;
            child.terminate(ec);
            if (ec)
                std::cerr << "[temporal] terminate failed: " << ec.message() << "\n";
            throw AnalysisTimeoutError("temporal analyzer did not finish within " +
                                       std::to_string(timeout_.count()) + " ms");
        }

        output = out.get();
        return exit_code;
    }
};

/*
 * File: src/score_main.cpp
 * Project: Pose Score Engine
 * Purpose: Main server binary: HTTP /v1/score and /v1/reference/normalize
 * Notes:
 *  - --config FILE is read first; other flags override it
 *  - Scoring requests beyond --workers are queued
 * Last updated: 2026-10-19
 */

#include <iostream>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <boost/asio/thread_pool.hpp>
#include "score_http.hpp"
#include "score_state.hpp"
#include "posescore/process_analyzer.hpp"

static ScoringConfig parse_args(int argc, char **argv)
{
    ScoringConfig cfg;
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string(argv[i]) == "--config")
        {
            load_config_file(argv[i + 1], cfg);
            break;
        }
    }
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc)
            ++i;
        else if (a == "--http" && i + 1 < argc)
            cfg.http_bind = argv[++i];
        else if (a == "--analyzer" && i + 1 < argc)
            cfg.analyzer_command = {argv[++i]};
        else if (a == "--timeout-ms" && i + 1 < argc)
            cfg.analysis_timeout_ms = std::stol(argv[++i]);
        else if (a == "--workers" && i + 1 < argc)
            cfg.workers = workers_from(std::stoll(argv[++i]));
        else if (a == "--scratch" && i + 1 < argc)
            cfg.scratch_dir = argv[++i];
        else
            throw std::invalid_argument("unknown or incomplete option: " + a);
    }
    validate_config(cfg);
    return cfg;
}

int main(int argc, char **argv)
{
    try
    {
        ServerState state;
        state.config = parse_args(argc, argv);

        auto split = [](const std::string &s)
        { auto p=s.rfind(":"); return std::pair{s.substr(0,p), static_cast<unsigned short>(std::stoi(s.substr(p+1)))}; };
        auto [http_host, http_port] = split(state.config.http_bind);

        auto analyzer = std::make_shared<ProcessTemporalAnalyzer>(
            state.config.analyzer_command,
            std::chrono::milliseconds(state.config.analysis_timeout_ms),
            state.config.scratch_dir);
        state.engine = std::make_shared<ScoringEngine>(analyzer);

        boost::asio::thread_pool workers{state.config.workers};
        state.workers = &workers;

        boost::asio::io_context ioc{1};
        boost::asio::ip::tcp::endpoint http_ep{boost::asio::ip::make_address(http_host), http_port};
        HttpServer http{ioc, http_ep, state};

        std::cout << "posescore listening http=" << state.config.http_bind
                  << " analyzer=" << state.config.analyzer_command.front()
                  << " timeout_ms=" << state.config.analysis_timeout_ms
                  << " workers=" << state.config.workers
                  << " scratch=" << state.config.scratch_dir << "\n";

        ioc.run();
        workers.join();
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "posescore error: " << e.what() << "\n";
        return 1;
    }
}

/*
 * File: clients/score_client/score_client_main.cpp
 * Project: Pose Score Engine
 * Purpose: Example HTTP consumer client
 * Notes:
 *  - Posts one scoring request built from two JSON files
 *  - --captured: [{"landmarks":[...],"elapsed_ms":N}, ...]
 *  - --reference: [[landmark...], ...]
 * Last updated: 2026-10-19
 */

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <nlohmann/json.hpp>

namespace http = boost::beast::http;
using json = nlohmann::json;

static json read_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("failed to open " + path);
    return json::parse(f);
}

int main(int argc, char **argv)
{
    bool pretty = false;
    std::string base = "http://localhost:8080";
    std::string captured_path;
    std::string reference_path;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--captured" && i + 1 < argc)
            captured_path = argv[++i];
        else if (a == "--reference" && i + 1 < argc)
            reference_path = argv[++i];
        else if (a == "--pretty")
            pretty = true;
    }
    if (captured_path.empty() || reference_path.empty())
    {
        std::cerr << "usage: " << argv[0] << " --captured FILE --reference FILE [--http URL] [--pretty]\n";
        return 2;
    }

    try
    {
        json body{{"captured", read_json_file(captured_path)}, {"reference", read_json_file(reference_path)}};

        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto pos = base.find("//");
        auto hp = (pos == std::string::npos) ? base : base.substr(pos + 2);
        auto colon = hp.find(":");
        auto host = hp.substr(0, colon);
        auto port = (colon == std::string::npos) ? std::string("80") : hp.substr(colon + 1);
        auto results = res.resolve(host, port);

        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        http::request<http::string_body> req{http::verb::post, "/v1/score", 11};
        req.set(http::field::host, host);
        req.set(http::field::content_type, "application/json");
        req.body() = body.dump();
        req.prepare_payload();
        http::write(sock, req);

        boost::beast::flat_buffer buf;
        http::response_parser<http::string_body> parser;
        parser.body_limit(16 * 1024 * 1024);
        http::read(sock, buf, parser);
        auto response = parser.release();

        boost::system::error_code ec;
        sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != boost::asio::error::not_connected)
            std::cerr << "[score_client] shutdown: " << ec.message() << "\n";

        auto j = json::parse(response.body(), nullptr, false);
        std::cout << "[score_client] status=" << response.result_int() << " body:\n";
        if (j.is_discarded())
            std::cout << response.body() << std::endl;
        else
            std::cout << j.dump(pretty ? 2 : -1, ' ', false, json::error_handler_t::replace) << std::endl;
        return response.result() == http::status::ok ? 0 : 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "[score_client] error: " << e.what() << "\n";
        return 1;
    }
}

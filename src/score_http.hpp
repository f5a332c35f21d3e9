/*
 * File: src/score_http.hpp
 * Project: Pose Score Engine
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - POST /v1/score runs on the worker pool; the io thread never waits on
 *    the analyzer process
 *  - Every response body is JSON
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "score_state.hpp"
#include "common/pose.hpp"
#include "posescore/normalizer.hpp"
#include "posescore/scoring_engine.hpp"

namespace http = boost::beast::http;

struct HttpReply
{
    http::status status;
    nlohmann::json body;
};

// Serialized response body. Bytes that are not UTF-8 (client input echoed in
// parse errors, analyzer text) become U+FFFD instead of failing the dump.
inline std::string json_body(const nlohmann::json &body)
{
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline HttpReply error_reply(http::status st, const char *error, const std::exception &e)
{
    return HttpReply{st, nlohmann::json{{"error", error}, {"what", e.what()}}};
}

// POST /v1/score
inline HttpReply score_reply(const std::string &body, const ScoringEngine &engine)
{
    using nlohmann::json;
    try
    {
        const ScoreRequest request = score_request_from_json(json::parse(body));
        const ScoreResult result = engine.score(request);
        json out = score_result_to_json(result);
        out["message"] = "Score calculated successfully!";
        return HttpReply{http::status::ok, out};
    }
    catch (const json::parse_error &e)
    {
        return error_reply(http::status::bad_request, "bad json", e);
    }
    catch (const InvalidRequestError &e)
    {
        return error_reply(http::status::bad_request, "invalid request", e);
    }
    catch (const NoAlignedFramesError &e)
    {
        return error_reply(http::status::unprocessable_entity, "no aligned frames", e);
    }
    catch (const AnalysisTimeoutError &e)
    {
        return error_reply(http::status::gateway_timeout, "analysis timeout", e);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[http] score failed: " << e.what() << "\n";
        return error_reply(http::status::internal_server_error, "score failed", e);
    }
}

// POST /v1/reference/normalize
// Body (JSON): { "reference":[[landmark...], ...] }
inline HttpReply normalize_reply(const std::string &body)
{
    using nlohmann::json;
    try
    {
        const json j = json::parse(body);
        if (!j.is_object() || !j.contains("reference"))
            throw InvalidRequestError("request requires reference");
        const ReferenceSequence normalized = normalize_sequence(reference_from_json(j["reference"]));
        return HttpReply{http::status::ok, json{{"frames", normalized.size()}, {"reference", reference_to_json(normalized)}}};
    }
    catch (const json::parse_error &e)
    {
        return error_reply(http::status::bad_request, "bad json", e);
    }
    catch (const InvalidRequestError &e)
    {
        return error_reply(http::status::bad_request, "invalid request", e);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[http] normalize failed: " << e.what() << "\n";
        return error_reply(http::status::internal_server_error, "normalize failed", e);
    }
}

// -------- HTTP server --------

class HttpServer
{
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::steady_timer retry_;
    ServerState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, ServerState &s)
        : acceptor_(ioc), socket_(ioc), retry_(ioc), state_(s)
    {
        acceptor_.open(ep.protocol());
        acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
        acceptor_.bind(ep);
        acceptor_.listen(boost::asio::socket_base::max_listen_connections);
        do_accept();
    }

    // Bound address; port 0 in the constructor picks an ephemeral one.
    boost::asio::ip::tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

private:
    static constexpr std::chrono::milliseconds kAcceptRetryDelay{100};

    void do_accept()
    {
        acceptor_.async_accept(socket_, [this](auto ec)
                               {
            if (!ec)
            {
                std::make_shared<Session>(std::move(socket_), state_)->run();
                return do_accept();
            }
            if (ec == boost::asio::error::operation_aborted)
                return;
            // fd exhaustion and similar: back off instead of spinning
            std::cerr << "[http] accept failed: " << ec.message() << "\n";
            retry_.expires_after(kAcceptRetryDelay);
            retry_.async_wait([this](auto wait_ec)
                              { if (!wait_ec) do_accept(); }); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        http::request_parser<http::string_body> parser;
        http::request<http::string_body> req;
        ServerState &state;

        Session(boost::asio::ip::tcp::socket &&s, ServerState &st)
            : socket(std::move(s)), state(st)
        {
            parser.body_limit(st.max_body_bytes);
        }

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, parser, [self](auto ec, auto)
                             {
                if (ec == http::error::body_limit)
                    return self->respond(self->json_response(http::status::payload_too_large, {{"error", "body too large"}}));
                if (ec)
                {
                    if (ec != http::error::end_of_stream)
                        std::cerr << "[http] read failed: " << ec.message() << "\n";
                    return;
                }
                self->req = self->parser.release();
                self->handle(); });
        }

        // keep response alive through async_write
        void respond(http::response<http::string_body> &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
            sp->set(http::field::server, "posescore-beast");

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code ec, std::size_t)
                              {
                if (ec)
                    std::cerr << "[http] write failed: " << ec.message() << "\n";
                boost::system::error_code shutdown_ec;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, shutdown_ec);
                if (shutdown_ec && shutdown_ec != boost::asio::error::not_connected)
                    std::cerr << "[http] shutdown failed: " << shutdown_ec.message() << "\n"; });
        }

        http::response<http::string_body> json_response(http::status st, const nlohmann::json &body)
        {
            http::response<http::string_body> res{st, req.version()};
            res.set(http::field::content_type, "application/json");
            res.body() = json_body(body);
            res.prepare_payload();
            return res;
        }

        void handle()
        {
            using nlohmann::json;

            // GET /health
            if (req.method() == http::verb::get && req.target() == "/health")
            {
                auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
                return respond(json_response(http::status::ok, json{{"status", "ok"}, {"uptime_s", up}}));
            }

            // GET /v1/config
            if (req.method() == http::verb::get && req.target() == "/v1/config")
                return respond(json_response(http::status::ok, config_to_json(state.config)));

            // POST /v1/score  (queued on the worker pool)
            if (req.method() == http::verb::post && req.target() == "/v1/score")
            {
                auto self = shared_from_this();
                boost::asio::post(*state.workers, [self]()
                                  {
                    HttpReply reply = score_reply(self->req.body(), *self->state.engine);
                    boost::asio::post(self->socket.get_executor(), [self, reply = std::move(reply)]()
                                      { self->respond(self->json_response(reply.status, reply.body)); }); });
                return;
            }

            // POST /v1/reference/normalize
            if (req.method() == http::verb::post && req.target() == "/v1/reference/normalize")
            {
                HttpReply reply = normalize_reply(req.body());
                return respond(json_response(reply.status, reply.body));
            }

            // 404 fallback
            return respond(json_response(http::status::not_found, json{{"error", "not found"}}));
        }
    };
};

#pragma once
/// In-process cpp-httplib server hosting the math service on an ephemeral
/// loopback port, plus an /inspect route that reports what it received.

#include "math_service.hpp"
#include <gtest/gtest.h>
#include <httplib.h>
#include <rpcwire/service_address.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

class MathServerTest : public ::testing::Test {
protected:
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    int port_ = 0;

    void SetUp() override {
        server_ = std::make_unique<httplib::Server>();

        server_->Post("/math-api", [](const httplib::Request& req, httplib::Response& res) {
            res.set_content(math_service::handle(req.body).dump(), "application/json");
        });

        // Replies with a JSON-RPC result describing the received request
        server_->Post("/inspect", [](const httplib::Request& req, httplib::Response& res) {
            rpcwire::Json seen = {
                {"path", req.path},
                {"host", req.get_header_value("Host")},
                {"user_agent", req.get_header_value("User-Agent")},
                {"accept", req.get_header_value("Accept")},
                {"content_type", req.get_header_value("Content-Type")},
                {"api_key", req.get_header_value("X-API-KEY")},
                {"body", req.body},
            };
            rpcwire::Json reply = {{"jsonrpc", "2.0"}, {"result", seen}, {"error", nullptr}, {"id", 0}};
            res.set_content(reply.dump(), "application/json");
        });

        port_ = server_->bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        server_thread_ = std::thread([this]() { server_->listen_after_bind(); });

        // Wait for server to be ready
        for (int i = 0; i < 200 && !server_->is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        ASSERT_TRUE(server_->is_running());
    }

    void TearDown() override {
        server_->stop();
        if (server_thread_.joinable()) server_thread_.join();
    }

    std::string host_port() const {
        return "127.0.0.1:" + std::to_string(port_);
    }

    rpcwire::ServiceAddress math_address() const {
        return rpcwire::ServiceAddress(host_port(), "math-api");
    }
};

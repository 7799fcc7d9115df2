/// Math server: JSON-RPC math service over HTTP.
/// Usage: ./math_server [port] [path]
/// Example: ./math_server 8082 math-api

#include "math_service.hpp"
#include <rpcwire/logging.hpp>
#include <httplib.h>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    int port = argc > 1 ? std::stoi(argv[1]) : 8082;
    std::string path = "/" + std::string(argc > 2 ? argv[2] : "math-api");

    rpcwire::LogManager::initialize("info");

    httplib::Server server;
    server.Post(path, [](const httplib::Request& req, httplib::Response& res) {
        auto reply = math_service::handle(req.body);
        RPCWIRE_LOG_INFO("{} -> {}", req.body, reply.dump());
        res.set_content(reply.dump(), "application/json");
    });

    RPCWIRE_LOG_INFO("math server listening on 127.0.0.1:{}{}", port, path);
    if (!server.listen("127.0.0.1", port)) {
        std::cerr << "Failed to listen on port " << port << "\n";
        return 1;
    }
    return 0;
}

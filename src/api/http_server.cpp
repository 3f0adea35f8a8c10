/**
 * @file http_server.cpp
 * @brief cpp-httplib listener that forwards every request to the ApiRouter
 *
 * @date 2025
 */

#include "agentbox/api/http_server.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <chrono>

namespace agentbox {
namespace api {

namespace {

ApiRequest ToApiRequest(const httplib::Request& req) {
    ApiRequest request;
    request.method = req.method;
    request.path = req.path;
    request.body = req.body;
    for (const auto& [key, value] : req.params) {
        request.query.emplace(key, value);
    }
    for (const auto& [key, value] : req.headers) {
        request.headers.emplace(key, value);
    }
    return request;
}

} // anonymous namespace

HttpServer::HttpServer(ApiRouter& router, std::string host, int port)
    : router_(router),
      host_(std::move(host)),
      port_(port),
      server_(std::make_unique<httplib::Server>()) {

    auto dispatch = [this](const httplib::Request& req, httplib::Response& res) {
        auto started = std::chrono::steady_clock::now();
        ApiResponse response = router_.Handle(ToApiRequest(req));

        res.status = response.status;
        res.set_content(response.body.dump(), "application/json");

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        spdlog::debug("{} {} -> {} ({}ms)", req.method, req.path, response.status, elapsed.count());
    };

    const std::string any = R"(/.*)";
    server_->Get(any, dispatch);
    server_->Post(any, dispatch);
    server_->Put(any, dispatch);
    server_->Delete(any, dispatch);
}

HttpServer::~HttpServer() {
    Stop();
}

bool HttpServer::Listen() {
    spdlog::info("Listening on http://{}:{}", host_, port_);
    if (!server_->listen(host_.c_str(), port_)) {
        spdlog::error("Failed to bind {}:{}", host_, port_);
        return false;
    }
    return true;
}

void HttpServer::Stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
        spdlog::info("HTTP server stopped");
    }
}

} // namespace api
} // namespace agentbox

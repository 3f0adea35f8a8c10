/**
 * @file http_server.hpp
 * @brief cpp-httplib front end for ApiRouter
 *
 * @date 2025
 */

#pragma once

#include <memory>
#include <string>

#include "agentbox/api/api_router.hpp"

namespace httplib {
class Server;
}

namespace agentbox {
namespace api {

class HttpServer {
public:
    HttpServer(ApiRouter& router, std::string host, int port);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind and serve until Stop() is called
     * @return false if the address could not be bound
     */
    bool Listen();

    /// Safe to call from a signal-watching thread
    void Stop();

private:
    ApiRouter& router_;
    std::string host_;
    int port_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace api
} // namespace agentbox

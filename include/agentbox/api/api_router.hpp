/**
 * @file api_router.hpp
 * @brief Transport-independent REST routing onto the engine
 *
 * The router maps (method, path) to engine operations and engine errors to
 * HTTP statuses. It knows nothing about sockets; HttpServer adapts it to
 * cpp-httplib and tests drive it directly.
 *
 * **Error mapping**:
 * | ErrorKind          | Status |
 * |--------------------|--------|
 * | NOT_FOUND          | 404    |
 * | INVALID_TRANSITION | 409    |
 * | CONFLICT           | 409    |
 * | TIMEOUT            | 504    |
 * | VALIDATION         | 400    |
 * | UPSTREAM           | 502    |
 * | UNAUTHORIZED       | 401    |
 *
 * Error bodies are {"error": "<Kind>", "message": "<text>"}.
 *
 * @date 2025
 */

#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "agentbox/api/authenticator.hpp"
#include "agentbox/core/engine.hpp"
#include "agentbox/core/errors.hpp"

namespace agentbox {
namespace api {

using json = nlohmann::json;

struct ApiRequest {
    std::string method;                             ///< "GET", "POST", ...
    std::string path;                               ///< Without query string
    std::map<std::string, std::string> query;
    std::map<std::string, std::string> headers;     ///< Looked up case-insensitively
    std::string body;

    std::optional<std::string> Header(const std::string& name) const;
    std::optional<std::string> Query(const std::string& name) const;
};

struct ApiResponse {
    int status{200};
    json body = json::object();
};

class ApiRouter {
public:
    ApiRouter(core::Engine& engine, std::shared_ptr<Authenticator> authenticator);

    /// Never throws; every failure becomes an error response
    ApiResponse Handle(const ApiRequest& request) const;

    static int StatusFor(core::ErrorKind kind);
    static ApiResponse ErrorResponse(core::ErrorKind kind, const std::string& message);

private:
    using Params = std::vector<std::string>;
    using Handler = std::function<ApiResponse(const ApiRequest&, const Params&, const std::string& principal)>;

    struct Route {
        std::string method;
        std::regex pattern;
        bool is_public;
        Handler handler;
    };

    void AddRoute(const std::string& method, const std::string& pattern, Handler handler,
                  bool is_public = false);

    void RegisterSystemRoutes();
    void RegisterSandboxRoutes();
    void RegisterTaskRoutes();
    void RegisterContextRoutes();
    void RegisterSnapshotRoutes();

    core::Engine& engine_;
    std::shared_ptr<Authenticator> authenticator_;
    std::vector<Route> routes_;
};

} // namespace api
} // namespace agentbox

/**
 * @file api_router.cpp
 * @brief REST routes for sandboxes, tasks, context and snapshots
 *
 * Routes are matched in registration order, so literal segments
 * ("tasks/count") are registered before the parameter they would shadow.
 *
 * @date 2025
 */

#include "agentbox/api/api_router.hpp"
#include "agentbox/api/serialization.hpp"
#include "agentbox/core/version.hpp"
#include "agentbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

namespace agentbox {
namespace api {

using core::EngineError;
using core::ErrorKind;
using utils::StringUtils;

namespace {

const char* kId = "([0-9A-Za-z_-]+)";

std::string Pattern(const std::string& path) {
    std::string result;
    std::size_t pos = 0;
    while (pos < path.size()) {
        auto open = path.find('{', pos);
        if (open == std::string::npos) {
            result += path.substr(pos);
            break;
        }
        auto close = path.find('}', open);
        result += path.substr(pos, open - pos) + kId;
        pos = close + 1;
    }
    return "^" + result + "/?$";
}

std::optional<std::size_t> QuerySize(const ApiRequest& request, const std::string& name) {
    auto value = request.Query(name);
    if (!value || value->empty()) {
        return std::nullopt;
    }
    try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(*value, &consumed);
        if (consumed != value->size() || parsed < 0) {
            throw std::invalid_argument(name);
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::logic_error&) {
        throw EngineError(ErrorKind::VALIDATION,
                          "Query parameter '" + name + "' must be a non-negative integer");
    }
}

bool QueryFlag(const ApiRequest& request, const std::string& name) {
    auto value = request.Query(name);
    if (!value) {
        return false;
    }
    std::string lower = StringUtils::ToLower(*value);
    return lower == "true" || lower == "1" || lower == "yes";
}

ApiResponse Ok(json body, int status = 200) {
    ApiResponse response;
    response.status = status;
    response.body = std::move(body);
    return response;
}

template <typename T>
json ToJsonArray(const std::vector<T>& records) {
    json items = json::array();
    for (const auto& record : records) {
        items.push_back(ToJson(record));
    }
    return items;
}

} // anonymous namespace

// ============================================================================
// REQUEST HELPERS
// ============================================================================

std::optional<std::string> ApiRequest::Header(const std::string& name) const {
    std::string wanted = StringUtils::ToLower(name);
    for (const auto& [key, value] : headers) {
        if (StringUtils::ToLower(key) == wanted) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> ApiRequest::Query(const std::string& name) const {
    auto it = query.find(name);
    if (it == query.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// ROUTER
// ============================================================================

ApiRouter::ApiRouter(core::Engine& engine, std::shared_ptr<Authenticator> authenticator)
    : engine_(engine),
      authenticator_(std::move(authenticator)) {
    RegisterSystemRoutes();
    RegisterSandboxRoutes();
    RegisterTaskRoutes();
    RegisterContextRoutes();
    RegisterSnapshotRoutes();
}

int ApiRouter::StatusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND:          return 404;
        case ErrorKind::INVALID_TRANSITION: return 409;
        case ErrorKind::CONFLICT:           return 409;
        case ErrorKind::TIMEOUT:            return 504;
        case ErrorKind::VALIDATION:         return 400;
        case ErrorKind::UPSTREAM:           return 502;
        case ErrorKind::UNAUTHORIZED:       return 401;
    }
    return 500;
}

ApiResponse ApiRouter::ErrorResponse(ErrorKind kind, const std::string& message) {
    ApiResponse response;
    response.status = StatusFor(kind);
    response.body = json{{"error", core::ToString(kind)}, {"message", message}};
    return response;
}

void ApiRouter::AddRoute(const std::string& method, const std::string& pattern, Handler handler,
                         bool is_public) {
    routes_.push_back(Route{method, std::regex(Pattern(pattern)), is_public, std::move(handler)});
}

ApiResponse ApiRouter::Handle(const ApiRequest& request) const {
    bool path_matched = false;

    for (const auto& route : routes_) {
        std::smatch match;
        if (!std::regex_match(request.path, match, route.pattern)) {
            continue;
        }
        path_matched = true;
        if (route.method != request.method) {
            continue;
        }

        Params params;
        for (std::size_t i = 1; i < match.size(); ++i) {
            params.push_back(match[i].str());
        }

        try {
            std::string principal;
            if (!route.is_public) {
                auto resolved = authenticator_->Authenticate(request.Header("Authorization").value_or(""));
                if (!resolved) {
                    throw EngineError(ErrorKind::UNAUTHORIZED, "Missing or invalid bearer token");
                }
                principal = *resolved;
            }
            return route.handler(request, params, principal);
        } catch (const EngineError& e) {
            if (StatusFor(e.Kind()) >= 500) {
                spdlog::error("{} {} failed: {}", request.method, request.path, e.what());
            } else {
                spdlog::debug("{} {} rejected: {}", request.method, request.path, e.what());
            }
            return ErrorResponse(e.Kind(), e.what());
        } catch (const std::exception& e) {
            spdlog::error("{} {} failed unexpectedly: {}", request.method, request.path, e.what());
            ApiResponse response;
            response.status = 500;
            response.body = json{{"error", "InternalError"}, {"message", e.what()}};
            return response;
        }
    }

    ApiResponse response;
    if (path_matched) {
        response.status = 405;
        response.body = json{{"error", "MethodNotAllowed"},
                             {"message", request.method + " is not supported on " + request.path}};
    } else {
        response = ErrorResponse(ErrorKind::NOT_FOUND, "No route for " + request.path);
    }
    return response;
}

// ============================================================================
// SYSTEM
// ============================================================================

void ApiRouter::RegisterSystemRoutes() {
    AddRoute("GET", "/version", [](const ApiRequest&, const Params&, const std::string&) {
        return Ok(json{{"service", kServiceName}, {"version", kVersion}});
    }, true);

    AddRoute("GET", "/health", [this](const ApiRequest&, const Params&, const std::string&) {
        return Ok(json{{"status", "ok"},
                       {"runtime", engine_.Runtime()->Name()},
                       {"workers_running", engine_.IsRunning()}});
    }, true);
}

// ============================================================================
// SANDBOXES
// ============================================================================

void ApiRouter::RegisterSandboxRoutes() {
    AddRoute("POST", "/sandboxes", [this](const ApiRequest& req, const Params&, const std::string& who) {
        auto request = ParseCreateSandbox(ParseBody(req.body), who);
        return Ok(ToJson(engine_.Sandboxes().Create(request)), 201);
    });

    AddRoute("GET", "/sandboxes", [this](const ApiRequest& req, const Params&, const std::string&) {
        store::SandboxFilter filter;
        if (auto state = req.Query("state")) {
            filter.state = core::ParseSandboxState(*state);
            if (!filter.state) {
                throw EngineError(ErrorKind::VALIDATION, "Unknown sandbox state: " + *state);
            }
        }
        if (auto tag = req.Query("tag")) {
            auto normalized = StringUtils::NormalizeTag(*tag);
            if (!normalized) {
                throw EngineError(ErrorKind::VALIDATION, "Invalid tag: " + *tag);
            }
            filter.tag = normalized;
        }
        filter.created_by = req.Query("created_by");
        filter.parent_id = req.Query("parent_id");
        filter.offset = QuerySize(req, "offset").value_or(0);
        filter.limit = std::min<std::size_t>(
            QuerySize(req, "limit").value_or(engine_.GetConfig().scheduler.default_list_limit),
            engine_.GetConfig().scheduler.max_list_limit);

        auto sandboxes = engine_.Sandboxes().List(filter);
        return Ok(json{{"items", ToJsonArray(sandboxes)},
                       {"offset", filter.offset},
                       {"limit", filter.limit}});
    });

    AddRoute("GET", "/sandboxes/{id}", [this](const ApiRequest&, const Params& p, const std::string&) {
        json body = ToJson(engine_.Sandboxes().Get(p[0]));
        body["children"] = engine_.Sandboxes().Children(p[0]);
        return Ok(body);
    });

    AddRoute("PUT", "/sandboxes/{id}", [this](const ApiRequest& req, const Params& p, const std::string&) {
        auto request = ParseUpdateSandbox(ParseBody(req.body));
        return Ok(ToJson(engine_.Sandboxes().Update(p[0], request)));
    });

    AddRoute("DELETE", "/sandboxes/{id}", [this](const ApiRequest& req, const Params& p, const std::string&) {
        auto sandbox = engine_.Sandboxes().Delete(p[0]);
        if (QueryFlag(req, "purge")) {
            engine_.Sandboxes().Purge(p[0]);
            return Ok(json{{"id", p[0]}, {"purged", true}});
        }
        return Ok(ToJson(sandbox));
    });

    AddRoute("PUT", "/sandboxes/{id}/state", [this](const ApiRequest& req, const Params& p, const std::string&) {
        json body = ParseBody(req.body);
        if (!body.is_object() || !body.contains("state") || !body["state"].is_string()) {
            throw EngineError(ErrorKind::VALIDATION, "'state' must be a string");
        }
        std::string value = body["state"].get<std::string>();
        auto target = core::ParseSandboxState(value);
        if (!target) {
            throw EngineError(ErrorKind::VALIDATION, "Unknown sandbox state: " + value);
        }
        return Ok(ToJson(engine_.Sandboxes().Transition(p[0], *target)));
    });

    AddRoute("POST", "/sandboxes/{id}/busy", [this](const ApiRequest&, const Params& p, const std::string&) {
        return Ok(ToJson(engine_.Sandboxes().MarkBusy(p[0])));
    });

    AddRoute("POST", "/sandboxes/{id}/idle", [this](const ApiRequest&, const Params& p, const std::string&) {
        return Ok(ToJson(engine_.Sandboxes().MarkIdle(p[0])));
    });

    AddRoute("POST", "/sandboxes/{id}/stop", [this](const ApiRequest& req, const Params& p, const std::string&) {
        json body = ParseBody(req.body);
        int delay = 0;
        std::optional<std::string> note;
        if (body.is_object()) {
            delay = GetInt(body, "delay_seconds").value_or(0);
            if (body.contains("note") && body["note"].is_string()) {
                note = body["note"].get<std::string>();
            }
        }
        return Ok(ToJson(engine_.Sandboxes().Stop(p[0], delay, note)));
    });

    AddRoute("POST", "/sandboxes/{id}/cancel", [this](const ApiRequest&, const Params& p, const std::string&) {
        bool cancelled = engine_.Tasks().Cancel(p[0], "Cancelled by request");
        return Ok(json{{"cancelled", cancelled},
                       {"sandbox", ToJson(engine_.Sandboxes().Get(p[0]))}});
    });

    AddRoute("POST", "/sandboxes/{id}/restart", [this](const ApiRequest&, const Params& p, const std::string& who) {
        return Ok(ToJson(engine_.Sandboxes().Restart(p[0], who)));
    });

    AddRoute("POST", "/sandboxes/{id}/clone", [this](const ApiRequest& req, const Params& p, const std::string& who) {
        auto options = ParseCloneOptions(ParseBody(req.body), who);
        return Ok(ToJson(engine_.Snapshots().Clone(p[0], options)), 201);
    });
}

// ============================================================================
// TASKS
// ============================================================================

void ApiRouter::RegisterTaskRoutes() {
    AddRoute("GET", "/sandboxes/{id}/tasks/count", [this](const ApiRequest&, const Params& p, const std::string&) {
        return Ok(json{{"sandbox_id", p[0]}, {"count", engine_.Tasks().Count(p[0])}});
    });

    AddRoute("GET", "/sandboxes/{id}/runtime", [this](const ApiRequest&, const Params& p, const std::string&) {
        return Ok(ToJson(engine_.Tasks().Runtime(p[0])));
    });

    AddRoute("GET", "/sandboxes/{id}/tasks", [this](const ApiRequest& req, const Params& p, const std::string&) {
        std::size_t offset = QuerySize(req, "offset").value_or(0);
        auto tasks = engine_.Tasks().List(p[0], offset, QuerySize(req, "limit"));
        return Ok(json{{"items", ToJsonArray(tasks)},
                       {"offset", offset},
                       {"total", engine_.Tasks().Count(p[0])}});
    });

    AddRoute("POST", "/sandboxes/{id}/tasks", [this](const ApiRequest& req, const Params& p, const std::string& who) {
        json body = ParseBody(req.body);
        if (!body.is_object() || !body.contains("input")) {
            throw EngineError(ErrorKind::VALIDATION, "'input' is required");
        }
        auto options = ParseSubmitOptions(body, who);
        auto task = engine_.Tasks().Submit(p[0], body["input"], options);
        return Ok(ToJson(task), options.background ? 201 : 200);
    });

    AddRoute("GET", "/sandboxes/{id}/tasks/{task_id}", [this](const ApiRequest&, const Params& p, const std::string&) {
        return Ok(ToJson(engine_.Tasks().Get(p[0], p[1])));
    });

    AddRoute("PUT", "/sandboxes/{id}/tasks/{task_id}", [this](const ApiRequest& req, const Params& p, const std::string&) {
        auto update = ParseTaskUpdate(ParseBody(req.body));
        return Ok(ToJson(engine_.Tasks().Update(p[0], p[1], update)));
    });
}

// ============================================================================
// CONTEXT
// ============================================================================

void ApiRouter::RegisterContextRoutes() {
    AddRoute("GET", "/sandboxes/{id}/context", [this](const ApiRequest&, const Params& p, const std::string&) {
        return Ok(ToJson(engine_.Context().GetUsage(p[0])));
    });

    AddRoute("POST", "/sandboxes/{id}/context/clear", [this](const ApiRequest&, const Params& p, const std::string& who) {
        return Ok(ToJson(engine_.Context().Clear(p[0], who)));
    });

    AddRoute("POST", "/sandboxes/{id}/context/compact", [this](const ApiRequest&, const Params& p, const std::string& who) {
        return Ok(ToJson(engine_.Context().Compact(p[0], who)));
    });

    AddRoute("POST", "/sandboxes/{id}/context/usage", [this](const ApiRequest& req, const Params& p, const std::string&) {
        json body = ParseBody(req.body);
        auto tokens = body.is_object() ? GetLong(body, "tokens") : std::nullopt;
        if (!tokens) {
            throw EngineError(ErrorKind::VALIDATION, "'tokens' must be an integer");
        }
        return Ok(ToJson(engine_.Context().ReportUsage(p[0], *tokens)));
    });
}

// ============================================================================
// SNAPSHOTS
// ============================================================================

void ApiRouter::RegisterSnapshotRoutes() {
    AddRoute("GET", "/snapshots", [this](const ApiRequest& req, const Params&, const std::string&) {
        return Ok(json{{"items", ToJsonArray(engine_.Snapshots().List(req.Query("sandbox_id")))}});
    });

    AddRoute("POST", "/snapshots", [this](const ApiRequest& req, const Params&, const std::string&) {
        json body = ParseBody(req.body);
        if (!body.is_object() || !body.contains("sandbox_id") || !body["sandbox_id"].is_string()) {
            throw EngineError(ErrorKind::VALIDATION, "'sandbox_id' must be a string");
        }
        json metadata = json::object();
        if (body.contains("metadata") && !body["metadata"].is_null()) {
            metadata = body["metadata"];
        }
        auto snapshot = engine_.Snapshots().Capture(body["sandbox_id"].get<std::string>(),
                                                    core::SnapshotTrigger::MANUAL, metadata);
        return Ok(ToJson(snapshot), 201);
    });

    AddRoute("GET", "/snapshots/{id}", [this](const ApiRequest&, const Params& p, const std::string&) {
        return Ok(ToJson(engine_.Snapshots().Get(p[0])));
    });

    AddRoute("DELETE", "/snapshots/{id}", [this](const ApiRequest&, const Params& p, const std::string&) {
        engine_.Snapshots().Remove(p[0]);
        return Ok(json{{"id", p[0]}, {"deleted", true}});
    });

    AddRoute("POST", "/snapshots/{id}/create", [this](const ApiRequest& req, const Params& p, const std::string& who) {
        auto options = ParseCloneOptions(ParseBody(req.body), who);
        return Ok(ToJson(engine_.Snapshots().CreateFrom(p[0], options)), 201);
    });
}

} // namespace api
} // namespace agentbox

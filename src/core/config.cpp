/**
 * @file config.cpp
 * @brief Configuration file, environment and validation
 *
 * **Config file layout** (every key optional):
 * @code
 * {
 *   "sandbox":   { "default_idle_timeout_seconds": 900, "max_idle_timeout_seconds": 604800,
 *                  "min_stop_delay_seconds": 5 },
 *   "scheduler": { "default_task_timeout_seconds": 3600, "sync_poll_interval_ms": 500,
 *                  "sync_wait_ceiling_seconds": 900, "default_list_limit": 100,
 *                  "max_list_limit": 1000 },
 *   "reaper":    { "interval_ms": 5000, "batch_limit": 50, "termination_grace_seconds": 5 },
 *   "context":   { "soft_limit_tokens": 128000, "transcript_max_chars": 50000 },
 *   "runtime":   { "kind": "docker", "image": "...", "network": "bridge", ... },
 *   "inference": { "host": "http://localhost:11434", "model": "...", "timeout_seconds": 120 },
 *   "server":    { "host": "0.0.0.0", "port": 9000,
 *                  "tokens": [ { "name": "operator", "sha256": "<hex digest>" } ] },
 *   "logging":   { "level": "info", "file": "", "max_file_size_mb": 10, "max_files": 3 }
 * }
 * @endcode
 *
 * **Environment variables**:
 * - AGENTBOX_HOST, AGENTBOX_PORT
 * - AGENTBOX_LOG_LEVEL, AGENTBOX_LOG_FILE
 * - AGENTBOX_RUNTIME, AGENTBOX_DOCKER_IMAGE, AGENTBOX_DOCKER_NETWORK
 * - AGENTBOX_OLLAMA_HOST, AGENTBOX_OLLAMA_MODEL
 * - AGENTBOX_CONTEXT_SOFT_LIMIT_TOKENS
 * - AGENTBOX_DEFAULT_IDLE_TIMEOUT, AGENTBOX_DEFAULT_TASK_TIMEOUT
 * - AGENTBOX_REAPER_INTERVAL_MS
 * - AGENTBOX_API_TOKENS ("name:sha256,name:sha256")
 *
 * @date 2025
 */

#include "agentbox/core/config.hpp"
#include "agentbox/core/errors.hpp"
#include "agentbox/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdlib>
#include <fstream>

namespace agentbox {
namespace core {

using json = nlohmann::json;

namespace {

template <typename T>
void ReadKey(const json& section, const char* key, T& target) {
    if (section.contains(key) && !section[key].is_null()) {
        target = section[key].get<T>();
    }
}

void ReadMillis(const json& section, const char* key, std::chrono::milliseconds& target) {
    if (section.contains(key)) {
        target = std::chrono::milliseconds(section[key].get<long long>());
    }
}

long long ParseInteger(const std::string& name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument("trailing characters");
        }
        return parsed;
    } catch (const std::exception&) {
        throw EngineError(ErrorKind::VALIDATION,
                          name + " must be an integer, got '" + value + "'");
    }
}

std::vector<ApiToken> ParseTokenList(const std::string& value) {
    std::vector<ApiToken> tokens;
    for (const auto& entry : utils::StringUtils::Split(value, ',')) {
        auto separator = entry.find(':');
        if (separator == std::string::npos) {
            throw EngineError(ErrorKind::VALIDATION,
                              "AGENTBOX_API_TOKENS entries must be name:sha256");
        }
        ApiToken token;
        token.name = utils::StringUtils::Trim(entry.substr(0, separator));
        token.sha256 = utils::StringUtils::ToLower(
            utils::StringUtils::Trim(entry.substr(separator + 1)));
        tokens.push_back(token);
    }
    return tokens;
}

} // anonymous namespace

std::string GetEnvOr(const std::string& key, const std::string& fallback) {
    const char* value = std::getenv(key.c_str());
    return (value && *value) ? std::string(value) : fallback;
}

// ============================================================================
// CONFIG FILE
// ============================================================================

void LoadConfigFile(const std::filesystem::path& path, EngineConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw EngineError(ErrorKind::VALIDATION,
                          "Cannot open config file: " + path.string());
    }

    json root;
    try {
        file >> root;

        if (root.contains("sandbox")) {
            const auto& s = root["sandbox"];
            ReadKey(s, "default_idle_timeout_seconds", config.sandbox.default_idle_timeout_seconds);
            ReadKey(s, "max_idle_timeout_seconds", config.sandbox.max_idle_timeout_seconds);
            ReadKey(s, "min_stop_delay_seconds", config.sandbox.min_stop_delay_seconds);
        }

        if (root.contains("scheduler")) {
            const auto& s = root["scheduler"];
            ReadKey(s, "default_task_timeout_seconds", config.scheduler.default_task_timeout_seconds);
            ReadMillis(s, "sync_poll_interval_ms", config.scheduler.sync_poll_interval);
            if (s.contains("sync_wait_ceiling_seconds")) {
                config.scheduler.sync_wait_ceiling =
                    std::chrono::seconds(s["sync_wait_ceiling_seconds"].get<long long>());
            }
            ReadKey(s, "default_list_limit", config.scheduler.default_list_limit);
            ReadKey(s, "max_list_limit", config.scheduler.max_list_limit);
        }

        if (root.contains("reaper")) {
            const auto& s = root["reaper"];
            ReadMillis(s, "interval_ms", config.reaper.interval);
            ReadKey(s, "batch_limit", config.reaper.batch_limit);
            ReadKey(s, "termination_grace_seconds", config.reaper.termination_grace_seconds);
        }

        if (root.contains("context")) {
            const auto& s = root["context"];
            ReadKey(s, "soft_limit_tokens", config.context.soft_limit_tokens);
            ReadKey(s, "transcript_max_chars", config.context.transcript_max_chars);
        }

        if (root.contains("runtime")) {
            const auto& s = root["runtime"];
            ReadKey(s, "kind", config.runtime.kind);
            ReadKey(s, "docker_binary", config.runtime.docker_binary);
            ReadKey(s, "image", config.runtime.image);
            ReadKey(s, "network", config.runtime.network);
            ReadKey(s, "container_prefix", config.runtime.container_prefix);
            ReadKey(s, "snapshot_volume_prefix", config.runtime.snapshot_volume_prefix);
            ReadKey(s, "workspace_path", config.runtime.workspace_path);
            ReadKey(s, "agent_command", config.runtime.agent_command);
            ReadKey(s, "memory_mb", config.runtime.memory_mb);
            ReadKey(s, "cpus", config.runtime.cpus);
        }

        if (root.contains("inference")) {
            const auto& s = root["inference"];
            ReadKey(s, "host", config.inference.host);
            ReadKey(s, "model", config.inference.model);
            ReadKey(s, "timeout_seconds", config.inference.timeout_seconds);
        }

        if (root.contains("server")) {
            const auto& s = root["server"];
            ReadKey(s, "host", config.server.host);
            ReadKey(s, "port", config.server.port);
            if (s.contains("tokens")) {
                config.server.tokens.clear();
                for (const auto& t : s["tokens"]) {
                    ApiToken token;
                    token.name = t.at("name").get<std::string>();
                    token.sha256 = utils::StringUtils::ToLower(t.at("sha256").get<std::string>());
                    config.server.tokens.push_back(token);
                }
            }
        }

        if (root.contains("logging")) {
            const auto& s = root["logging"];
            ReadKey(s, "level", config.logging.level);
            ReadKey(s, "file", config.logging.file);
            ReadKey(s, "max_file_size_mb", config.logging.max_file_size_mb);
            ReadKey(s, "max_files", config.logging.max_files);
        }
    } catch (const json::exception& e) {
        throw EngineError(ErrorKind::VALIDATION,
                          "Invalid config file " + path.string() + ": " + e.what());
    }

    spdlog::debug("Loaded config file: {}", path.string());
}

// ============================================================================
// ENVIRONMENT
// ============================================================================

void ApplyEnvironment(EngineConfig& config) {
    config.server.host = GetEnvOr("AGENTBOX_HOST", config.server.host);

    auto port = GetEnvOr("AGENTBOX_PORT", "");
    if (!port.empty()) {
        config.server.port = static_cast<int>(ParseInteger("AGENTBOX_PORT", port));
    }

    config.logging.level = GetEnvOr("AGENTBOX_LOG_LEVEL", config.logging.level);
    config.logging.file = GetEnvOr("AGENTBOX_LOG_FILE", config.logging.file);

    config.runtime.kind = GetEnvOr("AGENTBOX_RUNTIME", config.runtime.kind);
    config.runtime.image = GetEnvOr("AGENTBOX_DOCKER_IMAGE", config.runtime.image);
    config.runtime.network = GetEnvOr("AGENTBOX_DOCKER_NETWORK", config.runtime.network);

    config.inference.host = GetEnvOr("AGENTBOX_OLLAMA_HOST", config.inference.host);
    config.inference.model = GetEnvOr("AGENTBOX_OLLAMA_MODEL", config.inference.model);

    auto soft_limit = GetEnvOr("AGENTBOX_CONTEXT_SOFT_LIMIT_TOKENS", "");
    if (!soft_limit.empty()) {
        config.context.soft_limit_tokens =
            ParseInteger("AGENTBOX_CONTEXT_SOFT_LIMIT_TOKENS", soft_limit);
    }

    auto idle_timeout = GetEnvOr("AGENTBOX_DEFAULT_IDLE_TIMEOUT", "");
    if (!idle_timeout.empty()) {
        config.sandbox.default_idle_timeout_seconds =
            static_cast<int>(ParseInteger("AGENTBOX_DEFAULT_IDLE_TIMEOUT", idle_timeout));
    }

    auto task_timeout = GetEnvOr("AGENTBOX_DEFAULT_TASK_TIMEOUT", "");
    if (!task_timeout.empty()) {
        config.scheduler.default_task_timeout_seconds =
            static_cast<int>(ParseInteger("AGENTBOX_DEFAULT_TASK_TIMEOUT", task_timeout));
    }

    auto reaper_interval = GetEnvOr("AGENTBOX_REAPER_INTERVAL_MS", "");
    if (!reaper_interval.empty()) {
        config.reaper.interval = std::chrono::milliseconds(
            ParseInteger("AGENTBOX_REAPER_INTERVAL_MS", reaper_interval));
    }

    auto tokens = GetEnvOr("AGENTBOX_API_TOKENS", "");
    if (!tokens.empty()) {
        config.server.tokens = ParseTokenList(tokens);
    }
}

// ============================================================================
// VALIDATION
// ============================================================================

void Validate(const EngineConfig& config) {
    auto fail = [](const std::string& message) {
        throw EngineError(ErrorKind::VALIDATION, message);
    };

    if (config.sandbox.max_idle_timeout_seconds <= 0) {
        fail("sandbox.max_idle_timeout_seconds must be positive");
    }
    if (config.sandbox.default_idle_timeout_seconds <= 0 ||
        config.sandbox.default_idle_timeout_seconds > config.sandbox.max_idle_timeout_seconds) {
        fail("sandbox.default_idle_timeout_seconds must be in (0, max_idle_timeout_seconds]");
    }
    if (config.sandbox.min_stop_delay_seconds < 0) {
        fail("sandbox.min_stop_delay_seconds must not be negative");
    }
    if (config.scheduler.sync_poll_interval.count() <= 0) {
        fail("scheduler.sync_poll_interval_ms must be positive");
    }
    if (config.scheduler.sync_wait_ceiling.count() <= 0) {
        fail("scheduler.sync_wait_ceiling_seconds must be positive");
    }
    if (config.scheduler.default_list_limit == 0 ||
        config.scheduler.default_list_limit > config.scheduler.max_list_limit) {
        fail("scheduler.default_list_limit must be in [1, max_list_limit]");
    }
    if (config.reaper.interval.count() <= 0) {
        fail("reaper.interval_ms must be positive");
    }
    if (config.reaper.batch_limit == 0) {
        fail("reaper.batch_limit must be positive");
    }
    if (config.reaper.termination_grace_seconds < 0) {
        fail("reaper.termination_grace_seconds must not be negative");
    }
    if (config.context.soft_limit_tokens <= 0) {
        fail("context.soft_limit_tokens must be positive");
    }
    if (config.runtime.kind != "docker" && config.runtime.kind != "none") {
        fail("runtime.kind must be 'docker' or 'none', got '" + config.runtime.kind + "'");
    }
    if (config.inference.timeout_seconds <= 0) {
        fail("inference.timeout_seconds must be positive");
    }
    if (config.server.port <= 0 || config.server.port > 65535) {
        fail("server.port must be in [1, 65535]");
    }
    for (const auto& token : config.server.tokens) {
        if (token.name.empty()) {
            fail("server.tokens entries need a name");
        }
        if (token.sha256.size() != 64 ||
            token.sha256.find_first_not_of("0123456789abcdef") != std::string::npos) {
            fail("server.tokens[" + token.name + "].sha256 must be a hex SHA-256 digest");
        }
    }

    static const std::vector<std::string> levels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"};
    if (std::find(levels.begin(), levels.end(), config.logging.level) == levels.end()) {
        fail("logging.level must be one of trace, debug, info, warn, error, critical, off");
    }
}

} // namespace core
} // namespace agentbox

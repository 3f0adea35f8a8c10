/**
 * @file config.hpp
 * @brief Engine configuration and its loaders
 *
 * Configuration is layered, lowest precedence first:
 * built-in defaults, JSON config file, AGENTBOX_* environment variables,
 * command-line flags (applied by main). Validate() is called once the
 * layers are merged and raises ValidationError on the first bad value.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <filesystem>

namespace agentbox {
namespace core {

/**
 * @struct SandboxSettings
 * @brief Bounds and defaults for sandbox lifecycle
 */
struct SandboxSettings {
    int default_idle_timeout_seconds{900};      ///< Applied when create omits it
    int max_idle_timeout_seconds{604800};       ///< One week
    int min_stop_delay_seconds{5};              ///< Floor for scheduled stops
};

/**
 * @struct SchedulerSettings
 * @brief Task submission and listing limits
 */
struct SchedulerSettings {
    int default_task_timeout_seconds{3600};
    std::chrono::milliseconds sync_poll_interval{500};   ///< Store re-check period while waiting
    std::chrono::seconds sync_wait_ceiling{900};         ///< 15 minutes
    std::size_t default_list_limit{100};
    std::size_t max_list_limit{1000};
};

struct ReaperSettings {
    std::chrono::milliseconds interval{5000};
    std::size_t batch_limit{50};                ///< Rows per category per sweep
    int termination_grace_seconds{5};
};

struct ContextSettings {
    long long soft_limit_tokens{128000};
    std::size_t transcript_max_chars{50000};
};

/**
 * @struct RuntimeSettings
 * @brief Container runtime adapter settings
 */
struct RuntimeSettings {
    std::string kind{"docker"};                 ///< "docker" or "none"
    std::string docker_binary{"docker"};
    std::string image{"agentbox/agent:latest"};
    std::string network{"bridge"};
    std::string container_prefix{"agentbox"};
    std::string snapshot_volume_prefix{"agentbox-snapshot"};
    std::string workspace_path{"/workspace"};       ///< Mount point of the sandbox's data volume
    std::string agent_command{"agentbox-agent"};    ///< Executed inside the container per task
    std::size_t memory_mb{2048};
    double cpus{2.0};
};

struct InferenceSettings {
    std::string host{"http://localhost:11434"};
    std::string model{"gpt-oss:20b"};
    int timeout_seconds{120};
};

/**
 * @struct ApiToken
 * @brief Accepted bearer credential, stored as a SHA-256 hex digest
 */
struct ApiToken {
    std::string name;           ///< Principal name recorded as created_by
    std::string sha256;
};

struct ServerSettings {
    std::string host{"0.0.0.0"};
    int port{9000};
    std::vector<ApiToken> tokens;
};

struct LoggingSettings {
    std::string level{"info"};
    std::string file;                           ///< Empty disables the file sink
    std::size_t max_file_size_mb{10};
    std::size_t max_files{3};
};

/**
 * @struct EngineConfig
 * @brief Complete service configuration
 */
struct EngineConfig {
    SandboxSettings sandbox;
    SchedulerSettings scheduler;
    ReaperSettings reaper;
    ContextSettings context;
    RuntimeSettings runtime;
    InferenceSettings inference;
    ServerSettings server;
    LoggingSettings logging;
};

/// Merges a JSON config file over @p config. Unknown keys are ignored.
void LoadConfigFile(const std::filesystem::path& path, EngineConfig& config);

/// Applies AGENTBOX_* environment variables over @p config
void ApplyEnvironment(EngineConfig& config);

/// Throws EngineError(VALIDATION) describing the first invalid setting
void Validate(const EngineConfig& config);

/// Environment variable, or @p fallback when unset or empty
std::string GetEnvOr(const std::string& key, const std::string& fallback);

} // namespace core
} // namespace agentbox

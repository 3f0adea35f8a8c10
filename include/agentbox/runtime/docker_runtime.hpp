/**
 * @file docker_runtime.hpp
 * @brief RuntimeClient backed by the Docker CLI
 *
 * Each sandbox maps to one long-running container named
 * "<container_prefix>-<sandbox id>" and labelled agentbox.sandbox=<id>,
 * plus a data volume "<container>-data" mounted at workspace_path with a
 * code/ and a content/ area. The container name is the runtime handle.
 *
 * **Container mapping**:
 * - Provision: docker volume create, a throwaway container that lays out
 *   the workspace (copying areas from a snapshot volume when asked), then
 *   docker run -d on the base image and the seed's setup script
 * - DispatchTask: docker exec -d with AGENTBOX_TASK_ID / AGENTBOX_TASK_TYPE /
 *   AGENTBOX_TASK_INPUT
 * - Restart: docker restart
 * - Snapshot: workspace copied into volume <snapshot_volume_prefix>-<snapshot id>
 * - Destroy: docker rm -f, then the data volume
 *
 * Containers always start from the configured image, so a clone only gets
 * the environment variables and instructions passed in its own seed.
 *
 * @date 2025
 */

#pragma once

#include <functional>
#include <string>
#include <vector>

#include "agentbox/core/config.hpp"
#include "agentbox/runtime/runtime_client.hpp"

namespace agentbox {
namespace runtime {

/**
 * @struct CommandResult
 * @brief Exit status and combined stdout/stderr of a shell command
 */
struct CommandResult {
    int exit_code{0};
    std::string output;
};

/// Runs a shell command line and captures its output
using CommandExecutor = std::function<CommandResult(const std::string& command)>;

/// popen-based executor; stderr is folded into output
CommandResult ExecuteCommand(const std::string& command);

class DockerRuntime : public RuntimeClient {
public:
    explicit DockerRuntime(core::RuntimeSettings settings,
                           CommandExecutor executor = ExecuteCommand);

    /**
     * @brief Check that the Docker daemon answers
     * @return true if "docker info" succeeds
     */
    bool IsAvailable() const;

    std::string Provision(const ProvisionSpec& spec) override;
    void Destroy(const std::string& handle) override;
    void DispatchTask(const std::string& handle, const core::Task& task) override;
    void Restart(const std::string& handle) override;
    std::optional<std::string> Snapshot(const std::string& handle,
                                        const std::string& snapshot_id) override;
    void RemoveSnapshot(const std::string& runtime_ref) override;
    std::string Name() const override { return "docker"; }

    /// Arguments of the "docker run" call for @p spec (without the binary)
    std::vector<std::string> BuildRunCommand(const ProvisionSpec& spec) const;

    /// Arguments of the throwaway container that lays out the workspace volume
    std::vector<std::string> BuildSeedCommand(const ProvisionSpec& spec) const;

    std::string ContainerName(const std::string& sandbox_id) const;
    std::string DataVolumeName(const std::string& container) const;
    std::string SnapshotVolumeName(const std::string& snapshot_id) const;

private:
    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args) const;
    void RemoveVolume(const std::string& volume);

    core::RuntimeSettings settings_;
    CommandExecutor executor_;
};

} // namespace runtime
} // namespace agentbox

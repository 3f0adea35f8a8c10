/**
 * @file docker_runtime.cpp
 * @brief Docker CLI runtime adapter
 *
 * Commands are assembled as argument vectors and shell-quoted one by one,
 * so seed content (instructions, env values, task input) never reaches the
 * shell unescaped.
 *
 * @date 2025
 */

#include "agentbox/runtime/docker_runtime.hpp"
#include "agentbox/core/errors.hpp"
#include "agentbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cstdio>
#include <sstream>
#include <sys/wait.h>

namespace agentbox {
namespace runtime {

using core::EngineError;
using core::ErrorKind;
using utils::StringUtils;

namespace {

std::string TrimOutput(std::string output) {
    output.erase(output.find_last_not_of(" \n\r\t") + 1);
    return output;
}

} // anonymous namespace

// ============================================================================
// COMMAND EXECUTION
// ============================================================================

CommandResult ExecuteCommand(const std::string& command) {
    CommandResult result;

    std::array<char, 256> buffer;
    std::string cmd = command + " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.exit_code = -1;
        result.output = "Failed to execute command";
        return result;
    }

    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result.output += buffer.data();
    }

    int status = pclose(pipe);
    result.exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;
    return result;
}

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerRuntime::DockerRuntime(core::RuntimeSettings settings, CommandExecutor executor)
    : settings_(std::move(settings)), executor_(std::move(executor)) {
    spdlog::info("Docker runtime initialized (image={}, network={})",
                 settings_.image, settings_.network);
}

bool DockerRuntime::IsAvailable() const {
    return ExecuteDockerCommand({"info", "--format", "{{.ServerVersion}}"}).exit_code == 0;
}

std::string DockerRuntime::ContainerName(const std::string& sandbox_id) const {
    return settings_.container_prefix + "-" + sandbox_id;
}

std::string DockerRuntime::DataVolumeName(const std::string& container) const {
    return container + "-data";
}

std::string DockerRuntime::SnapshotVolumeName(const std::string& snapshot_id) const {
    return settings_.snapshot_volume_prefix + "-" + snapshot_id;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

std::string DockerRuntime::Provision(const ProvisionSpec& spec) {
    std::string name = ContainerName(spec.sandbox_id);
    std::string volume = DataVolumeName(name);
    spdlog::info("Provisioning container {} for sandbox {}", name, spec.sandbox_id);

    auto created = ExecuteDockerCommand({"volume", "create", "--label", "agentbox.sandbox=" + spec.sandbox_id, volume});
    if (created.exit_code != 0) {
        spdlog::error("Failed to create volume {}: {}", volume, TrimOutput(created.output));
        throw EngineError(ErrorKind::UPSTREAM,
                          "docker volume create failed for sandbox " + spec.sandbox_id + ": " +
                          TrimOutput(created.output));
    }

    auto seeded = ExecuteDockerCommand(BuildSeedCommand(spec));
    if (seeded.exit_code != 0) {
        spdlog::error("Failed to seed workspace of {}: {}", name, TrimOutput(seeded.output));
        ExecuteDockerCommand({"volume", "rm", "-f", volume});
        throw EngineError(ErrorKind::UPSTREAM,
                          "workspace copy failed for sandbox " + spec.sandbox_id + ": " +
                          TrimOutput(seeded.output));
    }

    auto result = ExecuteDockerCommand(BuildRunCommand(spec));
    if (result.exit_code != 0) {
        spdlog::error("Failed to create container {}: {}", name, TrimOutput(result.output));
        ExecuteDockerCommand({"volume", "rm", "-f", volume});
        throw EngineError(ErrorKind::UPSTREAM,
                          "docker run failed for sandbox " + spec.sandbox_id + ": " +
                          TrimOutput(result.output));
    }

    if (!spec.seed.setup.empty()) {
        spdlog::debug("Running setup script in {}", name);
        auto setup = ExecuteDockerCommand({"exec", "-w", settings_.workspace_path + "/code",
                                           name, "sh", "-c", spec.seed.setup});
        if (setup.exit_code != 0) {
            spdlog::error("Setup script failed in {}: {}", name, TrimOutput(setup.output));
            ExecuteDockerCommand({"rm", "-f", name});
            ExecuteDockerCommand({"volume", "rm", "-f", volume});
            throw EngineError(ErrorKind::UPSTREAM,
                              "setup script failed for sandbox " + spec.sandbox_id + ": " +
                              TrimOutput(setup.output));
        }
    }

    spdlog::info("✓ Container ready: {}", name);
    return name;
}

void DockerRuntime::Destroy(const std::string& handle) {
    spdlog::info("Removing container: {}", handle);

    auto result = ExecuteDockerCommand({"rm", "-f", handle});
    if (result.exit_code != 0) {
        if (result.output.find("No such container") == std::string::npos) {
            spdlog::error("Failed to remove container {}: {}", handle, TrimOutput(result.output));
            throw EngineError(ErrorKind::UPSTREAM,
                              "docker rm failed for " + handle + ": " + TrimOutput(result.output));
        }
        spdlog::debug("Container {} already gone", handle);
    }

    RemoveVolume(DataVolumeName(handle));
}

void DockerRuntime::DispatchTask(const std::string& handle, const core::Task& task) {
    spdlog::debug("Dispatching task {} to {}", task.id, handle);

    auto result = ExecuteDockerCommand({
        "exec", "-d",
        "-e", "AGENTBOX_TASK_ID=" + task.id,
        "-e", "AGENTBOX_TASK_TYPE=" + core::ToString(task.type),
        "-e", "AGENTBOX_TASK_INPUT=" + task.input.dump(),
        handle,
        settings_.agent_command
    });

    if (result.exit_code != 0) {
        spdlog::error("Failed to dispatch task {} to {}: {}",
                      task.id, handle, TrimOutput(result.output));
        throw EngineError(ErrorKind::UPSTREAM,
                          "docker exec failed for task " + task.id + ": " + TrimOutput(result.output));
    }
}

void DockerRuntime::Restart(const std::string& handle) {
    spdlog::info("Restarting container: {}", handle);

    auto result = ExecuteDockerCommand({"restart", handle});
    if (result.exit_code != 0) {
        spdlog::error("Failed to restart container {}: {}", handle, TrimOutput(result.output));
        throw EngineError(ErrorKind::UPSTREAM,
                          "docker restart failed for " + handle + ": " + TrimOutput(result.output));
    }
}

std::optional<std::string> DockerRuntime::Snapshot(const std::string& handle,
                                                   const std::string& snapshot_id) {
    std::string volume = SnapshotVolumeName(snapshot_id);
    spdlog::info("Creating snapshot of container: {} into volume: {}", handle, volume);

    auto created = ExecuteDockerCommand({"volume", "create", "--label", "agentbox.snapshot=" + snapshot_id, volume});
    if (created.exit_code != 0) {
        spdlog::error("Failed to create snapshot volume: {}", TrimOutput(created.output));
        throw EngineError(ErrorKind::UPSTREAM,
                          "docker volume create failed for snapshot " + snapshot_id + ": " +
                          TrimOutput(created.output));
    }

    auto copied = ExecuteDockerCommand({
        "run", "--rm",
        "-v", DataVolumeName(handle) + ":/source:ro",
        "-v", volume + ":/dest",
        settings_.image,
        "sh", "-c", "cp -a /source/. /dest/"
    });
    if (copied.exit_code != 0) {
        spdlog::error("Failed to copy workspace of {}: {}", handle, TrimOutput(copied.output));
        ExecuteDockerCommand({"volume", "rm", "-f", volume});
        throw EngineError(ErrorKind::UPSTREAM,
                          "workspace copy failed for " + handle + ": " + TrimOutput(copied.output));
    }

    spdlog::info("Snapshot created: {}", volume);
    return volume;
}

void DockerRuntime::RemoveSnapshot(const std::string& runtime_ref) {
    spdlog::info("Removing snapshot volume: {}", runtime_ref);
    RemoveVolume(runtime_ref);
}

void DockerRuntime::RemoveVolume(const std::string& volume) {
    auto result = ExecuteDockerCommand({"volume", "rm", "-f", volume});
    if (result.exit_code != 0) {
        if (result.output.find("no such volume") != std::string::npos ||
            result.output.find("No such volume") != std::string::npos) {
            spdlog::debug("Volume {} already gone", volume);
            return;
        }
        spdlog::error("Failed to remove volume {}: {}", volume, TrimOutput(result.output));
        throw EngineError(ErrorKind::UPSTREAM,
                          "docker volume rm failed for " + volume + ": " + TrimOutput(result.output));
    }
}

// ============================================================================
// COMMAND BUILDING
// ============================================================================

std::vector<std::string> DockerRuntime::BuildRunCommand(const ProvisionSpec& spec) const {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");

    args.push_back("--name");
    args.push_back(ContainerName(spec.sandbox_id));

    args.push_back("--label");
    args.push_back("agentbox.sandbox=" + spec.sandbox_id);

    if (settings_.memory_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(settings_.memory_mb) + "m");
    }

    if (settings_.cpus > 0) {
        std::ostringstream cpus;
        cpus << settings_.cpus;
        args.push_back("--cpus");
        args.push_back(cpus.str());
    }

    if (!settings_.network.empty()) {
        args.push_back("--network");
        args.push_back(settings_.network);
    }

    args.push_back("-e");
    args.push_back("AGENTBOX_SANDBOX_ID=" + spec.sandbox_id);

    if (!spec.seed.instructions.empty()) {
        args.push_back("-e");
        args.push_back("AGENTBOX_INSTRUCTIONS=" + spec.seed.instructions);
    }

    for (const auto& [key, value] : spec.seed.env) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    args.push_back("-v");
    args.push_back(DataVolumeName(ContainerName(spec.sandbox_id)) + ":" + settings_.workspace_path);
    args.push_back("-w");
    args.push_back(settings_.workspace_path);

    // Always the base image
    args.push_back(settings_.image);

    return args;
}

std::vector<std::string> DockerRuntime::BuildSeedCommand(const ProvisionSpec& spec) const {
    std::string script = "mkdir -p /dest/code /dest/content";
    if (spec.source_snapshot) {
        script += " && if [ -d /source/content ]; then cp -a /source/content/. /dest/content/; fi";
        if (spec.copy_code) {
            script += " && if [ -d /source/code ]; then cp -a /source/code/. /dest/code/; fi";
        }
    }

    std::vector<std::string> args = {"run", "--rm"};
    if (spec.source_snapshot) {
        args.push_back("-v");
        args.push_back(*spec.source_snapshot + ":/source:ro");
    }
    args.push_back("-v");
    args.push_back(DataVolumeName(ContainerName(spec.sandbox_id)) + ":/dest");
    args.push_back(settings_.image);
    args.push_back("sh");
    args.push_back("-c");
    args.push_back(script);
    return args;
}

CommandResult DockerRuntime::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    std::ostringstream cmd;
    cmd << StringUtils::ShellQuote(settings_.docker_binary);

    for (const auto& arg : args) {
        cmd << " " << StringUtils::ShellQuote(arg);
    }

    spdlog::debug("Executing: {}", cmd.str());
    return executor_(cmd.str());
}

} // namespace runtime
} // namespace agentbox

/**
 * @file runtime_client.hpp
 * @brief Boundary to the container/VM runtime that hosts sandbox agents
 *
 * The engine calls the runtime only after the matching state transition has
 * been committed to the store. Every method reports failure by throwing
 * core::EngineError(UPSTREAM).
 *
 * @date 2025
 */

#pragma once

#include <optional>
#include <string>

#include "agentbox/core/types.hpp"

namespace agentbox {
namespace runtime {

/**
 * @struct ProvisionSpec
 * @brief Everything the runtime needs to bring a sandbox up
 */
struct ProvisionSpec {
    std::string sandbox_id;
    core::SandboxSeed seed;
    std::optional<std::string> source_snapshot;     ///< Snapshot reference whose workspace is copied in
    bool copy_code{true};                           ///< With source_snapshot, copy its code area as well
    core::json metadata = core::json::object();
};

class RuntimeClient {
public:
    virtual ~RuntimeClient() = default;

    /// @return Opaque handle stored as Sandbox::runtime_handle
    virtual std::string Provision(const ProvisionSpec& spec) = 0;

    /// Releases the environment. An already-gone environment is not an error.
    virtual void Destroy(const std::string& handle) = 0;

    /// Hands a task to the agent inside the sandbox
    virtual void DispatchTask(const std::string& handle, const core::Task& task) = 0;

    virtual void Restart(const std::string& handle) = 0;

    /**
     * @brief Copy the environment's workspace
     * @return Runtime snapshot reference, or std::nullopt if the runtime keeps none
     */
    virtual std::optional<std::string> Snapshot(const std::string& handle,
                                                const std::string& snapshot_id) = 0;

    /// Releases what Snapshot produced. An already-gone reference is not an error.
    virtual void RemoveSnapshot(const std::string& runtime_ref) = 0;

    virtual std::string Name() const = 0;
};

/**
 * @class NullRuntime
 * @brief Runtime that holds no environment
 *
 * Used with --runtime none: agents run elsewhere and report progress
 * through the task update API.
 */
class NullRuntime : public RuntimeClient {
public:
    std::string Provision(const ProvisionSpec& spec) override { return "local-" + spec.sandbox_id; }
    void Destroy(const std::string&) override {}
    void DispatchTask(const std::string&, const core::Task&) override {}
    void Restart(const std::string&) override {}
    std::optional<std::string> Snapshot(const std::string&, const std::string&) override {
        return std::nullopt;
    }
    void RemoveSnapshot(const std::string&) override {}
    std::string Name() const override { return "none"; }
};

} // namespace runtime
} // namespace agentbox

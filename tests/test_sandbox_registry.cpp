#include "test_helpers.hpp"

#include "agentbox/core/task_markers.hpp"

using namespace agentbox::core;
using agentbox::testing::EngineTest;
using agentbox::testing::ErrorKindOf;

class SandboxRegistryTest : public EngineTest {};

// ============================================================================
// Creation
// ============================================================================

TEST_F(SandboxRegistryTest, CreateRecordsInitializingAndQueuesProvisioning) {
    SandboxCreateRequest request;
    request.created_by = "alice";
    request.seed.instructions = "Be terse.";
    request.seed.env = {{"API_URL", "http://internal"}};

    auto sandbox = engine->Sandboxes().Create(request);
    EXPECT_EQ(sandbox.state, SandboxState::INITIALIZING);
    EXPECT_EQ(sandbox.idle_timeout_seconds, 900);
    EXPECT_TRUE(runtime->provisioned.empty());

    auto requests = store->ListRequests(sandbox.id);
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].type, WorkRequestType::PROVISION_SANDBOX);

    EXPECT_EQ(engine->Requests().ProcessPending(), 1u);

    auto ready = engine->Sandboxes().Get(sandbox.id);
    EXPECT_EQ(ready.state, SandboxState::IDLE);
    EXPECT_EQ(ready.runtime_handle, "fake-" + sandbox.id);
    EXPECT_TRUE(ready.idle_from.has_value());
    EXPECT_FALSE(ready.busy_from.has_value());

    ASSERT_EQ(runtime->provisioned.size(), 1u);
    EXPECT_EQ(runtime->provisioned[0].seed.instructions, "Be terse.");
    EXPECT_EQ(runtime->provisioned[0].seed.env.at("API_URL"), "http://internal");
    EXPECT_FALSE(runtime->provisioned[0].source_snapshot.has_value());
}

TEST_F(SandboxRegistryTest, CreateValidatesIdleTimeoutBounds) {
    SandboxCreateRequest request;
    request.idle_timeout_seconds = 0;
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Create(request); }), ErrorKind::VALIDATION);

    request.idle_timeout_seconds = 604801;
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Create(request); }), ErrorKind::VALIDATION);

    request.idle_timeout_seconds = 604800;
    EXPECT_NO_THROW(engine->Sandboxes().Create(request));
}

TEST_F(SandboxRegistryTest, TagsAreNormalizedAndDeduplicated) {
    SandboxCreateRequest request;
    request.tags = {" Team/Alpha", "team/alpha", "GPU"};
    auto sandbox = engine->Sandboxes().Create(request);
    EXPECT_EQ(sandbox.tags, (std::vector<std::string>{"team/alpha", "gpu"}));

    request.tags = {"bad tag"};
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Create(request); }), ErrorKind::VALIDATION);
}

TEST_F(SandboxRegistryTest, UnknownSandboxIsNotFound) {
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Get("nope"); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().MarkBusy("nope"); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Delete("nope"); }), ErrorKind::NOT_FOUND);
}

// ============================================================================
// Idle/busy clocks
// ============================================================================

TEST_F(SandboxRegistryTest, BusyAndIdleClocksAreExclusive) {
    auto sandbox = CreateIdleSandbox();
    auto idle_since = *sandbox.idle_from;

    Advance(std::chrono::seconds(3));
    auto busy = engine->Sandboxes().MarkBusy(sandbox.id);
    EXPECT_EQ(busy.state, SandboxState::BUSY);
    EXPECT_EQ(busy.busy_from, clock->Now());
    EXPECT_FALSE(busy.idle_from.has_value());

    Advance(std::chrono::seconds(3));
    auto again = engine->Sandboxes().MarkBusy(sandbox.id);
    EXPECT_EQ(again.busy_from, busy.busy_from);

    auto idle = engine->Sandboxes().MarkIdle(sandbox.id);
    EXPECT_EQ(idle.state, SandboxState::IDLE);
    EXPECT_EQ(idle.idle_from, clock->Now());
    EXPECT_GT(*idle.idle_from, idle_since);
    EXPECT_FALSE(idle.busy_from.has_value());
}

TEST_F(SandboxRegistryTest, MarkOnTerminatedSandboxIsConflict) {
    auto sandbox = CreateIdleSandbox();
    engine->Sandboxes().Delete(sandbox.id);

    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().MarkBusy(sandbox.id); }), ErrorKind::CONFLICT);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().MarkIdle(sandbox.id); }), ErrorKind::CONFLICT);
}

TEST_F(SandboxRegistryTest, MarkIdleRefusedWhileTaskInFlight) {
    SandboxCreateRequest request;
    request.idle_timeout_seconds = 60;
    auto sandbox = CreateIdleSandbox(request);
    auto task = SubmitText(sandbox.id, "long running", 0);

    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().MarkIdle(sandbox.id); }), ErrorKind::CONFLICT);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Transition(sandbox.id, SandboxState::IDLE); }),
              ErrorKind::CONFLICT);
    EXPECT_EQ(engine->Sandboxes().Get(sandbox.id).state, SandboxState::BUSY);

    // A busy sandbox is never idle-reaped, so the task survives
    Advance(std::chrono::seconds(61));
    engine->Reaper().SweepOnce();
    Advance(std::chrono::seconds(10));
    engine->Reaper().SweepOnce();
    EXPECT_EQ(engine->Sandboxes().Get(sandbox.id).state, SandboxState::BUSY);
    EXPECT_EQ(engine->Tasks().Get(sandbox.id, task.id).status, TaskStatus::PENDING);

    Complete(sandbox.id, task.id, "done");
    EXPECT_EQ(engine->Sandboxes().MarkIdle(sandbox.id).state, SandboxState::IDLE);
}

// ============================================================================
// Explicit transitions
// ============================================================================

TEST_F(SandboxRegistryTest, TransitionRejectsEdgesOutsideTheTable) {
    auto sandbox = CreateIdleSandbox();
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Transition(sandbox.id, SandboxState::TERMINATED); }),
              ErrorKind::INVALID_TRANSITION);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Transition(sandbox.id, SandboxState::INITIALIZING); }),
              ErrorKind::INVALID_TRANSITION);

    auto pending = engine->Sandboxes().Create(SandboxCreateRequest{});
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Transition(pending.id, SandboxState::BUSY); }),
              ErrorKind::INVALID_TRANSITION);
}

TEST_F(SandboxRegistryTest, TransitionWalksTerminationInTwoSteps) {
    auto sandbox = CreateIdleSandbox();

    auto terminating = engine->Sandboxes().Transition(sandbox.id, SandboxState::TERMINATING);
    EXPECT_EQ(terminating.state, SandboxState::TERMINATING);
    EXPECT_TRUE(runtime->destroyed.empty());

    auto terminated = engine->Sandboxes().Transition(sandbox.id, SandboxState::TERMINATED);
    EXPECT_EQ(terminated.state, SandboxState::TERMINATED);
    EXPECT_EQ(runtime->destroyed, std::vector<std::string>{"fake-" + sandbox.id});

    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Transition(sandbox.id, SandboxState::IDLE); }),
              ErrorKind::INVALID_TRANSITION);
}

// ============================================================================
// Stop, delete and purge
// ============================================================================

TEST_F(SandboxRegistryTest, StopSchedulesWithMinimumDelayAndIsIdempotent) {
    auto sandbox = CreateIdleSandbox();
    auto now = clock->Now();

    auto stopping = engine->Sandboxes().Stop(sandbox.id, 0, std::string("maintenance"));
    ASSERT_TRUE(stopping.stop_at.has_value());
    EXPECT_EQ(*stopping.stop_at, now + std::chrono::seconds(5));
    EXPECT_EQ(stopping.stop_note, std::optional<std::string>("maintenance"));

    Advance(std::chrono::seconds(1));
    auto second = engine->Sandboxes().Stop(sandbox.id, 60, std::nullopt);
    EXPECT_EQ(second.stop_at, stopping.stop_at);
    EXPECT_EQ(second.stop_note, stopping.stop_note);
    EXPECT_EQ(second.state, SandboxState::IDLE);
}

TEST_F(SandboxRegistryTest, StopUsesRequestedDelayAboveMinimum) {
    auto sandbox = CreateIdleSandbox();
    auto now = clock->Now();
    auto stopping = engine->Sandboxes().Stop(sandbox.id, 30, std::nullopt);
    EXPECT_EQ(*stopping.stop_at, now + std::chrono::seconds(30));
}

TEST_F(SandboxRegistryTest, StopWhileInitializingIsConflict) {
    auto sandbox = engine->Sandboxes().Create(SandboxCreateRequest{});
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Stop(sandbox.id, 10, std::nullopt); }),
              ErrorKind::CONFLICT);
}

TEST_F(SandboxRegistryTest, DeleteCancelsTaskReleasesRuntimeAndSnapshots) {
    auto sandbox = CreateIdleSandbox();
    auto task = SubmitText(sandbox.id, "long job");

    auto deleted = engine->Sandboxes().Delete(sandbox.id);
    EXPECT_EQ(deleted.state, SandboxState::TERMINATED);
    EXPECT_FALSE(deleted.idle_from.has_value());
    EXPECT_FALSE(deleted.busy_from.has_value());

    EXPECT_EQ(engine->Tasks().Get(sandbox.id, task.id).status, TaskStatus::CANCELLED);
    EXPECT_EQ(runtime->destroyed, std::vector<std::string>{"fake-" + sandbox.id});

    auto snapshots = engine->Snapshots().List(sandbox.id);
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0].trigger, SnapshotTrigger::TERMINATION);
    EXPECT_EQ(snapshots[0].metadata["trigger"], "sandbox_stop");

    // Already terminated: unchanged, nothing released twice
    engine->Sandboxes().Delete(sandbox.id);
    EXPECT_EQ(runtime->destroyed.size(), 1u);
    EXPECT_EQ(engine->Snapshots().List(sandbox.id).size(), 1u);
}

TEST_F(SandboxRegistryTest, DeleteOfInitializingSandboxSkipsRuntime) {
    auto sandbox = engine->Sandboxes().Create(SandboxCreateRequest{});
    auto deleted = engine->Sandboxes().Delete(sandbox.id);
    EXPECT_EQ(deleted.state, SandboxState::TERMINATED);
    EXPECT_TRUE(runtime->destroyed.empty());

    // The queued provisioning was cancelled with the sandbox
    EXPECT_EQ(engine->Requests().ProcessPending(), 0u);
    EXPECT_TRUE(runtime->provisioned.empty());
}

TEST_F(SandboxRegistryTest, FailedReleaseLeavesSandboxTerminating) {
    auto sandbox = CreateIdleSandbox();
    runtime->fail_destroy = true;

    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Delete(sandbox.id); }), ErrorKind::UPSTREAM);
    EXPECT_EQ(engine->Sandboxes().Get(sandbox.id).state, SandboxState::TERMINATING);

    runtime->fail_destroy = false;
    auto stats = engine->Reaper().SweepOnce();
    EXPECT_EQ(stats.finalized, 1u);
    EXPECT_EQ(engine->Sandboxes().Get(sandbox.id).state, SandboxState::TERMINATED);
    EXPECT_EQ(engine->Snapshots().List(sandbox.id).size(), 1u);
}

TEST_F(SandboxRegistryTest, PurgeRequiresTermination) {
    auto sandbox = CreateIdleSandbox();
    SubmitText(sandbox.id, "hello");

    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Purge(sandbox.id); }), ErrorKind::CONFLICT);

    engine->Sandboxes().Delete(sandbox.id);
    engine->Sandboxes().Purge(sandbox.id);

    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Get(sandbox.id); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(store->CountTasks(sandbox.id), 0u);
}

// ============================================================================
// Restart and update
// ============================================================================

TEST_F(SandboxRegistryTest, RestartCancelsTaskAndRecordsMarker) {
    auto sandbox = CreateIdleSandbox();
    auto task = SubmitText(sandbox.id, "stuck job");
    Advance(std::chrono::seconds(1));

    auto restarted = engine->Sandboxes().Restart(sandbox.id, "operator");
    EXPECT_EQ(restarted.state, SandboxState::IDLE);
    EXPECT_EQ(runtime->restarted, std::vector<std::string>{"fake-" + sandbox.id});
    EXPECT_EQ(engine->Tasks().Get(sandbox.id, task.id).status, TaskStatus::CANCELLED);

    auto tasks = engine->Tasks().List(sandbox.id, 0, std::nullopt);
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(MarkerTitle(tasks[1]), "Sandbox Restarted");
    EXPECT_EQ(tasks[1].created_by, "operator");
}

TEST_F(SandboxRegistryTest, RestartWhileStoppingIsConflict) {
    auto sandbox = CreateIdleSandbox();
    engine->Sandboxes().Stop(sandbox.id, 30, std::nullopt);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Restart(sandbox.id, "operator"); }),
              ErrorKind::CONFLICT);
}

TEST_F(SandboxRegistryTest, UpdateChangesAnnotationsOnly) {
    auto sandbox = CreateIdleSandbox();

    SandboxUpdateRequest update;
    update.metadata = json{{"owner", "team-a"}};
    update.description = "nightly";
    update.tags = std::vector<std::string>{"Nightly"};
    update.idle_timeout_seconds = 120;

    auto updated = engine->Sandboxes().Update(sandbox.id, update);
    EXPECT_EQ(updated.metadata["owner"], "team-a");
    EXPECT_EQ(updated.description, "nightly");
    EXPECT_EQ(updated.tags, std::vector<std::string>{"nightly"});
    EXPECT_EQ(updated.idle_timeout_seconds, 120);
    EXPECT_EQ(updated.state, SandboxState::IDLE);

    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Update(sandbox.id, SandboxUpdateRequest{}); }),
              ErrorKind::VALIDATION);

    engine->Sandboxes().Delete(sandbox.id);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Sandboxes().Update(sandbox.id, update); }),
              ErrorKind::CONFLICT);
}

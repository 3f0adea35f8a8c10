#include "test_helpers.hpp"

#include <thread>

using namespace agentbox::core;
using agentbox::testing::EngineTest;
using agentbox::testing::ErrorKindOf;

class SnapshotManagerTest : public EngineTest {
protected:
    Sandbox CreateSeededSandbox() {
        SandboxCreateRequest request;
        request.created_by = "alice";
        request.idle_timeout_seconds = 300;
        request.tags = {"team/a"};
        request.metadata = json{{"project", "atlas"}};
        request.description = "source sandbox";
        request.seed.instructions = "You are a build agent.";
        request.seed.setup = "apt-get install -y make";
        request.seed.env = {{"REGION", "eu-west-1"}, {"TOKEN", "s3cr3t"}};
        return CreateIdleSandbox(request);
    }
};

// ============================================================================
// Capture
// ============================================================================

TEST_F(SnapshotManagerTest, CaptureRecordsSeedAndWorkspaceCopy) {
    auto sandbox = CreateSeededSandbox();

    auto snapshot = engine->Snapshots().Capture(sandbox.id, SnapshotTrigger::MANUAL,
                                                json{{"label", "before upgrade"}});
    EXPECT_EQ(snapshot.sandbox_id, sandbox.id);
    EXPECT_EQ(snapshot.trigger, SnapshotTrigger::MANUAL);
    EXPECT_EQ(snapshot.metadata["label"], "before upgrade");
    EXPECT_EQ(snapshot.seed.instructions, "You are a build agent.");
    EXPECT_EQ(snapshot.seed.env.size(), 2u);
    EXPECT_EQ(snapshot.runtime_ref, std::optional<std::string>("volumes:" + snapshot.id));

    // The source keeps running
    EXPECT_EQ(engine->Sandboxes().Get(sandbox.id).state, SandboxState::IDLE);
    EXPECT_EQ(engine->Snapshots().Get(snapshot.id).id, snapshot.id);
}

TEST_F(SnapshotManagerTest, CaptureRejectsTerminatedAndBadMetadata) {
    auto sandbox = CreateSeededSandbox();
    EXPECT_EQ(ErrorKindOf([&]() {
        engine->Snapshots().Capture(sandbox.id, SnapshotTrigger::MANUAL, json::array());
    }), ErrorKind::VALIDATION);

    engine->Sandboxes().Delete(sandbox.id);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Snapshots().Capture(sandbox.id, SnapshotTrigger::MANUAL); }),
              ErrorKind::CONFLICT);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Snapshots().Capture("missing", SnapshotTrigger::MANUAL); }),
              ErrorKind::NOT_FOUND);
}

TEST_F(SnapshotManagerTest, RuntimeFailureStillRecordsSnapshot) {
    auto sandbox = CreateSeededSandbox();
    runtime->fail_snapshot = true;

    auto snapshot = engine->Snapshots().Capture(sandbox.id, SnapshotTrigger::MANUAL);
    EXPECT_FALSE(snapshot.runtime_ref.has_value());
    EXPECT_EQ(snapshot.seed.setup, "apt-get install -y make");
}

TEST_F(SnapshotManagerTest, TerminationSnapshotIsRecordedOnce) {
    auto sandbox = CreateSeededSandbox();
    auto current = engine->Sandboxes().Get(sandbox.id);

    auto first = engine->Snapshots().CaptureTermination(current);
    auto second = engine->Snapshots().CaptureTermination(current);
    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(first.trigger, SnapshotTrigger::TERMINATION);
    EXPECT_EQ(first.metadata["trigger"], "sandbox_stop");
    EXPECT_TRUE(first.metadata.contains("stopped_at"));
    EXPECT_EQ(engine->Snapshots().List(sandbox.id).size(), 1u);
}

TEST_F(SnapshotManagerTest, ConcurrentFinalizationsShareOneTerminationSnapshot) {
    auto sandbox = CreateSeededSandbox();
    auto current = engine->Sandboxes().Get(sandbox.id);
    runtime->on_snapshot = []() { std::this_thread::sleep_for(std::chrono::milliseconds(50)); };

    Snapshot first;
    Snapshot second;
    std::thread a([&]() { first = engine->Snapshots().CaptureTermination(current); });
    std::thread b([&]() { second = engine->Snapshots().CaptureTermination(current); });
    a.join();
    b.join();

    EXPECT_EQ(first.id, second.id);
    EXPECT_EQ(engine->Snapshots().List(sandbox.id).size(), 1u);
    EXPECT_EQ(runtime->snapshotted.size(), 1u);
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(SnapshotManagerTest, ListFiltersBySandboxNewestFirst) {
    auto a = CreateSeededSandbox();
    auto b = CreateSeededSandbox();

    auto first = engine->Snapshots().Capture(a.id, SnapshotTrigger::MANUAL);
    Advance(std::chrono::seconds(1));
    auto second = engine->Snapshots().Capture(a.id, SnapshotTrigger::MANUAL);
    engine->Snapshots().Capture(b.id, SnapshotTrigger::MANUAL);

    auto for_a = engine->Snapshots().List(a.id);
    ASSERT_EQ(for_a.size(), 2u);
    EXPECT_EQ(for_a[0].id, second.id);
    EXPECT_EQ(for_a[1].id, first.id);

    EXPECT_EQ(engine->Snapshots().List(std::nullopt).size(), 3u);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Snapshots().List(std::string("missing")); }),
              ErrorKind::NOT_FOUND);
}

TEST_F(SnapshotManagerTest, RemoveDeletesRecordAndWorkspaceCopy) {
    auto sandbox = CreateSeededSandbox();
    auto snapshot = engine->Snapshots().Capture(sandbox.id, SnapshotTrigger::MANUAL);

    engine->Snapshots().Remove(snapshot.id);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Snapshots().Get(snapshot.id); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Snapshots().Remove(snapshot.id); }), ErrorKind::NOT_FOUND);
    EXPECT_EQ(runtime->removed_snapshots, std::vector<std::string>{*snapshot.runtime_ref});
}

TEST_F(SnapshotManagerTest, RuntimeCleanupFailureStillRemovesRecord) {
    auto sandbox = CreateSeededSandbox();
    auto snapshot = engine->Snapshots().Capture(sandbox.id, SnapshotTrigger::MANUAL);
    runtime->fail_remove_snapshot = true;

    EXPECT_NO_THROW(engine->Snapshots().Remove(snapshot.id));
    EXPECT_EQ(ErrorKindOf([&]() { engine->Snapshots().Get(snapshot.id); }), ErrorKind::NOT_FOUND);
}

// ============================================================================
// Seeding sandboxes
// ============================================================================

TEST_F(SnapshotManagerTest, CreateFromCopiesOnlySelectedAreas) {
    auto source = CreateSeededSandbox();
    auto snapshot = engine->Snapshots().Capture(source.id, SnapshotTrigger::MANUAL);

    CloneOptions options;
    options.copy_code = false;
    options.copy_env = true;
    options.created_by = "bob";
    auto clone = engine->Snapshots().CreateFrom(snapshot.id, options);

    EXPECT_EQ(clone.state, SandboxState::INITIALIZING);
    EXPECT_EQ(clone.parent_id, std::optional<std::string>(source.id));
    EXPECT_EQ(clone.snapshot_id, std::optional<std::string>(snapshot.id));
    EXPECT_EQ(clone.created_by, "bob");
    EXPECT_TRUE(clone.seed.instructions.empty());
    EXPECT_TRUE(clone.seed.setup.empty());
    EXPECT_EQ(clone.seed.env.at("REGION"), "eu-west-1");

    engine->Requests().ProcessPending();
    EXPECT_EQ(engine->Sandboxes().Get(clone.id).state, SandboxState::IDLE);
    ASSERT_EQ(runtime->provisioned.size(), 2u);
    EXPECT_EQ(runtime->provisioned[1].source_snapshot, snapshot.runtime_ref);
    EXPECT_FALSE(runtime->provisioned[1].copy_code);
    EXPECT_TRUE(runtime->provisioned[1].seed.instructions.empty());
    EXPECT_EQ(runtime->provisioned[1].seed.env.count("TOKEN"), 1u);

    EXPECT_EQ(engine->Sandboxes().Children(source.id), std::vector<std::string>{clone.id});
}

TEST_F(SnapshotManagerTest, CreateFromWithoutEnvKeepsCode) {
    auto source = CreateSeededSandbox();
    auto snapshot = engine->Snapshots().Capture(source.id, SnapshotTrigger::MANUAL);

    CloneOptions options;
    options.copy_env = false;
    auto clone = engine->Snapshots().CreateFrom(snapshot.id, options);
    EXPECT_EQ(clone.seed.instructions, "You are a build agent.");
    EXPECT_TRUE(clone.seed.env.empty());

    engine->Requests().ProcessPending();
    ASSERT_EQ(runtime->provisioned.size(), 2u);
    EXPECT_TRUE(runtime->provisioned[1].seed.env.empty());
    EXPECT_TRUE(runtime->provisioned[1].copy_code);
    EXPECT_EQ(runtime->provisioned[1].source_snapshot, snapshot.runtime_ref);
}

TEST_F(SnapshotManagerTest, CloneInheritsAnnotationsUnlessOverridden) {
    auto source = CreateSeededSandbox();

    CloneOptions options;
    options.created_by = "alice";
    options.description = "experiment branch";
    auto clone = engine->Snapshots().Clone(source.id, options);

    EXPECT_EQ(clone.idle_timeout_seconds, 300);
    EXPECT_EQ(clone.tags, std::vector<std::string>{"team/a"});
    EXPECT_EQ(clone.metadata["project"], "atlas");
    EXPECT_EQ(clone.description, "experiment branch");

    auto snapshots = engine->Snapshots().List(source.id);
    ASSERT_EQ(snapshots.size(), 1u);
    EXPECT_EQ(snapshots[0].metadata["trigger"], "clone");
    EXPECT_EQ(clone.snapshot_id, std::optional<std::string>(snapshots[0].id));

    CloneOptions replace_metadata;
    replace_metadata.metadata = json{{"project", "zephyr"}};
    auto second = engine->Snapshots().Clone(source.id, replace_metadata);
    EXPECT_EQ(second.metadata["project"], "zephyr");
    EXPECT_EQ(second.description, "source sandbox");
}

TEST_F(SnapshotManagerTest, CloneSubmitsInitialPromptOnceReady) {
    auto source = CreateSeededSandbox();

    CloneOptions options;
    options.created_by = "alice";
    options.initial_prompt = "Continue where you left off";
    auto clone = engine->Snapshots().Clone(source.id, options);

    engine->Requests().ProcessPending();

    auto tasks = engine->Tasks().List(clone.id, 0, std::nullopt);
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].input["text"], "Continue where you left off");
    EXPECT_EQ(tasks[0].created_by, "alice");
    EXPECT_EQ(tasks[0].status, TaskStatus::PROCESSING);
    EXPECT_EQ(engine->Sandboxes().Get(clone.id).state, SandboxState::BUSY);
}

TEST_F(SnapshotManagerTest, SnapshotOutlivesPurgedSource) {
    auto source = CreateSeededSandbox();
    auto snapshot = engine->Snapshots().Capture(source.id, SnapshotTrigger::MANUAL);

    engine->Sandboxes().Delete(source.id);
    engine->Sandboxes().Purge(source.id);

    auto clone = engine->Snapshots().CreateFrom(snapshot.id, CloneOptions{});
    EXPECT_EQ(clone.parent_id, std::optional<std::string>(source.id));
    EXPECT_EQ(clone.seed.instructions, "You are a build agent.");
    EXPECT_EQ(clone.idle_timeout_seconds, 900);
    EXPECT_TRUE(clone.tags.empty());
}

TEST_F(SnapshotManagerTest, CreateFromUnknownSnapshotIsNotFound) {
    EXPECT_EQ(ErrorKindOf([&]() { engine->Snapshots().CreateFrom("missing", CloneOptions{}); }),
              ErrorKind::NOT_FOUND);
}

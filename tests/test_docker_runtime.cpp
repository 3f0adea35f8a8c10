#include <gtest/gtest.h>

#include "agentbox/core/errors.hpp"
#include "agentbox/runtime/docker_runtime.hpp"

#include <deque>

using namespace agentbox;
using namespace agentbox::runtime;

/**
 * Captures every command line and answers from a scripted queue;
 * unscripted commands succeed with empty output.
 */
class DockerRuntimeTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.docker_binary = "docker";
        settings.image = "agentbox/agent:latest";
        settings.network = "bridge";
        settings.memory_mb = 2048;
        settings.cpus = 2.0;
    }

    DockerRuntime MakeRuntime() {
        return DockerRuntime(settings, [this](const std::string& command) {
            commands.push_back(command);
            if (responses.empty()) {
                return CommandResult{};
            }
            auto next = responses.front();
            responses.pop_front();
            return next;
        });
    }

    core::RuntimeSettings settings;
    std::vector<std::string> commands;
    std::deque<CommandResult> responses;
};

TEST_F(DockerRuntimeTest, ProvisionRunsLabelledContainer) {
    auto docker = MakeRuntime();

    ProvisionSpec spec;
    spec.sandbox_id = "sb1";
    spec.seed.instructions = "Be brief.";
    spec.seed.env = {{"REGION", "eu"}};

    EXPECT_EQ(docker.Provision(spec), "agentbox-sb1");
    ASSERT_EQ(commands.size(), 3u);
    EXPECT_EQ(commands[0],
              "'docker' 'volume' 'create' '--label' 'agentbox.sandbox=sb1' 'agentbox-sb1-data'");
    EXPECT_EQ(commands[1],
              "'docker' 'run' '--rm' '-v' 'agentbox-sb1-data:/dest' 'agentbox/agent:latest' "
              "'sh' '-c' 'mkdir -p /dest/code /dest/content'");
    EXPECT_EQ(commands[2],
              "'docker' 'run' '-d' '--name' 'agentbox-sb1' '--label' 'agentbox.sandbox=sb1' "
              "'--memory' '2048m' '--cpus' '2' '--network' 'bridge' "
              "'-e' 'AGENTBOX_SANDBOX_ID=sb1' '-e' 'AGENTBOX_INSTRUCTIONS=Be brief.' "
              "'-e' 'REGION=eu' '-v' 'agentbox-sb1-data:/workspace' '-w' '/workspace' "
              "'agentbox/agent:latest'");
}

TEST_F(DockerRuntimeTest, CloneWithoutCodeOrEnvGetsNeitherFromSource) {
    settings.memory_mb = 0;
    settings.cpus = 0;
    settings.network.clear();
    auto docker = MakeRuntime();

    // What CreateFrom hands over for code=false, env=false
    ProvisionSpec spec;
    spec.sandbox_id = "sb2";
    spec.source_snapshot = "agentbox-snapshot-snap1";
    spec.copy_code = false;

    auto seed = docker.BuildSeedCommand(spec);
    std::vector<std::string> expected_seed = {
        "run", "--rm", "-v", "agentbox-snapshot-snap1:/source:ro", "-v", "agentbox-sb2-data:/dest",
        "agentbox/agent:latest", "sh", "-c",
        "mkdir -p /dest/code /dest/content"
        " && if [ -d /source/content ]; then cp -a /source/content/. /dest/content/; fi"};
    EXPECT_EQ(seed, expected_seed);

    auto run = docker.BuildRunCommand(spec);
    std::vector<std::string> expected_run = {
        "run", "-d", "--name", "agentbox-sb2", "--label", "agentbox.sandbox=sb2",
        "-e", "AGENTBOX_SANDBOX_ID=sb2",
        "-v", "agentbox-sb2-data:/workspace", "-w", "/workspace",
        "agentbox/agent:latest"};
    EXPECT_EQ(run, expected_run);
    for (const auto& arg : run) {
        EXPECT_EQ(arg.find("AGENTBOX_INSTRUCTIONS"), std::string::npos) << arg;
        EXPECT_EQ(arg.find("snapshot"), std::string::npos) << arg;
    }
}

TEST_F(DockerRuntimeTest, CloneWithCodeCopiesBothAreas) {
    auto docker = MakeRuntime();

    ProvisionSpec spec;
    spec.sandbox_id = "sb7";
    spec.source_snapshot = "agentbox-snapshot-snap1";

    auto seed = docker.BuildSeedCommand(spec);
    ASSERT_FALSE(seed.empty());
    EXPECT_NE(seed.back().find("cp -a /source/content/. /dest/content/"), std::string::npos);
    EXPECT_NE(seed.back().find("cp -a /source/code/. /dest/code/"), std::string::npos);
}

TEST_F(DockerRuntimeTest, SeedContentIsQuotedForTheShell) {
    auto docker = MakeRuntime();

    ProvisionSpec spec;
    spec.sandbox_id = "sb3";
    spec.seed.instructions = "don't $(rm -rf /)";
    docker.Provision(spec);

    ASSERT_EQ(commands.size(), 3u);
    EXPECT_NE(commands[2].find("'AGENTBOX_INSTRUCTIONS=don'\\''t $(rm -rf /)'"), std::string::npos);
}

TEST_F(DockerRuntimeTest, SetupScriptRunsInCodeAreaAfterCreate) {
    auto docker = MakeRuntime();

    ProvisionSpec spec;
    spec.sandbox_id = "sb4";
    spec.seed.setup = "make deps";
    docker.Provision(spec);

    ASSERT_EQ(commands.size(), 4u);
    EXPECT_EQ(commands[3], "'docker' 'exec' '-w' '/workspace/code' 'agentbox-sb4' 'sh' '-c' 'make deps'");
}

TEST_F(DockerRuntimeTest, FailedSetupRemovesContainerAndVolume) {
    auto docker = MakeRuntime();
    responses = {CommandResult{}, CommandResult{}, CommandResult{0, "abc123\n"},
                 CommandResult{2, "make: *** No rule\n"}};

    ProvisionSpec spec;
    spec.sandbox_id = "sb5";
    spec.seed.setup = "make deps";

    try {
        docker.Provision(spec);
        FAIL() << "expected provisioning to fail";
    } catch (const core::EngineError& e) {
        EXPECT_EQ(e.Kind(), core::ErrorKind::UPSTREAM);
        EXPECT_NE(std::string(e.what()).find("No rule"), std::string::npos);
    }

    ASSERT_EQ(commands.size(), 6u);
    EXPECT_EQ(commands[4], "'docker' 'rm' '-f' 'agentbox-sb5'");
    EXPECT_EQ(commands[5], "'docker' 'volume' 'rm' '-f' 'agentbox-sb5-data'");
}

TEST_F(DockerRuntimeTest, FailedRunIsUpstreamErrorAndReleasesVolume) {
    auto docker = MakeRuntime();
    responses = {CommandResult{}, CommandResult{}, CommandResult{125, "Unable to find image\n"}};

    ProvisionSpec spec;
    spec.sandbox_id = "sb6";
    EXPECT_THROW(docker.Provision(spec), core::EngineError);
    ASSERT_EQ(commands.size(), 4u);
    EXPECT_EQ(commands[3], "'docker' 'volume' 'rm' '-f' 'agentbox-sb6-data'");
}

TEST_F(DockerRuntimeTest, FailedVolumeCreateStopsProvisioning) {
    auto docker = MakeRuntime();
    responses = {CommandResult{1, "Cannot connect to the Docker daemon\n"}};

    ProvisionSpec spec;
    spec.sandbox_id = "sb8";
    EXPECT_THROW(docker.Provision(spec), core::EngineError);
    EXPECT_EQ(commands.size(), 1u);
}

TEST_F(DockerRuntimeTest, DestroyRemovesContainerThenVolume) {
    auto docker = MakeRuntime();
    responses = {CommandResult{1, "Error: No such container: agentbox-gone\n"},
                 CommandResult{1, "Error: no such volume: agentbox-gone-data\n"}};
    EXPECT_NO_THROW(docker.Destroy("agentbox-gone"));
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0], "'docker' 'rm' '-f' 'agentbox-gone'");
    EXPECT_EQ(commands[1], "'docker' 'volume' 'rm' '-f' 'agentbox-gone-data'");

    responses = {CommandResult{1, "permission denied\n"}};
    EXPECT_THROW(docker.Destroy("agentbox-other"), core::EngineError);

    responses = {CommandResult{}, CommandResult{1, "volume is in use\n"}};
    EXPECT_THROW(docker.Destroy("agentbox-busy"), core::EngineError);
}

TEST_F(DockerRuntimeTest, DispatchPassesTaskThroughEnvironment) {
    auto docker = MakeRuntime();

    core::Task task;
    task.id = "t1";
    task.type = core::TaskType::SH;
    task.input = core::json{{"text", "ls"}};
    docker.DispatchTask("agentbox-sb1", task);

    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0],
              "'docker' 'exec' '-d' '-e' 'AGENTBOX_TASK_ID=t1' '-e' 'AGENTBOX_TASK_TYPE=SH' "
              "'-e' 'AGENTBOX_TASK_INPUT={\"text\":\"ls\"}' 'agentbox-sb1' 'agentbox-agent'");
}

TEST_F(DockerRuntimeTest, SnapshotCopiesWorkspaceIntoVolume) {
    auto docker = MakeRuntime();

    EXPECT_EQ(docker.Snapshot("agentbox-sb1", "snap1"),
              std::optional<std::string>("agentbox-snapshot-snap1"));
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0],
              "'docker' 'volume' 'create' '--label' 'agentbox.snapshot=snap1' 'agentbox-snapshot-snap1'");
    EXPECT_EQ(commands[1],
              "'docker' 'run' '--rm' '-v' 'agentbox-sb1-data:/source:ro' "
              "'-v' 'agentbox-snapshot-snap1:/dest' 'agentbox/agent:latest' 'sh' '-c' 'cp -a /source/. /dest/'");

    commands.clear();
    responses = {CommandResult{}, CommandResult{1, "No such volume\n"}};
    EXPECT_THROW(docker.Snapshot("agentbox-sb1", "snap2"), core::EngineError);
    ASSERT_EQ(commands.size(), 3u);
    EXPECT_EQ(commands[2], "'docker' 'volume' 'rm' '-f' 'agentbox-snapshot-snap2'");
}

TEST_F(DockerRuntimeTest, RemoveSnapshotDropsVolume) {
    auto docker = MakeRuntime();
    docker.RemoveSnapshot("agentbox-snapshot-snap1");
    EXPECT_EQ(commands[0], "'docker' 'volume' 'rm' '-f' 'agentbox-snapshot-snap1'");

    responses = {CommandResult{1, "Error: no such volume: agentbox-snapshot-gone\n"}};
    EXPECT_NO_THROW(docker.RemoveSnapshot("agentbox-snapshot-gone"));
}

TEST_F(DockerRuntimeTest, RestartAndAvailability) {
    auto docker = MakeRuntime();

    docker.Restart("agentbox-sb1");
    EXPECT_EQ(commands[0], "'docker' 'restart' 'agentbox-sb1'");

    EXPECT_TRUE(docker.IsAvailable());
    EXPECT_EQ(commands[1], "'docker' 'info' '--format' '{{.ServerVersion}}'");

    responses = {CommandResult{1, "Cannot connect to the Docker daemon\n"}};
    EXPECT_FALSE(docker.IsAvailable());
    EXPECT_EQ(docker.Name(), "docker");
}

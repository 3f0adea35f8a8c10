#include "test_helpers.hpp"

#include "agentbox/core/task_markers.hpp"

using namespace agentbox::core;
using agentbox::testing::EngineTest;
using agentbox::testing::ErrorKindOf;

class ContextAccountantTest : public EngineTest {
protected:
    /// Submits @p text, completes it with @p reply and moves the clock on
    Task Exchange(const std::string& sandbox_id, const std::string& text, const std::string& reply) {
        auto task = SubmitText(sandbox_id, text);
        auto done = Complete(sandbox_id, task.id, reply);
        Advance(std::chrono::seconds(1));
        return done;
    }
};

// ============================================================================
// Usage
// ============================================================================

TEST_F(ContextAccountantTest, FreshSandboxHasNoUsage) {
    auto sandbox = CreateIdleSandbox();
    auto usage = engine->Context().GetUsage(sandbox.id);
    EXPECT_EQ(usage.sandbox_id, sandbox.id);
    EXPECT_EQ(usage.soft_limit_tokens, 128000);
    EXPECT_EQ(usage.used_tokens_estimated, 0);
    EXPECT_DOUBLE_EQ(usage.used_percent, 0.0);
    EXPECT_EQ(usage.basis, "last_context_length");
    EXPECT_FALSE(usage.cutoff_at.has_value());
}

TEST_F(ContextAccountantTest, ReportUsageStoresAndClamps) {
    auto sandbox = CreateIdleSandbox();

    auto usage = engine->Context().ReportUsage(sandbox.id, 32000);
    EXPECT_EQ(usage.used_tokens_estimated, 32000);
    EXPECT_DOUBLE_EQ(usage.used_percent, 25.0);
    EXPECT_EQ(usage.measured_at, clock->Now());

    EXPECT_EQ(engine->Context().ReportUsage(sandbox.id, -5).used_tokens_estimated, 0);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Context().ReportUsage("missing", 1); }), ErrorKind::NOT_FOUND);
}

// ============================================================================
// Clear
// ============================================================================

TEST_F(ContextAccountantTest, ClearMovesCutoffAndRecordsMarker) {
    auto sandbox = CreateIdleSandbox();
    Exchange(sandbox.id, "hello", "hi there");
    engine->Context().ReportUsage(sandbox.id, 5000);

    auto cleared = engine->Context().Clear(sandbox.id, "alice");
    EXPECT_EQ(cleared.used_tokens_estimated, 0);
    EXPECT_EQ(cleared.cutoff_at, clock->Now());

    auto tasks = engine->Tasks().List(sandbox.id, 0, std::nullopt);
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(MarkerTitle(tasks[1]), "Context Cleared");
    EXPECT_EQ(tasks[1].status, TaskStatus::COMPLETED);
    EXPECT_EQ(tasks[1].created_by, "alice");

    // Fresh usage reports start from zero again
    EXPECT_EQ(engine->Context().ReportUsage(sandbox.id, 1000).used_tokens_estimated, 1000);
}

TEST_F(ContextAccountantTest, ClearOnTerminatedSandboxIsConflict) {
    auto sandbox = CreateIdleSandbox();
    engine->Sandboxes().Delete(sandbox.id);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Context().Clear(sandbox.id, "alice"); }), ErrorKind::CONFLICT);
    EXPECT_EQ(ErrorKindOf([&]() { engine->Context().Clear("missing", "alice"); }), ErrorKind::NOT_FOUND);
}

// ============================================================================
// Compact
// ============================================================================

TEST_F(ContextAccountantTest, CompactSummarizesSinceCutoff) {
    auto sandbox = CreateIdleSandbox();
    Exchange(sandbox.id, "old question", "old answer");
    engine->Context().Clear(sandbox.id, "alice");
    Advance(std::chrono::seconds(1));
    Exchange(sandbox.id, "Deploy service X", "Deployed to staging");
    engine->Context().ReportUsage(sandbox.id, 90000);

    auto usage = engine->Context().Compact(sandbox.id, "alice");
    EXPECT_EQ(usage.used_tokens_estimated, 0);
    EXPECT_EQ(usage.cutoff_at, clock->Now());

    ASSERT_EQ(inference->transcripts.size(), 1u);
    EXPECT_EQ(inference->transcripts[0],
              "User: Deploy service X\nAssistant: Deployed to staging\n");

    auto tasks = engine->Tasks().List(sandbox.id, 0, std::nullopt);
    const auto& marker = tasks.back();
    EXPECT_EQ(MarkerTitle(marker), "Context Compacted");
    EXPECT_EQ(marker.output["items"][1]["type"], "compact_summary");
    EXPECT_EQ(marker.output["items"][1]["content"], inference->summary);
}

TEST_F(ContextAccountantTest, NextCompactionCarriesPreviousSummary) {
    auto sandbox = CreateIdleSandbox();
    Exchange(sandbox.id, "step one", "done one");
    engine->Context().Compact(sandbox.id, "alice");
    Advance(std::chrono::seconds(1));

    Exchange(sandbox.id, "step two", "done two");
    inference->summary = "second summary";
    engine->Context().Compact(sandbox.id, "alice");

    ASSERT_EQ(inference->transcripts.size(), 2u);
    std::string expected_prefix = "Assistant: - user asked for a report\n- assistant produced it\n";
    EXPECT_EQ(inference->transcripts[1].rfind(expected_prefix, 0), 0u) << inference->transcripts[1];
    EXPECT_NE(inference->transcripts[1].find("User: step two"), std::string::npos);
    EXPECT_EQ(inference->transcripts[1].find("step one"), std::string::npos);
}

TEST_F(ContextAccountantTest, ExchangeDuringCompactionIsKeptForNextTranscript) {
    auto sandbox = CreateIdleSandbox();
    Exchange(sandbox.id, "first question", "first answer");

    int calls = 0;
    inference->on_summarize = [&]() {
        if (calls++ == 0) {
            Advance(std::chrono::seconds(1));
            Exchange(sandbox.id, "second question asked during compaction", "second answer");
            Advance(std::chrono::seconds(5));
        }
    };

    auto started = clock->Now();
    auto usage = engine->Context().Compact(sandbox.id, "alice");
    EXPECT_EQ(usage.cutoff_at, started);

    auto tasks = engine->Tasks().List(sandbox.id, 0, std::nullopt);
    ASSERT_EQ(tasks.size(), 3u);
    EXPECT_EQ(MarkerTitle(tasks[1]), "Context Compacted");
    EXPECT_EQ(tasks[1].created_at, started);

    engine->Context().Compact(sandbox.id, "alice");
    ASSERT_EQ(inference->transcripts.size(), 2u);
    EXPECT_NE(inference->transcripts[1].find("User: second question asked during compaction"),
              std::string::npos) << inference->transcripts[1];
    EXPECT_EQ(inference->transcripts[1].find("first question"), std::string::npos);
}

TEST_F(ContextAccountantTest, ClearDuringCompactionWins) {
    auto sandbox = CreateIdleSandbox();
    Exchange(sandbox.id, "hello", "hi");

    int calls = 0;
    inference->on_summarize = [&]() {
        if (calls++ == 0) {
            engine->Context().Clear(sandbox.id, "bob");
        }
    };

    EXPECT_EQ(ErrorKindOf([&]() { engine->Context().Compact(sandbox.id, "alice"); }), ErrorKind::CONFLICT);
    auto tasks = engine->Tasks().List(sandbox.id, 0, std::nullopt);
    EXPECT_EQ(MarkerTitle(tasks.back()), "Context Cleared");
}

TEST_F(ContextAccountantTest, FailedSummaryLeavesCutoffUnchanged) {
    auto sandbox = CreateIdleSandbox();
    Exchange(sandbox.id, "hello", "hi");
    engine->Context().ReportUsage(sandbox.id, 70000);
    auto before = engine->Sandboxes().Get(sandbox.id);
    inference->fail = true;

    EXPECT_EQ(ErrorKindOf([&]() { engine->Context().Compact(sandbox.id, "alice"); }), ErrorKind::UPSTREAM);

    auto after = engine->Sandboxes().Get(sandbox.id);
    EXPECT_EQ(after.context_cutoff_at, before.context_cutoff_at);
    EXPECT_EQ(after.last_context_length, 70000);
    EXPECT_EQ(engine->Tasks().Count(sandbox.id), 1u);
}

TEST_F(ContextAccountantTest, EmptyConversationCompactsWithoutBackend) {
    auto sandbox = CreateIdleSandbox();
    auto usage = engine->Context().Compact(sandbox.id, "alice");
    EXPECT_TRUE(usage.cutoff_at.has_value());
    EXPECT_TRUE(inference->transcripts.empty());

    auto tasks = engine->Tasks().List(sandbox.id, 0, std::nullopt);
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].output["items"][1]["content"], "(No prior conversation to compact.)");
}

// ============================================================================
// Transcript
// ============================================================================

TEST_F(ContextAccountantTest, TranscriptRendersItemsAndSkipsOtherMarkers) {
    auto now = clock->Now();

    Task user;
    user.input = json{{"text", "  list files  "},
                      {"content", json::array({json{{"type", "text"}, {"content", "in /srv"}},
                                               json{{"type", "image"}, {"content", "b64"}}})}};
    user.output = json{{"text", "here they are"},
                       {"items", json::array({json{{"type", "json"}, {"content", json{{"n", 2}}}},
                                              json{{"type", "markdown"}, {"content", "**a**, b"}},
                                              json{{"type", "binary"}, {"content", "skip"}}})}};

    auto cleared = MakeMarkerTask("sb", "alice", "Context Cleared",
                                  json::array({json{{"type", "context_cleared"}}}), now);

    auto transcript = engine->Context().BuildTranscript({user, cleared});
    EXPECT_EQ(transcript,
              "User: list files\n"
              "User: in /srv\n"
              "Assistant: here they are\n"
              "Assistant: {\"n\":2}\n"
              "Assistant: **a**, b\n");
}

class TranscriptCapTest : public EngineTest {
protected:
    void Configure(EngineConfig& c) override {
        c.context.transcript_max_chars = 40;
    }
};

TEST_F(TranscriptCapTest, StopsBeforeLineThatWouldExceedCap) {
    Task first;
    first.input = json{{"text", "short"}};
    first.output = json{{"text", "fine"}};
    Task second;
    second.input = json{{"text", std::string(100, 'x')}};
    Task third;
    third.input = json{{"text", "tiny"}};

    auto transcript = engine->Context().BuildTranscript({first, second, third});
    EXPECT_EQ(transcript, "User: short\nAssistant: fine\n");
}

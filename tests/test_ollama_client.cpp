#include <gtest/gtest.h>

#include "agentbox/core/errors.hpp"
#include "agentbox/inference/ollama_client.hpp"

#include <httplib.h>

#include <thread>

using namespace agentbox;
using agentbox::core::json;
using agentbox::inference::OllamaClient;

namespace {

core::InferenceSettings SettingsFor(const std::string& host) {
    core::InferenceSettings settings;
    settings.host = host;
    settings.model = "test-model";
    settings.timeout_seconds = 2;
    return settings;
}

} // anonymous namespace

TEST(OllamaClientTest, BuildRequestCarriesTranscript) {
    OllamaClient client(SettingsFor("http://localhost:11434"));
    auto body = client.BuildRequest("User: hello\n");

    EXPECT_EQ(body["model"], "test-model");
    EXPECT_EQ(body["stream"], false);
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "system");
    EXPECT_EQ(body["messages"][1]["role"], "user");

    auto prompt = body["messages"][1]["content"].get<std::string>();
    EXPECT_EQ(prompt.substr(prompt.size() - 12), "User: hello\n");
}

TEST(OllamaClientTest, ParseResponseReadsMessageContent) {
    EXPECT_EQ(OllamaClient::ParseResponse(R"({"message":{"role":"assistant","content":"- done"}})"),
              "- done");

    for (const char* body : {"not json", "{}", R"({"message":{"content":3}})"}) {
        try {
            OllamaClient::ParseResponse(body);
            ADD_FAILURE() << "accepted " << body;
        } catch (const core::EngineError& e) {
            EXPECT_EQ(e.Kind(), core::ErrorKind::UPSTREAM);
        }
    }
}

TEST(OllamaClientTest, UnreachableHostIsUpstreamError) {
    auto settings = SettingsFor("http://127.0.0.1:1");
    settings.timeout_seconds = 1;
    OllamaClient client(settings);

    try {
        client.Summarize("User: hi\n");
        FAIL() << "expected an upstream error";
    } catch (const core::EngineError& e) {
        EXPECT_EQ(e.Kind(), core::ErrorKind::UPSTREAM);
    }
}

// ============================================================================
// Against a local chat endpoint
// ============================================================================

class OllamaServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        server.Post("/api/chat", [this](const httplib::Request& req, httplib::Response& res) {
            received = json::parse(req.body);
            res.status = status;
            res.set_content(reply, "application/json");
        });
        port = server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        thread = std::thread([this]() { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    void TearDown() override {
        server.stop();
        if (thread.joinable()) {
            thread.join();
        }
    }

    std::string Host() const {
        return "http://127.0.0.1:" + std::to_string(port);
    }

    httplib::Server server;
    std::thread thread;
    int port{0};
    int status{200};
    std::string reply{R"({"message":{"role":"assistant","content":"- deployed X to staging"}})"};
    json received;
};

TEST_F(OllamaServerTest, SummarizeReturnsAssistantMessage) {
    OllamaClient client(SettingsFor(Host()));
    EXPECT_EQ(client.Summarize("User: Deploy X\nAssistant: Done\n"), "- deployed X to staging");
    EXPECT_EQ(received["model"], "test-model");
    EXPECT_EQ(received["stream"], false);
}

TEST_F(OllamaServerTest, NonSuccessStatusIsUpstreamError) {
    status = 500;
    reply = R"({"error":"model not loaded"})";
    OllamaClient client(SettingsFor(Host()));

    try {
        client.Summarize("User: hi\n");
        FAIL() << "expected an upstream error";
    } catch (const core::EngineError& e) {
        EXPECT_EQ(e.Kind(), core::ErrorKind::UPSTREAM);
        EXPECT_NE(std::string(e.what()).find("model not loaded"), std::string::npos);
    }
}

/**
 * @file ollama_client.cpp
 * @brief Conversation summaries through the Ollama chat endpoint
 *
 * @date 2025
 */

#include "agentbox/inference/ollama_client.hpp"
#include "agentbox/core/errors.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

namespace agentbox {
namespace inference {

using core::EngineError;
using core::ErrorKind;
using core::json;

namespace {

const char* kCompactionPrompt =
    "You are a helpful assistant that compresses conversation history into a concise "
    "context for future messages.\n"
    "- Keep key goals, decisions, constraints, URLs, files, and paths.\n"
    "- Remove chitchat and redundant steps.\n"
    "- Prefer bullet points.\n"
    "- Target 150-250 words.";

} // anonymous namespace

OllamaClient::OllamaClient(core::InferenceSettings settings)
    : settings_(std::move(settings)) {
    spdlog::info("Ollama client initialized (host={}, model={})", settings_.host, settings_.model);
}

json OllamaClient::BuildRequest(const std::string& transcript) const {
    return json{
        {"model", settings_.model},
        {"stream", false},
        {"messages", json::array({
            {{"role", "system"}, {"content", kCompactionPrompt}},
            {{"role", "user"},
             {"content", "Please summarize the following conversation so it can be used as "
                         "compact context for future turns.\n\n" + transcript}}
        })}
    };
}

std::string OllamaClient::ParseResponse(const std::string& body) {
    try {
        json j = json::parse(body);
        if (j.contains("message") && j["message"].contains("content") &&
            j["message"]["content"].is_string()) {
            return j["message"]["content"].get<std::string>();
        }
    } catch (const json::exception& e) {
        throw EngineError(ErrorKind::UPSTREAM, std::string("Ollama parse error: ") + e.what());
    }
    throw EngineError(ErrorKind::UPSTREAM, "Ollama response has no message content");
}

std::string OllamaClient::Summarize(const std::string& transcript) {
    httplib::Client cli(settings_.host);
    cli.set_connection_timeout(settings_.timeout_seconds);
    cli.set_read_timeout(settings_.timeout_seconds);
    cli.set_write_timeout(settings_.timeout_seconds);

    spdlog::debug("Calling Ollama chat API: {} ({} transcript chars)",
                  settings_.model, transcript.size());

    auto result = cli.Post("/api/chat", BuildRequest(transcript).dump(), "application/json");

    if (!result) {
        std::string error = "Ollama request failed: " + httplib::to_string(result.error());
        spdlog::error("{}", error);
        throw EngineError(ErrorKind::UPSTREAM, error);
    }

    if (result->status != 200) {
        std::string error = "Ollama error (" + std::to_string(result->status) + "): " + result->body;
        spdlog::error("{}", error);
        throw EngineError(ErrorKind::UPSTREAM, error);
    }

    return ParseResponse(result->body);
}

} // namespace inference
} // namespace agentbox

/**
 * @file ollama_client.hpp
 * @brief InferenceClient for the Ollama chat API
 *
 * Sends one non-streaming POST /api/chat per summary with a fixed
 * compaction system prompt.
 *
 * @date 2025
 */

#pragma once

#include <string>

#include "agentbox/core/config.hpp"
#include "agentbox/core/types.hpp"
#include "agentbox/inference/inference_client.hpp"

namespace agentbox {
namespace inference {

class OllamaClient : public InferenceClient {
public:
    explicit OllamaClient(core::InferenceSettings settings);

    std::string Summarize(const std::string& transcript) override;

    /// Request body sent for @p transcript
    core::json BuildRequest(const std::string& transcript) const;

    /**
     * @brief Extract message.content from a chat response body
     * @throws core::EngineError(UPSTREAM) on malformed bodies
     */
    static std::string ParseResponse(const std::string& body);

private:
    core::InferenceSettings settings_;
};

} // namespace inference
} // namespace agentbox

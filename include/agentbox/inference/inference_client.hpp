/**
 * @file inference_client.hpp
 * @brief Boundary to the LLM inference backend
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace agentbox {
namespace inference {

class InferenceClient {
public:
    virtual ~InferenceClient() = default;

    /**
     * @brief Summarize a conversation transcript into compact context
     *
     * @param transcript "User: ..." / "Assistant: ..." lines
     * @return Summary text
     * @throws core::EngineError(UPSTREAM) on transport or backend failure
     */
    virtual std::string Summarize(const std::string& transcript) = 0;
};

} // namespace inference
} // namespace agentbox

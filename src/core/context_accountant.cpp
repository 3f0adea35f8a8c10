/**
 * @file context_accountant.cpp
 * @brief Context usage, clear and compaction
 *
 * **Compaction order**:
 * 1. Load tasks created at or after the current cutoff
 * 2. Render the transcript (capped)
 * 3. Summarize through the inference backend
 * 4. Move the cutoff and reset usage
 * 5. Record the "Context Compacted" marker holding the summary
 *
 * Step 3 is the only step that talks to a collaborator, and nothing is
 * written before it succeeds.
 *
 * @date 2025
 */

#include "agentbox/core/context_accountant.hpp"
#include "agentbox/core/errors.hpp"
#include "agentbox/core/task_markers.hpp"
#include "agentbox/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace agentbox {
namespace core {

using utils::StringUtils;

namespace {

const char* kEmptyTranscriptSummary = "(No prior conversation to compact.)";

/**
 * @class TranscriptWriter
 * @brief Appends lines until the character cap would be exceeded
 */
class TranscriptWriter {
public:
    explicit TranscriptWriter(std::size_t max_chars) : max_chars_(max_chars) {}

    void Add(const std::string& speaker, const std::string& text) {
        if (full_) return;
        std::string trimmed = StringUtils::Trim(text);
        if (trimmed.empty()) return;

        std::string line = speaker + ": " + trimmed + "\n";
        if (transcript_.size() + line.size() > max_chars_) {
            full_ = true;
            return;
        }
        transcript_ += line;
    }

    bool Full() const { return full_; }
    const std::string& Text() const { return transcript_; }

private:
    std::size_t max_chars_;
    std::string transcript_;
    bool full_{false};
};

std::string ItemContent(const json& item) {
    if (!item.is_object()) {
        return "";
    }
    std::string type = StringUtils::ToLower(item.value("type", std::string()));
    if (!item.contains("content")) {
        return "";
    }
    const auto& content = item["content"];
    if (type == "json") {
        return content.dump();
    }
    if ((type == "text" || type == "markdown" || type == "url") && content.is_string()) {
        return content.get<std::string>();
    }
    return "";
}

} // anonymous namespace

ContextAccountant::ContextAccountant(std::shared_ptr<store::StateStore> store,
                                     std::shared_ptr<inference::InferenceClient> inference,
                                     std::shared_ptr<Clock> clock,
                                     ContextSettings settings)
    : store_(std::move(store)),
      inference_(std::move(inference)),
      clock_(std::move(clock)),
      settings_(settings) {}

Sandbox ContextAccountant::Require(const std::string& sandbox_id) const {
    auto sandbox = store_->GetSandbox(sandbox_id);
    if (!sandbox) {
        throw EngineError(ErrorKind::NOT_FOUND, "Sandbox not found: " + sandbox_id);
    }
    return *sandbox;
}

ContextUsage ContextAccountant::MakeUsage(const Sandbox& sandbox) const {
    ContextUsage usage;
    usage.sandbox_id = sandbox.id;
    usage.soft_limit_tokens = settings_.soft_limit_tokens;
    usage.used_tokens_estimated = sandbox.last_context_length;
    usage.used_percent = settings_.soft_limit_tokens > 0
        ? static_cast<double>(sandbox.last_context_length) * 100.0 /
              static_cast<double>(settings_.soft_limit_tokens)
        : 0.0;
    usage.cutoff_at = sandbox.context_cutoff_at;
    usage.measured_at = sandbox.context_measured_at;
    return usage;
}

// ============================================================================
// USAGE
// ============================================================================

ContextUsage ContextAccountant::ReportUsage(const std::string& sandbox_id, long long tokens) {
    long long clamped = std::max<long long>(tokens, 0);
    auto now = clock_->Now();

    auto updated = store_->UpdateSandboxIf(
        sandbox_id,
        [](const Sandbox&, std::size_t) { return true; },
        [clamped, now](Sandbox& s) {
            s.last_context_length = clamped;
            s.context_measured_at = now;
        });

    if (!updated) {
        throw EngineError(ErrorKind::NOT_FOUND, "Sandbox not found: " + sandbox_id);
    }

    spdlog::debug("Sandbox {} context usage: {} tokens", sandbox_id, clamped);
    return MakeUsage(*updated);
}

ContextUsage ContextAccountant::GetUsage(const std::string& sandbox_id) const {
    return MakeUsage(Require(sandbox_id));
}

bool ContextAccountant::IsFull(const Sandbox& sandbox) const {
    return sandbox.last_context_length >= settings_.soft_limit_tokens;
}

// ============================================================================
// CLEAR / COMPACT
// ============================================================================

ContextUsage ContextAccountant::Clear(const std::string& sandbox_id, const std::string& requested_by) {
    auto now = clock_->Now();

    auto updated = store_->UpdateSandboxIf(
        sandbox_id,
        [](const Sandbox& s, std::size_t) { return s.state != SandboxState::TERMINATED; },
        [now](Sandbox& s) {
            s.context_cutoff_at = now;
            s.last_context_length = 0;
            s.context_measured_at = now;
        });

    if (!updated) {
        Require(sandbox_id);
        throw EngineError(ErrorKind::CONFLICT,
                          "Cannot clear context of terminated sandbox " + sandbox_id);
    }

    store_->InsertTask(MakeMarkerTask(
        sandbox_id, requested_by, "Context Cleared",
        json::array({json{{"type", "context_cleared"}, {"cutoff_at", FormatTimestamp(now)}}}),
        now));

    spdlog::info("Sandbox {} context cleared", sandbox_id);
    return MakeUsage(*updated);
}

ContextUsage ContextAccountant::Compact(const std::string& sandbox_id, const std::string& requested_by) {
    auto sandbox = Require(sandbox_id);
    if (sandbox.state == SandboxState::TERMINATED) {
        throw EngineError(ErrorKind::CONFLICT,
                          "Cannot compact context of terminated sandbox " + sandbox_id);
    }

    // Tasks created while the summary is generated stay after the new cutoff
    auto cutoff = clock_->Now();
    auto previous_cutoff = sandbox.context_cutoff_at;
    auto tasks = store_->ListTasksSince(sandbox_id, previous_cutoff);
    std::string transcript = BuildTranscript(tasks);

    std::string summary;
    if (StringUtils::Trim(transcript).empty()) {
        summary = kEmptyTranscriptSummary;
    } else {
        spdlog::info("Compacting context of sandbox {} ({} tasks, {} chars)",
                     sandbox_id, tasks.size(), transcript.size());
        try {
            summary = inference_->Summarize(transcript);
        } catch (const EngineError&) {
            throw;
        } catch (const std::exception& e) {
            throw EngineError(ErrorKind::UPSTREAM,
                              std::string("Context summarization failed: ") + e.what());
        }
    }

    auto now = clock_->Now();
    auto updated = store_->UpdateSandboxIf(
        sandbox_id,
        [&previous_cutoff](const Sandbox& s, std::size_t) {
            return s.state != SandboxState::TERMINATED && s.context_cutoff_at == previous_cutoff;
        },
        [cutoff, now](Sandbox& s) {
            s.context_cutoff_at = cutoff;
            s.last_context_length = 0;
            s.context_measured_at = now;
        });

    if (!updated) {
        auto current = Require(sandbox_id);
        throw EngineError(ErrorKind::CONFLICT,
                          current.state == SandboxState::TERMINATED
                              ? "Sandbox " + sandbox_id + " terminated during compaction"
                              : "Context of sandbox " + sandbox_id + " changed during compaction");
    }

    store_->InsertTask(MakeMarkerTask(
        sandbox_id, requested_by, "Context Compacted",
        json::array({
            json{{"type", "context_compacted"}, {"cutoff_at", FormatTimestamp(cutoff)}},
            json{{"type", "compact_summary"}, {"content", summary}}
        }),
        cutoff));

    spdlog::info("✓ Sandbox {} context compacted", sandbox_id);
    return MakeUsage(*updated);
}

// ============================================================================
// TRANSCRIPT
// ============================================================================

std::string ContextAccountant::BuildTranscript(const std::vector<Task>& tasks) const {
    TranscriptWriter writer(settings_.transcript_max_chars);

    for (const auto& task : tasks) {
        if (writer.Full()) break;

        if (task.kind == TaskKind::MARKER) {
            if (task.output.contains("items") && task.output["items"].is_array()) {
                for (const auto& item : task.output["items"]) {
                    if (item.is_object() &&
                        item.value("type", std::string()) == "compact_summary" &&
                        item.contains("content") && item["content"].is_string()) {
                        writer.Add("Assistant", item["content"].get<std::string>());
                    }
                }
            }
            continue;
        }

        // User side
        if (task.input.contains("text") && task.input["text"].is_string()) {
            writer.Add("User", task.input["text"].get<std::string>());
        }
        if (task.input.contains("content") && task.input["content"].is_array()) {
            for (const auto& item : task.input["content"]) {
                if (item.is_object() &&
                    StringUtils::ToLower(item.value("type", std::string())) == "text") {
                    writer.Add("User", ItemContent(item));
                }
            }
        }

        // Assistant side
        if (task.output.contains("text") && task.output["text"].is_string()) {
            writer.Add("Assistant", task.output["text"].get<std::string>());
        }
        if (task.output.contains("items") && task.output["items"].is_array()) {
            for (const auto& item : task.output["items"]) {
                writer.Add("Assistant", ItemContent(item));
            }
        }
    }

    return writer.Text();
}

} // namespace core
} // namespace agentbox

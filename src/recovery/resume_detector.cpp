#include "lifeline/recovery/resume_detector.hpp"
#include "lifeline/core/uuid.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace lifeline::recovery {

using checkpoint::CheckpointTrigger;
using signals::CrashRisk;

namespace {

constexpr auto kFullRecencyWindow = std::chrono::minutes{5};

double trigger_score(CheckpointTrigger trigger) {
    switch (trigger) {
        case CheckpointTrigger::DangerZone: return 1.0;
        case CheckpointTrigger::WarningZone: return 0.8;
        case CheckpointTrigger::UserRequested:
        case CheckpointTrigger::RiskyOperation:
        case CheckpointTrigger::Milestone: return 0.6;
        case CheckpointTrigger::ToolCallInterval:
        case CheckpointTrigger::TimeInterval: return 0.5;
        case CheckpointTrigger::SessionStart: return 0.3;
        case CheckpointTrigger::SessionEnd: return 0.0;
    }
    return 0.0;
}

// Risk recorded in the snapshot, raised to what a zone trigger implies
CrashRisk effective_risk(const Checkpoint& cp) {
    CrashRisk risk = cp.signals.crash_risk;
    if (cp.triggered_by == CheckpointTrigger::DangerZone) {
        risk = std::max(risk, CrashRisk::Danger);
    } else if (cp.triggered_by == CheckpointTrigger::WarningZone) {
        risk = std::max(risk, CrashRisk::Warning);
    }
    return risk;
}

}  // namespace

double restore_fidelity(const Checkpoint& cp) {
    double fidelity = 0.0;
    if (!cp.conversation.empty()) fidelity += 0.3;
    if (!cp.task.empty()) fidelity += 0.4;
    if (!cp.files.empty()) fidelity += 0.2;
    if (!cp.tools.empty()) fidelity += 0.1;
    return fidelity;
}

Json ResumeDecision::to_json() const {
    Json j{
        {"session_id", session_id},
        {"should_resume", should_resume},
        {"interruption_reason", std::string(storage::interruption_reason_to_string(interruption_reason))},
        {"confidence", confidence},
        {"time_since_checkpoint_ms", time_since_checkpoint.count()},
        {"skipped_corrupt", skipped_corrupt}
    };
    if (checkpoint) {
        j["checkpoint_id"] = checkpoint->id;
        j["checkpoint_number"] = checkpoint->checkpoint_number;
    }
    if (prompt) {
        j["prompt"] = prompt->to_json();
    }
    return j;
}

ResumeDetector::ResumeDetector(storage::CheckpointStore& store, const ResumeConfig& config)
    : store_(store)
    , config_(config)
{
}

InterruptionReason ResumeDetector::classify(const Checkpoint& cp, Duration elapsed) const {
    if (cp.triggered_by == CheckpointTrigger::SessionEnd) {
        return InterruptionReason::ManualExit;
    }

    CrashRisk risk = effective_risk(cp);
    if (elapsed <= std::chrono::minutes{config_.crash_window_minutes} && risk != CrashRisk::Safe) {
        return InterruptionReason::Crash;
    }
    if (elapsed >= std::chrono::minutes{config_.timeout_after_minutes} && risk == CrashRisk::Safe) {
        return InterruptionReason::Timeout;
    }
    return InterruptionReason::Unknown;
}

double ResumeDetector::confidence(const Checkpoint& cp, Duration elapsed) const {
    Duration horizon = std::chrono::hours{config_.recency_horizon_hours};

    double recency;
    if (elapsed <= kFullRecencyWindow) {
        recency = 1.0;
    } else if (elapsed >= horizon) {
        recency = 0.0;
    } else {
        auto span = static_cast<double>((horizon - kFullRecencyWindow).count());
        auto past = static_cast<double>((elapsed - kFullRecencyWindow).count());
        recency = 1.0 - past / span;
    }

    double completeness = 0.0;
    if (!cp.task.operation.empty()) completeness += 0.5;
    if (!cp.task.next_steps.empty()) completeness += 0.5;

    double score = config_.recency_weight * recency +
                   config_.trigger_weight * trigger_score(cp.triggered_by) +
                   config_.completeness_weight * completeness;
    return std::clamp(score, 0.0, 1.0);
}

ResumeDecision ResumeDetector::check_resume_needed(const SessionId& session_id, TimePoint at) {
    ResumeDecision decision;
    decision.session_id = session_id;

    try {
        auto headers = store_.list_headers(session_id);
        if (headers.is_err()) {
            spdlog::warn("Resume check for session {} failed: {}", session_id, headers.error().to_string());
            return decision;
        }

        std::optional<Checkpoint> usable;
        int attempts = 0;
        for (const auto& header : headers.value()) {
            if (attempts >= config_.max_fallback_attempts) {
                break;
            }
            if (header.is_restored()) {
                // Already consumed; older checkpoints predate that resume
                break;
            }
            ++attempts;

            auto loaded = store_.get_by_id(header.id);
            if (loaded.is_ok()) {
                usable = std::move(loaded).value();
                break;
            }
            if (loaded.error().code == ErrorCode::CorruptData) {
                spdlog::warn("Skipping corrupt checkpoint {} for session {}: {}",
                             header.id, session_id, loaded.error().message);
                decision.skipped_corrupt++;
                continue;
            }
            spdlog::warn("Could not load checkpoint {}: {}", header.id, loaded.error().to_string());
            return decision;
        }

        if (!usable) {
            if (decision.skipped_corrupt > 0) {
                spdlog::warn("No usable checkpoint for session {} after {} corrupt",
                             session_id, decision.skipped_corrupt);
            }
            return decision;
        }

        Duration elapsed = std::max(Duration{0}, at - usable->created_at);
        decision.time_since_checkpoint = elapsed;
        decision.interruption_reason = classify(*usable, elapsed);
        decision.confidence = confidence(*usable, elapsed);
        decision.should_resume = decision.confidence >= config_.min_confidence &&
                                 decision.interruption_reason != InterruptionReason::ManualExit;
        if (decision.should_resume) {
            decision.prompt = ResumePrompt::build(*usable, decision.interruption_reason, elapsed);
        }
        decision.checkpoint = std::move(usable);

        spdlog::info("Resume check for session {}: resume={}, reason={}, confidence={:.2f}",
                     session_id, decision.should_resume,
                     storage::interruption_reason_to_string(decision.interruption_reason),
                     decision.confidence);
    } catch (const std::exception& e) {
        spdlog::error("Resume check for session {} failed: {}", session_id, e.what());
        return ResumeDecision{.session_id = session_id};
    }

    return decision;
}

Result<ResumeEvent, Error> ResumeDetector::consume(const ResumeDecision& decision, bool accepted,
                                                   TimePoint at) {
    if (!decision.checkpoint) {
        return Result<ResumeEvent, Error>::err(ErrorCode::InvalidArgument,
                                               "Resume decision has no checkpoint",
                                               decision.session_id);
    }

    try {
        const Checkpoint& cp = *decision.checkpoint;
        double fidelity = accepted ? restore_fidelity(cp) : 0.0;

        ResumeEvent event;
        event.id = generate_resume_event_id();
        event.checkpoint_id = cp.id;
        event.session_id = cp.session_id;
        event.restored_at = at;
        event.interruption_reason = decision.interruption_reason;
        event.time_since_checkpoint = decision.time_since_checkpoint;
        event.resume_confidence = decision.confidence;
        event.user_confirmed = accepted;
        event.success = accepted;
        event.fidelity_score = fidelity;
        if (!accepted) {
            event.notes = "declined";
        }

        auto recorded = store_.record_resume(event);
        if (recorded.is_err()) {
            return std::move(recorded).error();
        }
        return event;
    } catch (const std::exception& e) {
        return Error::from_exception(e).with_source("resume_detector");
    }
}

Result<RestoredState, Error> ResumeDetector::restore_state(const CheckpointId& checkpoint_id) {
    try {
        auto loaded = store_.get_by_id(checkpoint_id);
        if (loaded.is_err()) {
            return std::move(loaded).error();
        }

        Checkpoint cp = std::move(loaded).value();
        RestoredState state;
        state.checkpoint_id = cp.id;
        state.session_id = cp.session_id;
        state.fidelity = restore_fidelity(cp);
        state.conversation = std::move(cp.conversation);
        state.task = std::move(cp.task);
        state.files = std::move(cp.files);
        state.tools = std::move(cp.tools);
        state.user_preferences = std::move(cp.user_preferences);
        return state;
    } catch (const std::exception& e) {
        return Error::from_exception(e).with_source("resume_detector");
    }
}

}  // namespace lifeline::recovery

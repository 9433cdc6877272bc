#include "lifeline/storage/records.hpp"

namespace lifeline::storage {

std::string_view interruption_reason_to_string(InterruptionReason reason) {
    switch (reason) {
        case InterruptionReason::Crash: return "crash";
        case InterruptionReason::Timeout: return "timeout";
        case InterruptionReason::ManualExit: return "manual_exit";
        case InterruptionReason::Unknown: return "unknown";
    }
    return "unknown";
}

InterruptionReason interruption_reason_from_string(std::string_view str) {
    if (str == "crash") return InterruptionReason::Crash;
    if (str == "timeout") return InterruptionReason::Timeout;
    if (str == "manual_exit") return InterruptionReason::ManualExit;
    return InterruptionReason::Unknown;
}

Json ResumeEvent::to_json() const {
    Json j{
        {"id", id},
        {"checkpoint_id", checkpoint_id},
        {"session_id", session_id},
        {"restored_at", to_millis(restored_at)},
        {"interruption_reason", std::string(interruption_reason_to_string(interruption_reason))},
        {"time_since_checkpoint_ms", time_since_checkpoint.count()},
        {"resume_confidence", resume_confidence},
        {"success", success},
        {"fidelity_score", fidelity_score}
    };
    if (user_confirmed) {
        j["user_confirmed"] = *user_confirmed;
    }
    if (notes) {
        j["notes"] = *notes;
    }
    return j;
}

}  // namespace lifeline::storage

#include "lifeline/storage/checkpoint_store.hpp"

#include <spdlog/spdlog.h>

namespace lifeline::storage {

Result<void, Error> CheckpointStore::save(const Checkpoint& checkpoint) {
    auto encoded = checkpoint::encode(checkpoint, true);
    if (encoded.is_err()) {
        return std::move(encoded).error();
    }
    return save(checkpoint, encoded.value());
}

Result<void, Error> CheckpointStore::record_resume(const ResumeEvent& event) {
    LIFELINE_TRY_VOID(mark_restored(event.checkpoint_id, event.success,
                                    event.fidelity_score, event.restored_at));

    auto saved = save_resume_event(event);
    if (saved.is_err()) {
        spdlog::error("Checkpoint {} marked restored without a resume event: {}",
                      event.checkpoint_id, saved.error().message);
    }
    return saved;
}

}  // namespace lifeline::storage

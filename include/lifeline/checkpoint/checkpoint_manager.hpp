#pragma once

#include "checkpoint.hpp"
#include "checkpoint_codec.hpp"
#include "lifeline/core/config.hpp"
#include "lifeline/core/result.hpp"
#include "lifeline/core/thread_pool.hpp"
#include "lifeline/signals/risk_signal_aggregator.hpp"
#include "lifeline/storage/checkpoint_store.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace lifeline::checkpoint {

// Confirmation returned for every persisted checkpoint
struct CheckpointResult {
    CheckpointId checkpoint_id;
    SessionId session_id;
    int checkpoint_number = 0;
    CheckpointTrigger trigger = CheckpointTrigger::ToolCallInterval;
    signals::CrashRisk crash_risk = signals::CrashRisk::Safe;
    Duration elapsed{0};
    size_t uncompressed_size = 0;
    size_t compressed_size = 0;
    double compression_ratio = 1.0;

    Json to_json() const;
};

struct CheckpointStats {
    int count = 0;
    std::optional<storage::CheckpointHeader> last;
};

// Silent intake rules. Keeps the newest recent messages and tool calls,
// truncates their text, and clamps a finite progress into [0, 1].
void apply_intake_limits(CheckpointInput& input, const LimitsConfig& limits);

// Every bounded-field violation, one entry per field. Empty when valid.
std::vector<std::string> validate_input(const CheckpointInput& input, const LimitsConfig& limits);

// Builds, validates, encodes and persists checkpoints.
//
// Store calls run on a small worker pool and are abandoned after
// checkpoint.store_timeout_ms. No exception escapes this class.
class CheckpointManager {
public:
    CheckpointManager(storage::CheckpointStore& store,
                      signals::RiskSignalAggregator& aggregator,
                      const Config& config);
    ~CheckpointManager();

    Result<CheckpointResult, Error> create_checkpoint(CheckpointInput input,
                                                      CheckpointTrigger trigger,
                                                      TimePoint at = now());

    // Same pipeline, tagged user_requested with the reason as description
    Result<CheckpointResult, Error> force_checkpoint(CheckpointInput input,
                                                     const std::string& reason,
                                                     TimePoint at = now());

    // Checkpoint only when the trigger policy fires for the session
    Result<std::optional<CheckpointResult>, Error> auto_checkpoint(CheckpointInput input,
                                                                   TimePoint at = now());

    Result<CheckpointStats, Error> checkpoint_stats(const SessionId& session_id);

private:
    storage::CheckpointStore& store_;
    signals::RiskSignalAggregator& aggregator_;
    CheckpointConfig config_;
    LimitsConfig limits_;
    ThreadPool pool_;

    Result<CheckpointResult, Error> create(CheckpointInput input,
                                           CheckpointTrigger trigger,
                                           const signals::SignalSnapshot& snapshot,
                                           TimePoint at);

    // Encode and save with a freshly computed number
    Result<EncodedCheckpoint, Error> number_and_save(Checkpoint& checkpoint);

    template<typename T>
    Result<T, Error> bounded(std::function<Result<T, Error>()> call, const char* what);
};

}  // namespace lifeline::checkpoint

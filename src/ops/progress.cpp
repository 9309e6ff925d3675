#include "fops/ops/progress.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace fops::ops {

ProgressEmitter::ProgressEmitter(events::EventBus& bus, OperationState& state, TimeSource now)
    : bus_(bus), state_(state), now_(std::move(now)) {}

bool ProgressEmitter::report(ProgressSnapshot snapshot) {
    if (terminal_sent_) {
        return false;
    }

    snapshot.items_done = std::max(snapshot.items_done, last_.items_done);
    snapshot.items_total = std::max(snapshot.items_total, last_.items_total);
    snapshot.bytes_done = std::max(snapshot.bytes_done, last_.bytes_done);
    snapshot.bytes_total = std::max(snapshot.bytes_total, last_.bytes_total);
    last_ = snapshot;
    state_.update_progress(snapshot);

    const auto now = now_();
    const bool phase_changed = !last_phase_ || *last_phase_ != snapshot.phase;
    if (!phase_changed && now - last_emit_ < state_.config().progress_interval) {
        return false;
    }

    last_phase_ = snapshot.phase;
    last_emit_ = now;
    ++progress_events_;
    bus_.emit(events::OperationProgressEvent{state_.operation_id(), state_.kind(), snapshot});
    return true;
}

void ProgressEmitter::conflict_detected(const ConflictRecord& conflict) {
    bus_.emit(events::ConflictDetectedEvent{state_.operation_id(), conflict});
}

void ProgressEmitter::conflict_resolved(const std::string& destination,
                                        ConflictResolution resolution,
                                        bool apply_to_all) {
    bus_.emit(events::ConflictResolvedEvent{state_.operation_id(), destination, resolution, apply_to_all});
}

void ProgressEmitter::completed(std::uint64_t items, std::uint64_t bytes, std::uint64_t skipped,
                                std::vector<std::string> warnings) {
    if (!claim_terminal()) {
        return;
    }
    events::OperationCompletedEvent event{state_.operation_id(), state_.kind(), items, bytes, skipped,
                                          std::move(warnings)};
    bus_.emit(event);
}

void ProgressEmitter::cancelled(std::uint64_t items, bool rolled_back) {
    if (!claim_terminal()) {
        return;
    }
    bus_.emit(events::OperationCancelledEvent{state_.operation_id(), state_.kind(), items, rolled_back});
}

void ProgressEmitter::failed(const Error& error) {
    if (!claim_terminal()) {
        return;
    }
    bus_.emit(events::OperationFailedEvent{state_.operation_id(), state_.kind(), error});
}

void ProgressEmitter::dry_run_completed(events::DryRunCompletedEvent event) {
    event.operation_id = state_.operation_id();
    event.kind = state_.kind();
    bus_.emit(event);
}

bool ProgressEmitter::claim_terminal() {
    if (terminal_sent_) {
        spdlog::warn("[Progress] second terminal event suppressed id={}", state_.operation_id());
        return false;
    }
    terminal_sent_ = true;
    return true;
}

} // namespace fops::ops

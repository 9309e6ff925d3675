#pragma once

#include "fops/events/event_bus.hpp"
#include "fops/events/events.hpp"
#include "fops/ops/state.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fops::ops {

/**
 * @brief Throttled publisher for one operation's events
 *
 * RULES:
 * - At most one progress event per configured interval
 * - A phase change is always published at once
 * - Terminal events bypass the throttle and are published exactly once
 * - Counters never go backwards, even if a caller reports lower values
 *
 * Only the operation's worker thread calls into an emitter.
 */
class ProgressEmitter {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    ProgressEmitter(events::EventBus& bus, OperationState& state, TimeSource now = &Clock::now);

    /// Returns true when the snapshot was published
    bool report(ProgressSnapshot snapshot);

    void conflict_detected(const ConflictRecord& conflict);
    void conflict_resolved(const std::string& destination, ConflictResolution resolution, bool apply_to_all);

    void completed(std::uint64_t items, std::uint64_t bytes, std::uint64_t skipped,
                   std::vector<std::string> warnings = {});
    void cancelled(std::uint64_t items, bool rolled_back);
    void failed(const Error& error);
    void dry_run_completed(events::DryRunCompletedEvent event);

    [[nodiscard]] std::size_t progress_events() const noexcept { return progress_events_; }
    [[nodiscard]] bool terminal_sent() const noexcept { return terminal_sent_; }
    [[nodiscard]] const ProgressSnapshot& last() const noexcept { return last_; }

private:
    bool claim_terminal();

    events::EventBus& bus_;
    OperationState& state_;
    TimeSource now_;
    ProgressSnapshot last_;
    std::optional<Phase> last_phase_;
    Clock::time_point last_emit_{};
    std::size_t progress_events_ = 0;
    bool terminal_sent_ = false;
};

} // namespace fops::ops

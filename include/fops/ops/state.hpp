#pragma once

#include "fops/core/result.hpp"
#include "fops/ops/types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace fops::ops {

/// Answer to a conflict prompt
struct ConflictDecision {
    ConflictResolution resolution = ConflictResolution::Skip;
    bool apply_to_all = false;
};

/**
 * @brief Shared state of one in-flight operation
 *
 * Owned by the registry through a shared_ptr and touched by two sides:
 * the worker (progress, lifecycle, conflict wait) and the caller
 * (cancel, resolve, status). Everything here is safe to call from
 * either side.
 */
class OperationState {
public:
    OperationState(std::string operation_id, OperationKind kind, OperationConfig config);

    OperationState(const OperationState&) = delete;
    OperationState& operator=(const OperationState&) = delete;

    [[nodiscard]] const std::string& operation_id() const noexcept { return operation_id_; }
    [[nodiscard]] OperationKind kind() const noexcept { return kind_; }
    [[nodiscard]] const OperationConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::chrono::system_clock::time_point started_at() const noexcept { return started_at_; }

    /**
     * @brief Ask the worker to stop
     *
     * Idempotent: the first request decides whether rollback happens,
     * later requests are no-ops. Wakes a pending conflict wait.
     */
    void request_cancel(bool rollback);

    [[nodiscard]] bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }
    [[nodiscard]] bool rollback_requested() const noexcept { return rollback_.load(std::memory_order_acquire); }

    // ── Lifecycle ──────────────────────────────────────────

    [[nodiscard]] Lifecycle lifecycle() const;
    Result<void> transition_to(Lifecycle next);

    // ── Conflict handling ──────────────────────────────────

    /// Policy in force for the next conflict (an apply-to-all answer overrides the config)
    [[nodiscard]] ConflictResolution active_policy() const;

    /**
     * @brief Start accepting an answer for the conflict about to be announced
     *
     * Call before the conflict event goes out, so a handler answering
     * synchronously is not lost. Drops any answer left from earlier.
     */
    void open_prompt();

    /**
     * @brief Block until resolve() answers, the operation is cancelled,
     *        or the configured timeout elapses
     *
     * A timeout cancels the operation with rollback and reports Cancelled,
     * exactly like an explicit cancel. The prompt is closed on return.
     */
    Result<ConflictDecision> wait_for_decision();

    /**
     * @brief Record the caller's answer and wake the worker
     *
     * Only the first answer to an open prompt counts. Without an open
     * prompt the answer is refused with InvalidArgument.
     */
    Result<void> resolve(ConflictResolution resolution, bool apply_to_all);

    /// True between open_prompt() and the end of the matching wait
    [[nodiscard]] bool awaiting_decision() const;

    // ── Progress ───────────────────────────────────────────

    void update_progress(const ProgressSnapshot& snapshot);
    [[nodiscard]] ProgressSnapshot progress() const;

    [[nodiscard]] OperationStatus status() const;
    [[nodiscard]] OperationSummary summary() const;

private:
    [[nodiscard]] bool can_transition(Lifecycle target) const noexcept;

    const std::string operation_id_;
    const OperationKind kind_;
    const OperationConfig config_;
    const std::chrono::system_clock::time_point started_at_;

    std::atomic<bool> cancelled_{false};
    std::atomic<bool> rollback_{false};

    mutable std::mutex mutex_;  // lifecycle, progress, conflict fields
    std::condition_variable decision_cv_;
    Lifecycle lifecycle_ = Lifecycle::Running;
    ProgressSnapshot progress_;
    std::optional<ConflictDecision> pending_decision_;
    std::optional<ConflictResolution> batch_policy_;
    bool prompt_open_ = false;
};

} // namespace fops::ops

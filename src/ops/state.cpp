#include "fops/ops/state.hpp"

#include <spdlog/spdlog.h>

namespace fops::ops {

OperationState::OperationState(std::string operation_id, OperationKind kind, OperationConfig config)
    : operation_id_(std::move(operation_id)),
      kind_(kind),
      config_(config),
      started_at_(std::chrono::system_clock::now()) {}

void OperationState::request_cancel(bool rollback) {
    {
        std::lock_guard lock(mutex_);
        if (cancelled_.load(std::memory_order_acquire)) {
            return;
        }
        rollback_.store(rollback, std::memory_order_release);
        cancelled_.store(true, std::memory_order_release);
    }
    decision_cv_.notify_all();
    spdlog::debug("[Operation] cancel requested id={} rollback={}", operation_id_, rollback);
}

Lifecycle OperationState::lifecycle() const {
    std::lock_guard lock(mutex_);
    return lifecycle_;
}

Result<void> OperationState::transition_to(Lifecycle next) {
    std::lock_guard lock(mutex_);
    if (lifecycle_ == next) {
        return Ok();
    }
    if (!can_transition(next)) {
        return Err<void>(Error::invalid_argument(std::string("Illegal operation state transition from ") +
                                                 to_string(lifecycle_) + " to " + to_string(next)));
    }
    lifecycle_ = next;
    return Ok();
}

bool OperationState::can_transition(Lifecycle target) const noexcept {
    // Running leads to exactly one terminal state and never back
    return lifecycle_ == Lifecycle::Running && target != Lifecycle::Running;
}

ConflictResolution OperationState::active_policy() const {
    std::lock_guard lock(mutex_);
    if (batch_policy_) {
        return *batch_policy_;
    }
    return config_.effective_policy();
}

void OperationState::open_prompt() {
    std::lock_guard lock(mutex_);
    pending_decision_.reset();
    prompt_open_ = true;
}

Result<ConflictDecision> OperationState::wait_for_decision() {
    std::unique_lock lock(mutex_);
    if (cancelled_.load(std::memory_order_acquire)) {
        prompt_open_ = false;
        pending_decision_.reset();
        return Err<ConflictDecision>(Error::cancelled());
    }

    const bool answered = decision_cv_.wait_for(lock, config_.conflict_timeout, [this]() {
        return pending_decision_.has_value() || cancelled_.load(std::memory_order_acquire);
    });
    prompt_open_ = false;

    if (cancelled_.load(std::memory_order_acquire)) {
        pending_decision_.reset();
        return Err<ConflictDecision>(Error::cancelled());
    }

    if (!answered) {
        // An unanswered prompt is treated as abandonment: undo everything
        rollback_.store(true, std::memory_order_release);
        cancelled_.store(true, std::memory_order_release);
        spdlog::warn("[Operation] conflict prompt timed out id={} timeout={}ms",
                     operation_id_, config_.conflict_timeout.count());
        return Err<ConflictDecision>(Error::cancelled("No response to conflict prompt"));
    }

    const ConflictDecision decision = *pending_decision_;
    pending_decision_.reset();
    if (decision.apply_to_all) {
        batch_policy_ = decision.resolution;
    }
    return Ok(decision);
}

Result<void> OperationState::resolve(ConflictResolution resolution, bool apply_to_all) {
    {
        std::lock_guard lock(mutex_);
        if (!prompt_open_ || pending_decision_) {
            spdlog::debug("[Operation] answer ignored, no open prompt id={} resolution={}",
                          operation_id_, to_string(resolution));
            return Err<void>(Error::invalid_argument("Operation \"" + operation_id_ +
                                                     "\" is not waiting for a conflict decision"));
        }
        pending_decision_ = ConflictDecision{resolution, apply_to_all};
    }
    decision_cv_.notify_all();
    return Ok();
}

bool OperationState::awaiting_decision() const {
    std::lock_guard lock(mutex_);
    return prompt_open_ && !pending_decision_;
}

void OperationState::update_progress(const ProgressSnapshot& snapshot) {
    std::lock_guard lock(mutex_);
    progress_ = snapshot;
}

ProgressSnapshot OperationState::progress() const {
    std::lock_guard lock(mutex_);
    return progress_;
}

OperationStatus OperationState::status() const {
    std::lock_guard lock(mutex_);
    OperationStatus status;
    status.operation_id = operation_id_;
    status.kind = kind_;
    status.lifecycle = lifecycle_;
    status.progress = progress_;
    status.started_at = started_at_;
    return status;
}

OperationSummary OperationState::summary() const {
    std::lock_guard lock(mutex_);
    OperationSummary summary;
    summary.operation_id = operation_id_;
    summary.kind = kind_;
    summary.phase = progress_.phase;
    summary.started_at = started_at_;
    if (progress_.bytes_total > 0) {
        summary.percent_complete = 100.0 * static_cast<double>(progress_.bytes_done) /
                                   static_cast<double>(progress_.bytes_total);
    } else if (progress_.items_total > 0) {
        summary.percent_complete = 100.0 * static_cast<double>(progress_.items_done) /
                                   static_cast<double>(progress_.items_total);
    }
    return summary;
}

} // namespace fops::ops

/**
 * @file events.hpp
 * @brief Event types published by running write operations
 *
 * WHY THIS FILE EXISTS:
 * The host (dialogs, progress bars, the CLI) never polls the engine.
 * Each operation publishes these events on the EventBus and the host
 * subscribes to the ones it renders.
 *
 * NAMING CONVENTION:
 * - Events are past-tense: OperationStartedEvent, ConflictDetectedEvent
 * - Exactly one terminal event (Completed, Cancelled or Failed) is
 *   published per operation
 */

#pragma once

#include "fops/core/error.hpp"
#include "fops/ops/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace fops::events {

// ════════════════════════════════════════════════════════
// Lifecycle Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once the worker for a new operation is running
 *
 * WHO EMITS: OperationRegistry::start
 * WHO SUBSCRIBES: Logger, Metrics, host mailbox
 */
struct OperationStartedEvent {
    std::string operation_id;
    ops::OperationKind kind;
    std::vector<std::string> sources;
    std::string destination;
    std::chrono::system_clock::time_point timestamp;

    OperationStartedEvent(std::string id,
                          ops::OperationKind k,
                          std::vector<std::string> srcs,
                          std::string dest)
        : operation_id(std::move(id)),
          kind(k),
          sources(std::move(srcs)),
          destination(std::move(dest)),
          timestamp(std::chrono::system_clock::now())
    {}
};

/**
 * @brief Throttled progress update
 *
 * WHO EMITS: ProgressEmitter (at most once per interval, always on phase change)
 * WHO SUBSCRIBES: host progress bar
 */
struct OperationProgressEvent {
    std::string operation_id;
    ops::OperationKind kind;
    ops::ProgressSnapshot progress;
};

struct OperationCompletedEvent {
    std::string operation_id;
    ops::OperationKind kind;
    std::uint64_t items_processed = 0;
    std::uint64_t bytes_processed = 0;
    std::uint64_t items_skipped = 0;
    std::vector<std::string> warnings;  ///< Non-fatal failures after a move committed
};

struct OperationCancelledEvent {
    std::string operation_id;
    ops::OperationKind kind;
    std::uint64_t items_processed = 0;
    bool rolled_back = false;
};

struct OperationFailedEvent {
    std::string operation_id;
    ops::OperationKind kind;
    Error error;
};

/**
 * @brief Result of a dry run: what would happen, nothing written
 */
struct DryRunCompletedEvent {
    std::string operation_id;
    ops::OperationKind kind;
    std::uint64_t files_total = 0;
    std::uint64_t bytes_total = 0;
    std::uint64_t conflicts_total = 0;
    std::vector<ops::ConflictRecord> conflicts;  ///< At most max_conflicts_to_show
    bool conflicts_sampled = false;
};

// ════════════════════════════════════════════════════════
// Conflict Events
// ════════════════════════════════════════════════════════

/**
 * @brief The worker is blocked waiting for resolve()
 *
 * WHO EMITS: ConflictResolver under the Stop policy
 * WHO SUBSCRIBES: host conflict dialog
 */
struct ConflictDetectedEvent {
    std::string operation_id;
    ops::ConflictRecord conflict;
};

struct ConflictResolvedEvent {
    std::string operation_id;
    std::string destination_path;
    ops::ConflictResolution resolution;
    bool apply_to_all = false;
};

// ════════════════════════════════════════════════════════
// Scan Preview Events
// ════════════════════════════════════════════════════════

/**
 * @brief Running totals of a scan preview (throttled like operation progress)
 *
 * WHO EMITS: OperationRegistry preview worker
 * WHO SUBSCRIBES: host copy dialog, to show live totals before the user confirms
 */
struct ScanPreviewProgressEvent {
    std::string preview_id;
    std::uint64_t files_found = 0;
    std::uint64_t dirs_found = 0;
    std::uint64_t bytes_found = 0;
    std::string current_item;
};

/// The preview's result is cached; pass preview_id to start() to reuse it
struct ScanPreviewCompletedEvent {
    std::string preview_id;
    std::uint64_t files_total = 0;
    std::uint64_t dirs_total = 0;
    std::uint64_t bytes_total = 0;
};

struct ScanPreviewFailedEvent {
    std::string preview_id;
    Error error;
};

struct ScanPreviewCancelledEvent {
    std::string preview_id;
};

} // namespace fops::events

/**
 * @file registry.hpp
 * @brief Entry point for starting and controlling write operations
 *
 * WHY THIS FILE EXISTS:
 * The host starts copies, moves and deletes and then only talks to them
 * by id: cancel, answer a conflict prompt, ask for status. The registry
 * owns every in-flight operation and the worker thread running it.
 *
 * THREADING:
 * Every public method may be called from any thread. Each operation
 * runs on its own worker; operations never share state.
 */

#pragma once

#include "fops/core/result.hpp"
#include "fops/events/event_bus.hpp"
#include "fops/ops/state.hpp"
#include "fops/ops/types.hpp"
#include "fops/volume/manager.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace fops::ops {

class OperationRegistry {
public:
    OperationRegistry(events::EventBus& bus, std::shared_ptr<volume::VolumeManager> volumes);

    /// Cancels everything still running (with rollback) and joins the workers
    ~OperationRegistry();

    OperationRegistry(const OperationRegistry&) = delete;
    OperationRegistry& operator=(const OperationRegistry&) = delete;

    /**
     * @brief Validate a request and start its worker
     *
     * Validation failures are returned here and no worker is started.
     * Once this returns an id, exactly one terminal event follows for it.
     */
    Result<std::string> start(StartRequest request);

    /// NotFound for unknown or finished ids
    Result<void> cancel(const std::string& operation_id, bool rollback = true);

    /// Cancel every running operation without waiting for them
    void cancel_all(bool rollback = true);

    /**
     * @brief Answer the pending conflict prompt of an operation
     *
     * InvalidArgument when the operation is not waiting on a prompt or
     * the prompt was already answered. Such answers are dropped.
     */
    Result<void> resolve(const std::string& operation_id, ConflictResolution resolution, bool apply_to_all = false);

    /**
     * @brief Scan `sources` in the background so a dialog can show totals
     *
     * Publishes ScanPreview* events under the returned id. A completed
     * preview is kept until a start() names it in `preview_id` (and, when
     * the sources and sort order match, uses it instead of scanning again)
     * or cancel_scan_preview() drops it.
     */
    Result<std::string> start_scan_preview(std::vector<std::filesystem::path> sources, OperationConfig config = {});

    /// Stops a running preview, or discards a finished one. NotFound otherwise.
    Result<void> cancel_scan_preview(const std::string& preview_id);

    Result<OperationStatus> status(const std::string& operation_id) const;
    std::vector<OperationSummary> list_active() const;
    std::size_t active_count() const;

    /// Block until the operation (or scan preview) has finished. Returns false on timeout.
    bool wait(const std::string& operation_id, std::chrono::milliseconds timeout);

    volume::VolumeManager& volumes() { return *volumes_; }

private:
    struct CachedScan {
        ScanResult scan;
        SortColumn sort_column = SortColumn::Name;
        SortOrder sort_order = SortOrder::Ascending;
    };

    void run_worker(std::shared_ptr<OperationState> state, StartRequest request, std::optional<ScanResult> prescanned);
    void run_preview(std::shared_ptr<OperationState> state, std::vector<std::filesystem::path> sources);
    std::optional<ScanResult> take_preview(const StartRequest& request);
    void flush_written(const StartRequest& request);
    void retire(const std::string& operation_id);
    void reap_finished();
    bool is_active(const std::string& operation_id) const;
    std::string next_id(const char* prefix);

    events::EventBus& bus_;
    std::shared_ptr<volume::VolumeManager> volumes_;

    mutable std::shared_mutex mutex_;  // active_, previews_
    std::unordered_map<std::string, std::shared_ptr<OperationState>> active_;
    std::unordered_map<std::string, std::shared_ptr<OperationState>> previews_;

    std::mutex cache_mutex_;  // preview_results_
    std::unordered_map<std::string, CachedScan> preview_results_;

    std::mutex retire_mutex_;
    std::condition_variable retired_cv_;

    std::mutex workers_mutex_;  // workers_, finished_
    std::unordered_map<std::string, std::thread> workers_;
    std::vector<std::string> finished_;

    std::mutex id_mutex_;
    std::uint64_t next_sequence_ = 1;
};

} // namespace fops::ops

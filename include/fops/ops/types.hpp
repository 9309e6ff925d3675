#pragma once

#include "fops/volume/volume.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fops::ops {

enum class OperationKind {
    Copy,
    Move,
    Delete
};

enum class Phase {
    Scanning,
    Copying,
    Deleting
};

/**
 * @brief How a name clash at the destination is handled
 *
 * Stop asks the caller and blocks until it answers (or the wait times out).
 */
enum class ConflictResolution {
    Stop,
    Skip,
    Overwrite,
    Rename
};

/// Sibling order used when walking a folder (the order items are copied in)
enum class SortColumn {
    Name,
    Extension,
    Size,
    Modified
};

enum class SortOrder {
    Ascending,
    Descending
};

enum class Lifecycle {
    Running,
    Completed,
    Cancelled,
    Failed
};

const char* to_string(OperationKind kind) noexcept;
const char* to_string(Phase phase) noexcept;
const char* to_string(ConflictResolution resolution) noexcept;
const char* to_string(Lifecycle lifecycle) noexcept;
const char* to_string(SortColumn column) noexcept;
const char* to_string(SortOrder order) noexcept;

std::optional<OperationKind> operation_kind_from_string(std::string_view text);
std::optional<ConflictResolution> conflict_resolution_from_string(std::string_view text);
std::optional<SortColumn> sort_column_from_string(std::string_view text);
std::optional<SortOrder> sort_order_from_string(std::string_view text);

struct OperationConfig {
    static constexpr std::size_t kDefaultChunkSize = 64 * 1024;

    std::chrono::milliseconds progress_interval{200};
    bool overwrite = false;  ///< Deprecated, forces Overwrite
    ConflictResolution conflict_resolution = ConflictResolution::Stop;
    bool dry_run = false;
    std::size_t max_conflicts_to_show = 100;
    std::chrono::milliseconds conflict_timeout{30000};
    std::size_t chunk_size = kDefaultChunkSize;
    SortColumn sort_column = SortColumn::Name;
    SortOrder sort_order = SortOrder::Ascending;
    bool sync_on_complete = true;  ///< Flush the written volume after a successful run

    ConflictResolution effective_policy() const noexcept {
        return overwrite ? ConflictResolution::Overwrite : conflict_resolution;
    }
};

struct StartRequest {
    OperationKind kind = OperationKind::Copy;
    std::vector<std::filesystem::path> sources;
    std::filesystem::path destination;  ///< Ignored for Delete
    OperationConfig config;
    std::string preview_id;  ///< Finished scan preview to reuse instead of scanning again
};

struct ProgressSnapshot {
    Phase phase = Phase::Scanning;
    std::string current_item;  ///< File name only
    std::uint64_t items_done = 0;
    std::uint64_t items_total = 0;
    std::uint64_t bytes_done = 0;
    std::uint64_t bytes_total = 0;
};

/**
 * @brief One item found while scanning
 *
 * `relative` starts with the name of the top-level source it belongs to,
 * so `destination / relative` is where a plain copy puts it.
 */
struct ScanEntry {
    std::filesystem::path source;
    std::filesystem::path relative;
    volume::ItemKind kind = volume::ItemKind::File;
    std::uint64_t size = 0;
    std::uint32_t mode = 0;
    std::chrono::system_clock::time_point modified{};
    std::size_t root_index = 0;
};

/**
 * @brief Immutable result of walking the sources
 *
 * `entries` is in pre-order: every directory precedes its contents.
 * Symlinks count as files and are never followed.
 */
struct ScanResult {
    std::vector<std::filesystem::path> roots;
    std::vector<ScanEntry> entries;
    std::uint64_t file_count = 0;
    std::uint64_t directory_count = 0;
    std::uint64_t total_bytes = 0;

    std::uint64_t item_count() const noexcept { return file_count + directory_count; }
};

struct ConflictRecord {
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
    std::uint64_t source_size = 0;
    std::uint64_t destination_size = 0;
    std::chrono::system_clock::time_point source_modified{};
    std::chrono::system_clock::time_point destination_modified{};
    bool is_case_only_rename = false;  ///< Destination is the source object itself

    bool is_conflict() const noexcept { return !is_case_only_rename; }
    bool destination_is_newer() const noexcept { return destination_modified > source_modified; }
    std::int64_t size_difference() const noexcept {
        return static_cast<std::int64_t>(destination_size) - static_cast<std::int64_t>(source_size);
    }
};

struct OperationStatus {
    std::string operation_id;
    OperationKind kind = OperationKind::Copy;
    Lifecycle lifecycle = Lifecycle::Running;
    ProgressSnapshot progress;
    std::chrono::system_clock::time_point started_at{};
};

struct OperationSummary {
    std::string operation_id;
    OperationKind kind = OperationKind::Copy;
    Phase phase = Phase::Scanning;
    double percent_complete = 0.0;
    std::chrono::system_clock::time_point started_at{};
};

} // namespace fops::ops

#include "fops/ops/types.hpp"

namespace fops::ops {

const char* to_string(OperationKind kind) noexcept {
    switch (kind) {
        case OperationKind::Copy: return "copy";
        case OperationKind::Move: return "move";
        case OperationKind::Delete: return "delete";
    }
    return "unknown";
}

const char* to_string(Phase phase) noexcept {
    switch (phase) {
        case Phase::Scanning: return "scanning";
        case Phase::Copying: return "copying";
        case Phase::Deleting: return "deleting";
    }
    return "unknown";
}

const char* to_string(ConflictResolution resolution) noexcept {
    switch (resolution) {
        case ConflictResolution::Stop: return "stop";
        case ConflictResolution::Skip: return "skip";
        case ConflictResolution::Overwrite: return "overwrite";
        case ConflictResolution::Rename: return "rename";
    }
    return "unknown";
}

const char* to_string(Lifecycle lifecycle) noexcept {
    switch (lifecycle) {
        case Lifecycle::Running: return "running";
        case Lifecycle::Completed: return "completed";
        case Lifecycle::Cancelled: return "cancelled";
        case Lifecycle::Failed: return "failed";
    }
    return "unknown";
}

const char* to_string(SortColumn column) noexcept {
    switch (column) {
        case SortColumn::Name: return "name";
        case SortColumn::Extension: return "extension";
        case SortColumn::Size: return "size";
        case SortColumn::Modified: return "modified";
    }
    return "unknown";
}

const char* to_string(SortOrder order) noexcept {
    switch (order) {
        case SortOrder::Ascending: return "ascending";
        case SortOrder::Descending: return "descending";
    }
    return "unknown";
}

std::optional<OperationKind> operation_kind_from_string(std::string_view text) {
    if (text == "copy") {
        return OperationKind::Copy;
    }
    if (text == "move") {
        return OperationKind::Move;
    }
    if (text == "delete") {
        return OperationKind::Delete;
    }
    return std::nullopt;
}

std::optional<ConflictResolution> conflict_resolution_from_string(std::string_view text) {
    if (text == "stop") {
        return ConflictResolution::Stop;
    }
    if (text == "skip") {
        return ConflictResolution::Skip;
    }
    if (text == "overwrite") {
        return ConflictResolution::Overwrite;
    }
    if (text == "rename") {
        return ConflictResolution::Rename;
    }
    return std::nullopt;
}

std::optional<SortColumn> sort_column_from_string(std::string_view text) {
    for (auto column : {SortColumn::Name, SortColumn::Extension, SortColumn::Size, SortColumn::Modified}) {
        if (text == to_string(column)) {
            return column;
        }
    }
    return std::nullopt;
}

std::optional<SortOrder> sort_order_from_string(std::string_view text) {
    if (text == "ascending") {
        return SortOrder::Ascending;
    }
    if (text == "descending") {
        return SortOrder::Descending;
    }
    return std::nullopt;
}

} // namespace fops::ops

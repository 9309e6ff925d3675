#include "fops/events/json_codec.hpp"

namespace fops::events {

using json = nlohmann::json;

namespace {

json header(const char* type, const std::string& operation_id, ops::OperationKind kind) {
    json j;
    j["type"] = type;
    j["operationId"] = operation_id;
    j["kind"] = ops::to_string(kind);
    return j;
}

} // namespace

std::int64_t to_epoch_millis(std::chrono::system_clock::time_point time) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
}

json error_to_json(const Error& error) {
    json j;
    j["kind"] = to_string(error.kind);
    j["message"] = error.message();
    if (!error.path.empty()) {
        j["path"] = error.path;
    }
    if (!error.other_path.empty()) {
        j["otherPath"] = error.other_path;
    }
    if (error.is(ErrorKind::InsufficientSpace)) {
        j["required"] = error.required;
        j["available"] = error.available;
        j["volume"] = error.volume;
    }
    return j;
}

json conflict_to_json(const ops::ConflictRecord& conflict) {
    json j;
    j["sourcePath"] = conflict.source_path.string();
    j["destinationPath"] = conflict.destination_path.string();
    j["sourceSize"] = conflict.source_size;
    j["destinationSize"] = conflict.destination_size;
    j["sourceModified"] = to_epoch_millis(conflict.source_modified);
    j["destinationModified"] = to_epoch_millis(conflict.destination_modified);
    j["destinationIsNewer"] = conflict.destination_is_newer();
    j["sizeDifference"] = conflict.size_difference();
    return j;
}

json progress_to_json(const ops::ProgressSnapshot& progress) {
    json j;
    j["phase"] = ops::to_string(progress.phase);
    j["currentItem"] = progress.current_item;
    j["itemsDone"] = progress.items_done;
    j["itemsTotal"] = progress.items_total;
    j["bytesDone"] = progress.bytes_done;
    j["bytesTotal"] = progress.bytes_total;
    return j;
}

json event_to_json(const OperationStartedEvent& event) {
    json j = header("operationStarted", event.operation_id, event.kind);
    j["sources"] = event.sources;
    j["destination"] = event.destination;
    j["timestamp"] = to_epoch_millis(event.timestamp);
    return j;
}

json event_to_json(const OperationProgressEvent& event) {
    json j = header("operationProgress", event.operation_id, event.kind);
    j.update(progress_to_json(event.progress));
    return j;
}

json event_to_json(const OperationCompletedEvent& event) {
    json j = header("operationCompleted", event.operation_id, event.kind);
    j["itemsProcessed"] = event.items_processed;
    j["bytesProcessed"] = event.bytes_processed;
    j["itemsSkipped"] = event.items_skipped;
    j["warnings"] = event.warnings;
    return j;
}

json event_to_json(const OperationCancelledEvent& event) {
    json j = header("operationCancelled", event.operation_id, event.kind);
    j["itemsProcessed"] = event.items_processed;
    j["rolledBack"] = event.rolled_back;
    return j;
}

json event_to_json(const OperationFailedEvent& event) {
    json j = header("operationFailed", event.operation_id, event.kind);
    j["error"] = error_to_json(event.error);
    return j;
}

json event_to_json(const DryRunCompletedEvent& event) {
    json j = header("dryRunCompleted", event.operation_id, event.kind);
    j["filesTotal"] = event.files_total;
    j["bytesTotal"] = event.bytes_total;
    j["conflictsTotal"] = event.conflicts_total;
    j["conflictsSampled"] = event.conflicts_sampled;
    j["conflicts"] = json::array();
    for (const auto& conflict : event.conflicts) {
        j["conflicts"].push_back(conflict_to_json(conflict));
    }
    return j;
}

json event_to_json(const ConflictDetectedEvent& event) {
    json j;
    j["type"] = "conflictDetected";
    j["operationId"] = event.operation_id;
    j.update(conflict_to_json(event.conflict));
    return j;
}

json event_to_json(const ConflictResolvedEvent& event) {
    json j;
    j["type"] = "conflictResolved";
    j["operationId"] = event.operation_id;
    j["destinationPath"] = event.destination_path;
    j["resolution"] = ops::to_string(event.resolution);
    j["applyToAll"] = event.apply_to_all;
    return j;
}

json event_to_json(const ScanPreviewProgressEvent& event) {
    json j;
    j["type"] = "scanPreviewProgress";
    j["previewId"] = event.preview_id;
    j["filesFound"] = event.files_found;
    j["dirsFound"] = event.dirs_found;
    j["bytesFound"] = event.bytes_found;
    j["currentItem"] = event.current_item;
    return j;
}

json event_to_json(const ScanPreviewCompletedEvent& event) {
    json j;
    j["type"] = "scanPreviewCompleted";
    j["previewId"] = event.preview_id;
    j["filesTotal"] = event.files_total;
    j["dirsTotal"] = event.dirs_total;
    j["bytesTotal"] = event.bytes_total;
    return j;
}

json event_to_json(const ScanPreviewFailedEvent& event) {
    json j;
    j["type"] = "scanPreviewFailed";
    j["previewId"] = event.preview_id;
    j["error"] = error_to_json(event.error);
    return j;
}

json event_to_json(const ScanPreviewCancelledEvent& event) {
    json j;
    j["type"] = "scanPreviewCancelled";
    j["previewId"] = event.preview_id;
    return j;
}

} // namespace fops::events

/**
 * @file json_codec.hpp
 * @brief JSON form of operation events for the host
 *
 * Every event object carries a "type" field naming the event
 * ("operationProgress", "conflictDetected", ...). Keys are camelCase,
 * sizes are byte counts and times are milliseconds since the epoch.
 */

#pragma once

#include "fops/core/error.hpp"
#include "fops/events/events.hpp"
#include "fops/ops/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

namespace fops::events {

std::int64_t to_epoch_millis(std::chrono::system_clock::time_point time);

nlohmann::json error_to_json(const Error& error);
nlohmann::json conflict_to_json(const ops::ConflictRecord& conflict);
nlohmann::json progress_to_json(const ops::ProgressSnapshot& progress);

nlohmann::json event_to_json(const OperationStartedEvent& event);
nlohmann::json event_to_json(const OperationProgressEvent& event);
nlohmann::json event_to_json(const OperationCompletedEvent& event);
nlohmann::json event_to_json(const OperationCancelledEvent& event);
nlohmann::json event_to_json(const OperationFailedEvent& event);
nlohmann::json event_to_json(const DryRunCompletedEvent& event);
nlohmann::json event_to_json(const ConflictDetectedEvent& event);
nlohmann::json event_to_json(const ConflictResolvedEvent& event);
nlohmann::json event_to_json(const ScanPreviewProgressEvent& event);
nlohmann::json event_to_json(const ScanPreviewCompletedEvent& event);
nlohmann::json event_to_json(const ScanPreviewFailedEvent& event);
nlohmann::json event_to_json(const ScanPreviewCancelledEvent& event);

} // namespace fops::events

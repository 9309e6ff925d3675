#pragma once

#include "fops/core/result.hpp"
#include "fops/ops/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace fops::ops {

/**
 * @brief Decode an OperationConfig
 *
 * Missing keys keep their defaults. Keys: progressIntervalMs, overwrite,
 * conflictResolution, dryRun, maxConflictsToShow, conflictTimeoutMs,
 * chunkSize, sortColumn, sortOrder, syncOnComplete. Wrong types and unknown policy names are InvalidArgument.
 */
Result<OperationConfig> config_from_json(const nlohmann::json& j);

nlohmann::json config_to_json(const OperationConfig& config);

/// {"kind": "copy", "sources": [...], "destination": "...", "previewId": "...", "config": {...}}
Result<StartRequest> start_request_from_json(const nlohmann::json& j);

/// Parse and decode a request document; malformed JSON is InvalidArgument
Result<StartRequest> parse_start_request(const std::string& text);

nlohmann::json status_to_json(const OperationStatus& status);
nlohmann::json summary_to_json(const OperationSummary& summary);

} // namespace fops::ops

#pragma once

#include "fops/core/result.hpp"
#include "fops/ops/progress.hpp"
#include "fops/ops/state.hpp"
#include "fops/ops/types.hpp"
#include "fops/volume/volume.hpp"

#include <filesystem>
#include <optional>

namespace fops::ops {

/**
 * @brief Compare a prospective destination against the source item
 *
 * RETURNS:
 * - nullopt when nothing occupies `destination`
 * - a record otherwise; `is_case_only_rename` is set when the destination
 *   is the source object itself (decided by identity, never by name), in
 *   which case it is not a conflict
 */
Result<std::optional<ConflictRecord>> inspect_conflict(const volume::Volume& source_volume,
                                                       const std::filesystem::path& source,
                                                       const volume::Volume& destination_volume,
                                                       const std::filesystem::path& destination);

/// First free "name (n).ext" next to `destination`
std::filesystem::path find_unique_name(const volume::Volume& volume, const std::filesystem::path& destination);

/// What to do with one conflicting item
struct Resolution {
    ConflictResolution action = ConflictResolution::Skip;  ///< Never Stop
    std::filesystem::path destination;                     ///< Final path (differs for Rename)
};

/**
 * @brief Applies the operation's conflict policy to one conflict
 *
 * Skip, Overwrite and Rename answer at once. Stop publishes a
 * ConflictDetectedEvent and blocks the worker until the caller answers
 * through OperationRegistry::resolve, the operation is cancelled, or the
 * bounded wait elapses (which cancels the operation with rollback).
 */
class ConflictResolver {
public:
    ConflictResolver(OperationState& state, ProgressEmitter& progress);

    Result<Resolution> resolve(const ConflictRecord& conflict, const volume::Volume& destination_volume);

private:
    OperationState& state_;
    ProgressEmitter& progress_;
};

} // namespace fops::ops

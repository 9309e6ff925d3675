#include "fops/ops/conflict.hpp"

#include <spdlog/spdlog.h>

namespace fops::ops {
namespace fs = std::filesystem;

Result<std::optional<ConflictRecord>> inspect_conflict(const volume::Volume& source_volume,
                                                       const fs::path& source,
                                                       const volume::Volume& destination_volume,
                                                       const fs::path& destination) {
    if (!destination_volume.exists(destination)) {
        return Ok(std::optional<ConflictRecord>{});
    }

    auto source_info = source_volume.info(source);
    if (source_info.is_error()) {
        return Err<std::optional<ConflictRecord>>(source_info.error());
    }
    auto destination_info = destination_volume.info(destination);
    if (destination_info.is_error()) {
        return Err<std::optional<ConflictRecord>>(destination_info.error());
    }

    ConflictRecord record;
    record.source_path = source;
    record.destination_path = destination;
    record.source_size = source_info.value().size;
    record.destination_size = destination_info.value().size;
    record.source_modified = source_info.value().modified;
    record.destination_modified = destination_info.value().modified;

    // Identity first: a case-insensitive volume answers "exists" for README.md
    // when only Readme.md is there, and that is the source itself.
    const auto source_id = source_volume.identity(source);
    const auto destination_id = destination_volume.identity(destination);
    record.is_case_only_rename = source_id && destination_id && *source_id == *destination_id;

    return Ok(std::optional<ConflictRecord>{std::move(record)});
}

fs::path find_unique_name(const volume::Volume& volume, const fs::path& destination) {
    const auto parent = destination.parent_path();
    const auto stem = destination.stem().string();
    const auto extension = destination.extension().string();

    for (std::uint64_t counter = 1;; ++counter) {
        fs::path candidate = parent / (stem + " (" + std::to_string(counter) + ")" + extension);
        if (!volume.exists(candidate)) {
            return candidate;
        }
    }
}

ConflictResolver::ConflictResolver(OperationState& state, ProgressEmitter& progress)
    : state_(state), progress_(progress) {}

Result<Resolution> ConflictResolver::resolve(const ConflictRecord& conflict,
                                             const volume::Volume& destination_volume) {
    ConflictResolution action = state_.active_policy();

    if (action == ConflictResolution::Stop) {
        spdlog::info("[Conflict] waiting for decision id={} destination={}",
                     state_.operation_id(), conflict.destination_path.string());
        state_.open_prompt();
        progress_.conflict_detected(conflict);

        auto decision = state_.wait_for_decision();
        if (decision.is_error()) {
            return Err<Resolution>(decision.error());
        }
        action = decision.value().resolution;
        progress_.conflict_resolved(conflict.destination_path.string(), action, decision.value().apply_to_all);

        if (action == ConflictResolution::Stop) {
            state_.request_cancel(true);
            return Err<Resolution>(Error::cancelled("Stopped at conflict"));
        }
    }

    Resolution resolution;
    resolution.action = action;
    resolution.destination = conflict.destination_path;
    if (action == ConflictResolution::Rename) {
        resolution.destination = find_unique_name(destination_volume, conflict.destination_path);
    }

    spdlog::debug("[Conflict] resolved id={} destination={} action={}",
                  state_.operation_id(), resolution.destination.string(), to_string(action));
    return Ok(std::move(resolution));
}

} // namespace fops::ops

#include "fops/ops/request_codec.hpp"
#include "fops/events/json_codec.hpp"

namespace fops::ops {

using json = nlohmann::json;

namespace {

Result<void> expect(const json& j, const char* key, bool (json::*check)() const, const char* type) {
    if (j.contains(key) && !(j.at(key).*check)()) {
        return Err<void>(Error::invalid_argument(std::string("'") + key + "' must be " + type));
    }
    return Ok();
}

} // namespace

Result<OperationConfig> config_from_json(const json& j) {
    OperationConfig config;
    if (j.is_null()) {
        return Ok(config);
    }
    if (!j.is_object()) {
        return Err<OperationConfig>(Error::invalid_argument("config must be an object"));
    }

    for (auto check : {expect(j, "progressIntervalMs", &json::is_number_unsigned, "a non-negative integer"),
                       expect(j, "overwrite", &json::is_boolean, "a boolean"),
                       expect(j, "conflictResolution", &json::is_string, "a string"),
                       expect(j, "dryRun", &json::is_boolean, "a boolean"),
                       expect(j, "maxConflictsToShow", &json::is_number_unsigned, "a non-negative integer"),
                       expect(j, "conflictTimeoutMs", &json::is_number_unsigned, "a non-negative integer"),
                       expect(j, "chunkSize", &json::is_number_unsigned, "a non-negative integer"),
                       expect(j, "sortColumn", &json::is_string, "a string"),
                       expect(j, "sortOrder", &json::is_string, "a string"),
                       expect(j, "syncOnComplete", &json::is_boolean, "a boolean")}) {
        if (check.is_error()) {
            return Err<OperationConfig>(check.error());
        }
    }

    config.progress_interval = std::chrono::milliseconds(
        j.value("progressIntervalMs", static_cast<std::uint64_t>(config.progress_interval.count())));
    config.overwrite = j.value("overwrite", config.overwrite);
    config.dry_run = j.value("dryRun", config.dry_run);
    config.max_conflicts_to_show = j.value("maxConflictsToShow", config.max_conflicts_to_show);
    config.conflict_timeout = std::chrono::milliseconds(
        j.value("conflictTimeoutMs", static_cast<std::uint64_t>(config.conflict_timeout.count())));
    config.chunk_size = j.value("chunkSize", config.chunk_size);
    config.sync_on_complete = j.value("syncOnComplete", config.sync_on_complete);

    if (j.contains("conflictResolution")) {
        const auto name = j.at("conflictResolution").get<std::string>();
        auto policy = conflict_resolution_from_string(name);
        if (!policy) {
            return Err<OperationConfig>(Error::invalid_argument("Unknown conflict resolution: " + name));
        }
        config.conflict_resolution = *policy;
    }
    if (j.contains("sortColumn")) {
        const auto name = j.at("sortColumn").get<std::string>();
        auto column = sort_column_from_string(name);
        if (!column) {
            return Err<OperationConfig>(Error::invalid_argument("Unknown sort column: " + name));
        }
        config.sort_column = *column;
    }
    if (j.contains("sortOrder")) {
        const auto name = j.at("sortOrder").get<std::string>();
        auto order = sort_order_from_string(name);
        if (!order) {
            return Err<OperationConfig>(Error::invalid_argument("Unknown sort order: " + name));
        }
        config.sort_order = *order;
    }
    if (config.chunk_size == 0) {
        return Err<OperationConfig>(Error::invalid_argument("'chunkSize' must be positive"));
    }
    return Ok(config);
}

json config_to_json(const OperationConfig& config) {
    json j;
    j["progressIntervalMs"] = config.progress_interval.count();
    j["overwrite"] = config.overwrite;
    j["conflictResolution"] = to_string(config.conflict_resolution);
    j["dryRun"] = config.dry_run;
    j["maxConflictsToShow"] = config.max_conflicts_to_show;
    j["conflictTimeoutMs"] = config.conflict_timeout.count();
    j["chunkSize"] = config.chunk_size;
    j["sortColumn"] = to_string(config.sort_column);
    j["sortOrder"] = to_string(config.sort_order);
    j["syncOnComplete"] = config.sync_on_complete;
    return j;
}

Result<StartRequest> start_request_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<StartRequest>(Error::invalid_argument("request must be an object"));
    }

    StartRequest request;
    const auto kind_name = j.value("kind", std::string{});
    auto kind = operation_kind_from_string(kind_name);
    if (!kind) {
        return Err<StartRequest>(Error::invalid_argument("Unknown operation kind: '" + kind_name + "'"));
    }
    request.kind = *kind;

    const auto sources = j.value("sources", json::array());
    if (!sources.is_array()) {
        return Err<StartRequest>(Error::invalid_argument("'sources' must be an array"));
    }
    for (const auto& source : sources) {
        if (!source.is_string()) {
            return Err<StartRequest>(Error::invalid_argument("'sources' must contain paths"));
        }
        request.sources.emplace_back(source.get<std::string>());
    }

    if (j.contains("destination")) {
        if (!j.at("destination").is_string()) {
            return Err<StartRequest>(Error::invalid_argument("'destination' must be a path"));
        }
        request.destination = j.at("destination").get<std::string>();
    } else if (request.kind != OperationKind::Delete) {
        return Err<StartRequest>(Error::invalid_argument("'destination' is required"));
    }

    if (j.contains("previewId")) {
        if (!j.at("previewId").is_string()) {
            return Err<StartRequest>(Error::invalid_argument("'previewId' must be a string"));
        }
        request.preview_id = j.at("previewId").get<std::string>();
    }

    auto config = config_from_json(j.value("config", json{}));
    if (config.is_error()) {
        return Err<StartRequest>(config.error());
    }
    request.config = config.value();
    return Ok(std::move(request));
}

Result<StartRequest> parse_start_request(const std::string& text) {
    auto payload = json::parse(text, nullptr, false);
    if (payload.is_discarded()) {
        return Err<StartRequest>(Error::invalid_argument("Malformed JSON request"));
    }
    return start_request_from_json(payload);
}

json status_to_json(const OperationStatus& status) {
    json j;
    j["operationId"] = status.operation_id;
    j["kind"] = to_string(status.kind);
    j["lifecycle"] = to_string(status.lifecycle);
    j["progress"] = events::progress_to_json(status.progress);
    j["startedAt"] = events::to_epoch_millis(status.started_at);
    return j;
}

json summary_to_json(const OperationSummary& summary) {
    json j;
    j["operationId"] = summary.operation_id;
    j["kind"] = to_string(summary.kind);
    j["phase"] = to_string(summary.phase);
    j["percentComplete"] = summary.percent_complete;
    j["startedAt"] = events::to_epoch_millis(summary.started_at);
    return j;
}

} // namespace fops::ops

#include "fops/ops/copy.hpp"
#include "fops/ops/validation.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>
#include <unordered_set>

namespace fops::ops {
namespace fs = std::filesystem;

CopyEngine::CopyEngine(OperationContext& context,
                       Transaction& transaction,
                       volume::Volume& destination_volume,
                       const ScanResult& scan)
    : context_(context),
      destination_volume_(destination_volume),
      scan_(scan),
      resolver_(context.state, context.progress),
      executor_(context.state, resolver_, transaction, [this](std::uint64_t delta) {
          totals_.bytes_done += delta;
          report(current_);
      }) {}

Result<std::vector<std::optional<fs::path>>> CopyEngine::copy_into(const fs::path& destination) {
    using Placed = std::vector<std::optional<fs::path>>;
    Placed placed(scan_.roots.size());

    // Source folder -> folder its contents go into
    std::unordered_map<std::string, fs::path> directory_targets;
    std::unordered_set<std::string> skipped_directories;

    report({});

    for (const auto& entry : scan_.entries) {
        if (context_.state.is_cancelled()) {
            return Err<Placed>(Error::cancelled());
        }

        const bool top_level = entry.relative.parent_path().empty();
        const auto parent_key = entry.source.parent_path().string();
        const bool is_directory = entry.kind == volume::ItemKind::Directory;

        if (!top_level && skipped_directories.count(parent_key) > 0) {
            if (is_directory) {
                skipped_directories.insert(entry.source.string());
            } else {
                totals_.items_done++;
                totals_.items_skipped++;
                totals_.bytes_done += entry.size;
            }
            report(entry.source);
            continue;
        }

        fs::path target;
        if (top_level) {
            target = destination / entry.relative;
        } else {
            auto parent = directory_targets.find(parent_key);
            if (parent == directory_targets.end()) {
                return Err<Placed>(Error::io_error(entry.source, "Parent folder was not copied"));
            }
            target = parent->second / entry.source.filename();
        }

        auto source_volume = context_.volumes.volume_for(entry.source);
        if (!source_volume) {
            return Err<Placed>(Error::source_not_found(entry.source));
        }

        current_ = entry.source;
        auto transferred = executor_.transfer_item(*source_volume, entry, destination_volume_, target);
        if (transferred.is_error()) {
            return Err<Placed>(transferred.error());
        }
        const TransferResult& result = transferred.value();

        if (is_directory) {
            if (result.status == TransferStatus::Skipped) {
                skipped_directories.insert(entry.source.string());
            } else {
                directory_targets[entry.source.string()] = result.destination;
            }
        } else {
            totals_.items_done++;
            if (result.status == TransferStatus::Skipped) {
                totals_.items_skipped++;
                totals_.bytes_done += entry.size;
            } else {
                totals_.items_copied++;
                totals_.bytes_copied += result.bytes;
            }
        }

        if (top_level && result.status != TransferStatus::Skipped) {
            placed[entry.root_index] = result.destination;
        }
        report(entry.source);
    }

    return Ok(std::move(placed));
}

void CopyEngine::report(const fs::path& current) {
    ProgressSnapshot snapshot;
    snapshot.phase = Phase::Copying;
    snapshot.current_item = current.filename().string();
    snapshot.items_done = totals_.items_done;
    snapshot.items_total = scan_.file_count;
    snapshot.bytes_done = totals_.bytes_done;
    snapshot.bytes_total = scan_.total_bytes;
    context_.progress.report(snapshot);
}

void report_dry_run(OperationContext& context,
                    const Scanner& scanner,
                    const ScanResult& scan,
                    const fs::path& destination) {
    events::DryRunCompletedEvent event{};
    event.files_total = scan.file_count;
    event.bytes_total = scan.total_bytes;

    if (context.state.kind() != OperationKind::Delete) {
        auto conflicts = scanner.scan_all_conflicts(scan, destination);
        if (conflicts.is_error()) {
            abort_operation(context, conflicts.error(), 0);
            return;
        }
        event.conflicts = std::move(conflicts.value());
    }

    const std::size_t limit = context.state.config().max_conflicts_to_show;
    event.conflicts_total = event.conflicts.size();
    if (event.conflicts.size() > limit) {
        event.conflicts.resize(limit);
        event.conflicts_sampled = true;
    }

    spdlog::info("[DryRun] id={} files={} bytes={} conflicts={}",
                 context.state.operation_id(), event.files_total, event.bytes_total, event.conflicts_total);
    context.progress.dry_run_completed(std::move(event));
    complete_operation(context, 0, 0, 0);
}

void run_copy(OperationContext& context, const StartRequest& request) {
    Scanner scanner(context.volumes, &context.state, &context.progress);
    auto scan = scan_sources(context, scanner, request.sources);
    if (scan.is_error()) {
        abort_operation(context, scan.error(), 0);
        return;
    }

    if (request.config.dry_run) {
        report_dry_run(context, scanner, scan.value(), request.destination);
        return;
    }

    auto destination_volume = context.volumes.volume_for(request.destination);
    if (!destination_volume) {
        abort_operation(context, Error::source_not_found(request.destination), 0);
        return;
    }

    auto space = validate_disk_space(*destination_volume, request.destination, scan.value().total_bytes);
    if (space.is_error()) {
        abort_operation(context, space.error(), 0);
        return;
    }

    Transaction transaction(*destination_volume);
    CopyEngine engine(context, transaction, *destination_volume, scan.value());
    auto copied = engine.copy_into(request.destination);
    if (copied.is_error()) {
        abort_operation(context, copied.error(), engine.totals().items_copied, &transaction);
        return;
    }

    transaction.commit();
    const auto& totals = engine.totals();
    spdlog::info("[Copy] done id={} items={} bytes={} skipped={}",
                 context.state.operation_id(), totals.items_copied, totals.bytes_copied, totals.items_skipped);
    complete_operation(context, totals.items_copied, totals.bytes_copied, totals.items_skipped);
}

void run_delete(OperationContext& context, const StartRequest& request) {
    Scanner scanner(context.volumes, &context.state, &context.progress);
    auto scan = scan_sources(context, scanner, request.sources);
    if (scan.is_error()) {
        abort_operation(context, scan.error(), 0);
        return;
    }
    const ScanResult& result = scan.value();

    if (request.config.dry_run) {
        report_dry_run(context, scanner, result, {});
        return;
    }

    ProgressSnapshot snapshot;
    snapshot.phase = Phase::Deleting;
    snapshot.items_total = result.file_count;
    snapshot.bytes_total = result.total_bytes;
    context.progress.report(snapshot);

    // Files first, then folders deepest-first
    for (const auto& entry : result.entries) {
        if (entry.kind == volume::ItemKind::Directory) {
            continue;
        }
        if (context.state.is_cancelled()) {
            abort_operation(context, Error::cancelled(), snapshot.items_done);
            return;
        }
        auto volume = context.volumes.volume_for(entry.source);
        auto removed = delete_item(*volume, entry);
        if (removed.is_error()) {
            abort_operation(context, removed.error(), snapshot.items_done);
            return;
        }
        snapshot.items_done++;
        snapshot.bytes_done += entry.size;
        snapshot.current_item = entry.source.filename().string();
        context.progress.report(snapshot);
    }

    for (auto it = result.entries.rbegin(); it != result.entries.rend(); ++it) {
        if (it->kind != volume::ItemKind::Directory) {
            continue;
        }
        if (context.state.is_cancelled()) {
            abort_operation(context, Error::cancelled(), snapshot.items_done);
            return;
        }
        auto volume = context.volumes.volume_for(it->source);
        auto removed = delete_item(*volume, *it);
        if (removed.is_error()) {
            abort_operation(context, removed.error(), snapshot.items_done);
            return;
        }
    }

    spdlog::info("[Delete] done id={} items={} bytes={}",
                 context.state.operation_id(), snapshot.items_done, snapshot.bytes_done);
    complete_operation(context, snapshot.items_done, snapshot.bytes_done, 0);
}

} // namespace fops::ops

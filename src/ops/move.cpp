#include "fops/ops/move.hpp"
#include "fops/ops/conflict.hpp"
#include "fops/ops/copy.hpp"
#include "fops/ops/scanner.hpp"
#include "fops/ops/transfer.hpp"
#include "fops/ops/validation.hpp"

#include <spdlog/spdlog.h>

namespace fops::ops {
namespace fs = std::filesystem;

const char* to_string(MoveStrategy strategy) noexcept {
    switch (strategy) {
        case MoveStrategy::SameVolume: return "same-volume";
        case MoveStrategy::CrossVolume: return "cross-volume";
    }
    return "unknown";
}

MoveStrategy decide_strategy(const volume::Volume& source_volume,
                             const fs::path& source,
                             const volume::Volume& destination_volume,
                             const fs::path& destination) {
    if (&source_volume != &destination_volume) {
        return MoveStrategy::CrossVolume;
    }
    const auto source_id = source_volume.identity(source);
    const auto destination_id = destination_volume.identity(destination);
    if (!source_id || !destination_id) {
        return MoveStrategy::CrossVolume;
    }
    return source_id->device == destination_id->device ? MoveStrategy::SameVolume : MoveStrategy::CrossVolume;
}

// ════════════════════════════════════════════════════════
// RenameJournal
// ════════════════════════════════════════════════════════

RenameJournal::RenameJournal(volume::Volume& volume) : volume_(volume) {}

RenameJournal::~RenameJournal() {
    if (!entries_.empty()) {
        undo();
    }
}

void RenameJournal::record(fs::path from, fs::path to) {
    entries_.emplace_back(std::move(from), std::move(to));
}

std::size_t RenameJournal::undo() {
    std::size_t reverted = 0;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        auto restored = volume_.rename(it->second, it->first, false);
        if (restored.is_error()) {
            spdlog::error("[Move] could not move back from={} to={} error={}",
                          it->second.string(), it->first.string(), restored.error().message());
            continue;
        }
        reverted++;
    }
    entries_.clear();
    return reverted;
}

// ════════════════════════════════════════════════════════
// MoveOrchestrator
// ════════════════════════════════════════════════════════

MoveOrchestrator::MoveOrchestrator(OperationContext& context) : context_(context) {}

void MoveOrchestrator::run(const StartRequest& request) {
    auto destination_volume = context_.volumes.volume_for(request.destination);
    if (!destination_volume) {
        abort_operation(context_, Error::source_not_found(request.destination), 0);
        return;
    }

    if (request.config.dry_run) {
        Scanner scanner(context_.volumes, &context_.state, &context_.progress);
        auto scan = scan_sources(context_, scanner, request.sources);
        if (scan.is_error()) {
            abort_operation(context_, scan.error(), 0);
            return;
        }
        report_dry_run(context_, scanner, scan.value(), request.destination);
        return;
    }

    std::vector<fs::path> same_volume;
    std::vector<fs::path> cross_volume;
    for (const auto& source : request.sources) {
        auto source_volume = context_.volumes.volume_for(source);
        if (!source_volume) {
            abort_operation(context_, Error::source_not_found(source), 0);
            return;
        }
        const auto strategy = decide_strategy(*source_volume, source, *destination_volume, request.destination);
        (strategy == MoveStrategy::SameVolume ? same_volume : cross_volume).push_back(source);
    }
    spdlog::info("[Move] id={} same_volume={} cross_volume={}",
                 context_.state.operation_id(), same_volume.size(), cross_volume.size());

    RenameJournal journal(*destination_volume);
    Outcome outcome;

    auto stop = [&](const Error& error) {
        if (error.is(ErrorKind::Cancelled) && !context_.state.rollback_requested()) {
            journal.commit();
        } else {
            const auto reverted = journal.undo();
            if (reverted > 0) {
                spdlog::info("[Move] reverted renames id={} count={}", context_.state.operation_id(), reverted);
            }
        }
        abort_operation(context_, error, outcome.items);
    };

    std::vector<fs::path> fallback;
    if (!same_volume.empty()) {
        auto moved = move_same_volume(same_volume, request.destination, *destination_volume, journal, fallback, outcome);
        if (moved.is_error()) {
            stop(moved.error());
            return;
        }
    }

    cross_volume.insert(cross_volume.end(), fallback.begin(), fallback.end());
    if (!cross_volume.empty()) {
        auto moved = move_cross_volume(cross_volume, request.destination, *destination_volume, outcome);
        if (moved.is_error()) {
            stop(moved.error());
            return;
        }
    }

    journal.commit();
    spdlog::info("[Move] done id={} items={} bytes={} skipped={} warnings={}",
                 context_.state.operation_id(), outcome.items, outcome.bytes, outcome.skipped,
                 outcome.warnings.size());
    complete_operation(context_, outcome.items, outcome.bytes, outcome.skipped, std::move(outcome.warnings));
}

Result<void> MoveOrchestrator::move_same_volume(const std::vector<fs::path>& sources,
                                                const fs::path& destination,
                                                volume::Volume& volume,
                                                RenameJournal& journal,
                                                std::vector<fs::path>& fallback,
                                                Outcome& outcome) {
    ConflictResolver resolver(context_.state, context_.progress);
    std::uint64_t handled = 0;

    for (const auto& source : sources) {
        if (context_.state.is_cancelled()) {
            return Err<void>(Error::cancelled());
        }

        auto info = volume.info(source);
        if (info.is_error()) {
            return Err<void>(info.error());
        }

        fs::path target = destination / source.filename();
        bool overwrite = false;

        auto inspected = inspect_conflict(volume, source, volume, target);
        if (inspected.is_error()) {
            return Err<void>(inspected.error());
        }
        if (inspected.value() && inspected.value()->is_conflict()) {
            auto resolution = resolver.resolve(*inspected.value(), volume);
            if (resolution.is_error()) {
                return Err<void>(resolution.error());
            }
            if (resolution.value().action == ConflictResolution::Skip) {
                outcome.skipped++;
                handled++;
                continue;
            }
            target = resolution.value().destination;
            overwrite = resolution.value().action == ConflictResolution::Overwrite;
        }

        auto renamed = replace_into(volume, source, target, overwrite);
        if (renamed.is_error()) {
            if (renamed.error().is(ErrorKind::Unsupported)) {
                spdlog::info("[Move] rename refused, copying instead path={} reason={}",
                             source.string(), renamed.error().detail);
                fallback.push_back(source);
                continue;
            }
            return renamed;
        }

        journal.record(source, target);
        outcome.items++;
        if (info.value().kind != volume::ItemKind::Directory) {
            outcome.bytes += info.value().size;
        }
        handled++;
    }

    ProgressSnapshot snapshot;
    snapshot.phase = Phase::Copying;
    snapshot.items_done = handled;
    snapshot.items_total = sources.size();
    snapshot.bytes_done = outcome.bytes;
    snapshot.bytes_total = outcome.bytes;
    context_.progress.report(snapshot);
    return Ok();
}

Result<void> MoveOrchestrator::move_cross_volume(const std::vector<fs::path>& sources,
                                                 const fs::path& destination,
                                                 volume::Volume& destination_volume,
                                                 Outcome& outcome) {
    Scanner scanner(context_.volumes, &context_.state, &context_.progress);
    auto scan = scan_sources(context_, scanner, sources);
    if (scan.is_error()) {
        return Err<void>(scan.error());
    }
    const ScanResult& result = scan.value();

    auto space = validate_disk_space(destination_volume, destination, result.total_bytes);
    if (space.is_error()) {
        return space;
    }

    std::vector<std::uint64_t> root_files(result.roots.size(), 0);
    std::vector<std::uint64_t> root_bytes(result.roots.size(), 0);
    for (const auto& entry : result.entries) {
        if (entry.kind != volume::ItemKind::Directory) {
            root_files[entry.root_index]++;
            root_bytes[entry.root_index] += entry.size;
        }
    }

    struct CommitStep {
        std::size_t root;
        fs::path staged;
        fs::path final_path;
        bool overwrite;
    };
    std::vector<CommitStep> plan;

    const fs::path staging = destination / (".fops-staging-" + context_.state.operation_id());
    {
        Transaction transaction(destination_volume);
        auto created = destination_volume.create_directory(staging);
        if (created.is_error()) {
            return created;
        }
        transaction.record_directory(staging);

        CopyEngine engine(context_, transaction, destination_volume, result);
        auto copied = engine.copy_into(staging);
        if (copied.is_error()) {
            return Err<void>(copied.error());
        }
        outcome.skipped += engine.totals().items_skipped;

        ConflictResolver resolver(context_.state, context_.progress);
        for (std::size_t root = 0; root < result.roots.size(); ++root) {
            const auto& staged = copied.value()[root];
            if (!staged) {
                continue;
            }
            fs::path final_path = destination / result.roots[root].filename();
            bool overwrite = false;

            auto source_volume = context_.volumes.volume_for(result.roots[root]);
            auto inspected = inspect_conflict(*source_volume, result.roots[root], destination_volume, final_path);
            if (inspected.is_error()) {
                return Err<void>(inspected.error());
            }
            if (inspected.value() && inspected.value()->is_conflict()) {
                auto resolution = resolver.resolve(*inspected.value(), destination_volume);
                if (resolution.is_error()) {
                    return Err<void>(resolution.error());
                }
                if (resolution.value().action == ConflictResolution::Skip) {
                    outcome.skipped += root_files[root];
                    continue;
                }
                final_path = resolution.value().destination;
                overwrite = resolution.value().action == ConflictResolution::Overwrite;
            }
            plan.push_back(CommitStep{root, *staged, std::move(final_path), overwrite});
        }

        if (context_.state.is_cancelled()) {
            return Err<void>(Error::cancelled());
        }
        // Staged data survives the scope; from here on it is cleaned up explicitly
        transaction.commit();
    }

    std::vector<std::size_t> committed;
    for (const auto& step : plan) {
        auto renamed = replace_into(destination_volume, step.staged, step.final_path, step.overwrite);
        if (renamed.is_error()) {
            spdlog::error("[Move] commit failed id={} path={} error={}",
                          context_.state.operation_id(), step.final_path.string(), renamed.error().message());
            auto cleaned = remove_tree(destination_volume, staging);
            if (cleaned.is_error()) {
                spdlog::warn("[Move] staging folder left behind path={} error={}",
                             staging.string(), cleaned.error().message());
            }
            return renamed;
        }
        committed.push_back(step.root);
    }

    // The destination is authoritative now; source cleanup can only warn.
    // Deleting counts on top of the copy totals.
    const ProgressSnapshot copied = context_.progress.last();
    ProgressSnapshot snapshot;
    snapshot.phase = Phase::Deleting;
    snapshot.items_done = copied.items_done;
    snapshot.bytes_done = copied.bytes_done;
    snapshot.items_total = copied.items_total;
    snapshot.bytes_total = copied.bytes_total;
    for (auto root : committed) {
        snapshot.items_total += root_files[root];
        snapshot.bytes_total += root_bytes[root];
    }
    context_.progress.report(snapshot);

    for (auto root : committed) {
        auto source_volume = context_.volumes.volume_for(result.roots[root]);
        for (const auto& entry : result.entries) {
            if (entry.root_index != root || entry.kind == volume::ItemKind::Directory) {
                continue;
            }
            auto removed = delete_item(*source_volume, entry);
            if (removed.is_error()) {
                outcome.warnings.push_back(removed.error().message());
                continue;
            }
            snapshot.items_done++;
            snapshot.bytes_done += entry.size;
            snapshot.current_item = entry.source.filename().string();
            context_.progress.report(snapshot);
        }
        for (auto it = result.entries.rbegin(); it != result.entries.rend(); ++it) {
            if (it->root_index != root || it->kind != volume::ItemKind::Directory) {
                continue;
            }
            auto removed = delete_item(*source_volume, *it);
            if (removed.is_error()) {
                outcome.warnings.push_back(removed.error().message());
            }
        }
        outcome.items += root_files[root];
        outcome.bytes += root_bytes[root];
    }

    auto cleaned = remove_tree(destination_volume, staging);
    if (cleaned.is_error()) {
        outcome.warnings.push_back("Could not remove staging folder: " + cleaned.error().message());
    }
    return Ok();
}

Result<void> MoveOrchestrator::replace_into(volume::Volume& volume,
                                            const fs::path& from,
                                            const fs::path& to,
                                            bool overwrite) {
    if (!overwrite) {
        return volume.rename(from, to, false);
    }

    auto existing = volume.info(to);
    if (existing.is_error()) {
        if (existing.error().is(ErrorKind::SourceNotFound)) {
            return volume.rename(from, to, false);
        }
        return Err<void>(existing.error());
    }
    auto incoming = volume.info(from);
    if (incoming.is_error()) {
        return Err<void>(incoming.error());
    }

    const bool existing_is_directory = existing.value().kind == volume::ItemKind::Directory;
    const bool incoming_is_directory = incoming.value().kind == volume::ItemKind::Directory;
    if (existing_is_directory != incoming_is_directory) {
        return Err<void>(Error::io_error(to, existing_is_directory ? "Cannot replace a folder with a file"
                                                                   : "Cannot replace a file with a folder"));
    }
    if (!existing_is_directory) {
        return volume.rename(from, to, true);
    }

    // rename(2) only replaces empty folders: park the old one, swap, then drop it
    const fs::path backup = to.parent_path() /
                            (to.filename().string() + ".fops-backup-" + context_.state.operation_id());
    auto parked = volume.rename(to, backup, false);
    if (parked.is_error()) {
        return parked;
    }
    auto renamed = volume.rename(from, to, false);
    if (renamed.is_error()) {
        auto restored = volume.rename(backup, to, false);
        if (restored.is_error()) {
            spdlog::error("[Move] could not restore replaced folder path={} backup={} error={}",
                          to.string(), backup.string(), restored.error().message());
        }
        return renamed;
    }
    auto dropped = remove_tree(volume, backup);
    if (dropped.is_error()) {
        spdlog::warn("[Move] replaced folder left behind path={} error={}", backup.string(), dropped.error().message());
    }
    return Ok();
}

} // namespace fops::ops

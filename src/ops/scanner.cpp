#include "fops/ops/scanner.hpp"
#include "fops/ops/conflict.hpp"
#include "fops/ops/validation.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace fops::ops {
namespace fs = std::filesystem;

namespace {

struct PendingItem {
    ScanEntry entry;
    fs::path canonical_parent;  ///< Resolved directory that contains the entry
};

std::string fold_case(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return name;
}

bool name_less(const volume::DirectoryEntry& a, const volume::DirectoryEntry& b) {
    const auto folded_a = fold_case(a.name);
    const auto folded_b = fold_case(b.name);
    if (folded_a != folded_b) {
        return folded_a < folded_b;
    }
    return a.name < b.name;
}

bool column_less(const volume::DirectoryEntry& a, const volume::DirectoryEntry& b, SortColumn column) {
    switch (column) {
        case SortColumn::Name:
            break;
        case SortColumn::Extension: {
            const auto ext_a = fold_case(fs::path(a.name).extension().string());
            const auto ext_b = fold_case(fs::path(b.name).extension().string());
            if (ext_a != ext_b) {
                return ext_a < ext_b;
            }
            break;
        }
        case SortColumn::Size:
            if (a.info.size != b.info.size) {
                return a.info.size < b.info.size;
            }
            break;
        case SortColumn::Modified:
            if (a.info.modified != b.info.modified) {
                return a.info.modified < b.info.modified;
            }
            break;
    }
    return name_less(a, b);
}

} // namespace

void sort_listing(std::vector<volume::DirectoryEntry>& entries, SortColumn column, SortOrder order) {
    std::sort(entries.begin(), entries.end(),
              [column, order](const volume::DirectoryEntry& a, const volume::DirectoryEntry& b) {
                  return order == SortOrder::Ascending ? column_less(a, b, column) : column_less(b, a, column);
              });
}

Scanner::Scanner(const volume::VolumeManager& volumes, const OperationState* state, ProgressEmitter* progress)
    : volumes_(volumes), state_(state), progress_(progress) {}

Result<ScanResult> Scanner::scan(const std::vector<fs::path>& sources) const {
    ScanResult result;

    for (std::size_t index = 0; index < sources.size(); ++index) {
        if (cancelled()) {
            return Err<ScanResult>(Error::cancelled());
        }

        const auto& root = sources[index];
        auto volume = volumes_.volume_for(root);
        if (!volume) {
            return Err<ScanResult>(Error::source_not_found(root));
        }

        auto root_info = volume->info(root);
        if (root_info.is_error()) {
            if (root_info.error().is(ErrorKind::PermissionDenied)) {
                return Err<ScanResult>(root_info.error());
            }
            return Err<ScanResult>(Error::source_not_found(root));
        }
        result.roots.push_back(root);

        fs::path canonical_parent;
        if (auto resolved = volume->canonical(root.parent_path()); resolved.is_ok()) {
            canonical_parent = resolved.value();
        }

        ScanEntry root_entry;
        root_entry.source = root;
        root_entry.relative = root.filename();
        root_entry.kind = root_info.value().kind;
        root_entry.size = root_info.value().size;
        root_entry.mode = root_info.value().mode;
        root_entry.modified = root_info.value().modified;
        root_entry.root_index = index;

        std::unordered_set<std::string> visited;
        std::vector<PendingItem> stack;
        stack.push_back(PendingItem{std::move(root_entry), std::move(canonical_parent)});

        while (!stack.empty()) {
            PendingItem current = std::move(stack.back());
            stack.pop_back();
            ScanEntry& entry = current.entry;

            switch (entry.kind) {
                case volume::ItemKind::Other:
                    spdlog::warn("[Scanner] skipping special file path={}", entry.source.string());
                    continue;

                case volume::ItemKind::Symlink: {
                    auto target = volume->canonical(entry.source);
                    if (target.is_error()) {
                        if (target.error().is(ErrorKind::SymlinkLoopDetected)) {
                            return Err<ScanResult>(Error::symlink_loop(entry.source));
                        }
                        // Dangling links are copied as they are
                    } else if (!current.canonical_parent.empty()) {
                        auto target_info = volume->info(target.value());
                        if (target_info.is_ok() && target_info.value().kind == volume::ItemKind::Directory &&
                            is_ancestor_or_self(target.value(), current.canonical_parent)) {
                            spdlog::warn("[Scanner] symlink loop path={} target={}",
                                         entry.source.string(), target.value().string());
                            return Err<ScanResult>(Error::symlink_loop(entry.source));
                        }
                    }
                    result.file_count++;
                    result.total_bytes += entry.size;
                    report(result, entry.source);
                    result.entries.push_back(std::move(entry));
                    continue;
                }

                case volume::ItemKind::File:
                    result.file_count++;
                    result.total_bytes += entry.size;
                    report(result, entry.source);
                    result.entries.push_back(std::move(entry));
                    continue;

                case volume::ItemKind::Directory:
                    break;
            }

            if (cancelled()) {
                return Err<ScanResult>(Error::cancelled());
            }

            auto canonical = volume->canonical(entry.source);
            if (canonical.is_error()) {
                return Err<ScanResult>(canonical.error());
            }
            if (!visited.insert(canonical.value().string()).second) {
                return Err<ScanResult>(Error::symlink_loop(entry.source));
            }

            auto listing = volume->list_directory(entry.source);
            if (listing.is_error()) {
                return Err<ScanResult>(listing.error());
            }
            auto& children = listing.value();
            if (state_ != nullptr) {
                sort_listing(children, state_->config().sort_column, state_->config().sort_order);
            } else {
                sort_listing(children, SortColumn::Name, SortOrder::Ascending);
            }

            entry.size = 0;
            result.directory_count++;
            report(result, entry.source);

            const fs::path directory_source = entry.source;
            const fs::path directory_relative = entry.relative;
            result.entries.push_back(std::move(entry));

            // Reverse push keeps children in sort order when popped
            for (auto it = children.rbegin(); it != children.rend(); ++it) {
                ScanEntry child;
                child.source = directory_source / it->name;
                child.relative = directory_relative / it->name;
                child.kind = it->info.kind;
                child.size = it->info.kind == volume::ItemKind::Directory ? 0 : it->info.size;
                child.mode = it->info.mode;
                child.modified = it->info.modified;
                child.root_index = index;
                stack.push_back(PendingItem{std::move(child), canonical.value()});
            }
        }
    }

    spdlog::debug("[Scanner] scanned roots={} files={} dirs={} bytes={}",
                  result.roots.size(), result.file_count, result.directory_count, result.total_bytes);
    return Ok(std::move(result));
}

Result<std::vector<ConflictRecord>> Scanner::scan_for_conflicts(const std::vector<ScanEntry>& source_items,
                                                                const fs::path& destination) const {
    if (cancelled()) {
        return Err<std::vector<ConflictRecord>>(Error::cancelled());
    }

    auto destination_volume = volumes_.volume_for(destination);
    if (!destination_volume) {
        return Err<std::vector<ConflictRecord>>(Error::source_not_found(destination));
    }

    auto listing = destination_volume->list_directory(destination);
    if (listing.is_error()) {
        return Err<std::vector<ConflictRecord>>(listing.error());
    }

    const bool fold = !destination_volume->case_sensitive();
    std::unordered_map<std::string, const volume::DirectoryEntry*> by_name;
    by_name.reserve(listing.value().size());
    for (const auto& existing : listing.value()) {
        by_name.emplace(fold ? fold_case(existing.name) : existing.name, &existing);
    }

    std::vector<ConflictRecord> conflicts;
    for (const auto& item : source_items) {
        if (cancelled()) {
            return Err<std::vector<ConflictRecord>>(Error::cancelled());
        }

        const auto name = item.source.filename().string();
        const auto found = by_name.find(fold ? fold_case(name) : name);
        if (found == by_name.end()) {
            continue;
        }
        const auto& existing = *found->second;
        if (item.kind == volume::ItemKind::Directory && existing.info.kind == volume::ItemKind::Directory) {
            continue;
        }

        auto source_volume = volumes_.volume_for(item.source);
        auto record = inspect_conflict(*source_volume, item.source, *destination_volume, destination / existing.name);
        if (record.is_error()) {
            return Err<std::vector<ConflictRecord>>(record.error());
        }
        if (!record.value() || !record.value()->is_conflict()) {
            continue;
        }
        conflicts.push_back(std::move(*record.value()));
    }
    return Ok(std::move(conflicts));
}

Result<std::vector<ConflictRecord>> Scanner::scan_all_conflicts(const ScanResult& scan,
                                                                const fs::path& destination) const {
    auto destination_volume = volumes_.volume_for(destination);
    if (!destination_volume) {
        return Err<std::vector<ConflictRecord>>(Error::source_not_found(destination));
    }

    std::vector<std::pair<fs::path, std::vector<ScanEntry>>> groups;
    std::unordered_map<std::string, std::size_t> group_index;
    for (const auto& entry : scan.entries) {
        const auto parent = entry.relative.parent_path();
        fs::path target_dir = parent.empty() ? destination : destination / parent;
        const auto key = target_dir.string();
        auto [it, inserted] = group_index.emplace(key, groups.size());
        if (inserted) {
            groups.emplace_back(std::move(target_dir), std::vector<ScanEntry>{});
        }
        groups[it->second].second.push_back(entry);
    }

    std::vector<ConflictRecord> conflicts;
    for (const auto& [target_dir, items] : groups) {
        auto info = destination_volume->info(target_dir);
        if (info.is_error() || info.value().kind != volume::ItemKind::Directory) {
            continue;
        }
        auto found = scan_for_conflicts(items, target_dir);
        if (found.is_error()) {
            return found;
        }
        for (auto& record : found.value()) {
            conflicts.push_back(std::move(record));
        }
    }
    return Ok(std::move(conflicts));
}

void Scanner::report(const ScanResult& result, const fs::path& current) const {
    if (observer_) {
        observer_(result, current);
        return;
    }
    if (progress_ == nullptr) {
        return;
    }
    ProgressSnapshot snapshot;
    snapshot.phase = Phase::Scanning;
    snapshot.current_item = current.filename().string();
    snapshot.items_total = result.file_count;
    snapshot.bytes_total = result.total_bytes;
    progress_->report(snapshot);
}

} // namespace fops::ops

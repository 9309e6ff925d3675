#pragma once

#include "fops/core/result.hpp"
#include "fops/ops/progress.hpp"
#include "fops/ops/state.hpp"
#include "fops/ops/types.hpp"
#include "fops/volume/manager.hpp"

#include <filesystem>
#include <functional>
#include <vector>

namespace fops::ops {

/**
 * @brief Order folder contents the way the walk visits them
 *
 * Names compare without regard to letter case. Ties on the chosen column
 * fall back to the name, so the order is total and repeatable.
 */
void sort_listing(std::vector<volume::DirectoryEntry>& entries, SortColumn column, SortOrder order);

/// Receives the running totals and the item just reached
using ScanObserver = std::function<void(const ScanResult& so_far, const std::filesystem::path& current)>;

/**
 * @brief Walks source trees and pre-screens destinations for clashes
 *
 * The walk uses an explicit stack, never follows symlinks and polls the
 * operation's cancellation flag before expanding each directory. A
 * cancelled walk fails with Cancelled; it never returns a partial result
 * that looks complete.
 *
 * Siblings are visited in the sort order of the operation's config
 * (name, ascending without one). Roots keep the order they were given in.
 */
class Scanner {
public:
    /// `state` and `progress` may be null for a standalone scan
    Scanner(const volume::VolumeManager& volumes,
            const OperationState* state = nullptr,
            ProgressEmitter* progress = nullptr);

    /**
     * @brief Enumerate every item under `sources`
     *
     * FAILS WITH:
     * - SourceNotFound if a root is missing or unreadable
     * - SymlinkLoopDetected if a symlink points back at one of its own
     *   ancestors or a directory is reached twice
     * - Cancelled
     */
    Result<ScanResult> scan(const std::vector<std::filesystem::path>& sources) const;

    /// Send scan progress here instead of the operation's ProgressEmitter
    void set_observer(ScanObserver observer) { observer_ = std::move(observer); }

    /**
     * @brief Clashes between `source_items` and the contents of `destination`
     *
     * Lists the destination once and matches names in memory. Items whose
     * destination is the source object itself (case-only renames) and
     * directories landing on existing directories (merges) are not
     * reported.
     */
    Result<std::vector<ConflictRecord>> scan_for_conflicts(const std::vector<ScanEntry>& source_items,
                                                           const std::filesystem::path& destination) const;

    /// Conflicts for a whole scan copied under `destination`, one listing per target directory
    Result<std::vector<ConflictRecord>> scan_all_conflicts(const ScanResult& scan,
                                                           const std::filesystem::path& destination) const;

private:
    bool cancelled() const noexcept { return state_ != nullptr && state_->is_cancelled(); }
    void report(const ScanResult& result, const std::filesystem::path& current) const;

    const volume::VolumeManager& volumes_;
    const OperationState* state_;
    ProgressEmitter* progress_;
    ScanObserver observer_;
};

} // namespace fops::ops

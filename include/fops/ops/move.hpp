#pragma once

#include "fops/core/result.hpp"
#include "fops/ops/context.hpp"
#include "fops/ops/types.hpp"
#include "fops/volume/volume.hpp"

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace fops::ops {

enum class MoveStrategy {
    SameVolume,   ///< Atomic rename
    CrossVolume   ///< Stage, commit, then delete sources
};

const char* to_string(MoveStrategy strategy) noexcept;

/// SameVolume only when both paths sit on one volume object and one device
MoveStrategy decide_strategy(const volume::Volume& source_volume,
                             const std::filesystem::path& source,
                             const volume::Volume& destination_volume,
                             const std::filesystem::path& destination);

/**
 * @brief Renames done by a move, undone unless committed
 *
 * undo() renames every entry back in reverse order. The destructor undoes
 * anything not committed.
 */
class RenameJournal {
public:
    explicit RenameJournal(volume::Volume& volume);
    ~RenameJournal();

    RenameJournal(const RenameJournal&) = delete;
    RenameJournal& operator=(const RenameJournal&) = delete;

    void record(std::filesystem::path from, std::filesystem::path to);
    void commit() noexcept { entries_.clear(); }

    /// RETURNS: number of renames reverted
    std::size_t undo();

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    volume::Volume& volume_;
    std::vector<std::pair<std::filesystem::path, std::filesystem::path>> entries_;
};

/**
 * @brief Worker body of a Move operation
 *
 * SAME VOLUME:
 * Each item is renamed into place. The whole batch publishes a single
 * progress event once the renames are done.
 *
 * CROSS VOLUME:
 * 1. Scan and check free space
 * 2. Copy everything into a hidden staging folder inside the destination
 * 3. Resolve conflicts against the final names
 * 4. Commit: rename staged items to their final names
 * 5. Delete the sources
 *
 * Nothing before step 4 touches the sources or the final names; a
 * failure there removes the staging folder. Once step 4 succeeds the
 * destination is authoritative and source deletion failures are
 * reported as warnings on the Completed event.
 *
 * Items whose rename is refused with Unsupported (for example EXDEV on a
 * bind mount) fall back to the cross-volume path.
 */
class MoveOrchestrator {
public:
    explicit MoveOrchestrator(OperationContext& context);

    void run(const StartRequest& request);

private:
    struct Outcome {
        std::uint64_t items = 0;
        std::uint64_t bytes = 0;
        std::uint64_t skipped = 0;
        std::vector<std::string> warnings;
    };

    Result<void> move_same_volume(const std::vector<std::filesystem::path>& sources,
                                  const std::filesystem::path& destination,
                                  volume::Volume& volume,
                                  RenameJournal& journal,
                                  std::vector<std::filesystem::path>& fallback,
                                  Outcome& outcome);

    Result<void> move_cross_volume(const std::vector<std::filesystem::path>& sources,
                                   const std::filesystem::path& destination,
                                   volume::Volume& destination_volume,
                                   Outcome& outcome);

    /// Rename `from` to `to`, replacing an existing `to` when `overwrite` is set
    Result<void> replace_into(volume::Volume& volume,
                              const std::filesystem::path& from,
                              const std::filesystem::path& to,
                              bool overwrite);

    OperationContext& context_;
};

} // namespace fops::ops

#pragma once

#include "fops/core/result.hpp"
#include "fops/ops/conflict.hpp"
#include "fops/ops/state.hpp"
#include "fops/ops/transaction.hpp"
#include "fops/ops/types.hpp"
#include "fops/volume/volume.hpp"

#include <filesystem>
#include <functional>

namespace fops::ops {

enum class TransferStatus {
    Copied,
    Skipped,
    Renamed
};

struct TransferResult {
    TransferStatus status = TransferStatus::Copied;
    std::filesystem::path destination;  ///< Where the item ended up (or was skipped at)
    std::uint64_t bytes = 0;
};

/**
 * @brief Duplicates or deletes one item at a time
 *
 * COPY PATH:
 * 1. Native duplication when both volumes share a backend that offers it
 *    (copy-on-write clone, kernel copy, xattrs/ACLs, timestamps)
 * 2. Otherwise a chunked stream copy followed by a permission-bit copy
 *
 * Cancellation is checked once per chunk (or per native progress
 * callback); a partially written destination is deleted before the
 * error is returned. Every object created is recorded in the
 * Transaction as it is created.
 *
 * OVERWRITE:
 * The replacement is written to a temporary sibling and renamed over the
 * existing object, so the old object disappears only when a complete
 * replacement takes its place.
 */
class TransferExecutor {
public:
    /// Receives byte deltas as data is written
    using BytesCallback = std::function<void(std::uint64_t delta)>;

    TransferExecutor(OperationState& state,
                     ConflictResolver& resolver,
                     Transaction& transaction,
                     BytesCallback on_bytes = {});

    Result<TransferResult> transfer_item(const volume::Volume& source_volume,
                                         const ScanEntry& source,
                                         volume::Volume& destination_volume,
                                         const std::filesystem::path& destination);

private:
    Result<std::uint64_t> copy_file(const volume::Volume& source_volume,
                                    const ScanEntry& source,
                                    volume::Volume& destination_volume,
                                    const std::filesystem::path& target,
                                    bool overwrite);

    Result<std::uint64_t> copy_contents(const volume::Volume& source_volume,
                                        const ScanEntry& source,
                                        volume::Volume& destination_volume,
                                        volume::WriteStream& stream);

    Result<std::uint64_t> copy_symlink(const volume::Volume& source_volume,
                                       const ScanEntry& source,
                                       volume::Volume& destination_volume,
                                       const std::filesystem::path& target,
                                       bool overwrite);

    void discard_partial(volume::Volume& volume, const std::filesystem::path& path);

    OperationState& state_;
    ConflictResolver& resolver_;
    Transaction& transaction_;
    BytesCallback on_bytes_;
};

/// Remove one file, symlink or (already emptied) directory
Result<void> delete_item(volume::Volume& volume, const ScanEntry& item);

/// Unique temporary name next to `target`, used while overwriting
std::filesystem::path temporary_sibling(const volume::Volume& volume, const std::filesystem::path& target);

/**
 * @brief Remove a whole tree bottom-up without following symlinks
 *
 * Used for staging directories and replaced folders, never for user
 * sources (those go through the scanned delete path).
 */
Result<void> remove_tree(volume::Volume& volume, const std::filesystem::path& path);

} // namespace fops::ops

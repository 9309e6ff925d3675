#pragma once

#include "fops/core/result.hpp"
#include "fops/ops/conflict.hpp"
#include "fops/ops/context.hpp"
#include "fops/ops/scanner.hpp"
#include "fops/ops/transaction.hpp"
#include "fops/ops/transfer.hpp"
#include "fops/ops/types.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace fops::ops {

/// Counters kept while a scan is being copied
struct CopyTotals {
    std::uint64_t items_done = 0;     ///< Files and symlinks finished or skipped
    std::uint64_t items_copied = 0;
    std::uint64_t items_skipped = 0;
    std::uint64_t bytes_done = 0;     ///< Includes the size of skipped items
    std::uint64_t bytes_copied = 0;
};

/**
 * @brief Copies a whole scan into one destination folder
 *
 * Entries are processed in scan order, so every folder exists before its
 * contents arrive. A folder skipped at a conflict takes its contents with
 * it; a renamed folder carries its contents to the new name.
 *
 * Progress is published in the Copying phase; items count files only.
 */
class CopyEngine {
public:
    CopyEngine(OperationContext& context,
               Transaction& transaction,
               volume::Volume& destination_volume,
               const ScanResult& scan);

    /**
     * @brief Copy every scanned entry under `destination`
     *
     * RETURNS: for each scan root, where it ended up (nullopt when skipped)
     */
    Result<std::vector<std::optional<std::filesystem::path>>> copy_into(const std::filesystem::path& destination);

    [[nodiscard]] const CopyTotals& totals() const noexcept { return totals_; }

private:
    void report(const std::filesystem::path& current);

    OperationContext& context_;
    volume::Volume& destination_volume_;
    const ScanResult& scan_;
    CopyTotals totals_;
    std::filesystem::path current_;
    ConflictResolver resolver_;
    TransferExecutor executor_;
};

/**
 * @brief Publish what an operation would do and finish without writing
 *
 * Conflicts are collected for Copy and Move only, and truncated to
 * max_conflicts_to_show.
 */
void report_dry_run(OperationContext& context,
                    const Scanner& scanner,
                    const ScanResult& scan,
                    const std::filesystem::path& destination);

/// Worker body of a Copy operation
void run_copy(OperationContext& context, const StartRequest& request);

/// Worker body of a Delete operation
void run_delete(OperationContext& context, const StartRequest& request);

} // namespace fops::ops

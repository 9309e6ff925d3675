#pragma once

#include "fops/core/error.hpp"
#include "fops/core/result.hpp"
#include "fops/ops/progress.hpp"
#include "fops/ops/state.hpp"
#include "fops/ops/transaction.hpp"
#include "fops/ops/types.hpp"
#include "fops/volume/manager.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace fops::ops {

class Scanner;

/// Everything a running operation's worker needs
struct OperationContext {
    OperationState& state;
    ProgressEmitter& progress;
    const volume::VolumeManager& volumes;
    std::optional<ScanResult> prescanned{};  ///< Taken from a finished scan preview
};

/**
 * @brief Scan `sources`, or hand out the preview scan when it covers exactly them
 *
 * The preview result is used at most once.
 */
Result<ScanResult> scan_sources(OperationContext& context,
                                const Scanner& scanner,
                                const std::vector<std::filesystem::path>& sources);

/// Move to Completed and publish the terminal event
void complete_operation(OperationContext& context,
                        std::uint64_t items,
                        std::uint64_t bytes,
                        std::uint64_t skipped,
                        std::vector<std::string> warnings = {});

/**
 * @brief Finish an operation that stopped early
 *
 * Cancelled: the transaction (if any) is rolled back when the cancel
 * asked for it, otherwise its work is kept. Any other error rolls the
 * transaction back and publishes Failed.
 */
void abort_operation(OperationContext& context,
                     const Error& error,
                     std::uint64_t items,
                     Transaction* transaction = nullptr);

} // namespace fops::ops

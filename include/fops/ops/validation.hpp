#pragma once

#include "fops/core/result.hpp"
#include "fops/ops/types.hpp"
#include "fops/volume/manager.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace fops::ops {

inline constexpr std::size_t kMaxNameLength = 255;
inline constexpr std::size_t kMaxPathLength = 1024;

/// Lexically normal form without a trailing separator ("/a/b/" -> "/a/b")
std::filesystem::path normalize_path(const std::filesystem::path& path);

/// Component-wise prefix test: "/a/b" contains "/a/b/c" but not "/a/bc"
bool is_ancestor_or_self(const std::filesystem::path& ancestor, const std::filesystem::path& path);

/// Rejects empty names, separators, "." and "..", and names over kMaxNameLength bytes
Result<void> validate_name(const std::string& name);

/**
 * @brief Checks run before any worker starts
 *
 * FAILS WITH:
 * - InvalidArgument for an empty source list
 * - SourceNotFound for a missing source or destination
 * - PermissionDenied if the destination is not writable
 * - SameLocation if a source already lives directly in the destination
 * - DestinationInsideSource if the destination is a source or lies below one
 * - IoError for a destination that is not a folder or an over-long path
 *
 * Delete requests only need their sources to exist.
 */
Result<void> validate_request(const volume::VolumeManager& volumes, const StartRequest& request);

/**
 * @brief Verify `volume` has room for `required` bytes under `destination`
 *
 * A volume that cannot report its free space passes with a warning.
 */
Result<void> validate_disk_space(const volume::Volume& volume,
                                 const std::filesystem::path& destination,
                                 std::uint64_t required);

} // namespace fops::ops

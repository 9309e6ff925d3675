#pragma once

#include "fops/core/result.hpp"
#include "fops/volume/volume.hpp"

#include <filesystem>
#include <string>

namespace fops::ops {

/**
 * @brief Rename one item inside its folder
 *
 * A new name that differs only in letter case is allowed on every
 * volume: when the existing "target" is the item itself, the rename goes
 * ahead. Runs synchronously; there is no operation id or event stream.
 *
 * FAILS WITH:
 * - InvalidArgument for an empty name, "." / "..", or a name with a separator
 * - SourceNotFound if `path` does not exist
 * - DestinationExists if another item already has the name and `force` is unset
 */
Result<std::filesystem::path> rename_item(volume::Volume& volume,
                                          const std::filesystem::path& path,
                                          const std::string& new_name,
                                          bool force = false);

} // namespace fops::ops

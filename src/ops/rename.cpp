#include "fops/ops/rename.hpp"
#include "fops/ops/validation.hpp"

#include <spdlog/spdlog.h>

namespace fops::ops {
namespace fs = std::filesystem;

Result<fs::path> rename_item(volume::Volume& volume,
                             const fs::path& path,
                             const std::string& new_name,
                             bool force) {
    auto valid = validate_name(new_name);
    if (valid.is_error()) {
        return Err<fs::path>(valid.error());
    }

    const fs::path source = normalize_path(path);
    if (!volume.exists(source)) {
        return Err<fs::path>(Error::source_not_found(source));
    }

    const fs::path target = source.parent_path() / new_name;
    if (target == source) {
        return Ok(target);
    }

    if (volume.exists(target)) {
        const auto source_id = volume.identity(source);
        const auto target_id = volume.identity(target);
        const bool same_object = source_id && target_id && *source_id == *target_id;
        if (!same_object && !force) {
            return Err<fs::path>(Error::destination_exists(target));
        }
        if (same_object) {
            spdlog::debug("[Rename] case-only rename from={} to={}", source.string(), target.string());
        }
    }

    auto renamed = volume.rename(source, target, force);
    if (renamed.is_error()) {
        return Err<fs::path>(renamed.error());
    }
    spdlog::info("[Rename] from={} to={}", source.string(), target.string());
    return Ok(target);
}

} // namespace fops::ops

#include "fops/ops/validation.hpp"

#include <spdlog/spdlog.h>

namespace fops::ops {
namespace fs = std::filesystem;

namespace {

fs::path resolved(const volume::Volume& volume, const fs::path& path) {
    auto canonical = volume.canonical(path);
    return canonical.is_ok() ? canonical.value() : path;
}

Result<void> validate_lengths(const fs::path& path) {
    if (path.native().size() > kMaxPathLength) {
        return Err<void>(Error::io_error(path, "Path is too long"));
    }
    for (const auto& part : path) {
        if (part.native().size() > kMaxNameLength) {
            return Err<void>(Error::io_error(path, "Name is too long: " + part.string()));
        }
    }
    return Ok();
}

} // namespace

bool is_ancestor_or_self(const fs::path& ancestor, const fs::path& path) {
    auto a = ancestor.begin();
    auto p = path.begin();
    for (; a != ancestor.end(); ++a, ++p) {
        if (a->empty()) {
            break;
        }
        if (p == path.end() || *a != *p) {
            return false;
        }
    }
    return true;
}

fs::path normalize_path(const fs::path& path) {
    fs::path normal = path.lexically_normal();
    if (!normal.has_filename() && normal.has_parent_path() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

Result<void> validate_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return Err<void>(Error::invalid_argument("Invalid name: '" + name + "'"));
    }
    if (name.find('/') != std::string::npos || name.find('\0') != std::string::npos) {
        return Err<void>(Error::invalid_argument("Name must not contain a path separator: " + name));
    }
    if (name.size() > kMaxNameLength) {
        return Err<void>(Error::invalid_argument("Name is too long: " + name));
    }
    return Ok();
}

Result<void> validate_request(const volume::VolumeManager& volumes, const StartRequest& request) {
    if (request.sources.empty()) {
        return Err<void>(Error::invalid_argument("No source items given"));
    }

    for (const auto& source : request.sources) {
        auto volume = volumes.volume_for(source);
        if (!volume || !volume->exists(source)) {
            return Err<void>(Error::source_not_found(source));
        }
    }

    if (request.kind == OperationKind::Delete) {
        return Ok();
    }

    const auto& destination = request.destination;
    auto destination_volume = volumes.volume_for(destination);
    if (!destination_volume) {
        return Err<void>(Error::source_not_found(destination));
    }
    auto destination_info = destination_volume->info(destination);
    if (destination_info.is_error()) {
        if (destination_info.error().is(ErrorKind::SourceNotFound)) {
            return Err<void>(Error::source_not_found(destination));
        }
        return Err<void>(destination_info.error());
    }
    auto destination_kind = destination_info.value().kind;
    if (destination_kind == volume::ItemKind::Symlink) {
        // A link to a folder is a valid destination
        auto target = destination_volume->canonical(destination);
        if (target.is_ok()) {
            auto target_info = destination_volume->info(target.value());
            if (target_info.is_ok()) {
                destination_kind = target_info.value().kind;
            }
        }
    }
    if (destination_kind != volume::ItemKind::Directory) {
        return Err<void>(Error::io_error(destination, "Destination is not a folder"));
    }
    if (!destination_volume->is_writable(destination)) {
        return Err<void>(Error::permission_denied(destination, "Destination is not writable"));
    }

    const fs::path destination_resolved = resolved(*destination_volume, destination);
    for (const auto& source : request.sources) {
        if (normalize_path(source.parent_path()) == normalize_path(destination)) {
            return Err<void>(Error::same_location(source));
        }

        auto source_volume = volumes.volume_for(source);
        const fs::path source_resolved = resolved(*source_volume, source);
        if (is_ancestor_or_self(source_resolved, destination_resolved)) {
            return Err<void>(Error::destination_inside_source(source, destination));
        }

        auto lengths = validate_lengths(destination / source.filename());
        if (lengths.is_error()) {
            return lengths;
        }
    }
    return Ok();
}

Result<void> validate_disk_space(const volume::Volume& volume,
                                 const fs::path& destination,
                                 std::uint64_t required) {
    auto space = volume.space_info(destination);
    if (space.is_error()) {
        spdlog::warn("[Validation] free space unknown, continuing volume={} error={}",
                     volume.name(), space.error().message());
        return Ok();
    }
    if (space.value().available < required) {
        return Err<void>(Error::insufficient_space(required, space.value().available, volume.name()));
    }
    return Ok();
}

} // namespace fops::ops

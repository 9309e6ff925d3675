#include "fops/ops/transfer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <vector>

namespace fops::ops {
namespace fs = std::filesystem;

namespace {

bool can_duplicate_natively(const volume::Volume& source, const volume::Volume& destination) {
    return source.supports_native_duplicate() && destination.supports_native_duplicate() &&
           source.backend() == destination.backend();
}

} // namespace

TransferExecutor::TransferExecutor(OperationState& state,
                                   ConflictResolver& resolver,
                                   Transaction& transaction,
                                   BytesCallback on_bytes)
    : state_(state),
      resolver_(resolver),
      transaction_(transaction),
      on_bytes_(std::move(on_bytes)) {}

Result<TransferResult> TransferExecutor::transfer_item(const volume::Volume& source_volume,
                                                       const ScanEntry& source,
                                                       volume::Volume& destination_volume,
                                                       const fs::path& destination) {
    if (state_.is_cancelled()) {
        return Err<TransferResult>(Error::cancelled());
    }

    fs::path target = destination;
    TransferStatus status = TransferStatus::Copied;
    bool overwrite = false;

    auto inspected = inspect_conflict(source_volume, source.source, destination_volume, destination);
    if (inspected.is_error()) {
        return Err<TransferResult>(inspected.error());
    }

    if (inspected.value()) {
        const ConflictRecord& conflict = *inspected.value();
        if (!conflict.is_conflict()) {
            spdlog::debug("[Transfer] source is the destination, skipping path={}", destination.string());
            return Ok(TransferResult{TransferStatus::Skipped, destination, 0});
        }

        auto existing = destination_volume.info(destination);
        if (existing.is_error()) {
            return Err<TransferResult>(existing.error());
        }
        const bool existing_is_directory = existing.value().kind == volume::ItemKind::Directory;
        if (source.kind == volume::ItemKind::Directory && existing_is_directory) {
            return Ok(TransferResult{TransferStatus::Copied, destination, 0});
        }

        auto resolution = resolver_.resolve(conflict, destination_volume);
        if (resolution.is_error()) {
            return Err<TransferResult>(resolution.error());
        }

        switch (resolution.value().action) {
            case ConflictResolution::Skip:
                return Ok(TransferResult{TransferStatus::Skipped, destination, 0});
            case ConflictResolution::Rename:
                target = resolution.value().destination;
                status = TransferStatus::Renamed;
                break;
            case ConflictResolution::Overwrite:
                if (existing_is_directory) {
                    return Err<TransferResult>(Error::io_error(destination, "Cannot replace a folder with a file"));
                }
                if (source.kind == volume::ItemKind::Directory) {
                    return Err<TransferResult>(Error::io_error(destination, "Cannot replace a file with a folder"));
                }
                overwrite = true;
                break;
            case ConflictResolution::Stop:
                return Err<TransferResult>(Error::cancelled());
        }
    }

    switch (source.kind) {
        case volume::ItemKind::Directory: {
            auto created = destination_volume.create_directory(target);
            if (created.is_error()) {
                return Err<TransferResult>(created.error());
            }
            transaction_.record_directory(target);
            return Ok(TransferResult{status, target, 0});
        }
        case volume::ItemKind::Symlink: {
            auto bytes = copy_symlink(source_volume, source, destination_volume, target, overwrite);
            if (bytes.is_error()) {
                return Err<TransferResult>(bytes.error());
            }
            return Ok(TransferResult{status, target, bytes.value()});
        }
        case volume::ItemKind::File: {
            auto bytes = copy_file(source_volume, source, destination_volume, target, overwrite);
            if (bytes.is_error()) {
                return Err<TransferResult>(bytes.error());
            }
            return Ok(TransferResult{status, target, bytes.value()});
        }
        case volume::ItemKind::Other:
            break;
    }
    return Err<TransferResult>(Error::io_error(source.source, "Unsupported file type"));
}

Result<std::uint64_t> TransferExecutor::copy_file(const volume::Volume& source_volume,
                                                  const ScanEntry& source,
                                                  volume::Volume& destination_volume,
                                                  const fs::path& target,
                                                  bool overwrite) {
    const fs::path write_path = overwrite ? temporary_sibling(destination_volume, target) : target;

    auto stream = destination_volume.create_file(write_path);
    if (stream.is_error()) {
        return Err<std::uint64_t>(stream.error());
    }
    transaction_.record_file(write_path);

    auto bytes = copy_contents(source_volume, source, destination_volume, *stream.value());
    if (bytes.is_error()) {
        stream.value().reset();
        discard_partial(destination_volume, write_path);
        return bytes;
    }

    auto finished = stream.value()->finish(source.mode);
    if (finished.is_error()) {
        discard_partial(destination_volume, write_path);
        return Err<std::uint64_t>(finished.error());
    }

    if (overwrite) {
        auto replaced = destination_volume.rename(write_path, target, true);
        if (replaced.is_error()) {
            discard_partial(destination_volume, write_path);
            return Err<std::uint64_t>(replaced.error());
        }
    }

    spdlog::debug("[Transfer] copied source={} destination={} bytes={}",
                  source.source.string(), target.string(), bytes.value());
    return bytes;
}

Result<std::uint64_t> TransferExecutor::copy_contents(const volume::Volume& source_volume,
                                                      const ScanEntry& source,
                                                      volume::Volume& destination_volume,
                                                      volume::WriteStream& stream) {
    std::uint64_t reported = 0;
    auto progress = [this, &reported](std::uint64_t so_far) {
        if (state_.is_cancelled()) {
            return false;
        }
        if (so_far > reported) {
            if (on_bytes_) {
                on_bytes_(so_far - reported);
            }
            reported = so_far;
        }
        // A cancel raised while reporting stops the duplicate at this step
        return !state_.is_cancelled();
    };

    if (can_duplicate_natively(source_volume, destination_volume)) {
        auto duplicated = destination_volume.native_duplicate(source.source, stream, progress);
        if (duplicated.is_ok() || !duplicated.error().is(ErrorKind::Unsupported)) {
            return duplicated;
        }
        spdlog::debug("[Transfer] native duplication unavailable, streaming path={} reason={}",
                      source.source.string(), duplicated.error().detail);
    }

    auto reader = source_volume.open_read(source.source);
    if (reader.is_error()) {
        return Err<std::uint64_t>(reader.error());
    }

    std::vector<char> buffer(std::max<std::size_t>(state_.config().chunk_size, 1));
    std::uint64_t total = 0;
    while (true) {
        if (state_.is_cancelled()) {
            return Err<std::uint64_t>(Error::cancelled());
        }
        auto read = reader.value()->read(buffer.data(), buffer.size());
        if (read.is_error()) {
            return Err<std::uint64_t>(read.error());
        }
        if (read.value() == 0) {
            break;
        }
        auto written = stream.write(buffer.data(), read.value());
        if (written.is_error()) {
            return Err<std::uint64_t>(written.error());
        }
        total += read.value();
        if (!progress(total)) {
            return Err<std::uint64_t>(Error::cancelled());
        }
    }
    return Ok(total);
}

Result<std::uint64_t> TransferExecutor::copy_symlink(const volume::Volume& source_volume,
                                                     const ScanEntry& source,
                                                     volume::Volume& destination_volume,
                                                     const fs::path& target,
                                                     bool overwrite) {
    auto link_target = source_volume.read_link(source.source);
    if (link_target.is_error()) {
        return Err<std::uint64_t>(link_target.error());
    }

    const fs::path write_path = overwrite ? temporary_sibling(destination_volume, target) : target;
    auto created = destination_volume.create_symlink(link_target.value(), write_path);
    if (created.is_error()) {
        return Err<std::uint64_t>(created.error());
    }
    transaction_.record_file(write_path);

    if (overwrite) {
        auto replaced = destination_volume.rename(write_path, target, true);
        if (replaced.is_error()) {
            discard_partial(destination_volume, write_path);
            return Err<std::uint64_t>(replaced.error());
        }
    }

    if (on_bytes_) {
        on_bytes_(source.size);
    }
    return Ok(source.size);
}

void TransferExecutor::discard_partial(volume::Volume& volume, const fs::path& path) {
    auto removed = volume.remove(path);
    if (removed.is_error() && !removed.error().is(ErrorKind::SourceNotFound)) {
        spdlog::warn("[Transfer] could not remove partial file path={} error={}",
                     path.string(), removed.error().message());
    }
}

Result<void> delete_item(volume::Volume& volume, const ScanEntry& item) {
    auto removed = volume.remove(item.source);
    if (removed.is_error()) {
        spdlog::warn("[Transfer] delete failed path={} error={}", item.source.string(), removed.error().message());
        return removed;
    }
    return Ok();
}

fs::path temporary_sibling(const volume::Volume& volume, const fs::path& target) {
    static std::atomic<std::uint64_t> counter{0};
    while (true) {
        fs::path candidate = target.parent_path() /
                             (target.filename().string() + ".fops-tmp-" + std::to_string(counter.fetch_add(1)));
        if (!volume.exists(candidate)) {
            return candidate;
        }
    }
}

Result<void> remove_tree(volume::Volume& volume, const fs::path& path) {
    auto root = volume.info(path);
    if (root.is_error()) {
        if (root.error().is(ErrorKind::SourceNotFound)) {
            return Ok();
        }
        return Err<void>(root.error());
    }
    if (root.value().kind != volume::ItemKind::Directory) {
        return volume.remove(path);
    }

    // Pre-order listing; removing it back to front deletes children before parents
    std::vector<fs::path> order;
    std::vector<fs::path> pending{path};
    while (!pending.empty()) {
        fs::path directory = std::move(pending.back());
        pending.pop_back();
        auto listing = volume.list_directory(directory);
        if (listing.is_error()) {
            return Err<void>(listing.error());
        }
        order.push_back(directory);
        for (const auto& child : listing.value()) {
            if (child.info.kind == volume::ItemKind::Directory) {
                pending.push_back(directory / child.name);
            } else {
                order.push_back(directory / child.name);
            }
        }
    }

    for (auto it = order.rbegin(); it != order.rend(); ++it) {
        auto removed = volume.remove(*it);
        if (removed.is_error() && !removed.error().is(ErrorKind::SourceNotFound)) {
            return removed;
        }
    }
    return Ok();
}

} // namespace fops::ops

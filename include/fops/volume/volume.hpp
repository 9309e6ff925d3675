/**
 * @file volume.hpp
 * @brief Item-level capability interface for storage backends
 *
 * WHY THIS FILE EXISTS:
 * The write engine never talks to a filesystem directly. Local disks,
 * removable devices and network shares all sit behind this interface so
 * that scanning, conflict checks and transfers work the same everywhere.
 *
 * WHAT IT PROVIDES:
 * - Existence, metadata and identity lookups (identity drives case-only
 *   rename detection)
 * - Directory listing, rename, create and remove
 * - Streaming read/write for the chunked copy path
 * - An optional native whole-object duplication primitive
 *
 * All paths are absolute paths in the host namespace.
 */

#pragma once

#include "fops/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fops::volume {

enum class ItemKind {
    File,
    Directory,
    Symlink,
    Other     ///< sockets, FIFOs, device nodes
};

struct ItemInfo {
    ItemKind kind = ItemKind::Other;
    std::uint64_t size = 0;
    std::uint32_t mode = 0;  ///< permission bits only
    std::chrono::system_clock::time_point modified{};
};

/**
 * @brief Identifies the underlying object a name refers to
 *
 * Two paths with equal identity are the same object, even when their
 * names differ (hard links, case-insensitive lookups).
 */
struct ItemIdentity {
    std::uint64_t device = 0;
    std::uint64_t inode = 0;

    bool operator==(const ItemIdentity& other) const noexcept {
        return device == other.device && inode == other.inode;
    }
    bool operator!=(const ItemIdentity& other) const noexcept { return !(*this == other); }
};

struct DirectoryEntry {
    std::string name;
    ItemInfo info;
};

struct SpaceInfo {
    std::uint64_t total = 0;
    std::uint64_t available = 0;
};

/// Receives the cumulative byte count; returning false aborts the copy
using ProgressCallback = std::function<bool(std::uint64_t bytes_so_far)>;

class ReadStream {
public:
    virtual ~ReadStream() = default;

    /// Returns 0 at end of file
    virtual Result<std::size_t> read(char* buffer, std::size_t length) = 0;
};

class WriteStream {
public:
    virtual ~WriteStream() = default;

    virtual Result<void> write(const char* data, std::size_t length) = 0;

    /// Apply permission bits and close; the stream is unusable afterwards
    virtual Result<void> finish(std::uint32_t mode) = 0;
};

class Volume {
public:
    virtual ~Volume() = default;

    virtual const std::string& name() const = 0;
    virtual const std::filesystem::path& root() const = 0;

    /// Backends that can duplicate natively between each other share a tag
    virtual std::string backend() const = 0;

    virtual bool case_sensitive() const { return true; }

    /// Does not follow symlinks
    virtual bool exists(const std::filesystem::path& path) const = 0;
    virtual Result<ItemInfo> info(const std::filesystem::path& path) const = 0;
    virtual std::optional<ItemIdentity> identity(const std::filesystem::path& path) const = 0;
    virtual bool is_writable(const std::filesystem::path& path) const = 0;

    /// Resolves every symlink on the way; fails with SymlinkLoopDetected on a cycle
    virtual Result<std::filesystem::path> canonical(const std::filesystem::path& path) const = 0;

    virtual Result<std::vector<DirectoryEntry>> list_directory(const std::filesystem::path& path) const = 0;

    /**
     * @brief Rename within this volume
     *
     * With force == false the call fails with DestinationExists when `to`
     * names a different object. When `to` is the same object as `from`
     * (a letter-case change on a case-insensitive volume) the rename goes
     * ahead regardless. Fails with Unsupported when the two paths turn out
     * to live on different filesystems.
     */
    virtual Result<void> rename(const std::filesystem::path& from,
                                const std::filesystem::path& to,
                                bool force) = 0;

    virtual Result<void> create_directory(const std::filesystem::path& path) = 0;

    /// Removes a file, a symlink or an empty directory
    virtual Result<void> remove(const std::filesystem::path& path) = 0;

    virtual Result<std::string> read_link(const std::filesystem::path& path) const = 0;
    virtual Result<void> create_symlink(const std::string& target, const std::filesystem::path& link) = 0;

    virtual Result<std::unique_ptr<ReadStream>> open_read(const std::filesystem::path& path) const = 0;

    /// Creates a new file; fails with DestinationExists if the name is taken
    virtual Result<std::unique_ptr<WriteStream>> create_file(const std::filesystem::path& path) = 0;

    virtual Result<SpaceInfo> space_info(const std::filesystem::path& path) const = 0;

    /**
     * @brief Push data written under `path` to stable storage
     *
     * Called once after an operation succeeded. Backends without a
     * write cache keep the default no-op.
     */
    virtual Result<void> flush(const std::filesystem::path& path) {
        (void)path;
        return Ok();
    }

    virtual bool supports_native_duplicate() const { return false; }

    /**
     * @brief Duplicate `source` into an already created destination stream
     *
     * Preserves extended attributes and access-control metadata and uses
     * copy-on-write where the filesystem offers it. Returns Unsupported
     * without writing anything when the primitive cannot be used for this
     * pair, in which case the caller streams the bytes itself.
     */
    virtual Result<std::uint64_t> native_duplicate(const std::filesystem::path& source,
                                                   WriteStream& destination,
                                                   const ProgressCallback& progress) {
        (void)source;
        (void)destination;
        (void)progress;
        return Err<std::uint64_t>(Error::unsupported("native duplication"));
    }
};

} // namespace fops::volume

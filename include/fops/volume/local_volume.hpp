#pragma once

#include "fops/volume/volume.hpp"

#include <filesystem>
#include <string>

namespace fops::volume {

/**
 * @brief POSIX filesystem backend
 *
 * Native duplication tries a copy-on-write clone (FICLONE) first, then a
 * kernel-side copy_file_range loop, and carries extended attributes
 * (which include POSIX ACLs), permission bits and timestamps over.
 */
class LocalVolume : public Volume {
public:
    static constexpr std::size_t kNativeStepBytes = 8 * 1024 * 1024;

    LocalVolume(std::string name, std::filesystem::path root);

    const std::string& name() const override { return name_; }
    const std::filesystem::path& root() const override { return root_; }
    std::string backend() const override { return "local"; }

    bool exists(const std::filesystem::path& path) const override;
    Result<ItemInfo> info(const std::filesystem::path& path) const override;
    std::optional<ItemIdentity> identity(const std::filesystem::path& path) const override;
    bool is_writable(const std::filesystem::path& path) const override;
    Result<std::filesystem::path> canonical(const std::filesystem::path& path) const override;
    Result<std::vector<DirectoryEntry>> list_directory(const std::filesystem::path& path) const override;

    Result<void> rename(const std::filesystem::path& from,
                        const std::filesystem::path& to,
                        bool force) override;
    Result<void> create_directory(const std::filesystem::path& path) override;
    Result<void> remove(const std::filesystem::path& path) override;

    Result<std::string> read_link(const std::filesystem::path& path) const override;
    Result<void> create_symlink(const std::string& target, const std::filesystem::path& link) override;

    Result<std::unique_ptr<ReadStream>> open_read(const std::filesystem::path& path) const override;
    Result<std::unique_ptr<WriteStream>> create_file(const std::filesystem::path& path) override;

    Result<SpaceInfo> space_info(const std::filesystem::path& path) const override;

    /// syncfs(2) on the filesystem holding `path`
    Result<void> flush(const std::filesystem::path& path) override;

    bool supports_native_duplicate() const override { return true; }
    Result<std::uint64_t> native_duplicate(const std::filesystem::path& source,
                                           WriteStream& destination,
                                           const ProgressCallback& progress) override;

private:
    std::string name_;
    std::filesystem::path root_;
};

} // namespace fops::volume

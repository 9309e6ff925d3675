#include "fops/volume/local_volume.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/xattr.h>
#include <unistd.h>

namespace fops::volume {
namespace fs = std::filesystem;

namespace {

ItemKind kind_from_mode(mode_t mode) {
    if (S_ISREG(mode)) {
        return ItemKind::File;
    }
    if (S_ISDIR(mode)) {
        return ItemKind::Directory;
    }
    if (S_ISLNK(mode)) {
        return ItemKind::Symlink;
    }
    return ItemKind::Other;
}

ItemInfo info_from_stat(const struct stat& st) {
    ItemInfo info;
    info.kind = kind_from_mode(st.st_mode);
    info.size = static_cast<std::uint64_t>(st.st_size);
    info.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
    info.modified = std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::seconds{st.st_mtim.tv_sec} + std::chrono::nanoseconds{st.st_mtim.tv_nsec})};
    return info;
}

class LocalReadStream : public ReadStream {
public:
    LocalReadStream(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}
    ~LocalReadStream() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    LocalReadStream(const LocalReadStream&) = delete;
    LocalReadStream& operator=(const LocalReadStream&) = delete;

    Result<std::size_t> read(char* buffer, std::size_t length) override {
        while (true) {
            const ssize_t n = ::read(fd_, buffer, length);
            if (n >= 0) {
                return Ok(static_cast<std::size_t>(n));
            }
            if (errno != EINTR) {
                return Err<std::size_t>(Error::from_errno(errno, path_));
            }
        }
    }

    int fd() const noexcept { return fd_; }

private:
    int fd_;
    fs::path path_;
};

class LocalWriteStream : public WriteStream {
public:
    LocalWriteStream(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}
    ~LocalWriteStream() override {
        if (fd_ >= 0) {
            ::close(fd_);
        }
    }

    LocalWriteStream(const LocalWriteStream&) = delete;
    LocalWriteStream& operator=(const LocalWriteStream&) = delete;

    Result<void> write(const char* data, std::size_t length) override {
        if (fd_ < 0) {
            return Err<void>(Error::io_error(path_, "stream already finished"));
        }
        while (length > 0) {
            const ssize_t n = ::write(fd_, data, length);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                return Err<void>(Error::from_errno(errno, path_));
            }
            data += n;
            length -= static_cast<std::size_t>(n);
        }
        return Ok();
    }

    Result<void> finish(std::uint32_t mode) override {
        if (fd_ < 0) {
            return Err<void>(Error::io_error(path_, "stream already finished"));
        }
        if (::fchmod(fd_, static_cast<mode_t>(mode & 07777)) != 0) {
            spdlog::warn("[LocalVolume] chmod failed path={} error={}", path_.string(), std::strerror(errno));
        }
        const int rc = ::close(fd_);
        fd_ = -1;
        if (rc != 0) {
            return Err<void>(Error::from_errno(errno, path_));
        }
        return Ok();
    }

    int fd() const noexcept { return fd_; }
    const fs::path& path() const noexcept { return path_; }

private:
    int fd_;
    fs::path path_;
};

// Extended attributes carry POSIX ACLs (system.posix_acl_access) on Linux.
void copy_xattrs(int source_fd, int dest_fd, const fs::path& source) {
    const ssize_t list_size = ::flistxattr(source_fd, nullptr, 0);
    if (list_size <= 0) {
        return;
    }
    std::vector<char> names(static_cast<std::size_t>(list_size));
    const ssize_t got = ::flistxattr(source_fd, names.data(), names.size());
    if (got <= 0) {
        return;
    }

    std::vector<char> value;
    for (const char* name = names.data(); name < names.data() + got; name += std::strlen(name) + 1) {
        const ssize_t value_size = ::fgetxattr(source_fd, name, nullptr, 0);
        if (value_size < 0) {
            continue;
        }
        value.resize(static_cast<std::size_t>(value_size));
        if (value_size > 0 && ::fgetxattr(source_fd, name, value.data(), value.size()) < 0) {
            continue;
        }
        if (::fsetxattr(dest_fd, name, value.data(), value.size(), 0) != 0) {
            spdlog::debug("[LocalVolume] xattr not preserved path={} name={} error={}",
                          source.string(), name, std::strerror(errno));
        }
    }
}

bool is_unsupported_copy_errno(int err) {
    return err == EXDEV || err == ENOSYS || err == EINVAL || err == EOPNOTSUPP || err == EBADF;
}

} // namespace

LocalVolume::LocalVolume(std::string name, fs::path root)
    : name_(std::move(name)), root_(std::move(root)) {}

bool LocalVolume::exists(const fs::path& path) const {
    struct stat st {};
    return ::lstat(path.c_str(), &st) == 0;
}

Result<ItemInfo> LocalVolume::info(const fs::path& path) const {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        return Err<ItemInfo>(Error::from_errno(errno, path));
    }
    return Ok(info_from_stat(st));
}

std::optional<ItemIdentity> LocalVolume::identity(const fs::path& path) const {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    return ItemIdentity{static_cast<std::uint64_t>(st.st_dev), static_cast<std::uint64_t>(st.st_ino)};
}

bool LocalVolume::is_writable(const fs::path& path) const {
    return ::access(path.c_str(), W_OK) == 0;
}

Result<fs::path> LocalVolume::canonical(const fs::path& path) const {
    std::error_code ec;
    auto resolved = fs::canonical(path, ec);
    if (ec) {
        return Err<fs::path>(Error::from_error_code(ec, path));
    }
    return Ok(std::move(resolved));
}

Result<std::vector<DirectoryEntry>> LocalVolume::list_directory(const fs::path& path) const {
    std::error_code ec;
    fs::directory_iterator it(path, ec);
    if (ec) {
        return Err<std::vector<DirectoryEntry>>(Error::from_error_code(ec, path));
    }

    std::vector<DirectoryEntry> entries;
    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Err<std::vector<DirectoryEntry>>(Error::from_error_code(ec, path));
        }
        auto entry_info = info(it->path());
        if (entry_info.is_error()) {
            // Removed between readdir and lstat
            if (entry_info.error().is(ErrorKind::SourceNotFound)) {
                continue;
            }
            return Err<std::vector<DirectoryEntry>>(entry_info.error());
        }
        entries.push_back(DirectoryEntry{it->path().filename().string(), entry_info.value()});
    }
    if (ec) {
        return Err<std::vector<DirectoryEntry>>(Error::from_error_code(ec, path));
    }

    std::sort(entries.begin(), entries.end(), [](const DirectoryEntry& a, const DirectoryEntry& b) {
        return a.name < b.name;
    });
    return Ok(std::move(entries));
}

Result<void> LocalVolume::rename(const fs::path& from, const fs::path& to, bool force) {
    if (!force && exists(to)) {
        const auto from_id = identity(from);
        const auto to_id = identity(to);
        if (!from_id || !to_id || *from_id != *to_id) {
            return Err<void>(Error::destination_exists(to));
        }
    }
    if (::rename(from.c_str(), to.c_str()) != 0) {
        const int err = errno;
        if (err == ENOENT && !exists(from)) {
            return Err<void>(Error::source_not_found(from));
        }
        if (err == EXDEV) {
            return Err<void>(Error::unsupported("cross-device rename of " + from.string()));
        }
        return Err<void>(Error::from_errno(err, to));
    }
    return Ok();
}

Result<void> LocalVolume::create_directory(const fs::path& path) {
    if (::mkdir(path.c_str(), 0777) != 0) {
        return Err<void>(Error::from_errno(errno, path));
    }
    return Ok();
}

Result<void> LocalVolume::remove(const fs::path& path) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        return Err<void>(Error::from_errno(errno, path));
    }
    const int rc = S_ISDIR(st.st_mode) ? ::rmdir(path.c_str()) : ::unlink(path.c_str());
    if (rc != 0) {
        return Err<void>(Error::from_errno(errno, path));
    }
    return Ok();
}

Result<std::string> LocalVolume::read_link(const fs::path& path) const {
    std::error_code ec;
    auto target = fs::read_symlink(path, ec);
    if (ec) {
        return Err<std::string>(Error::from_error_code(ec, path));
    }
    return Ok(target.string());
}

Result<void> LocalVolume::create_symlink(const std::string& target, const fs::path& link) {
    if (::symlink(target.c_str(), link.c_str()) != 0) {
        return Err<void>(Error::from_errno(errno, link));
    }
    return Ok();
}

Result<std::unique_ptr<ReadStream>> LocalVolume::open_read(const fs::path& path) const {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Err<std::unique_ptr<ReadStream>>(Error::from_errno(errno, path));
    }
    return Ok<std::unique_ptr<ReadStream>>(std::make_unique<LocalReadStream>(fd, path));
}

Result<std::unique_ptr<WriteStream>> LocalVolume::create_file(const fs::path& path) {
    const int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Err<std::unique_ptr<WriteStream>>(Error::from_errno(errno, path));
    }
    return Ok<std::unique_ptr<WriteStream>>(std::make_unique<LocalWriteStream>(fd, path));
}

Result<SpaceInfo> LocalVolume::space_info(const fs::path& path) const {
    struct statvfs vfs {};
    if (::statvfs(path.c_str(), &vfs) != 0) {
        return Err<SpaceInfo>(Error::from_errno(errno, path));
    }
    SpaceInfo space;
    space.total = static_cast<std::uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    space.available = static_cast<std::uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    return Ok(space);
}

Result<void> LocalVolume::flush(const fs::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return Err<void>(Error::from_errno(errno, path));
    }
    const int rc = ::syncfs(fd);
    const int err = errno;
    ::close(fd);
    if (rc != 0) {
        return Err<void>(Error::from_errno(err, path));
    }
    spdlog::debug("[LocalVolume] flushed filesystem path={}", path.string());
    return Ok();
}

Result<std::uint64_t> LocalVolume::native_duplicate(const fs::path& source,
                                                    WriteStream& destination,
                                                    const ProgressCallback& progress) {
    auto* local_dest = dynamic_cast<LocalWriteStream*>(&destination);
    if (local_dest == nullptr || local_dest->fd() < 0) {
        return Err<std::uint64_t>(Error::unsupported("destination is not a local file"));
    }
    const int dest_fd = local_dest->fd();

    const int source_fd = ::open(source.c_str(), O_RDONLY | O_CLOEXEC);
    if (source_fd < 0) {
        return Err<std::uint64_t>(Error::from_errno(errno, source));
    }
    LocalReadStream source_guard(source_fd, source);

    struct stat st {};
    if (::fstat(source_fd, &st) != 0) {
        return Err<std::uint64_t>(Error::from_errno(errno, source));
    }
    const auto size = static_cast<std::uint64_t>(st.st_size);

    std::uint64_t copied = 0;
    if (::ioctl(dest_fd, FICLONE, source_fd) == 0) {
        copied = size;
        spdlog::debug("[LocalVolume] cloned path={} bytes={}", source.string(), size);
        if (progress && !progress(copied)) {
            return Err<std::uint64_t>(Error::cancelled());
        }
    } else {
        while (copied < size) {
            const auto step = static_cast<std::size_t>(std::min<std::uint64_t>(kNativeStepBytes, size - copied));
            const ssize_t n = ::copy_file_range(source_fd, nullptr, dest_fd, nullptr, step, 0);
            if (n < 0) {
                const int err = errno;
                if (err == EINTR) {
                    continue;
                }
                if (copied == 0 && is_unsupported_copy_errno(err)) {
                    return Err<std::uint64_t>(Error::unsupported(std::strerror(err)));
                }
                return Err<std::uint64_t>(Error::from_errno(err, local_dest->path()));
            }
            if (n == 0) {
                break;
            }
            copied += static_cast<std::uint64_t>(n);
            if (progress && !progress(copied)) {
                return Err<std::uint64_t>(Error::cancelled());
            }
        }
    }

    copy_xattrs(source_fd, dest_fd, source);

    const struct timespec times[2] = {st.st_atim, st.st_mtim};
    if (::futimens(dest_fd, times) != 0) {
        spdlog::debug("[LocalVolume] timestamps not preserved path={} error={}",
                      source.string(), std::strerror(errno));
    }
    return Ok(copied);
}

} // namespace fops::volume

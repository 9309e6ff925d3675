#include "fops/core/error.hpp"

#include <cerrno>
#include <cstring>
#include <iomanip>
#include <sstream>

namespace fops {
namespace fs = std::filesystem;

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::SourceNotFound: return "sourceNotFound";
        case ErrorKind::DestinationExists: return "destinationExists";
        case ErrorKind::PermissionDenied: return "permissionDenied";
        case ErrorKind::InsufficientSpace: return "insufficientSpace";
        case ErrorKind::SameLocation: return "sameLocation";
        case ErrorKind::DestinationInsideSource: return "destinationInsideSource";
        case ErrorKind::SymlinkLoopDetected: return "symlinkLoopDetected";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::IoError: return "ioError";
        case ErrorKind::NotFound: return "notFound";
        case ErrorKind::Unsupported: return "unsupported";
        case ErrorKind::InvalidArgument: return "invalidArgument";
    }
    return "unknown";
}

std::string Error::message() const {
    switch (kind) {
        case ErrorKind::SourceNotFound:
            return "Cannot find \"" + path + "\". It may have been moved or deleted.";
        case ErrorKind::DestinationExists:
            return "\"" + fs::path(path).filename().string() + "\" already exists at the destination.";
        case ErrorKind::PermissionDenied:
            return "Cannot write to \"" + path + "\": permission denied.";
        case ErrorKind::InsufficientSpace:
            return "Not enough space on " + (volume.empty() ? std::string("the destination") : volume) +
                   ". Need " + format_bytes(required) + ", but only " + format_bytes(available) + " available.";
        case ErrorKind::SameLocation:
            return "\"" + path + "\" is already in this location.";
        case ErrorKind::DestinationInsideSource:
            return "Cannot copy \"" + path + "\" into itself.";
        case ErrorKind::SymlinkLoopDetected:
            return "Symlink loop detected at \"" + path + "\". Cannot continue.";
        case ErrorKind::Cancelled:
            return "Operation was cancelled.";
        case ErrorKind::IoError:
            if (path.empty()) {
                return "An error occurred: " + detail;
            }
            return "Error with \"" + path + "\": " + detail;
        case ErrorKind::NotFound:
            return "No operation with id \"" + path + "\".";
        case ErrorKind::Unsupported:
            return "Not supported: " + detail;
        case ErrorKind::InvalidArgument:
            return "Invalid argument: " + detail;
    }
    return detail;
}

Error Error::source_not_found(const fs::path& path) {
    Error e;
    e.kind = ErrorKind::SourceNotFound;
    e.path = path.string();
    return e;
}

Error Error::destination_exists(const fs::path& path) {
    Error e;
    e.kind = ErrorKind::DestinationExists;
    e.path = path.string();
    return e;
}

Error Error::permission_denied(const fs::path& path, std::string detail) {
    Error e;
    e.kind = ErrorKind::PermissionDenied;
    e.path = path.string();
    e.detail = std::move(detail);
    return e;
}

Error Error::insufficient_space(std::uint64_t required, std::uint64_t available, std::string volume) {
    Error e;
    e.kind = ErrorKind::InsufficientSpace;
    e.required = required;
    e.available = available;
    e.volume = std::move(volume);
    return e;
}

Error Error::same_location(const fs::path& path) {
    Error e;
    e.kind = ErrorKind::SameLocation;
    e.path = path.string();
    return e;
}

Error Error::destination_inside_source(const fs::path& source, const fs::path& destination) {
    Error e;
    e.kind = ErrorKind::DestinationInsideSource;
    e.path = source.string();
    e.other_path = destination.string();
    return e;
}

Error Error::symlink_loop(const fs::path& path) {
    Error e;
    e.kind = ErrorKind::SymlinkLoopDetected;
    e.path = path.string();
    return e;
}

Error Error::cancelled(std::string detail) {
    Error e;
    e.kind = ErrorKind::Cancelled;
    e.detail = std::move(detail);
    return e;
}

Error Error::io_error(const fs::path& path, std::string detail) {
    Error e;
    e.kind = ErrorKind::IoError;
    e.path = path.string();
    e.detail = std::move(detail);
    return e;
}

Error Error::not_found(const std::string& operation_id) {
    Error e;
    e.kind = ErrorKind::NotFound;
    e.path = operation_id;
    return e;
}

Error Error::unsupported(std::string detail) {
    Error e;
    e.kind = ErrorKind::Unsupported;
    e.detail = std::move(detail);
    return e;
}

Error Error::invalid_argument(std::string detail) {
    Error e;
    e.kind = ErrorKind::InvalidArgument;
    e.detail = std::move(detail);
    return e;
}

Error Error::from_errno(int err, const fs::path& path) {
    switch (err) {
        case ENOENT:
            return source_not_found(path);
        case EEXIST:
            return destination_exists(path);
        case EACCES:
        case EPERM:
        case EROFS:
            return permission_denied(path, std::strerror(err));
        case ELOOP:
            return symlink_loop(path);
        case ENOSPC:
        case EDQUOT: {
            Error e = insufficient_space(0, 0, {});
            e.path = path.string();
            e.detail = std::strerror(err);
            return e;
        }
        default:
            return io_error(path, std::strerror(err));
    }
}

Error Error::from_error_code(const std::error_code& ec, const fs::path& path) {
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        return from_errno(ec.value(), path);
    }
    return io_error(path, ec.message());
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t kKB = 1024;
    constexpr std::uint64_t kMB = kKB * 1024;
    constexpr std::uint64_t kGB = kMB * 1024;
    constexpr std::uint64_t kTB = kGB * 1024;

    if (bytes < kKB) {
        return std::to_string(bytes) + " bytes";
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1);
    if (bytes >= kTB) {
        oss << static_cast<double>(bytes) / kTB << " TB";
    } else if (bytes >= kGB) {
        oss << static_cast<double>(bytes) / kGB << " GB";
    } else if (bytes >= kMB) {
        oss << static_cast<double>(bytes) / kMB << " MB";
    } else {
        oss << static_cast<double>(bytes) / kKB << " KB";
    }
    return oss.str();
}

} // namespace fops

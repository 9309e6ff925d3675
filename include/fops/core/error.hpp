/**
 * @file error.hpp
 * @brief Error taxonomy shared by every write operation
 *
 * WHY THIS FILE EXISTS:
 * Copy, move and delete can fail in a small number of ways the host must
 * tell apart (show a conflict dialog, ask for more space, say nothing on
 * cancel). Each variant carries the context needed to render a message
 * the user can act on.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <system_error>

namespace fops {

enum class ErrorKind {
    SourceNotFound,
    DestinationExists,
    PermissionDenied,
    InsufficientSpace,
    SameLocation,
    DestinationInsideSource,
    SymlinkLoopDetected,
    Cancelled,
    IoError,
    NotFound,         ///< Unknown or already retired operation id
    Unsupported,      ///< Optional backend capability is unavailable
    InvalidArgument
};

const char* to_string(ErrorKind kind) noexcept;

/**
 * @brief A failure with enough context to explain it to a user
 *
 * Only the fields relevant to `kind` are populated:
 * - path: the offending item (source, destination or operation id)
 * - other_path: the second path for DestinationInsideSource
 * - detail: OS message or free-form reason
 * - required / available / volume: InsufficientSpace
 */
struct Error {
    ErrorKind kind = ErrorKind::IoError;
    std::string path;
    std::string other_path;
    std::string detail;
    std::uint64_t required = 0;
    std::uint64_t available = 0;
    std::string volume;

    /// Human-readable message for dialogs and logs
    std::string message() const;

    bool is(ErrorKind k) const noexcept { return kind == k; }

    static Error source_not_found(const std::filesystem::path& path);
    static Error destination_exists(const std::filesystem::path& path);
    static Error permission_denied(const std::filesystem::path& path, std::string detail);
    static Error insufficient_space(std::uint64_t required, std::uint64_t available, std::string volume);
    static Error same_location(const std::filesystem::path& path);
    static Error destination_inside_source(const std::filesystem::path& source,
                                           const std::filesystem::path& destination);
    static Error symlink_loop(const std::filesystem::path& path);
    static Error cancelled(std::string detail = "Operation cancelled by user");
    static Error io_error(const std::filesystem::path& path, std::string detail);
    static Error not_found(const std::string& operation_id);
    static Error unsupported(std::string detail);
    static Error invalid_argument(std::string detail);

    /// Map an errno value raised while touching `path` onto the taxonomy
    static Error from_errno(int err, const std::filesystem::path& path);
    static Error from_error_code(const std::error_code& ec, const std::filesystem::path& path);
};

/// Format a byte count as "1.50 MB" style text
std::string format_bytes(std::uint64_t bytes);

} // namespace fops

#include "fops/core/error.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <system_error>

using fops::Error;
using fops::ErrorKind;
using fops::format_bytes;

TEST(ErrorTest, MapsErrnoToKinds) {
    EXPECT_EQ(Error::from_errno(ENOENT, "/a").kind, ErrorKind::SourceNotFound);
    EXPECT_EQ(Error::from_errno(EEXIST, "/a").kind, ErrorKind::DestinationExists);
    EXPECT_EQ(Error::from_errno(EACCES, "/a").kind, ErrorKind::PermissionDenied);
    EXPECT_EQ(Error::from_errno(EPERM, "/a").kind, ErrorKind::PermissionDenied);
    EXPECT_EQ(Error::from_errno(EROFS, "/a").kind, ErrorKind::PermissionDenied);
    EXPECT_EQ(Error::from_errno(ELOOP, "/a").kind, ErrorKind::SymlinkLoopDetected);
    EXPECT_EQ(Error::from_errno(ENOSPC, "/a").kind, ErrorKind::InsufficientSpace);
    EXPECT_EQ(Error::from_errno(EIO, "/a").kind, ErrorKind::IoError);
}

TEST(ErrorTest, MapsErrorCodes) {
    auto error = Error::from_error_code(std::make_error_code(std::errc::permission_denied), "/locked");
    EXPECT_TRUE(error.is(ErrorKind::PermissionDenied));
    EXPECT_EQ(error.path, "/locked");
}

TEST(ErrorTest, MessagesNameTheProblem) {
    EXPECT_EQ(Error::source_not_found("/home/a.txt").message(),
              "Cannot find \"/home/a.txt\". It may have been moved or deleted.");
    EXPECT_EQ(Error::destination_exists("/dst/a.txt").message(),
              "\"a.txt\" already exists at the destination.");
    EXPECT_EQ(Error::insufficient_space(2048, 1024, "Backup").message(),
              "Not enough space on Backup. Need 2.0 KB, but only 1.0 KB available.");
    EXPECT_EQ(Error::cancelled().message(), "Operation was cancelled.");
    EXPECT_EQ(Error::io_error("/x", "disk on fire").message(), "Error with \"/x\": disk on fire");
    EXPECT_EQ(Error::not_found("op-9").message(), "No operation with id \"op-9\".");
}

TEST(ErrorTest, DestinationInsideSourceKeepsBothPaths) {
    auto error = Error::destination_inside_source("/photos", "/photos/2024");
    EXPECT_EQ(error.path, "/photos");
    EXPECT_EQ(error.other_path, "/photos/2024");
    EXPECT_STREQ(fops::to_string(error.kind), "destinationInsideSource");
}

TEST(ErrorTest, FormatBytesPicksUnit) {
    EXPECT_EQ(format_bytes(0), "0 bytes");
    EXPECT_EQ(format_bytes(1023), "1023 bytes");
    EXPECT_EQ(format_bytes(1536), "1.5 KB");
    EXPECT_EQ(format_bytes(5ull * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(format_bytes(3ull * 1024 * 1024 * 1024), "3.0 GB");
    EXPECT_EQ(format_bytes(2ull * 1024 * 1024 * 1024 * 1024), "2.0 TB");
}

#include "fops/ops/validation.hpp"
#include "fops/volume/local_volume.hpp"
#include "fops/volume/manager.hpp"
#include "support/fake_volume.hpp"
#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

namespace fs = std::filesystem;
using namespace fops::ops;
using fops::ErrorKind;
using fops::testing::create_temp_dir;
using fops::testing::FakeVolume;
using fops::testing::write_file;
using fops::volume::VolumeManager;

namespace {

StartRequest request_for(OperationKind kind, std::vector<fs::path> sources, fs::path destination) {
    StartRequest request;
    request.kind = kind;
    request.sources = std::move(sources);
    request.destination = std::move(destination);
    return request;
}

ErrorKind rejection(const VolumeManager& volumes, const StartRequest& request) {
    auto result = validate_request(volumes, request);
    EXPECT_TRUE(result.is_error());
    return result.is_error() ? result.error().kind : ErrorKind::InvalidArgument;
}

} // namespace

TEST(ValidationTest, AcceptsPlainCopy) {
    const auto dir = create_temp_dir("fops_validate");
    write_file(dir / "src" / "a.txt", "a");
    fs::create_directories(dir / "dst");
    VolumeManager volumes;

    EXPECT_TRUE(validate_request(volumes, request_for(OperationKind::Copy, {dir / "src" / "a.txt"}, dir / "dst")).is_ok());
}

TEST(ValidationTest, RejectsEmptySourceList) {
    const auto dir = create_temp_dir("fops_validate");
    VolumeManager volumes;
    EXPECT_EQ(rejection(volumes, request_for(OperationKind::Copy, {}, dir)), ErrorKind::InvalidArgument);
}

TEST(ValidationTest, RejectsMissingSourceAndDestination) {
    const auto dir = create_temp_dir("fops_validate");
    write_file(dir / "a.txt", "a");
    VolumeManager volumes;

    EXPECT_EQ(rejection(volumes, request_for(OperationKind::Copy, {dir / "gone.txt"}, dir)),
              ErrorKind::SourceNotFound);
    EXPECT_EQ(rejection(volumes, request_for(OperationKind::Move, {dir / "a.txt"}, dir / "nowhere")),
              ErrorKind::SourceNotFound);
    EXPECT_EQ(rejection(volumes, request_for(OperationKind::Delete, {dir / "gone.txt"}, {})),
              ErrorKind::SourceNotFound);
}

TEST(ValidationTest, DeleteIgnoresDestination) {
    const auto dir = create_temp_dir("fops_validate");
    write_file(dir / "a.txt", "a");
    VolumeManager volumes;

    EXPECT_TRUE(validate_request(volumes, request_for(OperationKind::Delete, {dir / "a.txt"}, {})).is_ok());
}

TEST(ValidationTest, RejectsFileAsDestination) {
    const auto dir = create_temp_dir("fops_validate");
    write_file(dir / "src" / "a.txt", "a");
    write_file(dir / "target.txt", "t");
    VolumeManager volumes;

    auto result = validate_request(volumes, request_for(OperationKind::Copy, {dir / "src" / "a.txt"}, dir / "target.txt"));
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::IoError));
    EXPECT_EQ(result.error().detail, "Destination is not a folder");
}

TEST(ValidationTest, RejectsSameLocation) {
    const auto dir = create_temp_dir("fops_validate");
    write_file(dir / "a.txt", "a");
    VolumeManager volumes;

    EXPECT_EQ(rejection(volumes, request_for(OperationKind::Copy, {dir / "a.txt"}, dir)), ErrorKind::SameLocation);
    EXPECT_EQ(rejection(volumes, request_for(OperationKind::Move, {dir / "a.txt"}, normalize_path(dir / "."))),
              ErrorKind::SameLocation);
}

TEST(ValidationTest, RejectsDestinationInsideSource) {
    const auto dir = create_temp_dir("fops_validate");
    fs::create_directories(dir / "src" / "tree" / "deep");
    VolumeManager volumes;

    EXPECT_EQ(rejection(volumes, request_for(OperationKind::Copy, {dir / "src" / "tree"}, dir / "src" / "tree" / "deep")),
              ErrorKind::DestinationInsideSource);
    EXPECT_EQ(rejection(volumes, request_for(OperationKind::Move, {dir / "src" / "tree"}, dir / "src" / "tree")),
              ErrorKind::DestinationInsideSource);
}

TEST(ValidationTest, DestinationInsideSourceSeesThroughSymlinks) {
    const auto dir = create_temp_dir("fops_validate");
    fs::create_directories(dir / "src" / "tree" / "deep");
    fs::create_directory_symlink(dir / "src" / "tree" / "deep", dir / "shortcut");
    VolumeManager volumes;

    EXPECT_EQ(rejection(volumes, request_for(OperationKind::Copy, {dir / "src" / "tree"}, dir / "shortcut")),
              ErrorKind::DestinationInsideSource);
}

TEST(ValidationTest, SiblingWithCommonPrefixIsNotInside) {
    const auto dir = create_temp_dir("fops_validate");
    fs::create_directories(dir / "src" / "tree");
    fs::create_directories(dir / "src" / "tree-copy");
    VolumeManager volumes;

    EXPECT_TRUE(validate_request(volumes, request_for(OperationKind::Copy, {dir / "src" / "tree"}, dir / "src" / "tree-copy")).is_ok());
}

TEST(ValidationTest, NormalizePathDropsTrailingSeparator) {
    EXPECT_EQ(normalize_path("/a/b/"), fs::path("/a/b"));
    EXPECT_EQ(normalize_path("/a/./b/../c"), fs::path("/a/c"));
    EXPECT_EQ(normalize_path("/"), fs::path("/"));
}

TEST(ValidationTest, AncestorMatchesWholeComponents) {
    EXPECT_TRUE(is_ancestor_or_self("/a/b", "/a/b"));
    EXPECT_TRUE(is_ancestor_or_self("/a/b", "/a/b/c/d"));
    EXPECT_TRUE(is_ancestor_or_self("/a/b/", "/a/b/c"));
    EXPECT_FALSE(is_ancestor_or_self("/a/b", "/a/bc"));
    EXPECT_FALSE(is_ancestor_or_self("/a/b/c", "/a/b"));
}

TEST(ValidationTest, NameRules) {
    EXPECT_TRUE(validate_name("report.txt").is_ok());
    EXPECT_TRUE(validate_name("").error().is(ErrorKind::InvalidArgument));
    EXPECT_TRUE(validate_name(".").error().is(ErrorKind::InvalidArgument));
    EXPECT_TRUE(validate_name("..").error().is(ErrorKind::InvalidArgument));
    EXPECT_TRUE(validate_name("a/b").error().is(ErrorKind::InvalidArgument));
    EXPECT_TRUE(validate_name(std::string("a\0b", 3)).error().is(ErrorKind::InvalidArgument));
    EXPECT_TRUE(validate_name(std::string(kMaxNameLength, 'n')).is_ok());
    EXPECT_TRUE(validate_name(std::string(kMaxNameLength + 1, 'n')).error().is(ErrorKind::InvalidArgument));
}

TEST(ValidationTest, DiskSpaceCheck) {
    const auto dir = create_temp_dir("fops_validate");
    FakeVolume::Options options;
    options.available_bytes = 1024;
    FakeVolume volume("USB Stick", dir, options);

    EXPECT_TRUE(validate_disk_space(volume, dir, 1024).is_ok());

    auto result = validate_disk_space(volume, dir, 4096);
    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::InsufficientSpace));
    EXPECT_EQ(result.error().message(), "Not enough space on USB Stick. Need 4.0 KB, but only 1.0 KB available.");
}

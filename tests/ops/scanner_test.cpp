#include "fops/ops/scanner.hpp"
#include "fops/volume/manager.hpp"
#include "support/fake_volume.hpp"
#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace fops::ops;
using fops::ErrorKind;
using fops::testing::create_temp_dir;
using fops::testing::FakeVolume;
using fops::testing::write_file;
using fops::volume::ItemKind;
using fops::volume::VolumeManager;

TEST(ScannerTest, WalksTreeInPreOrderByName) {
    const auto dir = create_temp_dir("fops_scan");
    write_file(dir / "tree" / "b.txt", "bb");
    write_file(dir / "tree" / "a" / "inner.txt", "iii");
    write_file(dir / "tree" / "c.txt", "c");

    VolumeManager volumes;
    Scanner scanner(volumes);
    auto scan = scanner.scan({dir / "tree"});

    ASSERT_TRUE(scan.is_ok()) << scan.error().message();
    const auto& result = scan.value();
    ASSERT_EQ(result.entries.size(), 5u);
    EXPECT_EQ(result.entries[0].relative, fs::path("tree"));
    EXPECT_EQ(result.entries[1].relative, fs::path("tree/a"));
    EXPECT_EQ(result.entries[2].relative, fs::path("tree/a/inner.txt"));
    EXPECT_EQ(result.entries[3].relative, fs::path("tree/b.txt"));
    EXPECT_EQ(result.entries[4].relative, fs::path("tree/c.txt"));

    EXPECT_EQ(result.file_count, 3u);
    EXPECT_EQ(result.directory_count, 2u);
    EXPECT_EQ(result.total_bytes, 6u);
    EXPECT_EQ(result.item_count(), 5u);
}

TEST(ScannerTest, VisitsSiblingsInConfiguredOrder) {
    const auto dir = create_temp_dir("fops_scan");
    write_file(dir / "tree" / "a.txt", "aaa");
    write_file(dir / "tree" / "b.txt", "b");
    write_file(dir / "tree" / "c.txt", "cc");

    VolumeManager volumes;
    OperationConfig config;
    config.sort_column = SortColumn::Size;
    config.sort_order = SortOrder::Descending;
    OperationState state("op-1", OperationKind::Copy, config);

    auto scan = Scanner(volumes, &state).scan({dir / "tree"});
    ASSERT_TRUE(scan.is_ok()) << scan.error().message();
    const auto& entries = scan.value().entries;
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].relative, fs::path("tree"));
    EXPECT_EQ(entries[1].relative, fs::path("tree/a.txt"));
    EXPECT_EQ(entries[2].relative, fs::path("tree/c.txt"));
    EXPECT_EQ(entries[3].relative, fs::path("tree/b.txt"));
}

TEST(ScannerTest, SortListingFoldsCaseAndBreaksTiesByName) {
    auto entry = [](std::string name, std::uint64_t size) {
        fops::volume::DirectoryEntry e;
        e.name = std::move(name);
        e.info.kind = ItemKind::File;
        e.info.size = size;
        return e;
    };
    std::vector<fops::volume::DirectoryEntry> listing{entry("b.TXT", 1), entry("C.md", 1), entry("a.txt", 1),
                                                      entry("Makefile", 1)};

    sort_listing(listing, SortColumn::Name, SortOrder::Ascending);
    EXPECT_EQ(listing[0].name, "a.txt");
    EXPECT_EQ(listing[1].name, "b.TXT");
    EXPECT_EQ(listing[2].name, "C.md");
    EXPECT_EQ(listing[3].name, "Makefile");

    // No extension sorts first; equal extensions fall back to the name
    sort_listing(listing, SortColumn::Extension, SortOrder::Ascending);
    EXPECT_EQ(listing[0].name, "Makefile");
    EXPECT_EQ(listing[1].name, "C.md");
    EXPECT_EQ(listing[2].name, "a.txt");
    EXPECT_EQ(listing[3].name, "b.TXT");

    sort_listing(listing, SortColumn::Size, SortOrder::Descending);
    EXPECT_EQ(listing[0].name, "Makefile");
    EXPECT_EQ(listing[3].name, "a.txt");
}

TEST(ScannerTest, TagsEntriesWithTheirRoot) {
    const auto dir = create_temp_dir("fops_scan");
    write_file(dir / "one.txt", "1");
    write_file(dir / "two" / "x.txt", "2");

    VolumeManager volumes;
    auto scan = Scanner(volumes).scan({dir / "one.txt", dir / "two"});

    ASSERT_TRUE(scan.is_ok());
    ASSERT_EQ(scan.value().roots.size(), 2u);
    for (const auto& entry : scan.value().entries) {
        const std::size_t expected = entry.relative.begin()->string() == "one.txt" ? 0 : 1;
        EXPECT_EQ(entry.root_index, expected) << entry.relative;
    }
}

TEST(ScannerTest, MissingRootIsSourceNotFound) {
    const auto dir = create_temp_dir("fops_scan");
    VolumeManager volumes;

    auto scan = Scanner(volumes).scan({dir / "absent"});

    ASSERT_TRUE(scan.is_error());
    EXPECT_TRUE(scan.error().is(ErrorKind::SourceNotFound));
}

TEST(ScannerTest, SymlinkToOwnAncestorIsALoop) {
    const auto dir = create_temp_dir("fops_scan");
    fs::create_directories(dir / "a");
    write_file(dir / "a" / "file.txt", "x");
    fs::create_directory_symlink(".", dir / "a" / "loop");

    VolumeManager volumes;
    auto scan = Scanner(volumes).scan({dir / "a"});

    ASSERT_TRUE(scan.is_error());
    EXPECT_TRUE(scan.error().is(ErrorKind::SymlinkLoopDetected));
}

TEST(ScannerTest, SymlinksAreListedNotFollowed) {
    const auto dir = create_temp_dir("fops_scan");
    write_file(dir / "elsewhere" / "big.bin", std::string(100, 'x'));
    fs::create_directories(dir / "tree");
    fs::create_directory_symlink(dir / "elsewhere", dir / "tree" / "link");
    fs::create_symlink(dir / "nowhere", dir / "tree" / "dangling");

    VolumeManager volumes;
    auto scan = Scanner(volumes).scan({dir / "tree"});

    ASSERT_TRUE(scan.is_ok()) << scan.error().message();
    EXPECT_EQ(scan.value().file_count, 2u);
    EXPECT_EQ(scan.value().directory_count, 1u);
    for (const auto& entry : scan.value().entries) {
        EXPECT_NE(entry.source.filename(), fs::path("big.bin"));
    }
}

TEST(ScannerTest, CancelledScanFails) {
    const auto dir = create_temp_dir("fops_scan");
    write_file(dir / "tree" / "a.txt", "a");

    VolumeManager volumes;
    OperationState state("op-1", OperationKind::Copy, OperationConfig{});
    state.request_cancel(true);

    auto scan = Scanner(volumes, &state).scan({dir / "tree"});
    ASSERT_TRUE(scan.is_error());
    EXPECT_TRUE(scan.error().is(ErrorKind::Cancelled));
}

TEST(ScannerTest, ConflictsMatchNamesCaseInsensitively) {
    const auto dir = create_temp_dir("fops_scan");
    write_file(dir / "src" / "README.md", "new");
    write_file(dir / "src" / "fresh.txt", "f");
    write_file(dir / "dst" / "readme.md", "old");

    VolumeManager volumes;
    FakeVolume::Options options;
    options.case_insensitive = true;
    volumes.register_volume(std::make_shared<FakeVolume>("dst", dir / "dst", options));

    Scanner scanner(volumes);
    auto scan = scanner.scan({dir / "src" / "README.md", dir / "src" / "fresh.txt"});
    ASSERT_TRUE(scan.is_ok());

    auto conflicts = scanner.scan_for_conflicts(scan.value().entries, dir / "dst");
    ASSERT_TRUE(conflicts.is_ok()) << conflicts.error().message();
    ASSERT_EQ(conflicts.value().size(), 1u);
    EXPECT_EQ(conflicts.value()[0].source_path, dir / "src" / "README.md");
    EXPECT_EQ(conflicts.value()[0].destination_path, dir / "dst" / "readme.md");
    EXPECT_EQ(conflicts.value()[0].source_size, 3u);
}

TEST(ScannerTest, FindsConflictsInsideMergedFolders) {
    const auto dir = create_temp_dir("fops_scan");
    write_file(dir / "src" / "docs" / "a.txt", "a");
    write_file(dir / "src" / "docs" / "sub" / "b.txt", "b");
    write_file(dir / "src" / "docs" / "c.txt", "c");
    write_file(dir / "dst" / "docs" / "a.txt", "old");
    write_file(dir / "dst" / "docs" / "sub" / "b.txt", "old");

    VolumeManager volumes;
    Scanner scanner(volumes);
    auto scan = scanner.scan({dir / "src" / "docs"});
    ASSERT_TRUE(scan.is_ok());

    auto conflicts = scanner.scan_all_conflicts(scan.value(), dir / "dst");
    ASSERT_TRUE(conflicts.is_ok()) << conflicts.error().message();
    ASSERT_EQ(conflicts.value().size(), 2u);
    EXPECT_EQ(conflicts.value()[0].destination_path, dir / "dst" / "docs" / "a.txt");
    EXPECT_EQ(conflicts.value()[1].destination_path, dir / "dst" / "docs" / "sub" / "b.txt");
}

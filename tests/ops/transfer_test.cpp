#include "fops/events/event_bus.hpp"
#include "fops/ops/transfer.hpp"
#include "fops/volume/local_volume.hpp"
#include "support/fake_volume.hpp"
#include "support/test_helpers.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <vector>

namespace fs = std::filesystem;
using namespace fops::ops;
using fops::ErrorKind;
using fops::events::EventBus;
using fops::testing::create_temp_dir;
using fops::testing::FakeVolume;
using fops::testing::read_file;
using fops::testing::write_file;
using fops::volume::ItemKind;
using fops::volume::LocalVolume;
using fops::volume::Volume;

namespace {

ScanEntry entry_for(const Volume& volume, const fs::path& path) {
    auto info = volume.info(path);
    ScanEntry entry;
    entry.source = path;
    entry.relative = path.filename();
    entry.kind = info.value().kind;
    entry.size = info.value().size;
    entry.mode = info.value().mode;
    return entry;
}

/// One executor with everything it needs, writing into `volume`
struct Harness {
    Harness(Volume& volume, OperationConfig config)
        : state("op-transfer", OperationKind::Copy, config),
          progress(bus, state),
          resolver(state, progress),
          transaction(volume),
          executor(state, resolver, transaction, [this](std::uint64_t delta) { deltas.push_back(delta); }) {}

    EventBus bus;
    OperationState state;
    ProgressEmitter progress;
    ConflictResolver resolver;
    Transaction transaction;
    TransferExecutor executor;
    std::vector<std::uint64_t> deltas;
};

OperationConfig chunked(std::size_t chunk_size, ConflictResolution policy = ConflictResolution::Skip) {
    OperationConfig config;
    config.chunk_size = chunk_size;
    config.conflict_resolution = policy;
    return config;
}

std::uint64_t sum(const std::vector<std::uint64_t>& values) {
    std::uint64_t total = 0;
    for (auto v : values) {
        total += v;
    }
    return total;
}

} // namespace

TEST(TransferTest, StreamsFileInChunks) {
    const auto dir = create_temp_dir("fops_transfer");
    write_file(dir / "src" / "data.bin", "0123456789");
    fs::create_directories(dir / "dst");
    FakeVolume volume("fake", dir);

    Harness h(volume, chunked(4));
    auto result = h.executor.transfer_item(volume, entry_for(volume, dir / "src" / "data.bin"),
                                           volume, dir / "dst" / "data.bin");

    ASSERT_TRUE(result.is_ok()) << result.error().message();
    EXPECT_EQ(result.value().status, TransferStatus::Copied);
    EXPECT_EQ(result.value().bytes, 10u);
    EXPECT_EQ(read_file(dir / "dst" / "data.bin"), "0123456789");
    EXPECT_EQ(h.deltas.size(), 3u);
    EXPECT_EQ(sum(h.deltas), 10u);
    EXPECT_EQ(h.transaction.file_count(), 1u);
    h.transaction.commit();
}

TEST(TransferTest, NativeDuplicationKeepsContent) {
    const auto dir = create_temp_dir("fops_transfer");
    const std::string content(200000, 'z');
    write_file(dir / "big.bin", content);
    fs::create_directories(dir / "dst");
    LocalVolume volume("local", dir);

    Harness h(volume, chunked(OperationConfig::kDefaultChunkSize));
    auto result = h.executor.transfer_item(volume, entry_for(volume, dir / "big.bin"), volume, dir / "dst" / "big.bin");

    ASSERT_TRUE(result.is_ok()) << result.error().message();
    EXPECT_EQ(result.value().bytes, content.size());
    EXPECT_EQ(read_file(dir / "dst" / "big.bin"), content);
    EXPECT_EQ(sum(h.deltas), content.size());
    h.transaction.commit();
}

TEST(TransferTest, OverwriteReplacesExistingFile) {
    const auto dir = create_temp_dir("fops_transfer");
    write_file(dir / "src" / "a.txt", "new contents");
    write_file(dir / "dst" / "a.txt", "old");
    FakeVolume volume("fake", dir);

    Harness h(volume, chunked(4, ConflictResolution::Overwrite));
    auto result = h.executor.transfer_item(volume, entry_for(volume, dir / "src" / "a.txt"), volume, dir / "dst" / "a.txt");

    ASSERT_TRUE(result.is_ok()) << result.error().message();
    EXPECT_EQ(read_file(dir / "dst" / "a.txt"), "new contents");

    std::size_t entries = 0;
    for (const auto& item : fs::directory_iterator(dir / "dst")) {
        (void)item;
        entries++;
    }
    EXPECT_EQ(entries, 1u);
    h.transaction.commit();
}

TEST(TransferTest, RenameKeepsBothFiles) {
    const auto dir = create_temp_dir("fops_transfer");
    write_file(dir / "src" / "a.txt", "new");
    write_file(dir / "dst" / "a.txt", "old");
    FakeVolume volume("fake", dir);

    Harness h(volume, chunked(4, ConflictResolution::Rename));
    auto result = h.executor.transfer_item(volume, entry_for(volume, dir / "src" / "a.txt"), volume, dir / "dst" / "a.txt");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status, TransferStatus::Renamed);
    EXPECT_EQ(result.value().destination, dir / "dst" / "a (1).txt");
    EXPECT_EQ(read_file(dir / "dst" / "a.txt"), "old");
    EXPECT_EQ(read_file(dir / "dst" / "a (1).txt"), "new");
    h.transaction.commit();
}

TEST(TransferTest, SkipLeavesDestinationAlone) {
    const auto dir = create_temp_dir("fops_transfer");
    write_file(dir / "src" / "a.txt", "new");
    write_file(dir / "dst" / "a.txt", "old");
    FakeVolume volume("fake", dir);

    Harness h(volume, chunked(4, ConflictResolution::Skip));
    auto result = h.executor.transfer_item(volume, entry_for(volume, dir / "src" / "a.txt"), volume, dir / "dst" / "a.txt");

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().status, TransferStatus::Skipped);
    EXPECT_EQ(read_file(dir / "dst" / "a.txt"), "old");
    EXPECT_TRUE(h.transaction.empty());
}

TEST(TransferTest, CancelMidCopyRemovesPartialFile) {
    const auto dir = create_temp_dir("fops_transfer");
    write_file(dir / "src" / "data.bin", std::string(64, 'x'));
    fs::create_directories(dir / "dst");
    FakeVolume volume("fake", dir);

    Harness h(volume, chunked(8));
    TransferExecutor cancelling(h.state, h.resolver, h.transaction, [&h](std::uint64_t) {
        h.state.request_cancel(true);
    });
    auto result = cancelling.transfer_item(volume, entry_for(volume, dir / "src" / "data.bin"),
                                           volume, dir / "dst" / "data.bin");

    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Cancelled));
    EXPECT_FALSE(fs::exists(dir / "dst" / "data.bin"));
}

TEST(TransferTest, CancelDuringNativeDuplicateRemovesPartialFile) {
    const auto dir = create_temp_dir("fops_transfer");
    // Larger than one native step so the duplicate reports before it is done
    write_file(dir / "src" / "large.bin", std::string(LocalVolume::kNativeStepBytes * 2 + 4096, 'n'));
    fs::create_directories(dir / "dst");
    LocalVolume volume("local", dir);
    ASSERT_TRUE(volume.supports_native_duplicate());

    Harness h(volume, chunked(64 * 1024));
    int calls = 0;
    TransferExecutor cancelling(h.state, h.resolver, h.transaction, [&](std::uint64_t) {
        ++calls;
        h.state.request_cancel(true);
    });
    auto result = cancelling.transfer_item(volume, entry_for(volume, dir / "src" / "large.bin"),
                                           volume, dir / "dst" / "large.bin");

    ASSERT_TRUE(result.is_error());
    EXPECT_TRUE(result.error().is(ErrorKind::Cancelled));
    EXPECT_EQ(calls, 1);
    EXPECT_FALSE(fs::exists(dir / "dst" / "large.bin"));
    EXPECT_TRUE(fs::is_empty(dir / "dst"));
    EXPECT_EQ(fs::file_size(dir / "src" / "large.bin"), LocalVolume::kNativeStepBytes * 2 + 4096);
}

TEST(TransferTest, CopiesSymlinkAsLink) {
    const auto dir = create_temp_dir("fops_transfer");
    fs::create_directories(dir / "src");
    fs::create_directories(dir / "dst");
    fs::create_symlink("target.txt", dir / "src" / "link");
    LocalVolume volume("local", dir);

    Harness h(volume, chunked(4));
    auto result = h.executor.transfer_item(volume, entry_for(volume, dir / "src" / "link"), volume, dir / "dst" / "link");

    ASSERT_TRUE(result.is_ok()) << result.error().message();
    EXPECT_TRUE(fs::is_symlink(dir / "dst" / "link"));
    EXPECT_EQ(fs::read_symlink(dir / "dst" / "link"), fs::path("target.txt"));
    h.transaction.commit();
}

TEST(TransferTest, RemoveTreeDeletesNestedFolders) {
    const auto dir = create_temp_dir("fops_transfer");
    write_file(dir / "tree" / "a.txt", "a");
    write_file(dir / "tree" / "sub" / "deeper" / "b.txt", "b");
    fs::create_directory_symlink(dir, dir / "tree" / "sub" / "up");
    LocalVolume volume("local", dir);

    ASSERT_TRUE(remove_tree(volume, dir / "tree").is_ok());
    EXPECT_FALSE(fs::exists(dir / "tree"));
    EXPECT_TRUE(fs::exists(dir));

    EXPECT_TRUE(remove_tree(volume, dir / "tree").is_ok());
}

TEST(TransferTest, DeleteItemReportsFailure) {
    const auto dir = create_temp_dir("fops_transfer");
    write_file(dir / "a.txt", "a");
    FakeVolume::Options options;
    options.fail_remove = [](const fs::path& path) { return path.filename() == "a.txt"; };
    FakeVolume volume("fake", dir, options);

    auto removed = delete_item(volume, entry_for(volume, dir / "a.txt"));
    ASSERT_TRUE(removed.is_error());
    EXPECT_TRUE(removed.error().is(ErrorKind::PermissionDenied));
    EXPECT_TRUE(fs::exists(dir / "a.txt"));
}

#include "fops/volume/local_volume.hpp"
#include "fops/volume/manager.hpp"

#include <gtest/gtest.h>

#include <memory>

using fops::volume::LocalVolume;
using fops::volume::VolumeManager;

TEST(VolumeManagerTest, FallsBackToRootVolume) {
    VolumeManager manager;
    auto volume = manager.volume_for("/some/where/file.txt");
    ASSERT_NE(volume, nullptr);
    EXPECT_EQ(volume->name(), "root");
}

TEST(VolumeManagerTest, LongestMountPointWins) {
    VolumeManager manager;
    auto media = std::make_shared<LocalVolume>("media", "/media");
    auto usb = std::make_shared<LocalVolume>("usb", "/media/usb");
    manager.register_volume(media);
    manager.register_volume(usb);

    EXPECT_EQ(manager.volume_for("/media/usb/photos/a.jpg")->name(), "usb");
    EXPECT_EQ(manager.volume_for("/media/other/a.jpg")->name(), "media");
    EXPECT_EQ(manager.volume_for("/media/usbstick/a.jpg")->name(), "media");
    EXPECT_EQ(manager.volume_for("/home/a.jpg")->name(), "root");
}

TEST(VolumeManagerTest, RegisterReplacesSameRoot) {
    VolumeManager manager;
    manager.register_volume(std::make_shared<LocalVolume>("old", "/mnt/disk"));
    manager.register_volume(std::make_shared<LocalVolume>("new", "/mnt/disk/"));

    EXPECT_EQ(manager.volume_for("/mnt/disk/file")->name(), "new");
    EXPECT_EQ(manager.volumes().size(), 2u);
}

TEST(VolumeManagerTest, UnregisterKeepsRoot) {
    VolumeManager manager;
    manager.register_volume(std::make_shared<LocalVolume>("disk", "/mnt/disk"));
    manager.unregister_volume("/mnt/disk");
    manager.unregister_volume("/");

    EXPECT_EQ(manager.volume_for("/mnt/disk/file")->name(), "root");
    EXPECT_EQ(manager.volumes().size(), 1u);
}

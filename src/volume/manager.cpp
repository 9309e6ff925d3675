#include "fops/volume/manager.hpp"
#include "fops/volume/local_volume.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <mutex>

namespace fops::volume {
namespace fs = std::filesystem;

namespace {

bool is_under(const fs::path& path, const fs::path& root) {
    auto root_it = root.begin();
    auto path_it = path.begin();
    for (; root_it != root.end(); ++root_it, ++path_it) {
        if (root_it->empty()) {
            break;  // trailing separator
        }
        if (path_it == path.end() || *path_it != *root_it) {
            return false;
        }
    }
    return true;
}

/// "/mnt/disk/" and "/mnt/disk" name the same mount point
fs::path mount_key(const fs::path& root) {
    fs::path normal = root.lexically_normal();
    if (!normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

std::size_t depth(const fs::path& path) {
    return static_cast<std::size_t>(std::distance(path.begin(), path.end()));
}

} // namespace

VolumeManager::VolumeManager() {
    volumes_.push_back(std::make_shared<LocalVolume>("root", fs::path("/")));
}

void VolumeManager::register_volume(std::shared_ptr<Volume> volume) {
    std::unique_lock lock(mutex_);
    const auto root = mount_key(volume->root());
    volumes_.erase(std::remove_if(volumes_.begin(), volumes_.end(),
                                  [&root](const std::shared_ptr<Volume>& v) {
                                      return mount_key(v->root()) == root;
                                  }),
                   volumes_.end());
    spdlog::debug("[VolumeManager] mounted name={} root={}", volume->name(), root.string());
    volumes_.push_back(std::move(volume));
}

void VolumeManager::unregister_volume(const fs::path& root) {
    std::unique_lock lock(mutex_);
    const auto normal = mount_key(root);
    if (normal == fs::path("/")) {
        return;
    }
    volumes_.erase(std::remove_if(volumes_.begin(), volumes_.end(),
                                  [&normal](const std::shared_ptr<Volume>& v) {
                                      return mount_key(v->root()) == normal;
                                  }),
                   volumes_.end());
}

std::shared_ptr<Volume> VolumeManager::volume_for(const fs::path& path) const {
    std::shared_lock lock(mutex_);
    const auto normal = path.lexically_normal();
    std::shared_ptr<Volume> best;
    std::size_t best_depth = 0;
    for (const auto& volume : volumes_) {
        const auto root = mount_key(volume->root());
        if (!is_under(normal, root)) {
            continue;
        }
        const auto d = depth(root);
        if (!best || d > best_depth) {
            best = volume;
            best_depth = d;
        }
    }
    return best;
}

std::vector<std::shared_ptr<Volume>> VolumeManager::volumes() const {
    std::shared_lock lock(mutex_);
    return volumes_;
}

} // namespace fops::volume

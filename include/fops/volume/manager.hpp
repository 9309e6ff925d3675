#pragma once

#include "fops/volume/volume.hpp"

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <vector>

namespace fops::volume {

/**
 * @brief Maps host paths to the volume that owns them
 *
 * Volumes are mounted at their root(); the longest matching root wins.
 * A LocalVolume mounted at "/" is always present as the fallback.
 */
class VolumeManager {
public:
    VolumeManager();

    /// Replaces any volume already mounted at the same root
    void register_volume(std::shared_ptr<Volume> volume);
    void unregister_volume(const std::filesystem::path& root);

    std::shared_ptr<Volume> volume_for(const std::filesystem::path& path) const;
    std::vector<std::shared_ptr<Volume>> volumes() const;

private:
    mutable std::shared_mutex mutex_;
    std::vector<std::shared_ptr<Volume>> volumes_;
};

} // namespace fops::volume

#pragma once

#include "fops/volume/volume.hpp"

#include <filesystem>
#include <vector>

namespace fops::ops {

/**
 * @brief Objects created by one operation, undone unless committed
 *
 * Files and directories are recorded as they are created. rollback()
 * removes files first, then directories, each in reverse creation order.
 * The destructor rolls back anything not committed, so cleanup happens on
 * every exit path of the owning scope, including stack unwinding.
 *
 * Never shared between operations.
 */
class Transaction {
public:
    explicit Transaction(volume::Volume& volume);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void record_file(std::filesystem::path path);
    void record_directory(std::filesystem::path path);

    /// Keep everything; later rollbacks are no-ops
    void commit();

    /**
     * @brief Remove every recorded object still on disk
     *
     * Idempotent: a second call finds nothing left to do.
     * RETURNS: number of objects removed by this call
     */
    std::size_t rollback();

    [[nodiscard]] bool empty() const noexcept { return files_.empty() && directories_.empty(); }
    [[nodiscard]] std::size_t file_count() const noexcept { return files_.size(); }
    [[nodiscard]] std::size_t directory_count() const noexcept { return directories_.size(); }
    [[nodiscard]] bool committed() const noexcept { return committed_; }

private:
    volume::Volume& volume_;
    std::vector<std::filesystem::path> files_;
    std::vector<std::filesystem::path> directories_;
    bool committed_ = false;
};

} // namespace fops::ops

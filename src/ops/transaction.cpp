#include "fops/ops/transaction.hpp"

#include <spdlog/spdlog.h>

namespace fops::ops {
namespace fs = std::filesystem;

Transaction::Transaction(volume::Volume& volume) : volume_(volume) {}

Transaction::~Transaction() {
    if (!committed_ && !empty()) {
        const auto removed = rollback();
        spdlog::info("[Transaction] rolled back at scope exit removed={}", removed);
    }
}

void Transaction::record_file(fs::path path) {
    files_.push_back(std::move(path));
}

void Transaction::record_directory(fs::path path) {
    directories_.push_back(std::move(path));
}

void Transaction::commit() {
    files_.clear();
    directories_.clear();
    committed_ = true;
}

std::size_t Transaction::rollback() {
    std::size_t removed = 0;

    for (auto it = files_.rbegin(); it != files_.rend(); ++it) {
        if (!volume_.exists(*it)) {
            continue;
        }
        auto result = volume_.remove(*it);
        if (result.is_error()) {
            spdlog::warn("[Transaction] rollback could not remove file path={} error={}",
                         it->string(), result.error().message());
            continue;
        }
        ++removed;
    }

    for (auto it = directories_.rbegin(); it != directories_.rend(); ++it) {
        if (!volume_.exists(*it)) {
            continue;
        }
        auto result = volume_.remove(*it);
        if (result.is_error()) {
            spdlog::warn("[Transaction] rollback could not remove directory path={} error={}",
                         it->string(), result.error().message());
            continue;
        }
        ++removed;
    }

    files_.clear();
    directories_.clear();
    return removed;
}

} // namespace fops::ops

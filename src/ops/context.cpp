#include "fops/ops/context.hpp"
#include "fops/ops/scanner.hpp"

#include <spdlog/spdlog.h>

namespace fops::ops {

namespace {

void finish(OperationContext& context, Lifecycle lifecycle) {
    auto moved = context.state.transition_to(lifecycle);
    if (moved.is_error()) {
        spdlog::error("[Operation] id={} {}", context.state.operation_id(), moved.error().message());
    }
}

} // namespace

Result<ScanResult> scan_sources(OperationContext& context,
                                const Scanner& scanner,
                                const std::vector<std::filesystem::path>& sources) {
    if (context.prescanned && context.prescanned->roots == sources) {
        ScanResult reused = std::move(*context.prescanned);
        context.prescanned.reset();
        spdlog::debug("[Operation] reusing preview scan id={} files={} bytes={}",
                      context.state.operation_id(), reused.file_count, reused.total_bytes);

        ProgressSnapshot snapshot;
        snapshot.phase = Phase::Scanning;
        snapshot.items_total = reused.file_count;
        snapshot.bytes_total = reused.total_bytes;
        context.progress.report(snapshot);
        return Ok(std::move(reused));
    }
    return scanner.scan(sources);
}

void complete_operation(OperationContext& context,
                        std::uint64_t items,
                        std::uint64_t bytes,
                        std::uint64_t skipped,
                        std::vector<std::string> warnings) {
    finish(context, Lifecycle::Completed);
    context.progress.completed(items, bytes, skipped, std::move(warnings));
}

void abort_operation(OperationContext& context,
                     const Error& error,
                     std::uint64_t items,
                     Transaction* transaction) {
    if (error.is(ErrorKind::Cancelled)) {
        bool rolled_back = context.state.rollback_requested();
        if (transaction != nullptr) {
            if (rolled_back) {
                const auto removed = transaction->rollback();
                spdlog::info("[Operation] rolled back id={} removed={}", context.state.operation_id(), removed);
            } else {
                transaction->commit();
            }
        }
        finish(context, Lifecycle::Cancelled);
        context.progress.cancelled(items, rolled_back);
        return;
    }

    if (transaction != nullptr) {
        transaction->rollback();
    }
    spdlog::error("[Operation] failed id={} error={}", context.state.operation_id(), error.message());
    finish(context, Lifecycle::Failed);
    context.progress.failed(error);
}

} // namespace fops::ops

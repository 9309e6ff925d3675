#include "fops/ops/registry.hpp"
#include "fops/events/events.hpp"
#include "fops/ops/context.hpp"
#include "fops/ops/copy.hpp"
#include "fops/ops/move.hpp"
#include "fops/ops/progress.hpp"
#include "fops/ops/scanner.hpp"
#include "fops/ops/validation.hpp"

#include <spdlog/spdlog.h>

#include <iomanip>
#include <random>
#include <sstream>

namespace fops::ops {

OperationRegistry::OperationRegistry(events::EventBus& bus, std::shared_ptr<volume::VolumeManager> volumes)
    : bus_(bus), volumes_(std::move(volumes)) {
    if (!volumes_) {
        volumes_ = std::make_shared<volume::VolumeManager>();
    }
}

OperationRegistry::~OperationRegistry() {
    cancel_all(true);
    {
        std::shared_lock lock(mutex_);
        for (auto& [id, state] : previews_) {
            state->request_cancel(false);
        }
    }

    std::unordered_map<std::string, std::thread> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(workers_);
        finished_.clear();
    }
    for (auto& [id, worker] : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

Result<std::string> OperationRegistry::start(StartRequest request) {
    reap_finished();

    for (auto& source : request.sources) {
        source = normalize_path(source);
    }
    if (request.kind != OperationKind::Delete) {
        request.destination = normalize_path(request.destination);
    }

    auto valid = validate_request(*volumes_, request);
    if (valid.is_error()) {
        spdlog::warn("[Registry] rejected kind={} error={}", to_string(request.kind), valid.error().message());
        return Err<std::string>(valid.error());
    }

    auto prescanned = take_preview(request);

    const std::string id = next_id("op");
    auto state = std::make_shared<OperationState>(id, request.kind, request.config);
    {
        std::unique_lock lock(mutex_);
        active_.emplace(id, state);
    }

    std::vector<std::string> sources;
    sources.reserve(request.sources.size());
    for (const auto& source : request.sources) {
        sources.push_back(source.string());
    }
    bus_.emit(events::OperationStartedEvent{id, request.kind, std::move(sources), request.destination.string()});

    {
        std::lock_guard lock(workers_mutex_);
        workers_.emplace(id, std::thread(&OperationRegistry::run_worker, this, state, std::move(request),
                                         std::move(prescanned)));
    }
    return Ok(id);
}

Result<std::string> OperationRegistry::start_scan_preview(std::vector<std::filesystem::path> sources,
                                                          OperationConfig config) {
    reap_finished();

    if (sources.empty()) {
        return Err<std::string>(Error::invalid_argument("No source items given"));
    }
    for (auto& source : sources) {
        source = normalize_path(source);
        auto volume = volumes_->volume_for(source);
        if (!volume || !volume->exists(source)) {
            return Err<std::string>(Error::source_not_found(source));
        }
    }

    const std::string id = next_id("preview");
    auto state = std::make_shared<OperationState>(id, OperationKind::Copy, config);
    {
        std::unique_lock lock(mutex_);
        previews_.emplace(id, state);
    }
    spdlog::debug("[Registry] scan preview started id={} sources={}", id, sources.size());

    {
        std::lock_guard lock(workers_mutex_);
        workers_.emplace(id, std::thread(&OperationRegistry::run_preview, this, state, std::move(sources)));
    }
    return Ok(id);
}

Result<void> OperationRegistry::cancel_scan_preview(const std::string& preview_id) {
    {
        std::shared_lock lock(mutex_);
        auto it = previews_.find(preview_id);
        if (it != previews_.end()) {
            it->second->request_cancel(false);
            return Ok();
        }
    }
    std::lock_guard lock(cache_mutex_);
    if (preview_results_.erase(preview_id) > 0) {
        spdlog::debug("[Registry] scan preview discarded id={}", preview_id);
        return Ok();
    }
    return Err<void>(Error::not_found(preview_id));
}

Result<void> OperationRegistry::cancel(const std::string& operation_id, bool rollback) {
    std::shared_lock lock(mutex_);
    auto it = active_.find(operation_id);
    if (it == active_.end()) {
        return Err<void>(Error::not_found(operation_id));
    }
    spdlog::info("[Registry] cancel requested id={} rollback={}", operation_id, rollback);
    it->second->request_cancel(rollback);
    return Ok();
}

void OperationRegistry::cancel_all(bool rollback) {
    std::shared_lock lock(mutex_);
    for (auto& [id, state] : active_) {
        state->request_cancel(rollback);
    }
}

Result<void> OperationRegistry::resolve(const std::string& operation_id,
                                        ConflictResolution resolution,
                                        bool apply_to_all) {
    std::shared_lock lock(mutex_);
    auto it = active_.find(operation_id);
    if (it == active_.end()) {
        return Err<void>(Error::not_found(operation_id));
    }
    return it->second->resolve(resolution, apply_to_all);
}

Result<OperationStatus> OperationRegistry::status(const std::string& operation_id) const {
    std::shared_lock lock(mutex_);
    auto it = active_.find(operation_id);
    if (it == active_.end()) {
        return Err<OperationStatus>(Error::not_found(operation_id));
    }
    return Ok(it->second->status());
}

std::vector<OperationSummary> OperationRegistry::list_active() const {
    std::shared_lock lock(mutex_);
    std::vector<OperationSummary> summaries;
    summaries.reserve(active_.size());
    for (const auto& [id, state] : active_) {
        summaries.push_back(state->summary());
    }
    return summaries;
}

std::size_t OperationRegistry::active_count() const {
    std::shared_lock lock(mutex_);
    return active_.size();
}

bool OperationRegistry::wait(const std::string& operation_id, std::chrono::milliseconds timeout) {
    std::unique_lock lock(retire_mutex_);
    return retired_cv_.wait_for(lock, timeout, [&] { return !is_active(operation_id); });
}

void OperationRegistry::run_worker(std::shared_ptr<OperationState> state,
                                   StartRequest request,
                                   std::optional<ScanResult> prescanned) {
    ProgressEmitter progress(bus_, *state);
    OperationContext context{*state, progress, *volumes_, std::move(prescanned)};

    spdlog::debug("[Registry] worker started id={} kind={}", state->operation_id(), to_string(state->kind()));
    try {
        switch (request.kind) {
            case OperationKind::Copy:
                run_copy(context, request);
                break;
            case OperationKind::Move:
                MoveOrchestrator(context).run(request);
                break;
            case OperationKind::Delete:
                run_delete(context, request);
                break;
        }
    } catch (const std::exception& e) {
        spdlog::error("[Registry] worker aborted id={} error={}", state->operation_id(), e.what());
        if (!progress.terminal_sent()) {
            abort_operation(context, Error::io_error({}, e.what()), progress.last().items_done);
        }
    }

    if (state->lifecycle() == Lifecycle::Completed && !request.config.dry_run && request.config.sync_on_complete) {
        flush_written(request);
    }
    retire(state->operation_id());
}

void OperationRegistry::run_preview(std::shared_ptr<OperationState> state, std::vector<std::filesystem::path> sources) {
    const std::string& id = state->operation_id();
    const auto interval = state->config().progress_interval;
    auto last_emit = std::chrono::steady_clock::now();

    Scanner scanner(*volumes_, state.get());
    scanner.set_observer([&](const ScanResult& so_far, const std::filesystem::path& current) {
        const auto now = std::chrono::steady_clock::now();
        if (now - last_emit < interval) {
            return;
        }
        last_emit = now;
        bus_.emit(events::ScanPreviewProgressEvent{id, so_far.file_count, so_far.directory_count,
                                                   so_far.total_bytes, current.filename().string()});
    });

    auto scan = scanner.scan(sources);
    if (scan.is_error()) {
        if (scan.error().is(ErrorKind::Cancelled)) {
            spdlog::debug("[Registry] scan preview cancelled id={}", id);
            bus_.emit(events::ScanPreviewCancelledEvent{id});
        } else {
            spdlog::warn("[Registry] scan preview failed id={} error={}", id, scan.error().message());
            bus_.emit(events::ScanPreviewFailedEvent{id, scan.error()});
        }
        retire(id);
        return;
    }

    const ScanResult& result = scan.value();
    events::ScanPreviewCompletedEvent completed{id, result.file_count, result.directory_count, result.total_bytes};
    {
        std::lock_guard lock(cache_mutex_);
        preview_results_[id] = CachedScan{std::move(scan.value()), state->config().sort_column,
                                          state->config().sort_order};
    }
    bus_.emit(completed);
    retire(id);
}

std::optional<ScanResult> OperationRegistry::take_preview(const StartRequest& request) {
    if (request.preview_id.empty()) {
        return std::nullopt;
    }

    CachedScan cached;
    {
        std::lock_guard lock(cache_mutex_);
        auto it = preview_results_.find(request.preview_id);
        if (it == preview_results_.end()) {
            spdlog::debug("[Registry] no finished scan preview id={}, scanning again", request.preview_id);
            return std::nullopt;
        }
        cached = std::move(it->second);
        preview_results_.erase(it);
    }

    if (cached.scan.roots != request.sources || cached.sort_column != request.config.sort_column ||
        cached.sort_order != request.config.sort_order) {
        spdlog::debug("[Registry] scan preview does not match request id={}, scanning again", request.preview_id);
        return std::nullopt;
    }
    return std::move(cached.scan);
}

void OperationRegistry::flush_written(const StartRequest& request) {
    std::vector<std::pair<std::shared_ptr<volume::Volume>, std::filesystem::path>> targets;
    auto add = [&](const std::filesystem::path& path) {
        auto volume = volumes_->volume_for(path);
        if (!volume) {
            return;
        }
        for (const auto& target : targets) {
            if (target.first == volume) {
                return;
            }
        }
        targets.emplace_back(std::move(volume), path);
    };

    if (request.kind != OperationKind::Delete) {
        add(request.destination);
    }
    if (request.kind != OperationKind::Copy) {
        // Sources are gone; their parent folders are what changed
        for (const auto& source : request.sources) {
            add(source.parent_path());
        }
    }

    for (const auto& [volume, path] : targets) {
        auto flushed = volume->flush(path);
        if (flushed.is_error()) {
            spdlog::warn("[Registry] flush failed volume={} path={} error={}",
                         volume->name(), path.string(), flushed.error().message());
        }
    }
}

void OperationRegistry::retire(const std::string& operation_id) {
    {
        std::lock_guard retire_lock(retire_mutex_);
        std::unique_lock lock(mutex_);
        active_.erase(operation_id);
        previews_.erase(operation_id);
    }
    retired_cv_.notify_all();

    std::lock_guard lock(workers_mutex_);
    finished_.push_back(operation_id);
}

void OperationRegistry::reap_finished() {
    std::vector<std::thread> done;
    {
        std::lock_guard lock(workers_mutex_);
        for (const auto& id : finished_) {
            auto it = workers_.find(id);
            if (it != workers_.end()) {
                done.push_back(std::move(it->second));
                workers_.erase(it);
            }
        }
        finished_.clear();
    }
    for (auto& worker : done) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool OperationRegistry::is_active(const std::string& operation_id) const {
    std::shared_lock lock(mutex_);
    return active_.count(operation_id) > 0 || previews_.count(operation_id) > 0;
}

std::string OperationRegistry::next_id(const char* prefix) {
    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<std::uint32_t> distribution;

    std::uint64_t sequence;
    {
        std::lock_guard lock(id_mutex_);
        sequence = next_sequence_++;
    }
    std::ostringstream id;
    id << prefix << "-" << sequence << "-" << std::hex << std::setw(8) << std::setfill('0') << distribution(generator);
    return id.str();
}

} // namespace fops::ops

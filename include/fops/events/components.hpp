/**
 * @file components.hpp
 * @brief Ready-made subscribers for operation events
 *
 * WHY THIS FILE EXISTS:
 * Most hosts want the same three things from the event stream: a log
 * line per event, running totals, and a thread-safe inbox they can drain
 * from their own loop. Each component subscribes in its constructor and
 * unsubscribes in its destructor.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * EventMailbox mailbox(bus);
 * // ... start operations, then mailbox.drain() from the UI loop
 */

#pragma once

#include "fops/events/event_bus.hpp"
#include "fops/events/event_queue.hpp"
#include "fops/events/events.hpp"
#include "fops/events/json_codec.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fops::events {

namespace detail {

/// Keeps the unsubscribe calls for one component
class Subscriptions {
public:
    explicit Subscriptions(EventBus& bus) : bus_(bus) {}
    ~Subscriptions() {
        for (auto& drop : unsubscribers_) {
            drop();
        }
    }

    Subscriptions(const Subscriptions&) = delete;
    Subscriptions& operator=(const Subscriptions&) = delete;

    template<typename EventType>
    void add(std::function<void(const EventType&)> handler) {
        const size_t id = bus_.subscribe<EventType>(std::move(handler));
        unsubscribers_.emplace_back([this, id] { bus_.unsubscribe<EventType>(id); });
    }

private:
    EventBus& bus_;
    std::vector<std::function<void()>> unsubscribers_;
};

} // namespace detail

/**
 * @brief Logs every operation event through spdlog
 *
 * Progress events go to debug so a busy copy does not flood the log.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<OperationStartedEvent>([](const OperationStartedEvent& e) {
            spdlog::info("[OperationStarted] id={} kind={} sources={} destination={}",
                         e.operation_id, ops::to_string(e.kind), e.sources.size(), e.destination);
        });

        subscriptions_.add<OperationProgressEvent>([](const OperationProgressEvent& e) {
            spdlog::debug("[Progress] id={} phase={} item={} items={}/{} bytes={}/{}",
                          e.operation_id, ops::to_string(e.progress.phase), e.progress.current_item,
                          e.progress.items_done, e.progress.items_total,
                          e.progress.bytes_done, e.progress.bytes_total);
        });

        subscriptions_.add<OperationCompletedEvent>([](const OperationCompletedEvent& e) {
            spdlog::info("[OperationCompleted] id={} kind={} items={} bytes={} skipped={}",
                         e.operation_id, ops::to_string(e.kind), e.items_processed,
                         format_bytes(e.bytes_processed), e.items_skipped);
            for (const auto& warning : e.warnings) {
                spdlog::warn("[OperationCompleted] id={} warning={}", e.operation_id, warning);
            }
        });

        subscriptions_.add<OperationCancelledEvent>([](const OperationCancelledEvent& e) {
            spdlog::warn("[OperationCancelled] id={} kind={} items={} rolled_back={}",
                         e.operation_id, ops::to_string(e.kind), e.items_processed, e.rolled_back);
        });

        subscriptions_.add<OperationFailedEvent>([](const OperationFailedEvent& e) {
            spdlog::error("[OperationFailed] id={} kind={} error={}",
                          e.operation_id, ops::to_string(e.kind), e.error.message());
        });

        subscriptions_.add<DryRunCompletedEvent>([](const DryRunCompletedEvent& e) {
            spdlog::info("[DryRun] id={} files={} bytes={} conflicts={}{}",
                         e.operation_id, e.files_total, format_bytes(e.bytes_total),
                         e.conflicts_total, e.conflicts_sampled ? " (sampled)" : "");
        });

        subscriptions_.add<ConflictDetectedEvent>([](const ConflictDetectedEvent& e) {
            spdlog::warn("[ConflictDetected] id={} source={} destination={} newer={}",
                         e.operation_id, e.conflict.source_path.string(),
                         e.conflict.destination_path.string(), e.conflict.destination_is_newer());
        });

        subscriptions_.add<ConflictResolvedEvent>([](const ConflictResolvedEvent& e) {
            spdlog::info("[ConflictResolved] id={} destination={} resolution={} apply_to_all={}",
                         e.operation_id, e.destination_path, ops::to_string(e.resolution), e.apply_to_all);
        });

        subscriptions_.add<ScanPreviewCompletedEvent>([](const ScanPreviewCompletedEvent& e) {
            spdlog::info("[ScanPreview] id={} files={} dirs={} bytes={}",
                         e.preview_id, e.files_total, e.dirs_total, format_bytes(e.bytes_total));
        });

        subscriptions_.add<ScanPreviewFailedEvent>([](const ScanPreviewFailedEvent& e) {
            spdlog::warn("[ScanPreview] failed id={} error={}", e.preview_id, e.error.message());
        });
    }

private:
    detail::Subscriptions subscriptions_;
};

/**
 * @brief Running totals across all operations on a bus
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.get_stats().operations_completed.load();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> operations_started{0};
        std::atomic<uint64_t> operations_completed{0};
        std::atomic<uint64_t> operations_cancelled{0};
        std::atomic<uint64_t> operations_failed{0};
        std::atomic<uint64_t> items_processed{0};
        std::atomic<uint64_t> bytes_processed{0};
        std::atomic<uint64_t> items_skipped{0};
        std::atomic<uint64_t> conflicts_detected{0};
        std::atomic<uint64_t> conflicts_resolved{0};
    };

    explicit MetricsComponent(EventBus& bus) : subscriptions_(bus) {
        subscriptions_.add<OperationStartedEvent>([this](const OperationStartedEvent&) {
            stats_.operations_started++;
        });

        subscriptions_.add<OperationCompletedEvent>([this](const OperationCompletedEvent& e) {
            stats_.operations_completed++;
            stats_.items_processed += e.items_processed;
            stats_.bytes_processed += e.bytes_processed;
            stats_.items_skipped += e.items_skipped;
        });

        subscriptions_.add<OperationCancelledEvent>([this](const OperationCancelledEvent&) {
            stats_.operations_cancelled++;
        });

        subscriptions_.add<OperationFailedEvent>([this](const OperationFailedEvent&) {
            stats_.operations_failed++;
        });

        subscriptions_.add<ConflictDetectedEvent>([this](const ConflictDetectedEvent&) {
            stats_.conflicts_detected++;
        });

        subscriptions_.add<ConflictResolvedEvent>([this](const ConflictResolvedEvent&) {
            stats_.conflicts_resolved++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Operation Statistics:");
        spdlog::info("  Started:         {}", stats_.operations_started.load());
        spdlog::info("  Completed:       {}", stats_.operations_completed.load());
        spdlog::info("  Cancelled:       {}", stats_.operations_cancelled.load());
        spdlog::info("  Failed:          {}", stats_.operations_failed.load());
        spdlog::info("  Items processed: {}", stats_.items_processed.load());
        spdlog::info("  Bytes processed: {}", format_bytes(stats_.bytes_processed.load()));
        spdlog::info("  Items skipped:   {}", stats_.items_skipped.load());
        spdlog::info("  Conflicts det.:  {}", stats_.conflicts_detected.load());
        spdlog::info("  Conflicts res.:  {}", stats_.conflicts_resolved.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    Stats stats_;
    detail::Subscriptions subscriptions_;
};

/**
 * @brief Collects events as JSON for a host that polls
 *
 * Handlers run on operation worker threads; the host drains from its own
 * thread. With a capacity set, the oldest undrained events are dropped
 * first (progress is the bulk of the traffic and only the latest counts).
 */
class EventMailbox {
public:
    explicit EventMailbox(EventBus& bus, size_t capacity = 0)
        : queue_(capacity), subscriptions_(bus) {
        forward<OperationStartedEvent>();
        forward<OperationProgressEvent>();
        forward<OperationCompletedEvent>();
        forward<OperationCancelledEvent>();
        forward<OperationFailedEvent>();
        forward<DryRunCompletedEvent>();
        forward<ConflictDetectedEvent>();
        forward<ConflictResolvedEvent>();
        forward<ScanPreviewProgressEvent>();
        forward<ScanPreviewCompletedEvent>();
        forward<ScanPreviewFailedEvent>();
        forward<ScanPreviewCancelledEvent>();
    }

    ~EventMailbox() {
        queue_.shutdown();
    }

    std::optional<nlohmann::json> next() { return queue_.try_pop(); }

    template<typename Rep, typename Period>
    std::optional<nlohmann::json> next_for(const std::chrono::duration<Rep, Period>& timeout) {
        return queue_.pop_for(timeout);
    }

    std::vector<nlohmann::json> drain() { return queue_.drain(); }
    size_t pending() const { return queue_.size(); }
    size_t dropped() const { return queue_.dropped(); }

private:
    template<typename EventType>
    void forward() {
        subscriptions_.add<EventType>([this](const EventType& e) {
            queue_.push(event_to_json(e));
        });
    }

    ThreadSafeQueue<nlohmann::json> queue_;
    detail::Subscriptions subscriptions_;
};

} // namespace fops::events

/**
 * @file components.hpp
 * @brief Event-driven observers of the transfer pipeline
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // ... transfers run ...
 * metrics.print_stats();
 */

#pragma once

#include "shiplot/events/event_bus.hpp"
#include "shiplot/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace shiplot::events {

/**
 * @brief Logs every transfer lifecycle event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent& e) {
            on_transfer_started(e);
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent& e) {
            on_transfer_failed(e);
        });

        bus_.subscribe<VolumeEvictedEvent>([this](const VolumeEvictedEvent& e) {
            on_volume_evicted(e);
        });

        bus_.subscribe<PoolResizedEvent>([this](const PoolResizedEvent& e) {
            on_pool_resized(e);
        });

        bus_.subscribe<ServiceStartedEvent>([this](const ServiceStartedEvent& e) {
            on_service_started(e);
        });

        bus_.subscribe<ServiceStoppingEvent>([this](const ServiceStoppingEvent& e) {
            on_service_stopping(e);
        });
    }

private:
    void on_transfer_started(const TransferStartedEvent& e) {
        spdlog::info("[TransferStarted] {} {} -> {} ({} bytes)",
                     transfer::transfer_kind_name(e.kind), e.file_name,
                     e.destination.string(), e.expected_size);
    }

    void on_transfer_completed(const TransferCompletedEvent& e) {
        spdlog::info("[TransferCompleted] {} {} -> {} bytes={} duration={}ms",
                     transfer::transfer_kind_name(e.kind), e.file_name,
                     e.destination.string(), e.bytes_written, e.duration.count());
    }

    void on_transfer_failed(const TransferFailedEvent& e) {
        spdlog::error("[TransferFailed] {} {}: {}",
                      transfer::transfer_kind_name(e.kind), e.file_name, e.error);
    }

    void on_volume_evicted(const VolumeEvictedEvent& e) {
        // Running out of space is the normal end of a volume's life
        spdlog::info("[VolumeEvicted] {} free={} required={} remaining={}",
                     e.path.string(), e.free_bytes, e.required_bytes, e.remaining_volumes);
    }

    void on_pool_resized(const PoolResizedEvent& e) {
        spdlog::info("[PoolResized] {} -> {} concurrent transfers", e.previous_capacity, e.capacity);
    }

    void on_service_started(const ServiceStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("shiplot started in {} mode", e.mode);
        spdlog::info("Concurrent transfers: {}, destinations: {}", e.pool_capacity, e.destination_count);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_service_stopping(const ServiceStoppingEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("shiplot stopping: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
};

/**
 * @brief Transfer counters, printed as a summary at shutdown
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<std::uint64_t> transfers_started{0};
        std::atomic<std::uint64_t> transfers_completed{0};
        std::atomic<std::uint64_t> transfers_failed{0};
        std::atomic<std::uint64_t> files_moved{0};
        std::atomic<std::uint64_t> files_received{0};
        std::atomic<std::uint64_t> files_uploaded{0};
        std::atomic<std::uint64_t> bytes_written{0};
        std::atomic<std::uint64_t> volumes_evicted{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<TransferStartedEvent>([this](const TransferStartedEvent&) {
            stats_.transfers_started++;
        });

        bus_.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        bus_.subscribe<TransferFailedEvent>([this](const TransferFailedEvent&) {
            stats_.transfers_failed++;
        });

        bus_.subscribe<VolumeEvictedEvent>([this](const VolumeEvictedEvent&) {
            stats_.volumes_evicted++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer Statistics:");
        spdlog::info("  Started:         {}", stats_.transfers_started.load());
        spdlog::info("  Completed:       {}", stats_.transfers_completed.load());
        spdlog::info("  Failed:          {}", stats_.transfers_failed.load());
        spdlog::info("  Moved locally:   {}", stats_.files_moved.load());
        spdlog::info("  Received:        {}", stats_.files_received.load());
        spdlog::info("  Uploaded:        {}", stats_.files_uploaded.load());
        spdlog::info("  Bytes written:   {}", stats_.bytes_written.load());
        spdlog::info("  Volumes evicted: {}", stats_.volumes_evicted.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_transfer_completed(const TransferCompletedEvent& e) {
        stats_.transfers_completed++;
        stats_.bytes_written += e.bytes_written;
        switch (e.kind) {
            case transfer::TransferKind::Move: stats_.files_moved++; break;
            case transfer::TransferKind::Save: stats_.files_received++; break;
            case transfer::TransferKind::Upload: stats_.files_uploaded++; break;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace shiplot::events

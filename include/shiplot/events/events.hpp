/**
 * @file events.hpp
 * @brief Event types emitted by the transfer subsystem
 *
 * NAMING CONVENTION:
 * Events are past tense and describe something that already happened.
 */

#pragma once

#include "shiplot/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace shiplot::events {

// ════════════════════════════════════════════════════════
// Transfer Events
// ════════════════════════════════════════════════════════

/**
 * @brief A job claimed a destination and started writing
 *
 * WHO EMITS: TransferOrchestrator
 * WHO SUBSCRIBES: LoggerComponent
 */
struct TransferStartedEvent {
    transfer::TransferKind kind;
    std::string file_name;
    std::filesystem::path destination;
    std::uint64_t expected_size;
};

/**
 * @brief A file reached its final name (or the peer acknowledged it)
 *
 * WHO EMITS: TransferOrchestrator
 * WHO SUBSCRIBES: LoggerComponent, MetricsComponent
 */
struct TransferCompletedEvent {
    transfer::TransferKind kind;
    std::string file_name;
    std::filesystem::path destination;
    std::uint64_t bytes_written;
    std::chrono::milliseconds duration;
};

/**
 * @brief A job was abandoned; the source is left in place for a later pass
 */
struct TransferFailedEvent {
    transfer::TransferKind kind;
    std::string file_name;
    std::string error;
};

// ════════════════════════════════════════════════════════
// Capacity Events
// ════════════════════════════════════════════════════════

/**
 * @brief A destination was dropped because a file did not fit
 */
struct VolumeEvictedEvent {
    std::filesystem::path path;
    std::uint64_t free_bytes;
    std::uint64_t required_bytes;
    std::size_t remaining_volumes;
};

/**
 * @brief The worker pool capacity changed after an eviction
 */
struct PoolResizedEvent {
    std::size_t previous_capacity;
    std::size_t capacity;
};

// ════════════════════════════════════════════════════════
// Service Events
// ════════════════════════════════════════════════════════

struct ServiceStartedEvent {
    std::string mode;  ///< "local", "server" or "client"
    std::size_t pool_capacity;
    std::size_t destination_count;
};

struct ServiceStoppingEvent {
    std::string reason;
};

} // namespace shiplot::events

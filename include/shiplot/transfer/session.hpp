#pragma once

#include "shiplot/core/result.hpp"
#include "shiplot/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace shiplot::transfer {

enum class TransferState {
    Pending,
    SelectingDestination,
    Writing,
    Verifying,
    Committing,
    Cleanup,
    Complete,
    Failed
};

const char* transfer_state_name(TransferState state);

/**
 * @brief Progress of one job, kept for logging and failure reports
 */
struct TransferInfo {
    std::string file_name;
    TransferKind kind = TransferKind::Move;
    TransferState state = TransferState::Pending;
    std::chrono::steady_clock::time_point started_at{};
    std::uint64_t expected_size = 0;
    std::uint64_t bytes_written = 0;
    std::filesystem::path destination;
    std::string last_error;  ///< Populated when state == Failed
};

/**
 * @brief Write-verify-commit state machine for a single file
 *
 * Pending -> SelectingDestination -> Writing -> Verifying -> Committing
 *         -> Cleanup -> Complete
 *
 * Failed is reachable from every non-terminal state. Re-entering the
 * current state is a no-op (the destination loop selects again after an
 * eviction).
 */
class TransferSession {
public:
    TransferSession(std::string file_name, TransferKind kind);

    [[nodiscard]] TransferState state() const noexcept { return info_.state; }
    [[nodiscard]] const TransferInfo& info() const noexcept { return info_; }

    Result<void> start(std::uint64_t expected_size);
    Result<void> transition_to(TransferState next_state);
    Result<void> mark_failed(std::string error_message);

    void set_destination(std::filesystem::path destination) { info_.destination = std::move(destination); }
    void set_bytes_written(std::uint64_t bytes) { info_.bytes_written = bytes; }

    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    [[nodiscard]] bool can_transition(TransferState target) const noexcept;

    TransferInfo info_;
};

} // namespace shiplot::transfer

#include "shiplot/transfer/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace shiplot::transfer {
namespace {

bool is_progressive(TransferState current, TransferState target) {
    static const std::unordered_map<TransferState, std::vector<TransferState>> transitions {
        {TransferState::Pending, {TransferState::SelectingDestination}},
        {TransferState::SelectingDestination, {TransferState::Writing}},
        {TransferState::Writing, {TransferState::Verifying}},
        {TransferState::Verifying, {TransferState::Committing}},
        {TransferState::Committing, {TransferState::Cleanup}},
        {TransferState::Cleanup, {TransferState::Complete}},
    };

    if (target == TransferState::Failed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* transfer_state_name(TransferState state) {
    switch (state) {
        case TransferState::Pending: return "pending";
        case TransferState::SelectingDestination: return "selecting_destination";
        case TransferState::Writing: return "writing";
        case TransferState::Verifying: return "verifying";
        case TransferState::Committing: return "committing";
        case TransferState::Cleanup: return "cleanup";
        case TransferState::Complete: return "complete";
        case TransferState::Failed: return "failed";
    }
    return "unknown";
}

TransferSession::TransferSession(std::string file_name, TransferKind kind) {
    info_.file_name = std::move(file_name);
    info_.kind = kind;
    info_.state = TransferState::Pending;
    info_.started_at = std::chrono::steady_clock::now();
}

Result<void> TransferSession::start(std::uint64_t expected_size) {
    if (info_.state != TransferState::Pending) {
        return Err<void>(ErrorCode::InvalidArgument, "Transfer already started");
    }
    info_.started_at = std::chrono::steady_clock::now();
    info_.expected_size = expected_size;
    return transition_to(TransferState::SelectingDestination);
}

Result<void> TransferSession::transition_to(TransferState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorCode::InvalidArgument,
                         std::string("Illegal transfer state transition ") +
                             transfer_state_name(info_.state) + " -> " + transfer_state_name(next_state));
    }

    info_.state = next_state;
    if (next_state != TransferState::Failed) {
        info_.last_error.clear();
    }
    return Ok();
}

Result<void> TransferSession::mark_failed(std::string error_message) {
    info_.last_error = std::move(error_message);
    return transition_to(TransferState::Failed);
}

std::chrono::milliseconds TransferSession::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - info_.started_at);
}

bool TransferSession::can_transition(TransferState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (info_.state == TransferState::Failed || info_.state == TransferState::Complete) {
        return false;
    }

    return is_progressive(info_.state, target);
}

} // namespace shiplot::transfer

/**
 * @file cancellation.hpp
 * @brief Process-wide cancellation signal
 *
 * A CancellationSource owns the flag, CancellationToken is the cheap copyable
 * view handed to workers, streams and loops. Callbacks let blocking code
 * (socket reads, condition-variable waits) wake up when cancel() is called.
 *
 * EXAMPLE:
 * CancellationSource source;
 * auto token = source.token();
 * auto reg = token.on_cancel([&] { socket.shutdown(); });
 * source.cancel();  // runs the callback once, token.is_cancelled() == true
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace shiplot {

namespace detail {

struct CancellationState {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::recursive_mutex run_mutex;  // held while callbacks execute
    std::condition_variable cv;
    std::map<std::uint64_t, std::function<void()>> callbacks;
    std::uint64_t next_id = 0;
};

} // namespace detail

/**
 * @brief RAII handle for a registered cancellation callback
 *
 * Destroying the handle unregisters the callback. A callback registered on an
 * already-cancelled token runs immediately in the registering thread.
 */
class CancellationRegistration {
public:
    CancellationRegistration() = default;
    CancellationRegistration(std::shared_ptr<detail::CancellationState> state, std::uint64_t id)
        : state_(std::move(state)), id_(id) {}

    ~CancellationRegistration() { reset(); }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    CancellationRegistration(CancellationRegistration&& other) noexcept
        : state_(std::move(other.state_)), id_(other.id_) {}

    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept {
        if (this != &other) {
            reset();
            state_ = std::move(other.state_);
            id_ = other.id_;
        }
        return *this;
    }

    void reset() {
        if (state_) {
            // Waits for a concurrent cancel() to finish running callbacks
            std::lock_guard run_lock(state_->run_mutex);
            std::lock_guard lock(state_->mutex);
            state_->callbacks.erase(id_);
            state_.reset();
        }
    }

private:
    std::shared_ptr<detail::CancellationState> state_;
    std::uint64_t id_ = 0;
};

class CancellationToken {
public:
    // A default token is never cancelled
    CancellationToken() : state_(std::make_shared<detail::CancellationState>()) {}

    bool is_cancelled() const {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    /**
     * @brief Register a callback invoked once when cancellation happens
     *
     * THREAD SAFE: Yes
     * The callback runs in the thread calling CancellationSource::cancel(),
     * so it must not block.
     */
    [[nodiscard]] CancellationRegistration on_cancel(std::function<void()> callback) const {
        std::unique_lock lock(state_->mutex);
        if (is_cancelled()) {
            lock.unlock();
            callback();
            return {};
        }
        const auto id = state_->next_id++;
        state_->callbacks.emplace(id, std::move(callback));
        return CancellationRegistration(state_, id);
    }

    /**
     * @brief Sleep until cancelled or the timeout elapses
     *
     * RETURNS: true if cancelled
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this] { return is_cancelled(); });
    }

    void wait() const {
        std::unique_lock lock(state_->mutex);
        state_->cv.wait(lock, [this] { return is_cancelled(); });
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state)
        : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

class CancellationSource {
public:
    CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

    CancellationSource(const CancellationSource&) = delete;
    CancellationSource& operator=(const CancellationSource&) = delete;

    CancellationToken token() const { return CancellationToken(state_); }

    bool is_cancelled() const {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    /**
     * @brief Raise the signal; idempotent
     *
     * Callbacks are moved out under the lock and run without it. A registration
     * being destroyed concurrently blocks until they have returned.
     */
    void cancel() {
        std::lock_guard run_lock(state_->run_mutex);
        std::map<std::uint64_t, std::function<void()>> callbacks;
        {
            std::lock_guard lock(state_->mutex);
            if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
                return;
            }
            callbacks.swap(state_->callbacks);
        }
        state_->cv.notify_all();
        for (auto& [id, callback] : callbacks) {
            callback();
        }
    }

private:
    std::shared_ptr<detail::CancellationState> state_;
};

} // namespace shiplot

//
//  cancellation_token.hpp
//
//  Cooperative cancellation shared by the orchestrator and its workers
//

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace msdl {

class CancellationToken {
public:
    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    // Safe to call from a signal-watching thread or from callbacks.
    void Cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            cancelled_.store(true, std::memory_order_release);
        }
        cv_.notify_all();
    }

    bool IsCancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    // Sleeps for `duration` unless cancelled first. Returns true if cancelled.
    template <typename Rep, typename Period>
    bool WaitFor(const std::chrono::duration<Rep, Period>& duration) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, duration, [this] { return cancelled_.load(std::memory_order_acquire); });
    }

    void Reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(false, std::memory_order_release);
    }

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

} // namespace msdl

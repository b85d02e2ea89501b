#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tvlink::core {

/**
 * One-shot cancellation flag shared between an owner and a background task.
 *
 * Thread-safety:
 * - cancel() may be called from any thread, any number of times
 * - cancelled() is a lock-free read, cheap enough for transfer callbacks
 * - wait_for() sleeps until the timeout elapses or cancel() is called
 */
class CancelToken {
public:
    void cancel()
    {
        {
            std::lock_guard<std::mutex> g(_mx);
            _cancelled.store(true, std::memory_order_release);
        }
        _cv.notify_all();
    }

    bool cancelled() const
    {
        return _cancelled.load(std::memory_order_acquire);
    }

    // Returns true if cancelled before (or during) the wait.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> timeout) const
    {
        std::unique_lock<std::mutex> lk(_mx);
        return _cv.wait_for(lk, timeout, [this] { return cancelled(); });
    }

private:
    mutable std::mutex _mx;
    mutable std::condition_variable _cv;
    std::atomic<bool> _cancelled{false};
};

} // namespace tvlink::core

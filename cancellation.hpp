#ifndef CANCELLATION_HPP
#define CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

// One-shot cancellation flag with interruptible sleeps. Owned by the object
// whose background work it governs (Connection, Tunnel, TunnelManager).
class CancellationScope
{
private:
    std::atomic<bool> cancelled{false};
    mutable std::mutex mutex;
    mutable std::condition_variable cv;

public:
    CancellationScope() = default;
    CancellationScope(const CancellationScope &) = delete;
    CancellationScope &operator=(const CancellationScope &) = delete;

    void cancel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            cancelled = true;
        }
        cv.notify_all();
    }

    bool is_cancelled() const { return cancelled.load(); }

    // Sleeps for up to `duration`. Returns true if cancelled meanwhile.
    template <typename Rep, typename Period>
    bool wait_for(std::chrono::duration<Rep, Period> duration) const
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cv.wait_for(lock, duration, [this] { return cancelled.load(); });
    }
};

// A scope that is never cancelled, for callers with nothing to cancel.
inline const CancellationScope &never_cancelled()
{
    static const CancellationScope scope;
    return scope;
}

#endif

#ifndef EVENT_QUEUE_HPP
#define EVENT_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

// Bounded multi-producer queue. Producers never block: try_push drops the
// item when the queue is full or closed. Consumers drain what is left after
// close().
template <typename T>
class EventQueue
{
private:
    std::deque<T> items;
    size_t capacity;
    bool closed = false;
    mutable std::mutex mutex;
    std::condition_variable cv;

public:
    explicit EventQueue(size_t capacity) : capacity(capacity == 0 ? 1 : capacity) {}

    bool try_push(T item)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed || items.size() >= capacity)
                return false;
            items.push_back(std::move(item));
        }
        cv.notify_one();
        return true;
    }

    // Waits up to timeout. False on timeout, or once closed and empty.
    template <typename Rep, typename Period>
    bool next(T &out, std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, timeout, [this] { return closed || !items.empty(); });
        if (items.empty())
            return false;
        out = std::move(items.front());
        items.pop_front();
        return true;
    }

    bool try_next(T &out)
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (items.empty())
            return false;
        out = std::move(items.front());
        items.pop_front();
        return true;
    }

    // Returns false if it was already closed
    bool close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed)
                return false;
            closed = true;
        }
        cv.notify_all();
        return true;
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

    // Closed and nothing left to read
    bool finished() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return closed && items.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex);
        return items.size();
    }
};

#endif

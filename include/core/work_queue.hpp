#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace mysql2pg {

/**
 * @brief Blocking multi-producer multi-consumer FIFO
 *
 * pop() blocks until an item is available or the queue is closed and empty.
 * Each pushed item is handed to exactly one pop() caller.
 */
template<typename T>
class WorkQueue {
public:
    /**
     * @return false if the queue is already closed
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @return Next item, or std::nullopt once closed and drained
     */
    [[nodiscard]] std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // No further pushes; blocked consumers drain the rest then get nullopt
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace mysql2pg

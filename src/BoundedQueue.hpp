#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

// Fixed-capacity FIFO. Producers never block: tryPush fails when the queue is
// full or closed. A closed queue still hands out what it holds before
// reporting Closed, unless it was closed with discardPending.
template <typename T>
class BoundedQueue {
public:
    enum class PopResult { Item, Closed, Timeout };

    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool tryPush(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    PopResult pop(T& out, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        bool ready = cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        if (!ready) {
            return PopResult::Timeout;
        }
        if (!items_.empty()) {
            out = std::move(items_.front());
            items_.pop_front();
            return PopResult::Item;
        }
        return PopResult::Closed;
    }

    void close(bool discardPending = false) {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
            if (discardPending) {
                items_.clear();
            }
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    const size_t capacity_;
    std::deque<T> items_;
    bool closed_ = false;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

// filename: bounded_queue.hpp
#pragma once
#include <message_queue.hpp>
#include <queue_error.hpp>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

// BoundedQueue: blocking, uses two condition_variables to avoid busy-waiting
// - put() waits on not_full_ while at capacity
// - get() waits on not_empty_ while empty and still open
// - close() flips closed_ once and wakes everybody
// One mutex covers the buffer and the flag. Notifies happen under the lock.

template<typename T>
class BoundedQueue : public MessageQueue<T> {
public:
    explicit BoundedQueue(std::ptrdiff_t capacity)
        : capacity_(validate_capacity(capacity)) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    void put(T item) override {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) throw QueueClosed();
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
    }

    bool try_put(T item) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) throw QueueClosed();
        if (queue_.size() >= capacity_) return false;
        queue_.push_back(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> get() override {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt; // closed + drained
        T value = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return value;
    }

    PopStatus get_for(T& out, std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout,
                                 [this] { return closed_ || !queue_.empty(); })) {
            return PopStatus::Timeout;
        }
        if (queue_.empty()) return PopStatus::Closed;
        out = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return PopStatus::Item;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const override { return capacity_; }

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> queue_;
    bool closed_ = false;
};

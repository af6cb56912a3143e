// filename: core/lf_queue.hpp
#pragma once
#include <boost/lockfree/queue.hpp>
#include <message_queue.hpp>
#include <queue_error.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <new>
#include <optional>
#include <thread>

// MPMC lock-free bounded queue: allocates each T on the heap and links the
// pointer into boost::lockfree::queue.
// count_ is a slot counter reserved before linking, so linked items never
// exceed capacity_. The node freelist starts at kNodeReserve at most and
// grows on push, so a large capacity is a limit, not an allocation.
// Writers spin with yield, readers sleep 50us between polls.
template<typename T>
class LfQueue : public MessageQueue<T> {
public:
    explicit LfQueue(std::ptrdiff_t capacity)
      : capacity_(validate_capacity(capacity))
      , q_(std::min<std::size_t>(capacity_, kNodeReserve))
    {}

    LfQueue(const LfQueue&) = delete;
    LfQueue& operator=(const LfQueue&) = delete;

    ~LfQueue() override {
        T* p = nullptr;
        while (q_.pop(p)) { delete p; }
    }

    void put(T item) override {
        while (!try_enqueue(item)) {
            std::this_thread::yield();
        }
    }

    bool try_put(T item) override {
        return try_enqueue(item);
    }

    std::optional<T> get() override {
        for (;;) {
            if (auto v = try_dequeue()) return v;
            if (drained()) return try_dequeue();
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    PopStatus get_for(T& out, std::chrono::milliseconds timeout) override {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        for (;;) {
            std::optional<T> v = try_dequeue();
            if (!v && drained()) {
                v = try_dequeue();
                if (!v) return PopStatus::Closed;
            }
            if (v) {
                out = std::move(*v);
                return PopStatus::Item;
            }
            if (std::chrono::steady_clock::now() >= deadline) return PopStatus::Timeout;
            std::this_thread::sleep_for(kPollInterval);
        }
    }

    void close() override {
        closed_.store(true);
    }

    bool closed() const override {
        return closed_.load();
    }

    std::size_t size() const override {
        return count_.load(std::memory_order_relaxed);
    }

    std::size_t capacity() const override { return capacity_; }

    static constexpr std::size_t kNodeReserve = 1024;

private:
    static constexpr std::chrono::microseconds kPollInterval{50};

    // Keeps writers_ raised for the whole of a put attempt.
    class WriterScope {
    public:
        explicit WriterScope(std::atomic<std::size_t>& writers) : writers_(writers) {
            writers_.fetch_add(1);
        }
        ~WriterScope() { writers_.fetch_sub(1); }
        WriterScope(const WriterScope&) = delete;
        WriterScope& operator=(const WriterScope&) = delete;
    private:
        std::atomic<std::size_t>& writers_;
    };

    // Moves from item only when it returns true.
    bool try_enqueue(T& item) {
        WriterScope scope(writers_);
        if (closed_.load()) throw QueueClosed();

        std::size_t n = count_.load();
        do {
            if (n >= capacity_) return false;
        } while (!count_.compare_exchange_weak(n, n + 1));

        std::unique_ptr<T> p;
        try {
            p = std::make_unique<T>(std::move(item));
        } catch (...) {
            count_.fetch_sub(1);
            throw;
        }
        if (!q_.push(p.get())) {
            count_.fetch_sub(1);
            throw std::bad_alloc();
        }
        p.release();
        return true;
    }

    std::optional<T> try_dequeue() {
        T* raw = nullptr;
        if (!q_.pop(raw)) return std::nullopt;
        std::unique_ptr<T> p(raw);
        count_.fetch_sub(1);
        return std::optional<T>(std::move(*p));
    }

    // Once closed_ is seen together with no writer mid-put, no further item
    // can be linked; whatever is still there is picked up by one last pop.
    bool drained() const {
        return closed_.load() && writers_.load() == 0;
    }

    const std::size_t capacity_;
    boost::lockfree::queue<T*> q_;
    std::atomic<std::size_t> count_{0};
    std::atomic<std::size_t> writers_{0};
    std::atomic<bool> closed_{false};
};

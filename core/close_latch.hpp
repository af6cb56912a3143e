// filename: core/close_latch.hpp
#pragma once
#include <message_queue.hpp>
#include <atomic>
#include <cstddef>

// Countdown shared by every producer of one queue. The arrival that takes
// it to zero closes the queue, so the queue is closed once, after the last
// producer is done. A latch made for zero producers closes right away.
template<typename T>
class CloseLatch {
public:
    CloseLatch(MessageQueue<T>& queue, std::size_t producers)
        : queue_(queue), remaining_(producers) {
        if (producers == 0) queue_.close();
    }

    CloseLatch(const CloseLatch&) = delete;
    CloseLatch& operator=(const CloseLatch&) = delete;

    // Returns true for the arrival that closed the queue. Arrivals past
    // zero change nothing.
    bool arrive() {
        std::size_t n = remaining_.load(std::memory_order_acquire);
        do {
            if (n == 0) return false;
        } while (!remaining_.compare_exchange_weak(n, n - 1, std::memory_order_acq_rel));
        if (n == 1) {
            queue_.close();
            return true;
        }
        return false;
    }

    std::size_t remaining() const noexcept {
        return remaining_.load(std::memory_order_acquire);
    }

private:
    MessageQueue<T>& queue_;
    std::atomic<std::size_t> remaining_;
};

// filename: message_queue.hpp
#pragma once
#include <chrono>
#include <cstddef>
#include <optional>

// Outcome of a timed get.
enum class PopStatus { Item, Timeout, Closed };

// A generic interface for bounded blocking channels
// Producers and consumers only see this, so the mutex backend and the
// lock-free one can be swapped without touching them.
//
// Contract shared by every backend:
//  - put() blocks while full, throws QueueClosed once close() has run
//  - get() blocks while empty and open, returns std::nullopt when closed
//    and drained
//  - close() is one-way and idempotent, wakes every waiter
//  - items come out in the order they went in

template<typename T>
class MessageQueue {
public:
    virtual void put(T item) = 0;
    // non-blocking put, false when full
    virtual bool try_put(T item) = 0;
    virtual std::optional<T> get() = 0;
    virtual PopStatus get_for(T& out, std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
    virtual bool closed() const = 0;
    // advisory, may be stale as soon as it returns
    virtual std::size_t size() const = 0;
    virtual std::size_t capacity() const = 0;
    virtual ~MessageQueue() = default;
};

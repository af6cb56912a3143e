// filename: core/producer.hpp
#pragma once
#include <message_queue.hpp>
#include <close_latch.hpp>
#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

// Producers are plain functions meant to run on their own thread.
// Each one arrives on the latch when it stops, normally or by throwing,
// so consumers are never left waiting on a producer that died.

// Puts every element of source into q, in source order.
template<typename T, typename Source>
std::size_t produce(const Source& source, MessageQueue<T>& q, CloseLatch<T>& done,
                    const std::string& name = "producer") {
    std::cerr << "[" << name << "] started\n";
    std::size_t sent = 0;
    try {
        for (const auto& item : source) {
            q.put(item);
            ++sent;
        }
    } catch (...) {
        std::cerr << "[" << name << "] stopped after " << sent << " items\n";
        done.arrive();
        throw;
    }
    const bool closed_queue = done.arrive();
    std::cerr << "[" << name << "] finished, " << sent << " items"
              << (closed_queue ? ", queue closed\n" : "\n");
    return sent;
}

// Single producer: closes q itself once source is exhausted.
template<typename T, typename Source>
std::size_t produce(const Source& source, MessageQueue<T>& q,
                    const std::string& name = "producer") {
    CloseLatch<T> done(q, 1);
    return produce(source, q, done, name);
}

// Forwards items from next() until it returns std::nullopt.
template<typename T, typename Generator>
std::size_t produce_from(Generator next, MessageQueue<T>& q, CloseLatch<T>& done,
                         const std::string& name = "producer") {
    std::cerr << "[" << name << "] started\n";
    std::size_t sent = 0;
    try {
        for (std::optional<T> item = next(); item; item = next()) {
            q.put(std::move(*item));
            ++sent;
        }
    } catch (...) {
        std::cerr << "[" << name << "] stopped after " << sent << " items\n";
        done.arrive();
        throw;
    }
    const bool closed_queue = done.arrive();
    std::cerr << "[" << name << "] finished, " << sent << " items"
              << (closed_queue ? ", queue closed\n" : "\n");
    return sent;
}

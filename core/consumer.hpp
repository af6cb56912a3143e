// filename: core/consumer.hpp
#pragma once
#include <message_queue.hpp>
#include <cstddef>
#include <iostream>
#include <string>
#include <utility>

// Drains q into sink until get() reports closed and empty.
template<typename T, typename Sink>
std::size_t consume_with(MessageQueue<T>& q, Sink&& sink,
                         const std::string& name = "consumer") {
    std::cerr << "[" << name << "] started\n";
    std::size_t received = 0;
    while (auto item = q.get()) {
        sink(std::move(*item));
        ++received;
    }
    std::cerr << "[" << name << "] exiting, queue closed. received " << received << " items\n";
    return received;
}

// Appends every item to dest in the order it was received.
template<typename T, typename Container>
std::size_t consume(MessageQueue<T>& q, Container& dest,
                    const std::string& name = "consumer") {
    return consume_with(q, [&dest](T&& item) { dest.push_back(std::move(item)); }, name);
}

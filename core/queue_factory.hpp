// filename: queue_factory.hpp
#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <message_queue.hpp>
#include <bounded_queue.hpp>
#include <lf_queue.hpp>

enum class QueueKind {Mutex, LockFree};

// "lf" / "lockfree" pick the lock-free backend, anything else (or null) the mutex one
QueueKind parse_queue_kind(const char* v);

std::string to_string(QueueKind kind);

template<typename T>
std::shared_ptr<MessageQueue<T>> make_queue(QueueKind kind, std::ptrdiff_t capacity) {
    switch (kind) {
        case QueueKind::LockFree:
            return std::make_shared<LfQueue<T>>(capacity);
        default:
            return std::make_shared<BoundedQueue<T>>(capacity);
    }
}

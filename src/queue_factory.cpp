#include <queue_factory.hpp>

QueueKind parse_queue_kind(const char* v) {
    if (!v) return QueueKind::Mutex;
    std::string s{v};
    if (s == "lf" || s == "lockfree") return QueueKind::LockFree;
    return QueueKind::Mutex;
}

std::string to_string(QueueKind kind) {
    switch (kind) {
        case QueueKind::LockFree:
            return "lockfree";
        default:
            return "mutex";
    }
}

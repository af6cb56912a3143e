// filename: src/queue_error.cpp
#include "core/queue_error.hpp"
#include <string>

namespace {

class QueueCategory : public boost::system::error_category {
public:
    const char* name() const noexcept override { return "boundq"; }

    std::string message(int ev) const override {
        switch (static_cast<queue_errc>(ev)) {
            case queue_errc::closed:
                return "put on a closed queue";
            case queue_errc::invalid_capacity:
                return "queue capacity must be positive";
        }
        return "unknown queue error";
    }
};

} // namespace

const boost::system::error_category& queue_category() noexcept {
    static const QueueCategory category{};
    return category;
}

boost::system::error_code make_error_code(queue_errc e) noexcept {
    return boost::system::error_code(static_cast<int>(e), queue_category());
}

QueueClosed::QueueClosed()
    : boost::system::system_error(make_error_code(queue_errc::closed)) {}

InvalidCapacity::InvalidCapacity(std::ptrdiff_t requested)
    : boost::system::system_error(make_error_code(queue_errc::invalid_capacity),
                                  "capacity=" + std::to_string(requested)),
      requested_(requested) {}

std::size_t validate_capacity(std::ptrdiff_t capacity) {
    if (capacity <= 0) throw InvalidCapacity(capacity);
    return static_cast<std::size_t>(capacity);
}

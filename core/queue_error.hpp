// filename: core/queue_error.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <cstddef>
#include <type_traits>

// Error codes raised by queue backends. Values start at 1 so that a
// default constructed error_code never reads as one of them.
enum class queue_errc {
    closed = 1,
    invalid_capacity = 2,
};

const boost::system::error_category& queue_category() noexcept;

boost::system::error_code make_error_code(queue_errc e) noexcept;

namespace boost {
namespace system {
template<>
struct is_error_code_enum<queue_errc> : std::true_type {};
} // namespace system
} // namespace boost

// put() after close(): the producer went past its declared end of input
class QueueClosed : public boost::system::system_error {
public:
    QueueClosed();
};

class InvalidCapacity : public boost::system::system_error {
public:
    explicit InvalidCapacity(std::ptrdiff_t requested);

    std::ptrdiff_t requested() const noexcept { return requested_; }

private:
    std::ptrdiff_t requested_;
};

// Returns capacity as a size, throws InvalidCapacity when it is <= 0.
std::size_t validate_capacity(std::ptrdiff_t capacity);

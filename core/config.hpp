// filename: core/config.hpp
#pragma once
#include <queue_factory.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Settings for boundq_demo:
//   boundq_demo [capacity] [producers] [consumers] [items]
// plus BOUNDQ_QUEUE=lf|mutex for the backend.
struct DemoConfig {
    // signed so that 0 and negatives reach the queue, which rejects them
    std::int64_t capacity = 3;
    std::size_t producers = 1;
    std::size_t consumers = 1;
    std::size_t items = 10;
    QueueKind kind = QueueKind::Mutex;
};

constexpr std::size_t kMaxWorkers = 256;

// Throws std::invalid_argument on a malformed or out of range argument.
DemoConfig load_config(int argc, const char* const* argv, const char* queue_env);

std::string usage(const char* prog);

// Leading/trailing blanks are ignored, anything else must be digits.
std::optional<std::uint64_t> parse_count(const char* s);
std::optional<std::int64_t> parse_signed(const char* s);

// Smallest power of ten that is >= items (1 for items == 0).
std::int64_t source_stride(std::size_t items);

// Producer p gets `items` consecutive values starting at p * source_stride(items).
std::vector<std::vector<std::int64_t>> make_sources(std::size_t producers, std::size_t items);

// filename: src/config.cpp
#include "core/config.hpp"
#include <cctype>
#include <charconv>
#include <cstring>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

// trim spaces, then the remaining range must parse completely
template<typename Int>
std::optional<Int> parse_trimmed(const char* s) {
    if (!s) return std::nullopt;
    const char* b = s; while (*b && std::isspace(static_cast<unsigned char>(*b))) ++b;
    const char* e = s + std::strlen(s);
    while (e > b && std::isspace(static_cast<unsigned char>(e[-1]))) --e;
    if (b == e) return std::nullopt;

    Int v = 0;
    auto res = std::from_chars(b, e, v, 10);
    if (res.ec != std::errc{} || res.ptr != e) return std::nullopt;
    return v;
}

std::size_t worker_count(const char* arg, const char* what) {
    auto v = parse_count(arg);
    if (!v || *v == 0) {
        throw std::invalid_argument(std::string(what) + " must be a positive integer, got '" + arg + "'");
    }
    std::size_t n = static_cast<std::size_t>(*v);
    if (n > kMaxWorkers) {
        std::cerr << "[config] " << what << "=" << n
                  << " too large; clamping to " << kMaxWorkers << "\n";
        n = kMaxWorkers;
    }
    return n;
}

} // namespace

std::optional<std::uint64_t> parse_count(const char* s) {
    return parse_trimmed<std::uint64_t>(s);
}

std::optional<std::int64_t> parse_signed(const char* s) {
    return parse_trimmed<std::int64_t>(s);
}

DemoConfig load_config(int argc, const char* const* argv, const char* queue_env) {
    DemoConfig cfg;
    if (argc > 5) {
        throw std::invalid_argument("too many arguments");
    }
    if (argc > 1) {
        auto cap = parse_signed(argv[1]);
        if (!cap) throw std::invalid_argument(std::string("capacity is not an integer: '") + argv[1] + "'");
        cfg.capacity = *cap;
    }
    if (argc > 2) {
        // zero producers is legal: the queue closes before any consumer waits
        auto p = parse_count(argv[2]);
        if (!p) throw std::invalid_argument(std::string("producers is not a count: '") + argv[2] + "'");
        cfg.producers = static_cast<std::size_t>(*p);
        if (cfg.producers > kMaxWorkers) {
            std::cerr << "[config] producers=" << cfg.producers
                      << " too large; clamping to " << kMaxWorkers << "\n";
            cfg.producers = kMaxWorkers;
        }
    }
    if (argc > 3) {
        cfg.consumers = worker_count(argv[3], "consumers");
    }
    if (argc > 4) {
        auto n = parse_count(argv[4]);
        if (!n || *n > static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
            throw std::invalid_argument(std::string("items is not a count: '") + argv[4] + "'");
        }
        cfg.items = static_cast<std::size_t>(*n);
    }
    cfg.kind = parse_queue_kind(queue_env);
    return cfg;
}

std::string usage(const char* prog) {
    return std::string("Usage: ") + (prog ? prog : "boundq_demo") +
           " [capacity] [producers] [consumers] [items]\n"
           "  BOUNDQ_QUEUE=lf selects the lock-free queue\n";
}

std::int64_t source_stride(std::size_t items) {
    std::int64_t stride = 1;
    while (static_cast<std::uint64_t>(stride) < items) stride *= 10;
    return stride;
}

std::vector<std::vector<std::int64_t>> make_sources(std::size_t producers, std::size_t items) {
    const std::int64_t stride = source_stride(items);
    std::vector<std::vector<std::int64_t>> sources(producers);
    for (std::size_t p = 0; p < producers; ++p) {
        sources[p].reserve(items);
        const std::int64_t base = static_cast<std::int64_t>(p) * stride;
        for (std::size_t i = 0; i < items; ++i) {
            sources[p].push_back(base + static_cast<std::int64_t>(i));
        }
    }
    return sources;
}

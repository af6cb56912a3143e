// filename: src/demo.cpp
#include "core/config.hpp"
#include "core/coordinator.hpp"
#include "core/queue_error.hpp"
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <vector>

namespace {
    // longer sequences are summarized instead of printed
    constexpr std::size_t kMaxPrinted = 32;

    void print_items(const char* label, const std::vector<std::int64_t>& items) {
        std::cout << label;
        if (items.size() > kMaxPrinted) {
            std::cout << " " << items.size() << " items\n";
            return;
        }
        std::cout << " [";
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) std::cout << ", ";
            std::cout << items[i];
        }
        std::cout << "]\n";
    }
}

int main(int argc, char* argv[]) {
    DemoConfig cfg;
    try {
        cfg = load_config(argc, argv, std::getenv("BOUNDQ_QUEUE"));
    } catch (const std::invalid_argument& e) {
        std::cerr << "[demo] " << e.what() << "\n" << usage(argv[0]);
        return 1;
    }

    try {
        Coordinator<std::int64_t> coordinator(cfg.kind, cfg.capacity);
        const auto sources = make_sources(cfg.producers, cfg.items);
        auto result = coordinator.run(sources, cfg.consumers);

        for (std::size_t p = 0; p < sources.size(); ++p) {
            const std::string label = "Source " + std::to_string(p) + ":     ";
            print_items(label.c_str(), sources[p]);
        }
        for (std::size_t c = 0; c < result.received.size(); ++c) {
            const std::string label = "Destination " + std::to_string(c) + ":";
            print_items(label.c_str(), result.received[c]);
        }

        std::cout << "RUN SUMMARY\n-----------\n";
        std::cout << "Queue:            " << to_string(cfg.kind)
                  << " (capacity " << cfg.capacity << ")\n";
        std::cout << "Items produced:   " << result.produced << "\n";
        std::cout << "Items consumed:   " << result.consumed << "\n";
        std::cout << "Elapsed (us):     " << result.elapsed_ns / 1000 << "\n";
    } catch (const InvalidCapacity& e) {
        std::cerr << "[demo] " << e.what() << " (" << e.code() << ")\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "[demo] run failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}

// filename: core/coordinator.hpp
#pragma once
#include <close_latch.hpp>
#include <consumer.hpp>
#include <metrics.hpp>
#include <producer.hpp>
#include <queue_factory.hpp>
#include <thread_pool.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

template<typename T>
struct PipelineResult {
    // one entry per consumer, each in receipt order
    std::vector<std::vector<T>> received;
    uint64_t produced = 0;
    uint64_t consumed = 0;
    uint64_t elapsed_ns = 0;
};

// Owns the queue and the lifetime of every producer and consumer task.
// Producers share one CloseLatch, so the queue closes after the last of
// them finishes. A task failure is recorded, the remaining tasks are let
// run to completion, then the first failure is rethrown from run().
template<typename T>
class Coordinator {
public:
    using Sink = std::function<void(T)>;

    struct Summary {
        uint64_t produced = 0;
        uint64_t consumed = 0;
        uint64_t elapsed_ns = 0;
    };

    // capacity errors (InvalidCapacity) surface here
    Coordinator(QueueKind kind, std::ptrdiff_t capacity)
        : kind_(kind), queue_(make_queue<T>(kind, capacity)) {}

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    MessageQueue<T>& queue() { return *queue_; }
    const Metrics& metrics() const { return metrics_; }

    // One producer per entry of sources, `consumers` consumers each
    // collecting into its own vector.
    // Can be called once; the queue is closed when it returns.
    PipelineResult<T> run(const std::vector<std::vector<T>>& sources, std::size_t consumers) {
        if (consumers == 0) {
            throw std::invalid_argument("Coordinator::run needs at least one consumer");
        }
        PipelineResult<T> result;
        result.received.resize(consumers);
        std::vector<Sink> sinks;
        sinks.reserve(consumers);
        for (auto& dest : result.received) {
            sinks.emplace_back([&dest](T item) { dest.push_back(std::move(item)); });
        }
        const Summary s = run_into(sources, sinks);
        result.produced = s.produced;
        result.consumed = s.consumed;
        result.elapsed_ns = s.elapsed_ns;
        return result;
    }

    // Same as run(), but consumer i hands every item to sinks[i]. A sink
    // that throws fails its consumer: the queue is closed, the remaining
    // tasks wind down, and the sink's exception is rethrown.
    Summary run_into(const std::vector<std::vector<T>>& sources, std::vector<Sink>& sinks) {
        const std::size_t consumers = sinks.size();
        if (consumers == 0) {
            throw std::invalid_argument("Coordinator::run needs at least one consumer");
        }
        if (started_.exchange(true)) {
            throw std::logic_error("Coordinator::run called twice");
        }

        std::cerr << "[coordinator] starting " << sources.size() << " producers, "
                  << consumers << " consumers, queue=" << to_string(kind_)
                  << " capacity=" << queue_->capacity() << "\n";

        Summary summary;
        const uint64_t start = now_ns();
        {
            CloseLatch<T> done(*queue_, sources.size());
            // every task blocks on the queue, so each needs its own worker
            ThreadPool pool(sources.size() + consumers);

            for (std::size_t i = 0; i < sources.size(); ++i) {
                pool.post([this, &sources, &done, i] {
                    const std::string name = "producer-" + std::to_string(i);
                    guarded(name, false, [&] {
                        metrics_.produced.fetch_add(produce(sources[i], *queue_, done, name));
                    });
                });
            }
            for (std::size_t i = 0; i < consumers; ++i) {
                pool.post([this, &sinks, i] {
                    const std::string name = "consumer-" + std::to_string(i);
                    guarded(name, true, [&] {
                        metrics_.consumed.fetch_add(consume_with(*queue_, sinks[i], name));
                    });
                });
            }
            pool.join();
        }
        summary.elapsed_ns = now_ns() - start;
        summary.produced = metrics_.produced.load();
        summary.consumed = metrics_.consumed.load();

        std::exception_ptr err;
        {
            std::lock_guard<std::mutex> lk(error_mu_);
            err = first_error_;
        }
        if (err) {
            std::cerr << "[coordinator] finished with " << metrics_.failed_tasks.load()
                      << " failed task(s)\n";
            std::rethrow_exception(err);
        }
        std::cerr << "[coordinator] finished: produced=" << summary.produced
                  << " consumed=" << summary.consumed << "\n";
        return summary;
    }

private:
    // Runs body, records the first failure. A failed consumer also closes
    // the queue, otherwise producers stuck on a full queue never return.
    template<typename F>
    void guarded(const std::string& name, bool close_on_failure, F&& body) {
        try {
            body();
            return;
        } catch (const std::exception& e) {
            std::cerr << "[coordinator] " << name << " failed: " << e.what() << "\n";
            record(std::current_exception());
        } catch (...) {
            std::cerr << "[coordinator] " << name << " failed: unknown exception\n";
            record(std::current_exception());
        }
        if (close_on_failure) queue_->close();
    }

    void record(std::exception_ptr e) {
        metrics_.failed_tasks.fetch_add(1);
        std::lock_guard<std::mutex> lk(error_mu_);
        if (!first_error_) first_error_ = e;
    }

    QueueKind kind_;
    std::shared_ptr<MessageQueue<T>> queue_;
    Metrics metrics_;
    std::atomic<bool> started_{false};
    std::mutex error_mu_;
    std::exception_ptr first_error_;
};

// filename: src/thread_pool.cpp
#include "core/thread_pool.hpp"
#include <iostream>
#include <utility>

ThreadPool::ThreadPool(std::size_t n) {
    if (n == 0) n = 1;
    threads_.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        threads_.emplace_back([this] { worker_loop(); });
    }
}

void ThreadPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(mu_);
            cv_.wait(lk, [this]{
                return stop_.load(std::memory_order_acquire) || !tasks_.empty();
            });
            if (stop_.load(std::memory_order_relaxed) && tasks_.empty())
                return; // graceful shutdown after draining
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        try {
            task();
        } catch (...) {
            // keep the pool alive, the first failure is handed to join()
            std::lock_guard<std::mutex> lk(mu_);
            if (!first_error_) first_error_ = std::current_exception();
        }
    }
}

void ThreadPool::shutdown() {
    {
        // under the lock so a worker between its predicate check and wait()
        // cannot miss the notify
        std::lock_guard<std::mutex> lk(mu_);
        stop_.store(true, std::memory_order_release);
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

void ThreadPool::join() {
    shutdown();
    std::exception_ptr err;
    {
        std::lock_guard<std::mutex> lk(mu_);
        std::swap(err, first_error_);
    }
    if (err) std::rethrow_exception(err);
}

ThreadPool::~ThreadPool() {
    shutdown();
    if (first_error_) {
        try {
            std::rethrow_exception(first_error_);
        } catch (const std::exception& e) {
            std::cerr << "[thread_pool] task threw std::exception: " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[thread_pool] task threw unknown exception\n";
        }
    }
}

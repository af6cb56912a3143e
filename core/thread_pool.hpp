#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <exception>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed set of workers draining a task queue.
// A throwing task does not take its worker down and is not only logged:
// the first exception is kept and join() rethrows it after the remaining
// tasks have run and every worker is joined. The destructor joins too but
// can only log. post() after join() is dropped.
// Tasks are expected to block for long stretches (queue puts and gets),
// so size the pool to the number of tasks that must run at the same time.
class ThreadPool {
public:
    explicit ThreadPool(std::size_t n);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    template <class F>
    void post(F&& f) {
        if (stop_.load(std::memory_order_acquire)) return;   // ignore after stop
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (stop_) return;
            tasks_.emplace(std::forward<F>(f));
        }
        cv_.notify_one();
    }

    void join();

    std::size_t size() const noexcept { return threads_.size(); }

private:
    void worker_loop();
    void shutdown();

    std::atomic<bool> stop_{false};
    std::mutex mu_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> tasks_;
    std::vector<std::thread> threads_;
    std::exception_ptr first_error_;
};

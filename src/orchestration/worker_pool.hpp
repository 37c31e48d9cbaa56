#pragma once

#include "core/errors.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <semaphore>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// WorkerPool — fixed-size FIFO thread pool. Tasks must not share mutable
// state; results come back through the returned futures.
// ---------------------------------------------------------------------------
class WorkerPool {
public:
    // 0 threads -> hardware concurrency (at least 1).
    explicit WorkerPool(size_t num_threads = 0) {
        if (num_threads == 0) {
            num_threads = std::max<size_t>(1, std::thread::hardware_concurrency());
        }
        workers_.reserve(num_threads);
        for (size_t i = 0; i < num_threads; ++i) {
            workers_.emplace_back([this] { worker_loop(); });
        }
    }

    ~WorkerPool() { shutdown(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<Fn>> {
        using Result = std::invoke_result_t<Fn>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        auto future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) throw std::runtime_error("submit on stopped WorkerPool");
            tasks_.push([task] { (*task)(); });
        }
        cv_.notify_one();
        return future;
    }

    // Drains queued tasks, then joins all workers.
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return;
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            if (w.joinable()) w.join();
        }
    }

    size_t size() const { return workers_.size(); }

private:
    void worker_loop() {
        for (;;) {
            std::function<void()> task;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
                if (tasks_.empty()) return;
                task = std::move(tasks_.front());
                tasks_.pop();
            }
            task();
        }
    }

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

// ---------------------------------------------------------------------------
// ResamplingGate — caps concurrent bootstrap work to bound peak memory
// ---------------------------------------------------------------------------
class ResamplingGate {
public:
    explicit ResamplingGate(int max_concurrent) : slots_(check_slots(max_concurrent)),
                                                  capacity_(max_concurrent) {}

    class Permit {
    public:
        explicit Permit(ResamplingGate& gate) : gate_(gate) { gate_.acquire(); }
        ~Permit() { gate_.release(); }
        Permit(const Permit&) = delete;
        Permit& operator=(const Permit&) = delete;

    private:
        ResamplingGate& gate_;
    };

    int capacity() const { return capacity_; }
    int in_use() const { return in_use_.load(); }
    int peak_in_use() const { return peak_.load(); }

private:
    static std::ptrdiff_t check_slots(int n) {
        if (n < 1) throw ConfigError("ResamplingGate needs at least one slot");
        return n;
    }

    void acquire() {
        slots_.acquire();
        int now = ++in_use_;
        int prev = peak_.load();
        while (now > prev && !peak_.compare_exchange_weak(prev, now)) {
        }
    }

    void release() {
        --in_use_;
        slots_.release();
    }

    std::counting_semaphore<> slots_;
    int capacity_;
    std::atomic<int> in_use_{0};
    std::atomic<int> peak_{0};
};

// ---------------------------------------------------------------------------
// CancellationToken — cooperative, checked between windows
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

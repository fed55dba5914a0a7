/**
 * Work-Stealing Thread Pool for CLAM
 *
 * Shared by tree construction (one task per pending subtree) and query
 * batches (one task per chunk of queries). Each worker owns a deque: the
 * owner pushes and pops at the back (LIFO, cache-warm subtrees), idle
 * workers steal from the front (FIFO, the largest pending subtrees).
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace clam {

/**
 * Double-ended task queue owned by one worker
 */
class WorkStealingDeque {
public:
    using Task = std::function<void()>;

    // Push work to bottom (owner thread, or external submitters)
    void push_bottom(Task task) {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push_back(std::move(task));
    }

    // Pop work from bottom (owner thread - LIFO)
    bool pop_bottom(Task& task) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.empty()) return false;
        task = std::move(tasks_.back());
        tasks_.pop_back();
        return true;
    }

    // Steal work from top (other threads - FIFO)
    bool steal(Task& task) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (tasks_.empty()) return false;
        task = std::move(tasks_.front());
        tasks_.pop_front();
        return true;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return tasks_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::deque<Task> tasks_;
};

class ThreadPool {
public:
    using Task = std::function<void()>;

    // Shared pool sized by ThreadConfig (created on first use)
    static ThreadPool& instance();

    // Dedicated pool; a count of 0 is treated as 1
    explicit ThreadPool(size_t num_threads);

    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Submit a task and get a future for the result
    template<typename F, typename... Args>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
        using ReturnType = std::invoke_result_t<F, Args...>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(
            std::bind(std::forward<F>(f), std::forward<Args>(args)...)
        );

        std::future<ReturnType> result = task->get_future();
        enqueue([task]() { (*task)(); });
        return result;
    }

    // Run func(i) for every i in [begin, end) and wait for completion.
    // From inside a worker of this pool the loop runs inline.
    template<typename Func>
    void parallel_for(size_t begin, size_t end, Func&& func) {
        if (begin >= end) return;

        if (num_threads_ == 1 || in_worker_thread()) {
            for (size_t i = begin; i < end; ++i) {
                func(i);
            }
            return;
        }

        const size_t total = end - begin;
        const size_t chunk_size = std::max(size_t(1), total / (num_threads_ * 8));

        std::vector<std::future<void>> futures;
        futures.reserve(total / chunk_size + 1);

        for (size_t i = begin; i < end; i += chunk_size) {
            size_t chunk_end = std::min(i + chunk_size, end);
            futures.push_back(submit([&func, i, chunk_end]() {
                for (size_t j = i; j < chunk_end; ++j) {
                    func(j);
                }
            }));
        }

        // Wait for every chunk before surfacing the first failure, since the
        // chunks reference func and the caller's state
        std::exception_ptr first_error;
        for (auto& future : futures) {
            try {
                future.get();
            } catch (...) {
                if (!first_error) first_error = std::current_exception();
            }
        }
        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

    size_t num_threads() const { return num_threads_; }

    // True when called from one of this pool's workers
    bool in_worker_thread() const;

    // Tasks queued but not yet started
    size_t pending() const { return pending_.load(std::memory_order_acquire); }

private:
    void enqueue(Task task);
    bool try_acquire(size_t thread_id, Task& task);
    void worker_loop(size_t thread_id);

    size_t num_threads_;
    std::vector<std::thread> workers_;
    std::vector<std::unique_ptr<WorkStealingDeque>> deques_;
    std::atomic<bool> stop_;
    std::atomic<size_t> pending_;
    std::atomic<size_t> next_queue_;

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

} // namespace clam

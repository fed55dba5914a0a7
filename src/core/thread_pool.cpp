#include "clam/thread_pool.hpp"
#include "clam/thread_config.hpp"
#include "clam/logging.hpp"

namespace clam {

namespace {

// Identity of the pool/worker running on this thread
thread_local const ThreadPool* current_pool = nullptr;
thread_local size_t current_thread_id = 0;

} // namespace

ThreadPool& ThreadPool::instance() {
    static ThreadPool pool(ThreadConfig::instance().get_thread_count());
    return pool;
}

ThreadPool::ThreadPool(size_t num_threads)
    : num_threads_(std::max(size_t(1), num_threads))
    , stop_(false)
    , pending_(0)
    , next_queue_(0) {
    workers_.reserve(num_threads_);
    deques_.reserve(num_threads_);

    for (size_t i = 0; i < num_threads_; ++i) {
        deques_.push_back(std::make_unique<WorkStealingDeque>());
    }

    for (size_t i = 0; i < num_threads_; ++i) {
        workers_.emplace_back(&ThreadPool::worker_loop, this, i);
    }

    LOG_DEBUG("Thread pool started with ", num_threads_, " workers");
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        stop_ = true;
    }
    wake_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

bool ThreadPool::in_worker_thread() const {
    return current_pool == this;
}

void ThreadPool::enqueue(Task task) {
    // Workers keep their own spawn local; external submitters round-robin
    size_t target = in_worker_thread()
        ? current_thread_id
        : next_queue_.fetch_add(1, std::memory_order_relaxed) % num_threads_;

    // Counted before it becomes visible, so a worker that takes it at once
    // never decrements below zero
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        pending_.fetch_add(1, std::memory_order_release);
    }
    deques_[target]->push_bottom(std::move(task));
    wake_cv_.notify_one();
}

bool ThreadPool::try_acquire(size_t thread_id, Task& task) {
    // First, try to pop from our own deque
    if (deques_[thread_id]->pop_bottom(task)) {
        return true;
    }

    // Then try to steal from the others
    for (size_t attempt = 1; attempt < num_threads_; ++attempt) {
        size_t victim = (thread_id + attempt) % num_threads_;
        if (deques_[victim]->steal(task)) {
            return true;
        }
    }
    return false;
}

void ThreadPool::worker_loop(size_t thread_id) {
    current_pool = this;
    current_thread_id = thread_id;

    while (true) {
        Task task;
        if (try_acquire(thread_id, task)) {
            pending_.fetch_sub(1, std::memory_order_acq_rel);
            // packaged_task captures the task's exception in its future
            task();
            continue;
        }

        std::unique_lock<std::mutex> lock(wake_mutex_);
        wake_cv_.wait(lock, [this]() {
            return stop_.load() || pending_.load(std::memory_order_acquire) > 0;
        });

        // Remaining tasks are drained before shutdown
        if (stop_.load() && pending_.load(std::memory_order_acquire) == 0) {
            return;
        }
    }
}

} // namespace clam

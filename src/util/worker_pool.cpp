#include <aarc/worker_pool.hpp>

namespace aarc {

WorkerPool::WorkerPool(unsigned int n_threads) {
    if (n_threads == 0) n_threads = std::thread::hardware_concurrency();
    if (n_threads == 0) n_threads = 4;
    threads_.reserve(n_threads);
    for (unsigned int i = 0; i < n_threads; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
}

std::future<void> WorkerPool::submit(std::function<void()> fn) {
    std::packaged_task<void()> task(std::move(fn));
    std::future<void> fut = task.get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(task));
    }
    cv_.notify_one();
    return fut;
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            // Drain queued work before exiting so no future is left unsatisfied
            if (stopping_ && queue_.empty()) return;
            task = std::move(queue_.front());
            queue_.pop();
        }
        task();
    }
}

Status await_all(std::vector<std::future<void>>& futures, const CancelToken& token) {
    std::string first_failure;
    size_t failures = 0;

    for (auto& fut : futures) {
        if (!fut.valid()) continue;
        if (!wait_ready(fut, token)) {
            return AarcError{AarcError::Cancelled, "wait for pending tasks was cancelled"};
        }
        try {
            fut.get();
        } catch (const std::exception& e) {
            if (failures == 0) first_failure = e.what();
            failures++;
        }
    }

    if (failures > 0) {
        return AarcError{AarcError::Execution,
            std::to_string(failures) + " task(s) failed: " + first_failure};
    }
    return ok_status();
}

TaskGroup::TaskGroup(WorkerPool& pool, CancelToken token)
    : pool_(pool), token_(std::move(token)) {}

void TaskGroup::spawn(std::function<void()> fn) {
    futures_.push_back(pool_.submit(std::move(fn)));
}

Status TaskGroup::wait() {
    Status s = await_all(futures_, token_);
    futures_.clear();
    return s;
}

} // namespace aarc

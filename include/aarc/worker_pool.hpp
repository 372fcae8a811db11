#pragma once

#include <aarc/result.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace aarc {

// Cooperative cancellation flag shared between a caller and its waits.
// Copies observe the same flag.
class CancelToken {
public:
    CancelToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }
    bool is_cancelled() const { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

// Fixed-size pool of threads running short filesystem tasks
class WorkerPool {
public:
    // 0 selects std::thread::hardware_concurrency()
    explicit WorkerPool(unsigned int n_threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Queue a task. An exception escaping fn is delivered through the future.
    std::future<void> submit(std::function<void()> fn);

    unsigned int worker_count() const { return static_cast<unsigned int>(threads_.size()); }

private:
    void worker_loop();

    std::vector<std::thread> threads_;
    std::queue<std::packaged_task<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stopping_ = false;
};

// Block until fut is ready. Returns false if the token was cancelled first;
// the task itself keeps running.
template<typename T>
bool wait_ready(const std::future<T>& fut, const CancelToken& token,
                std::chrono::milliseconds poll = std::chrono::milliseconds(20)) {
    while (fut.wait_for(poll) != std::future_status::ready) {
        if (token.is_cancelled()) return false;
    }
    return true;
}

// Join every future. Returns Cancelled when the token trips during the wait,
// Execution when any task escaped with an exception (after joining the rest).
Status await_all(std::vector<std::future<void>>& futures, const CancelToken& token);

// A batch of tasks tied to one unit of work; wait() joins all of them
class TaskGroup {
public:
    TaskGroup(WorkerPool& pool, CancelToken token);

    void spawn(std::function<void()> fn);

    size_t size() const { return futures_.size(); }

    Status wait();

private:
    WorkerPool& pool_;
    CancelToken token_;
    std::vector<std::future<void>> futures_;
};

} // namespace aarc

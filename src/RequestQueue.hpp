// RequestQueue.hpp
// Single-worker FIFO: every task runs to completion before the next starts,
// whatever thread submitted it.
#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <type_traits>

class RequestQueue {
public:
    explicit RequestQueue(bool verbose = false);
    ~RequestQueue();

    RequestQueue(const RequestQueue&) = delete;
    RequestQueue& operator=(const RequestQueue&) = delete;

    // Queue fn and return a future for its result. An exception thrown by fn
    // is stored in the future; the queue carries on with the next task.
    template <typename Fn>
    auto enqueue(std::string name, Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>&>> {
        using Result = std::invoke_result_t<std::decay_t<Fn>&>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> future = task->get_future();
        push(QueuedTask{std::move(name), [task]() { (*task)(); }});
        return future;
    }

    // Tasks waiting to run (not counting the one in flight).
    std::size_t pending() const;

    // Run everything already queued, then stop the worker. Later enqueues
    // get a broken promise.
    void shutdown();

private:
    struct QueuedTask {
        std::string name;
        std::function<void()> run;
    };

    void push(QueuedTask task);
    void workerLoop();

    bool m_verbose;
    mutable std::mutex m_mutex;
    std::condition_variable m_taskAvailable;
    std::queue<QueuedTask> m_tasks;
    std::atomic<bool> m_stopping{false};
    std::thread m_worker;
};

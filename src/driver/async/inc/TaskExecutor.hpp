#pragma once

#include "DriverErrors.hpp"
#include "TaskQueue.hpp"
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <vector>

/**
 * Fixed pool of worker threads running submitted callables in FIFO order.
 * Results and exceptions are delivered through the returned std::future.
 */
class TaskExecutor {
public:
    static constexpr size_t DEFAULT_WORKERS = 4;

    explicit TaskExecutor(size_t workers = DEFAULT_WORKERS);

    // Runs every queued task, then joins the workers
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    /**
     * @throws InterfaceError After shutdown()
     */
    template <typename Fn>
    auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
        using Result = std::invoke_result_t<std::decay_t<Fn>>;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<Fn>(fn));
        std::future<Result> result = task->get_future();
        if (!queue_.enqueue([task]() { (*task)(); })) {
            throw InterfaceError("Task executor is shut down.");
        }
        return result;
    }

    // Stop accepting tasks and wait for the queued ones; safe to call twice, never from a task
    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    TaskQueue queue_;
    std::vector<std::thread> workers_;
    std::mutex join_mutex_;
};

#pragma once

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>

using Task = std::function<void()>;

class TaskQueue {
public:
    // Add task to queue; false once the queue is stopped
    bool enqueue(Task task);

    // Block until a task is available; an empty Task once stopped and drained
    Task dequeue();

    // Stop accepting tasks; queued tasks are still handed out
    void stop();

    bool stopped() const;

private:
    std::queue<Task> queue_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_ = false;
};

#include "TaskQueue.hpp"

bool TaskQueue::enqueue(Task task) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stop_) {
            return false;
        }
        queue_.push(std::move(task));
    }
    cv_.notify_one();
    return true;
}

Task TaskQueue::dequeue() {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return !queue_.empty() || stop_; });
    if (queue_.empty()) {
        return Task();
    }
    Task task = std::move(queue_.front());
    queue_.pop();
    return task;
}

void TaskQueue::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stop_ = true;
    }
    cv_.notify_all();
}

bool TaskQueue::stopped() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return stop_;
}

#include "TaskExecutor.hpp"

TaskExecutor::TaskExecutor(size_t workers) {
    if (workers == 0) {
        throw std::invalid_argument("TaskExecutor needs at least one worker");
    }
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

TaskExecutor::~TaskExecutor() {
    shutdown();
}

void TaskExecutor::shutdown() {
    queue_.stop();
    std::lock_guard<std::mutex> lock(join_mutex_);
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void TaskExecutor::worker_loop() {
    while (true) {
        Task task = queue_.dequeue();
        if (!task) {
            return;
        }
        // packaged_task stores any exception in its future
        task();
    }
}

#include "loop.hpp"

#include <exception>
#include <iostream>

namespace switchyard {

void Loop::Run() {
    while (true)
    {
        Task task;

        {
            std::unique_lock<std::mutex> lock(Mutex_);
            Cv_.wait(lock, [this]{
                return Stopped_ || !TaskQueue_.empty();
            });
            if (Stopped_) {
                return;
            }
            task = std::move(TaskQueue_.front());
            TaskQueue_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            std::cerr << "[Loop] Task failed: " << e.what() << std::endl;
        }
    }
}

void Loop::EnqueueTask(Task&& task) {
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        if (Stopped_) {
            return;
        }
        TaskQueue_.push(std::move(task));
    }

    Cv_.notify_one();
}

void Loop::Stop() {
    std::queue<Task> dropped;
    {
        std::lock_guard<std::mutex> lock(Mutex_);
        Stopped_ = true;
        dropped.swap(TaskQueue_);
    }

    Cv_.notify_all();
}

bool Loop::IsStopped() {
    std::lock_guard<std::mutex> lock(Mutex_);
    return Stopped_;
}

} // namespace switchyard

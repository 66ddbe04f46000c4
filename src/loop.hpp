#pragma once

#include <condition_variable>
#include <mutex>
#include <functional>
#include <queue>

namespace switchyard {

using Task = std::function<void()>;

// Single-consumer task queue. Run() executes tasks in the order they were
// enqueued until Stop() is called; tasks still queued at that point are dropped.
class Loop {
public:
    void EnqueueTask(Task&& task);
    void Run();
    void Stop();

    bool IsStopped();

private:
    std::mutex Mutex_;
    std::condition_variable Cv_;
    std::queue<Task> TaskQueue_;
    bool Stopped_ = false;
};

} // namespace switchyard

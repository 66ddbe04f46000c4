#include "loop.hpp"

#include <gtest/gtest.h>

#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

namespace switchyard {
namespace test {

TEST(LoopTest, RunsTasksInOrder) {
    auto loop = std::make_shared<Loop>();
    std::thread thread{std::bind(&Loop::Run, loop)};

    std::vector<int> order;
    std::promise<void> done;
    for (int i = 0; i < 5; ++i) {
        loop->EnqueueTask([&order, i] { order.push_back(i); });
    }
    loop->EnqueueTask([&done] { done.set_value(); });

    done.get_future().wait();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));

    loop->Stop();
    thread.join();
}

TEST(LoopTest, FailingTaskDoesNotStopTheLoop) {
    auto loop = std::make_shared<Loop>();
    std::thread thread{std::bind(&Loop::Run, loop)};

    std::promise<void> done;
    loop->EnqueueTask([] { throw std::runtime_error("boom"); });
    loop->EnqueueTask([&done] { done.set_value(); });

    done.get_future().wait();
    EXPECT_FALSE(loop->IsStopped());

    loop->Stop();
    thread.join();
}

TEST(LoopTest, StopDropsQueuedTasks) {
    Loop loop;
    bool ran = false;
    loop.EnqueueTask([&ran] { ran = true; });

    loop.Stop();
    EXPECT_TRUE(loop.IsStopped());

    // Returns at once and never runs what was queued
    loop.Run();
    loop.EnqueueTask([&ran] { ran = true; });
    loop.Run();
    EXPECT_FALSE(ran);
}

} // namespace test
} // namespace switchyard

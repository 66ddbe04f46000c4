#include "negotiation_lock.hpp"

#include "error.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace switchyard {
namespace test {

using namespace std::chrono_literals;

TEST(NegotiationLockTest, AcquireAndRelease) {
    NegotiationLock lock("test");
    EXPECT_EQ(lock.GetState(), NegotiationLock::State::Idle);

    lock.Acquire();
    EXPECT_EQ(lock.GetState(), NegotiationLock::State::Negotiating);

    EXPECT_TRUE(lock.Release());
    EXPECT_EQ(lock.GetState(), NegotiationLock::State::Idle);
    EXPECT_FALSE(lock.Release());
}

TEST(NegotiationLockTest, SecondAcquireWaitsForRelease) {
    NegotiationLock lock("test");
    lock.Acquire();

    std::atomic_bool acquired{false};
    std::thread waiter([&] {
        lock.Acquire();
        acquired = true;
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(acquired);

    // Released from a different thread than the one that acquired
    std::thread([&] { lock.Release(); }).join();
    waiter.join();
    EXPECT_TRUE(acquired);
    EXPECT_EQ(lock.GetState(), NegotiationLock::State::Negotiating);
}

TEST(NegotiationLockTest, WaitersAreServedInArrivalOrder) {
    NegotiationLock lock("test");
    lock.Acquire();

    std::mutex orderMutex;
    std::vector<int> order;
    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; ++i) {
        waiters.emplace_back([&, i] {
            lock.Acquire();
            {
                std::lock_guard<std::mutex> guard(orderMutex);
                order.push_back(i);
            }
            lock.Release();
        });
        // Give each waiter time to take its ticket
        std::this_thread::sleep_for(20ms);
    }

    lock.Release();
    for (auto& waiter : waiters) {
        waiter.join();
    }

    EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
}

TEST(NegotiationLockTest, CloseFailsWaiters) {
    NegotiationLock lock("test");
    lock.Acquire();

    std::atomic<int> failures{0};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 3; ++i) {
        waiters.emplace_back([&] {
            try {
                lock.Acquire();
            } catch (const Error& e) {
                if (e.Code() == ErrorCode::SessionClosed) {
                    ++failures;
                }
            }
        });
    }

    std::this_thread::sleep_for(50ms);
    lock.Close();
    for (auto& waiter : waiters) {
        waiter.join();
    }

    EXPECT_EQ(failures, 3);
    EXPECT_TRUE(lock.IsClosed());
    EXPECT_EQ(lock.GetState(), NegotiationLock::State::Idle);
    EXPECT_THROW(lock.Acquire(), Error);
}

TEST(NegotiationLockTest, ScopedNegotiationReleases) {
    NegotiationLock lock("test");
    {
        ScopedNegotiation negotiation(lock);
        EXPECT_EQ(lock.GetState(), NegotiationLock::State::Negotiating);
    }
    EXPECT_EQ(lock.GetState(), NegotiationLock::State::Idle);
}

TEST(NegotiationLockTest, ScopedNegotiationReleasesOnException) {
    NegotiationLock lock("test");
    try {
        ScopedNegotiation negotiation(lock);
        throw Error(ErrorCode::InvalidDescription, "bad offer");
    } catch (const Error&) {
    }
    EXPECT_EQ(lock.GetState(), NegotiationLock::State::Idle);
}

TEST(NegotiationLockTest, DetachedNegotiationStaysHeld) {
    NegotiationLock lock("test");
    {
        ScopedNegotiation negotiation(lock);
        negotiation.Detach();
    }
    EXPECT_EQ(lock.GetState(), NegotiationLock::State::Negotiating);
    EXPECT_TRUE(lock.Release());
}

} // namespace test
} // namespace switchyard

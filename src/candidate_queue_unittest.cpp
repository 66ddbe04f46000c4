#include "candidate_queue.hpp"

#include "error.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

namespace switchyard {
namespace test {

namespace {

IceCandidate MakeCandidate(int n) {
    return IceCandidate{"candidate:" + std::to_string(n) + " 1 udp 2122260223 10.0.0.1 5000 typ host", "0", 0};
}

} // namespace

TEST(CandidateQueueTest, QueuesUntilFlushed) {
    std::vector<std::string> applied;
    CandidateQueue queue("test", [&applied](const IceCandidate& candidate) {
        applied.push_back(candidate.candidate);
    });

    queue.EnqueueOrApply(MakeCandidate(1));
    queue.EnqueueOrApply(MakeCandidate(2));
    EXPECT_TRUE(applied.empty());
    EXPECT_EQ(queue.PendingCount(), 2u);
    EXPECT_FALSE(queue.IsFlushed());

    EXPECT_EQ(queue.Flush(), 0u);
    ASSERT_EQ(applied.size(), 2u);
    EXPECT_EQ(applied[0], MakeCandidate(1).candidate);
    EXPECT_EQ(applied[1], MakeCandidate(2).candidate);
    EXPECT_EQ(queue.PendingCount(), 0u);
    EXPECT_TRUE(queue.IsFlushed());
}

TEST(CandidateQueueTest, AppliesDirectlyAfterFlush) {
    std::vector<std::string> applied;
    CandidateQueue queue("test", [&applied](const IceCandidate& candidate) {
        applied.push_back(candidate.candidate);
    });

    queue.Flush();
    queue.EnqueueOrApply(MakeCandidate(3));
    ASSERT_EQ(applied.size(), 1u);
    EXPECT_EQ(applied[0], MakeCandidate(3).candidate);
}

TEST(CandidateQueueTest, SecondFlushIsNoop) {
    int applied = 0;
    CandidateQueue queue("test", [&applied](const IceCandidate&) {
        ++applied;
    });

    queue.EnqueueOrApply(MakeCandidate(1));
    queue.Flush();
    queue.Flush();
    EXPECT_EQ(applied, 1);
}

TEST(CandidateQueueTest, FailedCandidateDoesNotStopFlush) {
    std::vector<std::string> applied;
    CandidateQueue queue("test", [&applied](const IceCandidate& candidate) {
        if (candidate.candidate == MakeCandidate(2).candidate) {
            throw std::invalid_argument("bad candidate");
        }
        applied.push_back(candidate.candidate);
    });

    for (int i = 1; i <= 3; ++i) {
        queue.EnqueueOrApply(MakeCandidate(i));
    }

    EXPECT_EQ(queue.Flush(), 1u);
    ASSERT_EQ(applied.size(), 2u);
    EXPECT_EQ(applied[0], MakeCandidate(1).candidate);
    EXPECT_EQ(applied[1], MakeCandidate(3).candidate);
}

TEST(CandidateQueueTest, DirectApplyErrorPropagates) {
    CandidateQueue queue("test", [](const IceCandidate&) {
        throw std::invalid_argument("bad candidate");
    });

    queue.Flush();
    EXPECT_THROW(queue.EnqueueOrApply(MakeCandidate(1)), std::invalid_argument);
}

TEST(CandidateQueueTest, ClosedQueueRejectsCandidates) {
    int applied = 0;
    CandidateQueue queue("test", [&applied](const IceCandidate&) {
        ++applied;
    });

    queue.EnqueueOrApply(MakeCandidate(1));
    queue.Close();
    EXPECT_EQ(queue.PendingCount(), 0u);
    EXPECT_EQ(queue.Flush(), 0u);
    EXPECT_EQ(applied, 0);

    try {
        queue.EnqueueOrApply(MakeCandidate(2));
        FAIL() << "Expected SessionClosed";
    } catch (const Error& e) {
        EXPECT_EQ(e.Code(), ErrorCode::SessionClosed);
    }
}

TEST(CandidateQueueTest, KeepsArrivalOrderWhileFlushing) {
    std::vector<int> applied;
    CandidateQueue queue("test", [&applied](const IceCandidate& candidate) {
        applied.push_back(std::stoi(candidate.sdpMid));
    });

    for (int i = 0; i < 100; ++i) {
        queue.EnqueueOrApply(IceCandidate{"candidate", std::to_string(i), std::nullopt});
    }

    std::atomic_bool go{false};
    std::thread producer([&] {
        while (!go) {
            std::this_thread::yield();
        }
        for (int i = 100; i < 200; ++i) {
            queue.EnqueueOrApply(IceCandidate{"candidate", std::to_string(i), std::nullopt});
        }
    });

    go = true;
    queue.Flush();
    producer.join();

    ASSERT_EQ(applied.size(), 200u);
    for (int i = 0; i < 200; ++i) {
        EXPECT_EQ(applied[i], i);
    }
}

} // namespace test
} // namespace switchyard

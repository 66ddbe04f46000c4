#include "router.hpp"

#include "error.hpp"
#include "publish_session.hpp"
#include "publisher.hpp"
#include "subscribe_session.hpp"
#include "subscriber.hpp"
#include "testing/fake_peer_connection.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <future>
#include <thread>

namespace switchyard {
namespace test {

using namespace std::chrono_literals;

class RouterTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = std::make_shared<FakePeerConnectionFactory>();
        router_ = Router::Create(factory_);
    }

    void TearDown() override {
        router_->Close();
    }

    std::shared_ptr<Publisher> MakePublisher(const std::string& id, MediaKind kind = MediaKind::Audio) {
        return std::make_shared<Publisher>("session", std::make_shared<FakeRemoteTrack>(id, kind));
    }

    static ErrorCode CodeOf(const std::function<void()>& f) {
        try {
            f();
        } catch (const Error& e) {
            return e.Code();
        }
        ADD_FAILURE() << "No error thrown";
        return ErrorCode::InvalidState;
    }

    std::shared_ptr<FakePeerConnectionFactory> factory_;
    std::shared_ptr<Router> router_;
};

TEST_F(RouterTest, CreatesAndTracksSessions) {
    auto publish = router_->CreatePublishSession({});
    auto subscribe = router_->CreateSubscribeSession({});

    EXPECT_EQ(router_->SessionCount(), 2u);
    EXPECT_EQ(router_->FindSession(publish->Id()), publish);
    EXPECT_EQ(router_->FindSession(subscribe->Id())->GetType(), Session::Type::Subscribe);
    EXPECT_NE(publish->Id(), subscribe->Id());
    EXPECT_EQ(factory_->Created().size(), 2u);

    publish->Close();
    EXPECT_EQ(router_->SessionCount(), 1u);
    EXPECT_EQ(router_->FindSession(publish->Id()), nullptr);
}

TEST_F(RouterTest, EngineFailureOnCreate) {
    factory_->failCreate = true;
    EXPECT_EQ(CodeOf([&] { router_->CreatePublishSession({}); }), ErrorCode::EngineFailure);
    EXPECT_EQ(router_->SessionCount(), 0u);
}

TEST_F(RouterTest, RegisterAndGetPublisher) {
    auto publisher = MakePublisher("track-a");
    router_->RegisterPublisher(publisher);

    EXPECT_EQ(router_->GetPublisher("track-a"), publisher);
    EXPECT_EQ(router_->GetPublisher("track-b"), nullptr);
    EXPECT_EQ(router_->PublisherIds(), std::vector<std::string>{"track-a"});
}

TEST_F(RouterTest, DuplicatePublisherRejected) {
    auto publisher = MakePublisher("track-a");
    router_->RegisterPublisher(publisher);

    EXPECT_EQ(CodeOf([&] { router_->RegisterPublisher(MakePublisher("track-a")); }), ErrorCode::InvalidState);
}

TEST_F(RouterTest, ExpiredPublisherCanBeReplaced) {
    router_->RegisterPublisher(MakePublisher("track-a"));
    EXPECT_EQ(router_->GetPublisher("track-a"), nullptr);
    EXPECT_TRUE(router_->PublisherIds().empty());

    auto replacement = MakePublisher("track-a");
    router_->RegisterPublisher(replacement);
    EXPECT_EQ(router_->GetPublisher("track-a"), replacement);
}

TEST_F(RouterTest, UnregisterPublisher) {
    auto publisher = MakePublisher("track-a");
    router_->RegisterPublisher(publisher);

    EXPECT_TRUE(router_->UnregisterPublisher("track-a"));
    EXPECT_FALSE(router_->UnregisterPublisher("track-a"));
    EXPECT_EQ(router_->GetPublisher("track-a"), nullptr);
}

TEST_F(RouterTest, SubscriberIndex) {
    auto publisher = MakePublisher("track-a");
    router_->RegisterPublisher(publisher);

    Subscriber first("track-a", "session-1", MediaKind::Audio, "0");
    Subscriber second("track-a", "session-2", MediaKind::Audio, "0");
    router_->RegisterSubscriber(first);
    router_->RegisterSubscriber(second);
    EXPECT_EQ(router_->SubscriberCount("track-a"), 2u);

    EXPECT_TRUE(router_->UnregisterSubscriber(first.Id()));
    EXPECT_FALSE(router_->UnregisterSubscriber(first.Id()));
    EXPECT_EQ(router_->SubscriberCount("track-a"), 1u);

    router_->UnregisterPublisher("track-a");
    EXPECT_EQ(router_->SubscriberCount("track-a"), 0u);
}

TEST_F(RouterTest, SubscriberOfMissingPublisherRejected) {
    Subscriber subscriber("track-x", "session-1", MediaKind::Audio, "0");
    EXPECT_EQ(CodeOf([&] { router_->RegisterSubscriber(subscriber); }), ErrorCode::PublisherNotFound);
}

TEST_F(RouterTest, FindPublisherReturnsImmediately) {
    auto publisher = MakePublisher("track-a");
    router_->RegisterPublisher(publisher);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(router_->FindPublisher("track-a", 3, 1s), publisher);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 500ms);
}

TEST_F(RouterTest, FindPublisherWakesOnRegistration) {
    auto publisher = MakePublisher("track-a");

    auto start = std::chrono::steady_clock::now();
    std::thread registrar([&] {
        std::this_thread::sleep_for(120ms);
        router_->RegisterPublisher(publisher);
    });

    // Registered during the third window of 50ms
    EXPECT_EQ(router_->FindPublisher("track-a", 10, 50ms), publisher);
    auto elapsed = std::chrono::steady_clock::now() - start;
    registrar.join();

    EXPECT_GE(elapsed, 120ms);
    EXPECT_LT(elapsed, 400ms);
}

TEST_F(RouterTest, FindPublisherGivesUpAfterAllAttempts) {
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(CodeOf([&] { router_->FindPublisher("missing", 4, 50ms); }), ErrorCode::PublisherNotFound);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, 200ms);
    EXPECT_LT(elapsed, 1s);
}

TEST_F(RouterTest, FindPublisherCancelledByRequestingSession) {
    auto subscribe = router_->CreateSubscribeSession({});

    auto lookup = std::async(std::launch::async, [&] {
        return CodeOf([&] { router_->FindPublisher("missing", 100, 100ms, subscribe->Id()); });
    });

    std::this_thread::sleep_for(50ms);
    subscribe->Close();

    ASSERT_EQ(lookup.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(lookup.get(), ErrorCode::Cancelled);
}

TEST_F(RouterTest, FindPublisherCancelledByClose) {
    auto lookup = std::async(std::launch::async, [&] {
        return CodeOf([&] { router_->FindPublisher("missing", 100, 100ms); });
    });

    std::this_thread::sleep_for(50ms);
    router_->Close();

    ASSERT_EQ(lookup.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(lookup.get(), ErrorCode::Cancelled);
}

TEST_F(RouterTest, CloseClosesSessionsAndRejectsNewOnes) {
    auto publish = router_->CreatePublishSession({});
    auto subscribe = router_->CreateSubscribeSession({});

    router_->Close();
    EXPECT_TRUE(router_->IsClosed());
    EXPECT_TRUE(publish->IsClosed());
    EXPECT_TRUE(subscribe->IsClosed());
    EXPECT_EQ(router_->SessionCount(), 0u);

    EXPECT_EQ(CodeOf([&] { router_->CreateSubscribeSession({}); }), ErrorCode::SessionClosed);
}

} // namespace test
} // namespace switchyard

#include "subscribe_session.hpp"

#include "error.hpp"
#include "extension_normalizer.hpp"
#include "publish_session.hpp"
#include "publisher.hpp"
#include "router.hpp"
#include "subscriber.hpp"
#include "testing/fake_peer_connection.hpp"
#include "testing/recording_session_observer.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

namespace switchyard {
namespace test {

using namespace std::chrono_literals;

namespace {

size_t CountOccurrences(const std::string& text, const std::string& pattern) {
    size_t count = 0;
    for (auto pos = text.find(pattern); pos != std::string::npos; pos = text.find(pattern, pos + 1)) {
        ++count;
    }
    return count;
}

} // namespace

class SubscribeSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = std::make_shared<FakePeerConnectionFactory>();

        RouterConfig config;
        config.findPublisherAttempts = 5;
        config.findPublisherInterval = 50ms;
        config.trackWaitTimeout = 300ms;
        router_ = Router::Create(factory_, config);

        publishSession_ = router_->CreatePublishSession({});
        publishEngine_ = factory_->Last();
        publishSession_->GetAnswer(SessionDescription{SdpType::Offer, MakeRemoteOffer({"mic", "cam"})});

        session_ = router_->CreateSubscribeSession({});
        engine_ = factory_->Last();
        observer_ = std::make_shared<RecordingSessionObserver>();
        session_->AddObserver(observer_);
    }

    void TearDown() override {
        router_->Close();
    }

    std::shared_ptr<Publisher> PublishTrack(const std::string& id, MediaKind kind = MediaKind::Audio) {
        publishEngine_->FireTrack(std::make_shared<FakeRemoteTrack>(id, kind));
        return publishSession_->Publish(id);
    }

    static SessionDescription Answer() {
        return SessionDescription{SdpType::Answer, "v=0\r\no=- 7 1 IN IP4 127.0.0.1\r\ns=-\r\nt=0 0\r\n"};
    }

    // A negotiation-needed task queued by the engine may briefly hold the lock after an answer
    static bool WaitForIdle(Session& session) {
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (session.GetNegotiationLockState() != NegotiationLock::State::Idle) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            std::this_thread::sleep_for(5ms);
        }
        return true;
    }

    template <typename F>
    static ErrorCode CodeOf(F&& f) {
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
    std::shared_ptr<PublishSession> publishSession_;
    std::shared_ptr<FakePeerConnection> publishEngine_;
    std::shared_ptr<SubscribeSession> session_;
    std::shared_ptr<FakePeerConnection> engine_;
    std::shared_ptr<RecordingSessionObserver> observer_;
};

TEST_F(SubscribeSessionTest, SubscribeProducesNormalizedOffer) {
    PublishTrack("mic");

    auto [subscriber, offer] = session_->Subscribe("mic");

    ASSERT_NE(subscriber, nullptr);
    EXPECT_EQ(subscriber->PublisherId(), "mic");
    EXPECT_EQ(subscriber->SessionId(), session_->Id());
    EXPECT_EQ(subscriber->Kind(), MediaKind::Audio);
    EXPECT_FALSE(subscriber->IsClosed());

    EXPECT_EQ(offer.type, SdpType::Offer);
    EXPECT_NE(offer.sdp.find("a=extmap:1 urn:ietf:params:rtp-hdrext:ssrc-audio-level"), std::string::npos);
    EXPECT_NE(offer.sdp.find("a=extmap:4/sendonly urn:ietf:params:rtp-hdrext:sdes:mid"), std::string::npos);
    EXPECT_NE(offer.sdp.find("a=extmap:3 http://www.ietf.org/id/draft-holmer-rmcat-transport-wide-cc-extensions-01"),
              std::string::npos);
    EXPECT_EQ(offer.sdp.find("a=extmap:5 "), std::string::npos);

    EXPECT_EQ(session_->GetNegotiationState(), NegotiationState::HaveLocalOffer);
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Negotiating);
    EXPECT_EQ(router_->SubscriberCount("mic"), 1u);
    EXPECT_EQ(engine_->OutgoingMids(), std::vector<std::string>{subscriber->Mid()});

    // The engine keeps its own numbering; what goes out is its canonical form
    auto local = engine_->LocalDescriptions();
    ASSERT_EQ(local.size(), 1u);
    EXPECT_NE(local[0].sdp.find("a=extmap:5 "), std::string::npos);
    EXPECT_EQ(offer.sdp, NormalizeExtensions(local[0].sdp));

    session_->SetAnswer(Answer());
    EXPECT_EQ(session_->GetNegotiationState(), NegotiationState::Stable);
    EXPECT_TRUE(WaitForIdle(*session_));
    EXPECT_EQ(engine_->OfferCount(), 1u);
}

TEST_F(SubscribeSessionTest, SubscribeWaitsForLatePublisher) {
    std::thread publisher([&] {
        std::this_thread::sleep_for(120ms);
        PublishTrack("cam", MediaKind::Video);
    });

    auto [subscriber, offer] = session_->Subscribe("cam");
    publisher.join();

    EXPECT_EQ(subscriber->Kind(), MediaKind::Video);
    EXPECT_NE(offer.sdp.find("m=video"), std::string::npos);
}

TEST_F(SubscribeSessionTest, MissingPublisher) {
    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(CodeOf([&] { session_->Subscribe("nobody"); }), ErrorCode::PublisherNotFound);

    EXPECT_GE(std::chrono::steady_clock::now() - start, 250ms);
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Idle);
    EXPECT_TRUE(engine_->OutgoingMids().empty());
    EXPECT_TRUE(session_->GetSubscribers().empty());
}

TEST_F(SubscribeSessionTest, EngineRejectsTrack) {
    PublishTrack("mic");
    engine_->failAddTrack = true;

    EXPECT_EQ(CodeOf([&] { session_->Subscribe("mic"); }), ErrorCode::EngineFailure);
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Idle);
    EXPECT_EQ(router_->SubscriberCount("mic"), 0u);
}

TEST_F(SubscribeSessionTest, OfferFailureRollsBack) {
    PublishTrack("mic");
    engine_->signalNegotiationNeeded = false;
    engine_->failCreateOffer = true;

    EXPECT_EQ(CodeOf([&] { session_->Subscribe("mic"); }), ErrorCode::EngineFailure);
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Idle);
    EXPECT_EQ(router_->SubscriberCount("mic"), 0u);
    EXPECT_TRUE(session_->GetSubscribers().empty());
    EXPECT_TRUE(engine_->OutgoingMids().empty());
}

TEST_F(SubscribeSessionTest, PublisherRemovedDuringSubscribe) {
    PublishTrack("mic");
    engine_->signalNegotiationNeeded = false;
    engine_->onAddTrack = [this] {
        publishSession_->Unpublish("mic");
    };

    EXPECT_EQ(CodeOf([&] { session_->Subscribe("mic"); }), ErrorCode::PublisherNotFound);
    EXPECT_TRUE(session_->GetSubscribers().empty());
    EXPECT_EQ(router_->SubscriberCount("mic"), 0u);
    EXPECT_TRUE(engine_->OutgoingMids().empty());
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Idle);
    EXPECT_TRUE(observer_->Removed().empty());
}

TEST_F(SubscribeSessionTest, SetAnswerWithoutOffer) {
    EXPECT_EQ(CodeOf([&] { session_->SetAnswer(Answer()); }), ErrorCode::InvalidState);
}

TEST_F(SubscribeSessionTest, InvalidAnswerKeepsOfferOutstanding) {
    PublishTrack("mic");
    session_->Subscribe("mic");

    engine_->failSetRemoteDescription = true;
    EXPECT_EQ(CodeOf([&] { session_->SetAnswer(Answer()); }), ErrorCode::InvalidDescription);
    EXPECT_EQ(session_->GetNegotiationState(), NegotiationState::HaveLocalOffer);

    engine_->failSetRemoteDescription = false;
    session_->SetAnswer(Answer());
    EXPECT_EQ(session_->GetNegotiationState(), NegotiationState::Stable);
}

TEST_F(SubscribeSessionTest, ConcurrentSubscribesAreSerialized) {
    PublishTrack("mic");
    PublishTrack("cam", MediaKind::Video);

    auto [first, firstOffer] = session_->Subscribe("mic");

    auto second = std::async(std::launch::async, [&] {
        return session_->Subscribe("cam");
    });
    EXPECT_EQ(second.wait_for(150ms), std::future_status::timeout);

    session_->SetAnswer(Answer());
    ASSERT_EQ(second.wait_for(2s), std::future_status::ready);
    auto [secondSubscriber, secondOffer] = second.get();

    EXPECT_NE(first->Mid(), secondSubscriber->Mid());
    EXPECT_EQ(CountOccurrences(firstOffer.sdp, "m="), 1u);
    EXPECT_EQ(CountOccurrences(secondOffer.sdp, "m="), 2u);

    session_->SetAnswer(Answer());
    EXPECT_EQ(session_->GetSubscribers().size(), 2u);
    EXPECT_TRUE(WaitForIdle(*session_));
}

TEST_F(SubscribeSessionTest, CandidatesWaitForFirstAnswer) {
    PublishTrack("mic");
    session_->AddIceCandidate(IceCandidate{"candidate:1", "0", 0});
    session_->Subscribe("mic");
    EXPECT_TRUE(engine_->AppliedCandidates().empty());

    session_->SetAnswer(Answer());
    ASSERT_EQ(engine_->AppliedCandidates().size(), 1u);
    EXPECT_EQ(engine_->AppliedCandidates()[0].candidate, "candidate:1");
}

TEST_F(SubscribeSessionTest, PublisherRemovalClosesSubscriber) {
    PublishTrack("mic");
    auto [subscriber, offer] = session_->Subscribe("mic");
    session_->SetAnswer(Answer());

    ASSERT_TRUE(publishSession_->Unpublish("mic"));

    ASSERT_TRUE(observer_->WaitForRemoved(1));
    auto removed = observer_->Removed();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0].subscriberId, subscriber->Id());
    EXPECT_EQ(removed[0].publisherId, "mic");

    EXPECT_TRUE(subscriber->IsClosed());
    EXPECT_TRUE(session_->GetSubscribers().empty());
    EXPECT_TRUE(engine_->OutgoingMids().empty());

    // The removed section is renegotiated by the session itself
    ASSERT_TRUE(observer_->WaitForOffers(1));
    EXPECT_EQ(CountOccurrences(observer_->Offers()[0].sdp, "m="), 0u);
    session_->SetAnswer(Answer());
}

TEST_F(SubscribeSessionTest, PublisherRemovalNotifiesEverySession) {
    PublishTrack("mic");
    auto other = router_->CreateSubscribeSession({});
    auto otherObserver = std::make_shared<RecordingSessionObserver>();
    other->AddObserver(otherObserver);

    session_->Subscribe("mic");
    session_->SetAnswer(Answer());
    other->Subscribe("mic");
    other->SetAnswer(Answer());
    EXPECT_EQ(router_->SubscriberCount("mic"), 2u);

    publishSession_->Close();

    EXPECT_TRUE(observer_->WaitForRemoved(1));
    EXPECT_TRUE(otherObserver->WaitForRemoved(1));
    EXPECT_EQ(observer_->Removed().size(), 1u);
    EXPECT_EQ(otherObserver->Removed().size(), 1u);
    EXPECT_EQ(router_->SubscriberCount("mic"), 0u);
}

TEST_F(SubscribeSessionTest, SessionsSubscribeToOnePublisherIndependently) {
    PublishTrack("mic");
    auto other = router_->CreateSubscribeSession({});
    auto otherEngine = factory_->Last();

    auto first = std::async(std::launch::async, [&] { return session_->Subscribe("mic"); });
    auto second = std::async(std::launch::async, [&] { return other->Subscribe("mic"); });
    auto [firstSubscriber, firstOffer] = first.get();
    auto [secondSubscriber, secondOffer] = second.get();

    // Neither session waits for the other's answer
    EXPECT_NE(firstSubscriber->Id(), secondSubscriber->Id());
    EXPECT_EQ(CountOccurrences(firstOffer.sdp, "m=audio"), 1u);
    EXPECT_EQ(CountOccurrences(secondOffer.sdp, "m=audio"), 1u);
    EXPECT_EQ(engine_->OutgoingMids().size(), 1u);
    EXPECT_EQ(otherEngine->OutgoingMids().size(), 1u);
    EXPECT_EQ(router_->SubscriberCount("mic"), 2u);

    session_->SetAnswer(Answer());
    other->SetAnswer(Answer());
}

TEST_F(SubscribeSessionTest, Unsubscribe) {
    PublishTrack("mic");
    auto [subscriber, offer] = session_->Subscribe("mic");
    session_->SetAnswer(Answer());

    EXPECT_TRUE(session_->Unsubscribe(subscriber->Id()));
    EXPECT_FALSE(session_->Unsubscribe(subscriber->Id()));
    EXPECT_TRUE(subscriber->IsClosed());
    EXPECT_EQ(router_->SubscriberCount("mic"), 0u);

    ASSERT_TRUE(observer_->WaitForOffers(1));
    EXPECT_EQ(session_->GetNegotiationState(), NegotiationState::HaveLocalOffer);
    session_->SetAnswer(Answer());
}

TEST_F(SubscribeSessionTest, SubscribeToDataPublisher) {
    PublishTrack("chat", MediaKind::Data);

    auto [subscriber, offer] = session_->Subscribe("chat");
    EXPECT_EQ(subscriber->Kind(), MediaKind::Data);
    EXPECT_NE(offer.sdp.find("m=application"), std::string::npos);
}

TEST_F(SubscribeSessionTest, CloseCancelsPendingSubscribe) {
    RouterConfig slow;
    slow.findPublisherAttempts = 100;
    slow.findPublisherInterval = 100ms;
    auto router = Router::Create(factory_, slow);
    auto session = router->CreateSubscribeSession({});

    auto subscribe = std::async(std::launch::async, [&] {
        return CodeOf([&] { session->Subscribe("nobody"); });
    });

    std::this_thread::sleep_for(50ms);
    session->Close();

    ASSERT_EQ(subscribe.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(subscribe.get(), ErrorCode::Cancelled);
    router->Close();
}

TEST_F(SubscribeSessionTest, CloseReleasesEverything) {
    PublishTrack("mic");
    auto [subscriber, offer] = session_->Subscribe("mic");

    session_->Close();
    EXPECT_TRUE(subscriber->IsClosed());
    EXPECT_EQ(router_->SubscriberCount("mic"), 0u);
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Idle);
    EXPECT_TRUE(engine_->IsClosed());
    EXPECT_EQ(observer_->ClosedCount(), 1);

    EXPECT_EQ(CodeOf([&] { session_->Subscribe("mic"); }), ErrorCode::SessionClosed);
    EXPECT_EQ(CodeOf([&] { session_->SetAnswer(Answer()); }), ErrorCode::SessionClosed);
}

} // namespace test
} // namespace switchyard

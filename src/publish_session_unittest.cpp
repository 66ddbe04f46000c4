#include "publish_session.hpp"

#include "error.hpp"
#include "publisher.hpp"
#include "router.hpp"
#include "testing/fake_peer_connection.hpp"
#include "testing/recording_session_observer.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>

namespace switchyard {
namespace test {

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::Field;

class MockSessionObserver : public SessionObserver {
public:
    MOCK_METHOD(void, OnIceCandidate, (const std::string&, const IceCandidate&), (override));
    MOCK_METHOD(void, OnNegotiationNeeded, (const std::string&, const SessionDescription&), (override));
    MOCK_METHOD(void, OnClosed, (const std::string&), (override));
};

class PublishSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = std::make_shared<FakePeerConnectionFactory>();

        RouterConfig config;
        config.trackWaitTimeout = 300ms;
        router_ = Router::Create(factory_, config);

        session_ = router_->CreatePublishSession({});
        engine_ = factory_->Last();
        observer_ = std::make_shared<RecordingSessionObserver>();
        session_->AddObserver(observer_);
    }

    void TearDown() override {
        router_->Close();
    }

    SessionDescription Offer(const std::vector<std::string>& tracks = {"mic"}) {
        return SessionDescription{SdpType::Offer, MakeRemoteOffer(tracks)};
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
    std::shared_ptr<PublishSession> session_;
    std::shared_ptr<FakePeerConnection> engine_;
    std::shared_ptr<RecordingSessionObserver> observer_;
};

TEST_F(PublishSessionTest, AnswersFirstOffer) {
    auto answer = session_->GetAnswer(Offer());

    EXPECT_EQ(answer.type, SdpType::Answer);
    EXPECT_FALSE(answer.sdp.empty());
    EXPECT_EQ(session_->GetNegotiationState(), NegotiationState::Stable);
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Idle);
    EXPECT_TRUE(session_->IsNegotiated());

    auto remote = engine_->RemoteDescriptions();
    ASSERT_EQ(remote.size(), 1u);
    EXPECT_EQ(remote[0].type, SdpType::Offer);
}

TEST_F(PublishSessionTest, CandidatesBeforeAnswerAreAppliedInOrder) {
    session_->AddIceCandidate(IceCandidate{"candidate:1", "0", 0});
    session_->AddIceCandidate(IceCandidate{"candidate:2", "0", 0});
    EXPECT_TRUE(engine_->AppliedCandidates().empty());

    session_->GetAnswer(Offer());
    session_->AddIceCandidate(IceCandidate{"candidate:3", "0", 0});

    auto applied = engine_->AppliedCandidates();
    ASSERT_EQ(applied.size(), 3u);
    EXPECT_EQ(applied[0].candidate, "candidate:1");
    EXPECT_EQ(applied[1].candidate, "candidate:2");
    EXPECT_EQ(applied[2].candidate, "candidate:3");
}

TEST_F(PublishSessionTest, InvalidOfferKeepsSessionUsable) {
    engine_->failSetRemoteDescription = true;
    EXPECT_EQ(CodeOf([&] { session_->GetAnswer(Offer()); }), ErrorCode::InvalidDescription);
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Idle);
    EXPECT_FALSE(session_->IsNegotiated());

    engine_->failSetRemoteDescription = false;
    EXPECT_EQ(session_->GetAnswer(Offer()).type, SdpType::Answer);
}

TEST_F(PublishSessionTest, RejectsAnswerInPlaceOfOffer) {
    SessionDescription answer{SdpType::Answer, MakeRemoteOffer({"mic"})};
    EXPECT_EQ(CodeOf([&] { session_->GetAnswer(answer); }), ErrorCode::InvalidDescription);
}

TEST_F(PublishSessionTest, SecondGetAnswerIsInvalidState) {
    session_->GetAnswer(Offer());
    EXPECT_EQ(CodeOf([&] { session_->GetAnswer(Offer()); }), ErrorCode::InvalidState);

    // Later client offers go through Renegotiate
    EXPECT_EQ(session_->Renegotiate(Offer({"mic", "cam"})).type, SdpType::Answer);
    EXPECT_EQ(engine_->RemoteDescriptions().size(), 2u);
}

TEST_F(PublishSessionTest, RenegotiateBeforeFirstNegotiationIsInvalidState) {
    EXPECT_EQ(CodeOf([&] { session_->Renegotiate(Offer()); }), ErrorCode::InvalidState);
}

TEST_F(PublishSessionTest, ForwardsLocalCandidates) {
    engine_->FireLocalCandidate(IceCandidate{"candidate:local", "0", 0});

    auto candidates = observer_->Candidates();
    ASSERT_EQ(candidates.size(), 1u);
    EXPECT_EQ(candidates[0].candidate, "candidate:local");
}

TEST_F(PublishSessionTest, EveryObserverSeesCandidatesAndClose) {
    auto mock = std::make_shared<::testing::NiceMock<MockSessionObserver>>();
    session_->AddObserver(mock);

    EXPECT_CALL(*mock, OnIceCandidate(session_->Id(), Field(&IceCandidate::candidate, "candidate:host"))).Times(1);
    EXPECT_CALL(*mock, OnNegotiationNeeded(_, _)).Times(0);
    EXPECT_CALL(*mock, OnClosed(session_->Id())).Times(1);

    engine_->FireLocalCandidate(IceCandidate{"candidate:host", "0", 0});
    session_->Close();
    session_->Close();

    EXPECT_EQ(observer_->Candidates().size(), 1u);
}

TEST_F(PublishSessionTest, PublishWaitsForTrack) {
    session_->GetAnswer(Offer());

    std::thread engineThread([&] {
        std::this_thread::sleep_for(50ms);
        engine_->FireTrack(std::make_shared<FakeRemoteTrack>("mic", MediaKind::Audio));
    });

    auto publisher = session_->Publish("mic");
    engineThread.join();

    ASSERT_NE(publisher, nullptr);
    EXPECT_EQ(publisher->Id(), "mic");
    EXPECT_EQ(publisher->Kind(), MediaKind::Audio);
    EXPECT_EQ(publisher->SessionId(), session_->Id());
    EXPECT_EQ(router_->GetPublisher("mic"), publisher);

    // Publishing again yields the same handle
    EXPECT_EQ(session_->Publish("mic"), publisher);
    EXPECT_EQ(session_->GetPublishers().size(), 1u);
}

TEST_F(PublishSessionTest, PublishUnknownTrackTimesOut) {
    session_->GetAnswer(Offer());

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(CodeOf([&] { session_->Publish("nope", 100ms); }), ErrorCode::TrackNotFound);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
    EXPECT_EQ(router_->GetPublisher("nope"), nullptr);
}

TEST_F(PublishSessionTest, CloseInterruptsPublish) {
    auto publish = std::async(std::launch::async, [&] {
        return CodeOf([&] { session_->Publish("mic", 5s); });
    });

    std::this_thread::sleep_for(50ms);
    session_->Close();

    ASSERT_EQ(publish.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(publish.get(), ErrorCode::SessionClosed);
}

TEST_F(PublishSessionTest, DataChannelIsPublishedByLabel) {
    session_->GetAnswer(Offer());
    engine_->FireTrack(std::make_shared<FakeRemoteTrack>("chat", MediaKind::Data));

    auto publisher = session_->Publish("chat");
    EXPECT_EQ(publisher->Kind(), MediaKind::Data);
    EXPECT_EQ(session_->GetArrivedTrackIds(), std::vector<std::string>{"chat"});
}

TEST_F(PublishSessionTest, EndedTrackUnregistersPublisher) {
    session_->GetAnswer(Offer());
    engine_->FireTrack(std::make_shared<FakeRemoteTrack>("mic", MediaKind::Audio));
    auto publisher = session_->Publish("mic");

    engine_->FireTrackClosed("mic");
    EXPECT_TRUE(publisher->IsClosed());
    EXPECT_EQ(router_->GetPublisher("mic"), nullptr);
    EXPECT_TRUE(session_->GetPublishers().empty());
}

TEST_F(PublishSessionTest, Unpublish) {
    session_->GetAnswer(Offer());
    engine_->FireTrack(std::make_shared<FakeRemoteTrack>("mic", MediaKind::Audio));
    auto publisher = session_->Publish("mic");

    EXPECT_TRUE(session_->Unpublish("mic"));
    EXPECT_FALSE(session_->Unpublish("mic"));
    EXPECT_TRUE(publisher->IsClosed());
    EXPECT_EQ(router_->GetPublisher("mic"), nullptr);
}

TEST_F(PublishSessionTest, RenegotiationOfferAfterFirstNegotiation) {
    session_->GetAnswer(Offer());

    engine_->FireNegotiationNeeded();
    ASSERT_TRUE(observer_->WaitForOffers(1));
    EXPECT_EQ(observer_->Offers()[0].type, SdpType::Offer);
    EXPECT_EQ(session_->GetNegotiationState(), NegotiationState::HaveLocalOffer);
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Negotiating);

    session_->SetAnswer(SessionDescription{SdpType::Answer, "v=0\r\n"});
    EXPECT_EQ(session_->GetNegotiationState(), NegotiationState::Stable);
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Idle);
}

TEST_F(PublishSessionTest, NoRenegotiationBeforeFirstNegotiation) {
    engine_->FireNegotiationNeeded();
    EXPECT_FALSE(observer_->WaitForOffers(1, 200ms));
    EXPECT_EQ(engine_->OfferCount(), 0u);
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Idle);
}

TEST_F(PublishSessionTest, SetAnswerWithoutOfferIsInvalidState) {
    session_->GetAnswer(Offer());
    EXPECT_EQ(CodeOf([&] { session_->SetAnswer(SessionDescription{SdpType::Answer, "v=0\r\n"}); }),
              ErrorCode::InvalidState);
}

TEST_F(PublishSessionTest, ClientOfferWaitsForOutstandingServerOffer) {
    session_->GetAnswer(Offer());
    engine_->FireNegotiationNeeded();
    ASSERT_TRUE(observer_->WaitForOffers(1));

    auto renegotiation = std::async(std::launch::async, [&] {
        return session_->Renegotiate(Offer({"mic", "cam"}));
    });
    EXPECT_EQ(renegotiation.wait_for(100ms), std::future_status::timeout);

    session_->SetAnswer(SessionDescription{SdpType::Answer, "v=0\r\n"});
    ASSERT_EQ(renegotiation.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(renegotiation.get().type, SdpType::Answer);
}

TEST_F(PublishSessionTest, SecondGetAnswerFailsWhileServerOfferIsOutstanding) {
    session_->GetAnswer(Offer());
    engine_->FireNegotiationNeeded();
    ASSERT_TRUE(observer_->WaitForOffers(1));

    auto second = std::async(std::launch::async, [&] {
        return CodeOf([&] { session_->GetAnswer(Offer()); });
    });
    ASSERT_EQ(second.wait_for(1s), std::future_status::ready);
    EXPECT_EQ(second.get(), ErrorCode::InvalidState);

    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Negotiating);
    session_->SetAnswer(SessionDescription{SdpType::Answer, "v=0\r\n"});
}

TEST_F(PublishSessionTest, AnswerFailureLeavesSessionStable) {
    session_->AddIceCandidate(IceCandidate{"candidate:1", "0", 0});
    engine_->failCreateAnswer = true;

    EXPECT_EQ(CodeOf([&] { session_->GetAnswer(Offer()); }), ErrorCode::EngineFailure);
    EXPECT_EQ(engine_->RemoteDescriptions().size(), 1u);
    EXPECT_EQ(session_->GetNegotiationState(), NegotiationState::Stable);
    EXPECT_EQ(session_->GetNegotiationLockState(), NegotiationLock::State::Idle);
    EXPECT_FALSE(session_->IsNegotiated());

    // The remote description is in place, so queued candidates were applied
    auto applied = engine_->AppliedCandidates();
    ASSERT_EQ(applied.size(), 1u);
    EXPECT_EQ(applied[0].candidate, "candidate:1");

    engine_->failCreateAnswer = false;
    EXPECT_EQ(session_->GetAnswer(Offer()).type, SdpType::Answer);
    EXPECT_TRUE(session_->IsNegotiated());
    EXPECT_EQ(engine_->AppliedCandidates().size(), 1u);
}

TEST_F(PublishSessionTest, CloseIsIdempotent) {
    session_->GetAnswer(Offer());
    engine_->FireTrack(std::make_shared<FakeRemoteTrack>("mic", MediaKind::Audio));
    auto publisher = session_->Publish("mic");

    session_->Close();
    session_->Close();

    EXPECT_TRUE(session_->IsClosed());
    EXPECT_TRUE(publisher->IsClosed());
    EXPECT_TRUE(engine_->IsClosed());
    EXPECT_EQ(router_->GetPublisher("mic"), nullptr);
    EXPECT_EQ(router_->FindSession(session_->Id()), nullptr);
    EXPECT_EQ(observer_->ClosedCount(), 1);

    EXPECT_EQ(CodeOf([&] { session_->GetAnswer(Offer()); }), ErrorCode::SessionClosed);
    EXPECT_EQ(CodeOf([&] { session_->AddIceCandidate(IceCandidate{"candidate:1", "0", 0}); }),
              ErrorCode::SessionClosed);
}

} // namespace test
} // namespace switchyard

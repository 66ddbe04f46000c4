#include "session.hpp"

#include "error.hpp"
#include "extension_normalizer.hpp"
#include "router.hpp"

#include <exception>
#include <iostream>

namespace switchyard {

const char* SessionTypeToString(Session::Type type) {
    switch (type) {
        case Session::Type::Publish: return "PublishSession";
        case Session::Type::Subscribe: return "SubscribeSession";
    }
    return "Session";
}

Session::Session(Type type,
                 std::weak_ptr<Router> router,
                 std::shared_ptr<PeerConnection> peerConnection,
                 RouterConfig routerConfig)
    : Id_(GenerateId())
    , Type_(type)
    , Label_(std::string(SessionTypeToString(type)) + " " + Id_)
    , RouterConfig_(std::move(routerConfig))
    , PeerConnection_(std::move(peerConnection))
    , NegotiationLock_(Label_)
    , Candidates_(Label_, [this](const IceCandidate& candidate) {
        try {
            PeerConnection_->AddRemoteCandidate(candidate);
        } catch (const std::exception& e) {
            throw Error(ErrorCode::EngineFailure, "Failed to add candidate: " + std::string(e.what()));
        }
    })
    , Router_(std::move(router))
    , Loop_(std::make_shared<Loop>())
{
    std::cout << "[" << Label_ << "] Created" << std::endl;
}

Session::~Session() {
    // Subclasses close themselves; this only covers a session that was never started
    Loop_->Stop();
    if (LoopThread_.joinable()) {
        if (LoopThread_.get_id() == std::this_thread::get_id()) {
            LoopThread_.detach();
        } else {
            LoopThread_.join();
        }
    }
}

void Session::Start() {
    PeerConnection_->SetObserver(std::weak_ptr<PeerConnectionObserver>(shared_from_this()));
    LoopThread_ = std::thread([loop = Loop_] {
        loop->Run();
    });
}

NegotiationState Session::GetNegotiationState() {
    std::lock_guard<std::mutex> guard(StateMutex_);
    return NegotiationState_;
}

NegotiationLock::State Session::GetNegotiationLockState() {
    return NegotiationLock_.GetState();
}

bool Session::IsClosed() const {
    return Closed_;
}

void Session::AddObserver(std::weak_ptr<SessionObserver> observer) {
    std::lock_guard<std::mutex> guard(ObserversMutex_);
    Observers_.push_back(std::move(observer));
}

void Session::AddIceCandidate(const IceCandidate& candidate) {
    ThrowIfClosed("AddIceCandidate");
    Candidates_.EnqueueOrApply(candidate);
}

void Session::Close() {
    if (Closed_.exchange(true)) {
        return;
    }

    std::cout << "[" << Label_ << "] Closing" << std::endl;

    NegotiationLock_.Close();
    Candidates_.Close();

    OnClose();

    // Also wakes any FindPublisher issued on behalf of this session
    if (auto router = GetRouter()) {
        router->RemoveSession(Id_);
    }

    Loop_->Stop();
    if (LoopThread_.joinable()) {
        if (LoopThread_.get_id() == std::this_thread::get_id()) {
            LoopThread_.detach();
        } else {
            LoopThread_.join();
        }
    }

    try {
        PeerConnection_->Close();
    } catch (const std::exception& e) {
        std::cerr << "[" << Label_ << "] Failed to close peer connection: " << e.what() << std::endl;
    }

    NotifyObservers([this](SessionObserver& observer) {
        observer.OnClosed(Id_);
    });

    std::cout << "[" << Label_ << "] Closed" << std::endl;
}

void Session::HandlePublisherRemoved(const std::string& publisherId,
                                     const std::vector<std::string>& subscriberIds) {
    std::cout << "[" << Label_ << "] Ignoring removal of publisher " << publisherId
              << " for " << subscriberIds.size() << " subscribers" << std::endl;
}

void Session::OnLocalCandidate(const IceCandidate& candidate) {
    if (Closed_) {
        return;
    }

    std::cout << "[" << Label_ << "] Local candidate: " << candidate.candidate << std::endl;
    NotifyObservers([this, &candidate](SessionObserver& observer) {
        observer.OnIceCandidate(Id_, candidate);
    });
}

void Session::OnNegotiationNeeded() {
    if (Closed_) {
        return;
    }

    std::cout << "[" << Label_ << "] Negotiation needed" << std::endl;
    NegotiationNeeded_ = true;
    Loop_->EnqueueTask([weak = weak_from_this()] {
        if (auto self = weak.lock()) {
            self->RunNegotiationNeeded();
        }
    });
}

void Session::OnStateChange(ConnectionState state) {
    std::cout << "[" << Label_ << "] PC State: " << ConnectionStateToString(state) << std::endl;
}

void Session::ThrowIfClosed(const char* operation) const {
    if (Closed_) {
        throw Error(ErrorCode::SessionClosed, std::string(operation) + " on closed session " + Id_);
    }
}

SessionDescription Session::CreateLocalOffer() {
    SessionDescription offer;
    try {
        offer = PeerConnection_->CreateOffer();
    } catch (const std::exception& e) {
        throw Error(ErrorCode::EngineFailure, "Failed to create offer: " + std::string(e.what()));
    }

    // The offer covers every change made so far
    NegotiationNeeded_ = false;

    offer.sdp = NormalizeExtensions(offer.sdp);
    SetNegotiationState(NegotiationState::HaveLocalOffer);
    std::cout << "[" << Label_ << "] Local offer created" << std::endl;
    return offer;
}

SessionDescription Session::AnswerRemoteOffer(const SessionDescription& offer) {
    if (offer.type != SdpType::Offer) {
        throw Error(ErrorCode::InvalidDescription, std::string("Expected an offer, got ") + SdpTypeToString(offer.type));
    }

    const auto previousState = GetNegotiationState();
    try {
        PeerConnection_->SetRemoteDescription(offer);
    } catch (const std::exception& e) {
        throw Error(ErrorCode::InvalidDescription, "Failed to apply remote offer: " + std::string(e.what()));
    }
    SetNegotiationState(NegotiationState::HaveRemoteOffer);
    std::cout << "[" << Label_ << "] Remote description set" << std::endl;

    // The engine has a remote description from here on, whatever happens to the answer
    FlushCandidatesOnce();

    SessionDescription answer;
    try {
        answer = PeerConnection_->CreateAnswer();
    } catch (const std::exception& e) {
        // The lock is released on the way out, so the state must not stay mid-cycle
        SetNegotiationState(previousState);
        throw Error(ErrorCode::EngineFailure, "Failed to create answer: " + std::string(e.what()));
    }
    SetNegotiationState(NegotiationState::Stable);
    std::cout << "[" << Label_ << "] Local answer created" << std::endl;

    return answer;
}

void Session::ApplyRemoteAnswer(const SessionDescription& answer) {
    if (answer.type != SdpType::Answer) {
        throw Error(ErrorCode::InvalidDescription, std::string("Expected an answer, got ") + SdpTypeToString(answer.type));
    }

    try {
        PeerConnection_->SetRemoteDescription(answer);
    } catch (const std::exception& e) {
        throw Error(ErrorCode::InvalidDescription, "Failed to apply remote answer: " + std::string(e.what()));
    }
    SetNegotiationState(NegotiationState::Stable);
    std::cout << "[" << Label_ << "] Remote answer set" << std::endl;

    FlushCandidatesOnce();
}

void Session::SetNegotiationState(NegotiationState state) {
    std::lock_guard<std::mutex> guard(StateMutex_);
    NegotiationState_ = state;
}

void Session::RunNegotiationNeeded() {
    if (Closed_) {
        return;
    }

    try {
        ScopedNegotiation negotiation(NegotiationLock_);
        if (!NegotiationNeeded_ || !CanRenegotiate()) {
            return;
        }

        auto offer = CreateLocalOffer();
        negotiation.Detach();

        std::cout << "[" << Label_ << "] Sending renegotiation offer" << std::endl;
        NotifyObservers([this, &offer](SessionObserver& observer) {
            observer.OnNegotiationNeeded(Id_, offer);
        });
    } catch (const Error& e) {
        if (e.Code() == ErrorCode::SessionClosed) {
            return;
        }
        std::cerr << "[" << Label_ << "] Renegotiation failed: " << e.what() << std::endl;
    }
}

void Session::FlushCandidatesOnce() {
    if (auto failed = Candidates_.Flush(); failed > 0) {
        std::cerr << "[" << Label_ << "] " << failed << " pending candidates could not be applied" << std::endl;
    }
}

} // namespace switchyard

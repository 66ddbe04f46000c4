#pragma once

#include "fwd.hpp"
#include "candidate_queue.hpp"
#include "config.hpp"
#include "loop.hpp"
#include "negotiation_lock.hpp"
#include "peer_connection.hpp"
#include "types.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace switchyard {

// Listener for session events. Register with Session::AddObserver; the session
// keeps a weak reference only, so an observer may go away at any time.
// Callbacks may arrive on engine threads or on the session's negotiation thread.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    // A locally gathered candidate to be sent to the remote peer
    virtual void OnIceCandidate(const std::string& sessionId, const IceCandidate& candidate) {}

    // A session-initiated offer; the remote answer must be given to SetAnswer()
    virtual void OnNegotiationNeeded(const std::string& sessionId, const SessionDescription& offer) {}

    // A subscribed Publisher went away and its Subscriber has been closed
    virtual void OnPublisherRemoved(const std::string& sessionId,
                                    const std::string& subscriberId,
                                    const std::string& publisherId) {}

    virtual void OnClosed(const std::string& sessionId) {}
};

class Session : public PeerConnectionObserver, public std::enable_shared_from_this<Session> {
public:
    enum class Type {
        Publish,
        Subscribe,
    };

    ~Session() override;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& Id() const {
        return Id_;
    }

    Type GetType() const {
        return Type_;
    }

    NegotiationState GetNegotiationState();
    NegotiationLock::State GetNegotiationLockState();
    bool IsClosed() const;

    void AddObserver(std::weak_ptr<SessionObserver> observer);

    // Queued until the first remote description is set, applied directly afterwards
    void AddIceCandidate(const IceCandidate& candidate);

    // Idempotent. Fails every pending wait on this session with SessionClosed.
    void Close();

    // Router notification: the given Subscribers of this session lost their Publisher
    virtual void HandlePublisherRemoved(const std::string& publisherId,
                                        const std::vector<std::string>& subscriberIds);

protected:
    Session(Type type,
            std::weak_ptr<Router> router,
            std::shared_ptr<PeerConnection> peerConnection,
            RouterConfig routerConfig);

    // Hooks the engine up to this session and starts the negotiation thread.
    // Called once by the Router right after construction.
    void Start();
    friend class Router;

    // Subclass part of Close(), called once before the engine is closed
    virtual void OnClose() = 0;

    // Whether a session-initiated offer may be generated now
    virtual bool CanRenegotiate() {
        return true;
    }

    // PeerConnectionObserver
    void OnLocalCandidate(const IceCandidate& candidate) override;
    void OnNegotiationNeeded() override;
    void OnStateChange(ConnectionState state) override;

    void ThrowIfClosed(const char* operation) const;

    // Generates the next local offer with canonical extension ids; state becomes HaveLocalOffer
    SessionDescription CreateLocalOffer();

    // Applies a remote offer and answers it; state goes through HaveRemoteOffer back to Stable
    SessionDescription AnswerRemoteOffer(const SessionDescription& offer);

    // Completes a cycle started by CreateLocalOffer(). The negotiation lock must be held.
    void ApplyRemoteAnswer(const SessionDescription& answer);

    void SetNegotiationState(NegotiationState state);

    template <typename Callback>
    void NotifyObservers(Callback&& callback);

    std::shared_ptr<Router> GetRouter() const {
        return Router_.lock();
    }

    const std::string Id_;
    const Type Type_;
    const std::string Label_;
    const RouterConfig RouterConfig_;
    const std::shared_ptr<PeerConnection> PeerConnection_;

    NegotiationLock NegotiationLock_;
    CandidateQueue Candidates_;

private:
    void RunNegotiationNeeded();
    void FlushCandidatesOnce();

    std::weak_ptr<Router> Router_;

    std::mutex StateMutex_;
    NegotiationState NegotiationState_ = NegotiationState::Stable;

    std::atomic_bool Closed_{false};
    std::atomic_bool NegotiationNeeded_{false};

    std::mutex ObserversMutex_;
    std::vector<std::weak_ptr<SessionObserver>> Observers_;

    std::shared_ptr<Loop> Loop_;
    std::thread LoopThread_;
};

template <typename Callback>
void Session::NotifyObservers(Callback&& callback) {
    std::vector<std::shared_ptr<SessionObserver>> observers;
    {
        std::lock_guard<std::mutex> guard(ObserversMutex_);
        for (auto it = Observers_.begin(); it != Observers_.end();) {
            if (auto observer = it->lock()) {
                observers.push_back(std::move(observer));
                ++it;
            } else {
                it = Observers_.erase(it);
            }
        }
    }

    for (auto& observer : observers) {
        callback(*observer);
    }
}

const char* SessionTypeToString(Session::Type type);

} // namespace switchyard

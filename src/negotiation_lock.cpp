#include "negotiation_lock.hpp"

#include "error.hpp"

namespace switchyard {

NegotiationLock::NegotiationLock(std::string owner)
    : Owner_(std::move(owner))
{ }

void NegotiationLock::Acquire() {
    std::unique_lock<std::mutex> lock(Mutex_);
    if (Closed_) {
        throw Error(ErrorCode::SessionClosed, "Negotiation lock of " + Owner_ + " is closed");
    }

    const auto ticket = NextTicket_++;
    Cv_.wait(lock, [this, ticket] {
        return Closed_ || (State_ == State::Idle && ServingTicket_ == ticket);
    });

    if (Closed_) {
        throw Error(ErrorCode::SessionClosed, "Session " + Owner_ + " closed while waiting to negotiate");
    }

    ++ServingTicket_;
    State_ = State::Negotiating;
}

bool NegotiationLock::Release() {
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        if (State_ == State::Idle) {
            return false;
        }
        State_ = State::Idle;
    }

    Cv_.notify_all();
    return true;
}

void NegotiationLock::Close() {
    {
        std::lock_guard<std::mutex> guard(Mutex_);
        Closed_ = true;
        State_ = State::Idle;
    }

    Cv_.notify_all();
}

NegotiationLock::State NegotiationLock::GetState() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return State_;
}

bool NegotiationLock::IsClosed() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Closed_;
}

ScopedNegotiation::ScopedNegotiation(NegotiationLock& lock)
    : Lock_(lock)
{
    Lock_.Acquire();
}

ScopedNegotiation::~ScopedNegotiation() {
    if (!Detached_) {
        Lock_.Release();
    }
}

const char* NegotiationLockStateToString(NegotiationLock::State state) {
    switch (state) {
        case NegotiationLock::State::Idle: return "Idle";
        case NegotiationLock::State::Negotiating: return "Negotiating";
    }
    return "Unknown";
}

} // namespace switchyard

#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

namespace switchyard {

// Serializes offer/answer cycles of one session. Unlike a mutex the lock is a
// state: it is acquired by the operation that starts a cycle and released by
// whichever operation sees the session become stable again, possibly on
// another thread. Waiters are served in arrival order.
class NegotiationLock {
public:
    enum class State {
        Idle,
        Negotiating,
    };

    explicit NegotiationLock(std::string owner);

    // Blocks until the lock is Idle and this caller is first in line.
    // Throws Error(SessionClosed) if the lock is closed before or while waiting.
    void Acquire();

    // Returns to Idle and wakes the next waiter. Returns false if the lock was already Idle.
    bool Release();

    // Forcibly releases the lock and fails every current and future waiter
    void Close();

    State GetState();
    bool IsClosed();

private:
    const std::string Owner_;

    std::mutex Mutex_;
    std::condition_variable Cv_;
    State State_ = State::Idle;
    bool Closed_ = false;
    uint64_t NextTicket_ = 0;
    uint64_t ServingTicket_ = 0;
};

// Holds one negotiation cycle for a scope. The cycle is released on scope exit
// unless Detach() hands it over to a later operation (typically SetAnswer).
class ScopedNegotiation {
public:
    explicit ScopedNegotiation(NegotiationLock& lock);
    ~ScopedNegotiation();

    ScopedNegotiation(const ScopedNegotiation&) = delete;
    ScopedNegotiation& operator=(const ScopedNegotiation&) = delete;

    void Detach() {
        Detached_ = true;
    }

private:
    NegotiationLock& Lock_;
    bool Detached_ = false;
};

const char* NegotiationLockStateToString(NegotiationLock::State state);

} // namespace switchyard

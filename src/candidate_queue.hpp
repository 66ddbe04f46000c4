#pragma once

#include "types.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace switchyard {

// Holds remote candidates that arrive before the session has a remote
// description. Until Flush() is called candidates are queued; Flush() applies
// them in arrival order and from then on candidates are applied directly.
class CandidateQueue {
public:
    using Applier = std::function<void(const IceCandidate&)>;

    CandidateQueue(std::string owner, Applier applier);

    // Errors from the applier propagate to the caller
    void EnqueueOrApply(const IceCandidate& candidate);

    // Returns the number of queued candidates that failed to apply.
    // Only the first call has any effect.
    size_t Flush();

    void Close();

    bool IsFlushed();
    size_t PendingCount();

private:
    const std::string Owner_;
    const Applier Applier_;

    // Held while applying so that a candidate arriving mid-flush lands after the queued ones
    std::mutex Mutex_;
    std::vector<IceCandidate> Pending_;
    bool Flushed_ = false;
    bool Closed_ = false;
};

} // namespace switchyard

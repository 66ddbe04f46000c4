#include "candidate_queue.hpp"

#include "error.hpp"

#include <exception>
#include <iostream>

namespace switchyard {

CandidateQueue::CandidateQueue(std::string owner, Applier applier)
    : Owner_(std::move(owner))
    , Applier_(std::move(applier))
{ }

void CandidateQueue::EnqueueOrApply(const IceCandidate& candidate) {
    std::lock_guard<std::mutex> guard(Mutex_);
    if (Closed_) {
        throw Error(ErrorCode::SessionClosed, "Cannot add candidate to closed session " + Owner_);
    }

    if (!Flushed_) {
        std::cout << "[" << Owner_ << "] Pending candidate: " << candidate.candidate << std::endl;
        Pending_.push_back(candidate);
        return;
    }

    Applier_(candidate);
}

size_t CandidateQueue::Flush() {
    std::lock_guard<std::mutex> guard(Mutex_);
    if (Flushed_ || Closed_) {
        return 0;
    }
    Flushed_ = true;

    size_t failed = 0;
    for (const auto& candidate : Pending_) {
        try {
            Applier_(candidate);
        } catch (const std::exception& e) {
            ++failed;
            std::cerr << "[" << Owner_ << "] Failed to apply pending candidate " << candidate.candidate
                      << ": " << e.what() << std::endl;
        }
    }

    std::cout << "[" << Owner_ << "] Flushed " << Pending_.size() << " pending candidates" << std::endl;
    Pending_.clear();
    return failed;
}

void CandidateQueue::Close() {
    std::lock_guard<std::mutex> guard(Mutex_);
    Closed_ = true;
    Pending_.clear();
}

bool CandidateQueue::IsFlushed() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Flushed_;
}

size_t CandidateQueue::PendingCount() {
    std::lock_guard<std::mutex> guard(Mutex_);
    return Pending_.size();
}

} // namespace switchyard

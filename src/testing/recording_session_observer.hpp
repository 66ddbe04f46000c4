#pragma once

#include "session.hpp"
#include "types.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace switchyard {
namespace test {

// Collects session events and lets a test wait for them
class RecordingSessionObserver : public SessionObserver {
public:
    struct PublisherRemoved {
        std::string subscriberId;
        std::string publisherId;
    };

    void OnIceCandidate(const std::string& sessionId, const IceCandidate& candidate) override {
        std::lock_guard<std::mutex> guard(Mutex_);
        Candidates_.push_back(candidate);
        Cv_.notify_all();
    }

    void OnNegotiationNeeded(const std::string& sessionId, const SessionDescription& offer) override {
        std::lock_guard<std::mutex> guard(Mutex_);
        Offers_.push_back(offer);
        Cv_.notify_all();
    }

    void OnPublisherRemoved(const std::string& sessionId,
                            const std::string& subscriberId,
                            const std::string& publisherId) override {
        std::lock_guard<std::mutex> guard(Mutex_);
        Removed_.push_back(PublisherRemoved{subscriberId, publisherId});
        Cv_.notify_all();
    }

    void OnClosed(const std::string& sessionId) override {
        std::lock_guard<std::mutex> guard(Mutex_);
        ++ClosedCount_;
        Cv_.notify_all();
    }

    bool WaitForOffers(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(Mutex_);
        return Cv_.wait_for(lock, timeout, [this, count] { return Offers_.size() >= count; });
    }

    bool WaitForRemoved(size_t count, std::chrono::milliseconds timeout = std::chrono::seconds(2)) {
        std::unique_lock<std::mutex> lock(Mutex_);
        return Cv_.wait_for(lock, timeout, [this, count] { return Removed_.size() >= count; });
    }

    std::vector<IceCandidate> Candidates() {
        std::lock_guard<std::mutex> guard(Mutex_);
        return Candidates_;
    }

    std::vector<SessionDescription> Offers() {
        std::lock_guard<std::mutex> guard(Mutex_);
        return Offers_;
    }

    std::vector<PublisherRemoved> Removed() {
        std::lock_guard<std::mutex> guard(Mutex_);
        return Removed_;
    }

    int ClosedCount() {
        std::lock_guard<std::mutex> guard(Mutex_);
        return ClosedCount_;
    }

private:
    std::mutex Mutex_;
    std::condition_variable Cv_;
    std::vector<IceCandidate> Candidates_;
    std::vector<SessionDescription> Offers_;
    std::vector<PublisherRemoved> Removed_;
    int ClosedCount_ = 0;
};

} // namespace test
} // namespace switchyard

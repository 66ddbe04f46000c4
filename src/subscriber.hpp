#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <atomic>
#include <string>

namespace switchyard {

// One forwarding of a Publisher's track into a SubscribeSession
class Subscriber {
public:
    Subscriber(std::string publisherId, std::string sessionId, MediaKind kind, std::string mid);

    const std::string& Id() const {
        return Id_;
    }

    const std::string& PublisherId() const {
        return PublisherId_;
    }

    const std::string& SessionId() const {
        return SessionId_;
    }

    MediaKind Kind() const {
        return Kind_;
    }

    // Mid of the outbound media section carrying the track
    const std::string& Mid() const {
        return Mid_;
    }

    // Returns true for the call that actually closed the subscriber
    bool Close();
    bool IsClosed() const;

private:
    const std::string Id_;
    const std::string PublisherId_;
    const std::string SessionId_;
    const MediaKind Kind_;
    const std::string Mid_;
    std::atomic_bool Closed_{false};
};

} // namespace switchyard

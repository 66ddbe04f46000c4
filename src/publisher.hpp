#pragma once

#include "fwd.hpp"
#include "types.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace switchyard {

// One forwardable inbound track. Owned by its PublishSession; the Router only
// keeps a lookup handle.
class Publisher {
public:
    Publisher(std::string sessionId, std::shared_ptr<RemoteTrack> source);

    const std::string& Id() const {
        return Id_;
    }

    MediaKind Kind() const {
        return Kind_;
    }

    const std::string& SessionId() const {
        return SessionId_;
    }

    const std::shared_ptr<RemoteTrack>& Source() const {
        return Source_;
    }

    void Close();
    bool IsClosed() const;

private:
    const std::string Id_;
    const MediaKind Kind_;
    const std::string SessionId_;
    const std::shared_ptr<RemoteTrack> Source_;
    std::atomic_bool Closed_{false};
};

} // namespace switchyard

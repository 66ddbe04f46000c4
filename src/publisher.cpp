#include "publisher.hpp"

#include "peer_connection.hpp"

#include <iostream>

namespace switchyard {

Publisher::Publisher(std::string sessionId, std::shared_ptr<RemoteTrack> source)
    : Id_(source->Id())
    , Kind_(source->Kind())
    , SessionId_(std::move(sessionId))
    , Source_(std::move(source))
{ }

void Publisher::Close() {
    if (!Closed_.exchange(true)) {
        std::cout << "[Publisher " << Id_ << "] Closed" << std::endl;
    }
}

bool Publisher::IsClosed() const {
    return Closed_;
}

} // namespace switchyard

#include "subscriber.hpp"

#include <iostream>

namespace switchyard {

Subscriber::Subscriber(std::string publisherId, std::string sessionId, MediaKind kind, std::string mid)
    : Id_(GenerateId())
    , PublisherId_(std::move(publisherId))
    , SessionId_(std::move(sessionId))
    , Kind_(kind)
    , Mid_(std::move(mid))
{
    std::cout << "[Subscriber " << Id_ << "] Created for publisher " << PublisherId_ << std::endl;
}

bool Subscriber::Close() {
    if (Closed_.exchange(true)) {
        return false;
    }
    std::cout << "[Subscriber " << Id_ << "] Closed" << std::endl;
    return true;
}

bool Subscriber::IsClosed() const {
    return Closed_;
}

} // namespace switchyard

#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace switchyard {

class Loop;
class Router;
class Session;
class PublishSession;
class SubscribeSession;
class Publisher;
class Subscriber;
class SessionObserver;

class PeerConnection;
class PeerConnectionFactory;
class PeerConnectionObserver;
class RemoteTrack;

struct SessionConfig;
struct RouterConfig;
struct ServerConfig;

} // namespace switchyard

#include "peer_connection.hpp"

namespace switchyard {

const char* ConnectionStateToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::New: return "New";
        case ConnectionState::Connecting: return "Connecting";
        case ConnectionState::Connected: return "Connected";
        case ConnectionState::Disconnected: return "Disconnected";
        case ConnectionState::Failed: return "Failed";
        case ConnectionState::Closed: return "Closed";
    }
    return "Unknown";
}

} // namespace switchyard

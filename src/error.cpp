#include "error.hpp"

namespace switchyard {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidDescription: return "InvalidDescription";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::PublisherNotFound: return "PublisherNotFound";
        case ErrorCode::TrackNotFound: return "TrackNotFound";
        case ErrorCode::SessionClosed: return "SessionClosed";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::EngineFailure: return "EngineFailure";
    }
    return "Unknown";
}

std::ostream& operator<<(std::ostream& out, ErrorCode code) {
    return out << ErrorCodeToString(code);
}

Error::Error(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(ErrorCodeToString(code)) + ": " + message)
    , Code_(code)
{ }

} // namespace switchyard

#pragma once

#include <ostream>
#include <stdexcept>
#include <string>

namespace switchyard {

enum class ErrorCode {
    // Malformed or inapplicable offer/answer, the session keeps its prior state
    InvalidDescription,
    // Operation invoked out of sequence
    InvalidState,
    PublisherNotFound,
    TrackNotFound,
    SessionClosed,
    Cancelled,
    // The connectivity engine refused an operation
    EngineFailure,
};

const char* ErrorCodeToString(ErrorCode code);
std::ostream& operator<<(std::ostream& out, ErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message);

    ErrorCode Code() const noexcept {
        return Code_;
    }

private:
    ErrorCode Code_;
};

} // namespace switchyard

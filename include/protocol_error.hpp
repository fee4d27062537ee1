#pragma once

#include <stdexcept>
#include <string>

namespace bc {

enum class ProtocolErrorCode {
    NotOwner,
    NotProvider,
    Paused,
    RateLimited,
    BatchClosed,
    BatchFull,
    InvalidBatch,
    InvalidState,
    StaleVersion,
    AlreadyProcessed,
    UnknownRequest,
    InvalidProof
};

const char* toString(ProtocolErrorCode code);

// Caller-visible rule violation. Retrying the same call unchanged fails the same way.
class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ProtocolErrorCode code, const std::string& detail);

    ProtocolErrorCode code() const { return code_; }

private:
    ProtocolErrorCode code_;
};

} // namespace bc

#include "protocol_error.hpp"

namespace bc {

namespace {

std::string formatMessage(ProtocolErrorCode code, const std::string& detail) {
    std::string message = toString(code);
    if (!detail.empty()) {
        message += ": ";
        message += detail;
    }
    return message;
}

} // namespace

const char* toString(ProtocolErrorCode code) {
    switch (code) {
    case ProtocolErrorCode::NotOwner:
        return "NotOwner";
    case ProtocolErrorCode::NotProvider:
        return "NotProvider";
    case ProtocolErrorCode::Paused:
        return "Paused";
    case ProtocolErrorCode::RateLimited:
        return "RateLimited";
    case ProtocolErrorCode::BatchClosed:
        return "BatchClosed";
    case ProtocolErrorCode::BatchFull:
        return "BatchFull";
    case ProtocolErrorCode::InvalidBatch:
        return "InvalidBatch";
    case ProtocolErrorCode::InvalidState:
        return "InvalidState";
    case ProtocolErrorCode::StaleVersion:
        return "StaleVersion";
    case ProtocolErrorCode::AlreadyProcessed:
        return "AlreadyProcessed";
    case ProtocolErrorCode::UnknownRequest:
        return "UnknownRequest";
    case ProtocolErrorCode::InvalidProof:
        return "InvalidProof";
    }
    return "Unknown";
}

ProtocolError::ProtocolError(ProtocolErrorCode code, const std::string& detail)
    : std::runtime_error(formatMessage(code, detail)), code_(code) {}

} // namespace bc

#include "engine_result.hpp"

namespace parking {

std::string to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::LockContention: return "lock_contention";
        case ErrorCode::NotFound: return "not_found";
        case ErrorCode::Conflict: return "conflict";
        case ErrorCode::Gone: return "gone";
        case ErrorCode::ClosedLot: return "closed_lot";
        case ErrorCode::Forbidden: return "forbidden";
        case ErrorCode::InvalidArgument: return "invalid_argument";
    }
    return "unknown";
}

bool is_retryable(ErrorCode code) {
    return code == ErrorCode::LockContention || code == ErrorCode::ClosedLot;
}

} // namespace parking

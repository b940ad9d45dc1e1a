#include "launchpad/errors.hpp"

namespace launchpad {

const char* errors::describe(int32_t code) {
    switch (code) {
        case OK: return "ok";
        case INVALID_AMOUNT: return "invalid amount";
        case INVALID_ARGUMENT: return "invalid argument";
        case ZERO_ADDRESS: return "zero address";
        case UNSUPPORTED_CHAIN: return "unsupported chain";
        case INVALID_FEE: return "invalid fee";
        case NOT_FOUND: return "not found";
        case ALREADY_DEPLOYED: return "already deployed";
        case ALREADY_MIGRATED: return "already migrated";
        case CURVE_MIGRATED: return "curve migrated";
        case CURVE_PAUSED: return "curve paused";
        case ALREADY_REGISTERED: return "already registered";
        case MIGRATION_NOT_TRIGGERED: return "migration not triggered";
        case DIVISION_BY_ZERO: return "division by zero";
        case ARITHMETIC_OVERFLOW: return "arithmetic overflow";
        case RESERVE_UNDERFLOW: return "reserve underflow";
        case SLIPPAGE_EXCEEDED: return "slippage exceeded";
        case UNAUTHORIZED: return "unauthorized caller";
        case NETWORK_FAILURE: return "network failure";
        case TIMEOUT: return "timeout";
        case STALE_SEQUENCE: return "stale sequence";
        case INTERNAL_ERROR: return "internal error";
        default: return "unknown error";
    }
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::State: return "state";
        case ErrorKind::Arithmetic: return "arithmetic";
        case ErrorKind::Slippage: return "slippage";
        case ErrorKind::Authorization: return "authorization";
        case ErrorKind::Network: return "network";
        case ErrorKind::Consistency: return "consistency";
    }
    return "unknown";
}

} // namespace launchpad

#ifndef LAUNCHPAD_ERRORS_HPP
#define LAUNCHPAD_ERRORS_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace launchpad {

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation
constexpr int32_t INVALID_AMOUNT = -1;
constexpr int32_t INVALID_ARGUMENT = -2;
constexpr int32_t ZERO_ADDRESS = -3;
constexpr int32_t UNSUPPORTED_CHAIN = -4;
constexpr int32_t INVALID_FEE = -5;
constexpr int32_t NOT_FOUND = -6;

// State (idempotent collisions)
constexpr int32_t ALREADY_DEPLOYED = -10;
constexpr int32_t ALREADY_MIGRATED = -11;
constexpr int32_t CURVE_MIGRATED = -12;
constexpr int32_t CURVE_PAUSED = -13;
constexpr int32_t ALREADY_REGISTERED = -14;
constexpr int32_t MIGRATION_NOT_TRIGGERED = -15;

// Arithmetic
constexpr int32_t DIVISION_BY_ZERO = -20;
constexpr int32_t ARITHMETIC_OVERFLOW = -21;
constexpr int32_t RESERVE_UNDERFLOW = -22;

constexpr int32_t SLIPPAGE_EXCEEDED = -30;
constexpr int32_t UNAUTHORIZED = -40;

// Network
constexpr int32_t NETWORK_FAILURE = -50;
constexpr int32_t TIMEOUT = -51;

// Consistency
constexpr int32_t STALE_SEQUENCE = -60;

// Failures raised outside the launchpad error hierarchy
constexpr int32_t INTERNAL_ERROR = -70;

const char* describe(int32_t code);
}

// =============================================================================
// Exceptions
// =============================================================================

enum class ErrorKind : uint8_t {
    Validation = 0,
    State = 1,
    Arithmetic = 2,
    Slippage = 3,
    Authorization = 4,
    Network = 5,
    Consistency = 6
};

const char* to_string(ErrorKind kind);

class LaunchpadError : public std::runtime_error {
public:
    LaunchpadError(ErrorKind kind, int32_t code, const std::string& msg)
        : std::runtime_error(msg), kind_(kind), code_(code) {}

    ErrorKind kind() const noexcept { return kind_; }
    int32_t code() const noexcept { return code_; }

private:
    ErrorKind kind_;
    int32_t code_;
};

// Bad amount, empty name, zero address
class ValidationError : public LaunchpadError {
public:
    explicit ValidationError(const std::string& msg, int32_t code = errors::INVALID_ARGUMENT)
        : LaunchpadError(ErrorKind::Validation, code, msg) {}
};

// AlreadyDeployed, AlreadyMigrated, CurveMigrated, CurvePaused
class StateError : public LaunchpadError {
public:
    StateError(int32_t code, const std::string& msg)
        : LaunchpadError(ErrorKind::State, code, msg) {}
};

// Division by zero, overflow, reserve underflow
class ArithmeticError : public LaunchpadError {
public:
    explicit ArithmeticError(const std::string& msg, int32_t code = errors::ARITHMETIC_OVERFLOW)
        : LaunchpadError(ErrorKind::Arithmetic, code, msg) {}
};

class SlippageExceeded : public LaunchpadError {
public:
    explicit SlippageExceeded(const std::string& msg)
        : LaunchpadError(ErrorKind::Slippage, errors::SLIPPAGE_EXCEEDED, msg) {}
};

class AuthorizationError : public LaunchpadError {
public:
    explicit AuthorizationError(const std::string& msg)
        : LaunchpadError(ErrorKind::Authorization, errors::UNAUTHORIZED, msg) {}
};

// Retryable
class NetworkError : public LaunchpadError {
public:
    explicit NetworkError(const std::string& msg, int32_t code = errors::NETWORK_FAILURE)
        : LaunchpadError(ErrorKind::Network, code, msg) {}
};

// Stale or out-of-order update; discarded, never user-visible
class ConsistencyError : public LaunchpadError {
public:
    explicit ConsistencyError(const std::string& msg)
        : LaunchpadError(ErrorKind::Consistency, errors::STALE_SEQUENCE, msg) {}
};

} // namespace launchpad

#endif // LAUNCHPAD_ERRORS_HPP

#pragma once

#include <string>
#include <stdexcept>

namespace spreadarb {

/**
 * Reasons an action was suppressed, blocked or failed. The first six are the
 * error taxonomy proper; the rest are block reasons surfaced alongside them
 * so observers can tell "no opportunity" from "opportunity blocked by X".
 */
enum class ErrorCode {
    NONE,
    STALE_DATA,             // Suppresses entries only
    SLIPPAGE_EXCEEDED,      // Blocks one attempt
    PARTIAL_FILL_TIMEOUT,   // Position held in current state
    LEG_MISMATCH,           // One leg failed, filled leg unwound
    RISK_LIMIT_BREACHED,    // Fatal for entries, not for exits
    PORT_UNAVAILABLE,       // Feed or execution port down
    POSITION_LIMIT,
    CONCURRENCY_LIMIT,
    RATE_LIMITED,
    ORDER_IN_FLIGHT,
    ORDER_REJECTED,
    INVARIANT_VIOLATION
};

inline std::string error_code_to_string(ErrorCode c) {
    switch (c) {
        case ErrorCode::NONE: return "NONE";
        case ErrorCode::STALE_DATA: return "STALE_DATA";
        case ErrorCode::SLIPPAGE_EXCEEDED: return "SLIPPAGE_EXCEEDED";
        case ErrorCode::PARTIAL_FILL_TIMEOUT: return "PARTIAL_FILL_TIMEOUT";
        case ErrorCode::LEG_MISMATCH: return "LEG_MISMATCH";
        case ErrorCode::RISK_LIMIT_BREACHED: return "RISK_LIMIT_BREACHED";
        case ErrorCode::PORT_UNAVAILABLE: return "PORT_UNAVAILABLE";
        case ErrorCode::POSITION_LIMIT: return "POSITION_LIMIT";
        case ErrorCode::CONCURRENCY_LIMIT: return "CONCURRENCY_LIMIT";
        case ErrorCode::RATE_LIMITED: return "RATE_LIMITED";
        case ErrorCode::ORDER_IN_FLIGHT: return "ORDER_IN_FLIGHT";
        case ErrorCode::ORDER_REJECTED: return "ORDER_REJECTED";
        case ErrorCode::INVARIANT_VIOLATION: return "INVARIANT_VIOLATION";
    }
    return "UNKNOWN";
}

/**
 * Broken internal invariant (negative contracts, fills beyond target).
 * Halts all trading until an operator re-arms.
 */
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Unreadable or out-of-range configuration
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Outcome of a gate check or command
struct CheckResult {
    bool allowed{false};
    std::string reason;
};

} // namespace spreadarb

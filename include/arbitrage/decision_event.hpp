#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"
#include "common/errors.hpp"

namespace spreadarb {

enum class DecisionKind {
    NO_OPPORTUNITY,        // Best spread below the entry threshold
    CANDIDATE_RAISED,      // Spread above threshold, confirmation hold started
    CANDIDATE_PENDING,     // Still inside the confirmation hold
    CANDIDATE_DISCARDED,   // Spread fell back or quotes went stale before confirmation
    ENTRY_BLOCKED,         // Opportunity present but a gate refused it
    ENTRY_SUBMITTED,
    EXIT_TRIGGERED,
    EXIT_SUBMITTED,
    FILL_APPLIED,
    ORDER_FAILED,
    POSITION_FAILED_OPEN,
    POSITION_CLOSED,
    TRADING_DISABLED,
    TRADING_HALTED,
    OPERATOR_COMMAND
};

inline std::string decision_kind_to_string(DecisionKind k) {
    switch (k) {
        case DecisionKind::NO_OPPORTUNITY: return "NO_OPPORTUNITY";
        case DecisionKind::CANDIDATE_RAISED: return "CANDIDATE_RAISED";
        case DecisionKind::CANDIDATE_PENDING: return "CANDIDATE_PENDING";
        case DecisionKind::CANDIDATE_DISCARDED: return "CANDIDATE_DISCARDED";
        case DecisionKind::ENTRY_BLOCKED: return "ENTRY_BLOCKED";
        case DecisionKind::ENTRY_SUBMITTED: return "ENTRY_SUBMITTED";
        case DecisionKind::EXIT_TRIGGERED: return "EXIT_TRIGGERED";
        case DecisionKind::EXIT_SUBMITTED: return "EXIT_SUBMITTED";
        case DecisionKind::FILL_APPLIED: return "FILL_APPLIED";
        case DecisionKind::ORDER_FAILED: return "ORDER_FAILED";
        case DecisionKind::POSITION_FAILED_OPEN: return "POSITION_FAILED_OPEN";
        case DecisionKind::POSITION_CLOSED: return "POSITION_CLOSED";
        case DecisionKind::TRADING_DISABLED: return "TRADING_DISABLED";
        case DecisionKind::TRADING_HALTED: return "TRADING_HALTED";
        case DecisionKind::OPERATOR_COMMAND: return "OPERATOR_COMMAND";
    }
    return "UNKNOWN";
}

// Structured, timestamped record of what the engine decided and why
struct DecisionEvent {
    WallClock timestamp;
    DecisionKind kind{DecisionKind::NO_OPPORTUNITY};
    ErrorCode reason{ErrorCode::NONE};
    std::optional<PositionId> position_id;
    std::optional<Direction> direction;
    double spread{0.0};
    std::string details;
};

} // namespace spreadarb

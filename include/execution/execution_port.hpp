#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"

namespace spreadarb {

// Outcome of a single venue order
enum class FillStatus {
    FILLED,    // Completely filled
    PARTIAL,   // Some contracts filled, remainder canceled
    TIMEOUT,   // No terminal state observed; fill unknown
    REJECTED,  // Venue refused the order, nothing filled
    ERROR      // Transport or port failure, nothing filled
};

inline std::string fill_status_to_string(FillStatus s) {
    switch (s) {
        case FillStatus::FILLED: return "FILLED";
        case FillStatus::PARTIAL: return "PARTIAL";
        case FillStatus::TIMEOUT: return "TIMEOUT";
        case FillStatus::REJECTED: return "REJECTED";
        case FillStatus::ERROR: return "ERROR";
    }
    return "UNKNOWN";
}

struct OrderRequest {
    std::string client_order_id;
    TradingMode mode{TradingMode::SIMULATED};
    Venue venue{Venue::V1};
    Side side{Side::BUY};
    Contracts contracts{0.0};
    Price price_hint{0.0};        // Best price seen when deciding; 0 = none
};

struct FillResult {
    FillStatus status{FillStatus::ERROR};
    std::string order_ref;        // Port-assigned, used for cancel/query
    Venue venue{Venue::V1};
    Side side{Side::BUY};
    Contracts requested{0.0};
    Contracts filled_contracts{0.0};
    Price avg_price{0.0};
    Notional fee{0.0};
    std::string error;
    WallClock timestamp;

    bool has_fill() const { return filled_contracts > CONTRACT_EPSILON; }
};

/**
 * Order placement on one execution backend. Implementations must be safe to
 * call from several threads at once: both legs of a pair are placed
 * concurrently.
 */
class ExecutionPort {
public:
    virtual ~ExecutionPort() = default;

    virtual TradingMode mode() const = 0;

    // Market order; blocks until a terminal state or the port's own timeout
    virtual FillResult place_order(const OrderRequest& request) = 0;

    // Best effort; false if the order is unknown or already terminal
    virtual bool cancel(const std::string& order_ref) = 0;

    // Latest known state, nullopt if unknown
    virtual std::optional<FillResult> query(const std::string& order_ref) = 0;
};

} // namespace spreadarb

#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace spreadarb {

// Time types
using Timestamp = std::chrono::time_point<std::chrono::steady_clock>;
using WallClock = std::chrono::time_point<std::chrono::system_clock>;
using Duration = std::chrono::nanoseconds;

inline Timestamp now() {
    return std::chrono::steady_clock::now();
}

inline WallClock wall_now() {
    return std::chrono::system_clock::now();
}

using Price = double;
using Contracts = double;
using Notional = double;

using PositionId = uint64_t;

// Contract quantities are fractional (0.01 increments on most venues)
constexpr Contracts CONTRACT_EPSILON = 1e-9;

// The two venues quoting the same instrument
enum class Venue {
    V1,
    V2
};

inline std::string venue_to_string(Venue v) {
    return v == Venue::V1 ? "V1" : "V2";
}

inline Venue other_venue(Venue v) {
    return v == Venue::V1 ? Venue::V2 : Venue::V1;
}

inline size_t venue_index(Venue v) {
    return v == Venue::V1 ? 0 : 1;
}

// Direction of an arbitrage position: V1_TO_V2 buys on V1 and sells on V2
enum class Direction {
    V1_TO_V2,
    V2_TO_V1
};

inline std::string direction_to_string(Direction d) {
    return d == Direction::V1_TO_V2 ? "V1_TO_V2" : "V2_TO_V1";
}

enum class Side {
    BUY,
    SELL
};

inline std::string side_to_string(Side s) {
    return s == Side::BUY ? "BUY" : "SELL";
}

inline Side opposite_side(Side s) {
    return s == Side::BUY ? Side::SELL : Side::BUY;
}

// Whether a paired order opens or closes a position
enum class OrderPurpose {
    ENTRY,
    EXIT
};

inline std::string purpose_to_string(OrderPurpose p) {
    return p == OrderPurpose::ENTRY ? "ENTRY" : "EXIT";
}

/**
 * Venue bought on for a paired order. Entries buy on the source venue of the
 * direction; exits reverse both legs.
 */
inline Venue buy_venue(Direction d, OrderPurpose p) {
    Venue entry_buy = (d == Direction::V1_TO_V2) ? Venue::V1 : Venue::V2;
    return p == OrderPurpose::ENTRY ? entry_buy : other_venue(entry_buy);
}

inline Venue sell_venue(Direction d, OrderPurpose p) {
    return other_venue(buy_venue(d, p));
}

// Execution mode, fixed per position at creation
enum class TradingMode {
    SIMULATED,  // Paper execution, no real funds
    REAL        // Live orders
};

inline std::string mode_to_string(TradingMode m) {
    return m == TradingMode::SIMULATED ? "SIMULATED" : "REAL";
}

// Order state as reported by a venue
enum class OrderState {
    PENDING,      // Created but not sent
    SENT,         // Sent to exchange
    ACKNOWLEDGED, // Exchange confirmed receipt
    PARTIAL,      // Partially filled
    FILLED,       // Fully filled
    CANCELED,     // Canceled by user
    REJECTED,     // Rejected by exchange
    EXPIRED       // TTL expired
};

inline std::string order_state_to_string(OrderState s) {
    switch (s) {
        case OrderState::PENDING: return "PENDING";
        case OrderState::SENT: return "SENT";
        case OrderState::ACKNOWLEDGED: return "ACKNOWLEDGED";
        case OrderState::PARTIAL: return "PARTIAL";
        case OrderState::FILLED: return "FILLED";
        case OrderState::CANCELED: return "CANCELED";
        case OrderState::REJECTED: return "REJECTED";
        case OrderState::EXPIRED: return "EXPIRED";
    }
    return "UNKNOWN";
}

// Price level in order book
struct PriceLevel {
    Price price{0.0};
    Contracts size{0.0};

    bool operator==(const PriceLevel& other) const {
        return price == other.price && size == other.size;
    }
};

/**
 * Best bid/ask for one venue. Replaced wholesale on every update, never
 * partially mutated.
 */
struct Quote {
    Venue venue{Venue::V1};
    Price bid{0.0};
    Price ask{0.0};
    Timestamp received_at;

    bool is_valid() const {
        return bid > 0.0 && ask > 0.0 && bid <= ask;
    }

    Price mid() const { return (bid + ask) / 2.0; }

    Duration age(Timestamp at) const { return at - received_at; }
};

// One venue's execution record
struct LegFill {
    Venue venue{Venue::V1};
    Side side{Side::BUY};
    Contracts contracts{0.0};
    Price price{0.0};
    Notional fee{0.0};
    WallClock timestamp;
    std::string order_ref;
};

/**
 * Matched execution of both legs of a paired order. The fill id is unique per
 * order pair and is what makes fill replay idempotent.
 */
struct PairFill {
    std::string fill_id;
    Contracts contracts{0.0};
    LegFill buy_leg;
    LegFill sell_leg;
    WallClock timestamp;

    // Spread actually captured, as opposed to the spread that triggered the order
    double realized_spread() const {
        return buy_leg.price > 0.0 ? sell_leg.price / buy_leg.price - 1.0 : 0.0;
    }
};

} // namespace spreadarb

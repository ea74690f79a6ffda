#pragma once

#include "common/types.hpp"
#include "config/config.hpp"

namespace spreadarb {

// Spreads are fractions: 0.0055 means 0.55%
struct DirectionalSpread {
    Direction direction{Direction::V1_TO_V2};
    double gross_spread{0.0};     // sell_price / buy_price - 1
    double entry_spread{0.0};     // gross_spread minus the direction's fee offset
    double exit_spread{0.0};      // What closing a position in this direction would capture
    Price buy_price{0.0};         // Ask on the entry buy venue
    Price sell_price{0.0};        // Bid on the entry sell venue
};

struct SpreadSnapshot {
    DirectionalSpread v1_to_v2;
    DirectionalSpread v2_to_v1;

    const DirectionalSpread& for_direction(Direction d) const {
        return d == Direction::V1_TO_V2 ? v1_to_v2 : v2_to_v1;
    }

    // Direction with the larger net entry spread; V1_TO_V2 on ties
    const DirectionalSpread& best_entry() const {
        return v2_to_v1.entry_spread > v1_to_v2.entry_spread ? v2_to_v1 : v1_to_v2;
    }
};

/**
 * Net entry spread for opening a position in direction d. Entering V1_TO_V2
 * buys at V1's ask and sells at V2's bid:
 *   bid(V2) / ask(V1) - 1 - fee_offset
 */
double entry_spread(const Quote& v1, const Quote& v2, Direction d, double fee_offset);

/**
 * Spread realized by closing a position opened in direction d, i.e. with
 * both legs reversed. Closing V1_TO_V2 sells at V1's bid and buys at V2's ask:
 *   bid(V1) / ask(V2) - 1
 */
double exit_spread(const Quote& v1, const Quote& v2, Direction d);

// Both directions at once. Quotes must be valid (positive, uncrossed).
SpreadSnapshot compute_spreads(const Quote& v1, const Quote& v2, const TradingConfig& config);

} // namespace spreadarb

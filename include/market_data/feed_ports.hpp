#pragma once

#include <optional>
#include "common/types.hpp"

namespace spreadarb {

/**
 * Read side of the price feeds. Absence of a quote means the feed is down
 * or has not produced one yet; the caller treats that as infinitely stale.
 */
class PriceFeed {
public:
    virtual ~PriceFeed() = default;

    virtual std::optional<Quote> latest_quote(Venue venue) const = 0;

    // Expected fractional price impact of a market order of this size
    virtual double estimate_slippage(Venue venue, Side side, Contracts contracts) const = 0;
};

// Venue-reported account state. Used to size exits of REAL positions.
struct AccountState {
    Notional equity{0.0};
    Notional available_margin{0.0};
    Contracts open_position_size{0.0};   // Signed; positive is long
    Timestamp received_at;
};

class AccountFeed {
public:
    virtual ~AccountFeed() = default;

    virtual std::optional<AccountState> latest_account_state(Venue venue) const = 0;
};

} // namespace spreadarb

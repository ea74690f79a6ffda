#include "arbitrage/spread_calculator.hpp"

namespace spreadarb {

namespace {

const Quote& quote_on(const Quote& v1, const Quote& v2, Venue venue) {
    return venue == Venue::V1 ? v1 : v2;
}

double ratio_spread(Price sell, Price buy) {
    if (buy <= 0.0) return 0.0;
    return sell / buy - 1.0;
}

} // namespace

double entry_spread(const Quote& v1, const Quote& v2, Direction d, double fee_offset) {
    Price buy = quote_on(v1, v2, buy_venue(d, OrderPurpose::ENTRY)).ask;
    Price sell = quote_on(v1, v2, sell_venue(d, OrderPurpose::ENTRY)).bid;
    return ratio_spread(sell, buy) - fee_offset;
}

double exit_spread(const Quote& v1, const Quote& v2, Direction d) {
    Price buy = quote_on(v1, v2, buy_venue(d, OrderPurpose::EXIT)).ask;
    Price sell = quote_on(v1, v2, sell_venue(d, OrderPurpose::EXIT)).bid;
    return ratio_spread(sell, buy);
}

SpreadSnapshot compute_spreads(const Quote& v1, const Quote& v2, const TradingConfig& config) {
    SpreadSnapshot snap;

    for (Direction d : {Direction::V1_TO_V2, Direction::V2_TO_V1}) {
        DirectionalSpread s;
        s.direction = d;
        s.buy_price = quote_on(v1, v2, buy_venue(d, OrderPurpose::ENTRY)).ask;
        s.sell_price = quote_on(v1, v2, sell_venue(d, OrderPurpose::ENTRY)).bid;
        s.gross_spread = ratio_spread(s.sell_price, s.buy_price);
        s.entry_spread = s.gross_spread - config.fee_offset(d);
        s.exit_spread = exit_spread(v1, v2, d);

        if (d == Direction::V1_TO_V2) {
            snap.v1_to_v2 = s;
        } else {
            snap.v2_to_v1 = s;
        }
    }

    return snap;
}

} // namespace spreadarb

#pragma once

#include <string>
#include <optional>
#include "common/types.hpp"

namespace spreadarb {

struct OrderAck {
    bool success{false};
    std::string order_id;
    std::string error;
};

// Venue's view of one order
struct VenueOrder {
    std::string order_id;
    OrderState state{OrderState::PENDING};
    Contracts filled_size{0.0};
    Price avg_fill_price{0.0};
    Notional fee{0.0};
};

/**
 * Minimal venue trading API. Signing, transport and venue-specific order
 * formats live behind this interface.
 */
class ExchangeClient {
public:
    virtual ~ExchangeClient() = default;

    virtual std::string name() const = 0;

    virtual OrderAck submit_market_order(Side side, Contracts contracts, Price price_hint,
                                         const std::string& client_order_id) = 0;

    virtual std::optional<VenueOrder> get_order(const std::string& order_id) = 0;

    virtual OrderAck cancel_order(const std::string& order_id) = 0;
};

} // namespace spreadarb

#pragma once

#include <memory>
#include <atomic>
#include "execution/execution_port.hpp"
#include "execution/exchange_client.hpp"
#include "config/config.hpp"

namespace spreadarb {

/**
 * Live execution through one ExchangeClient per venue.
 *
 * An order is submitted, then polled until it reaches a terminal state or
 * the fill timeout expires. On timeout the order is canceled and its state
 * re-checked, since it may have filled in the meantime; only if the venue
 * still cannot confirm is the result reported as TIMEOUT.
 */
class RealExecutionPort : public ExecutionPort {
public:
    RealExecutionPort(std::shared_ptr<ExchangeClient> v1_client,
                      std::shared_ptr<ExchangeClient> v2_client,
                      const ExecutionConfig& config = ExecutionConfig{});

    TradingMode mode() const override { return TradingMode::REAL; }

    FillResult place_order(const OrderRequest& request) override;
    bool cancel(const std::string& order_ref) override;
    std::optional<FillResult> query(const std::string& order_ref) override;

    uint64_t orders_submitted() const { return orders_submitted_.load(); }
    uint64_t orders_timed_out() const { return orders_timed_out_.load(); }

private:
    std::shared_ptr<ExchangeClient> v1_client_;
    std::shared_ptr<ExchangeClient> v2_client_;
    ExecutionConfig config_;

    std::atomic<uint64_t> orders_submitted_{0};
    std::atomic<uint64_t> orders_timed_out_{0};

    ExchangeClient& client_for(Venue venue) const;

    // Refs are "<venue>:<venue order id>" so cancel/query can route
    static std::string make_ref(Venue venue, const std::string& order_id);
    static std::optional<std::pair<Venue, std::string>> parse_ref(const std::string& order_ref);

    static bool is_terminal(OrderState state);
    static void apply_venue_state(FillResult& result, const VenueOrder& order);
};

} // namespace spreadarb

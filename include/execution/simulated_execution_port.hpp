#pragma once

#include <map>
#include <mutex>
#include <atomic>
#include <memory>
#include "execution/execution_port.hpp"
#include "market_data/feed_ports.hpp"
#include "config/config_manager.hpp"

namespace spreadarb {

// Paper holdings on one venue
struct PaperBalance {
    Notional cash{0.0};            // Net quote currency flow, fees included
    Contracts contracts{0.0};      // Signed net position
    Notional fees_paid{0.0};
    uint64_t orders_filled{0};
};

/**
 * Paper execution against live quotes. Market orders fill completely at the
 * touch worsened by the configured simulated slippage, and pay the venue's
 * taker fee. No real funds move.
 */
class SimulatedExecutionPort : public ExecutionPort {
public:
    SimulatedExecutionPort(std::shared_ptr<const PriceFeed> prices,
                           std::shared_ptr<const ConfigManager> config);

    TradingMode mode() const override { return TradingMode::SIMULATED; }

    FillResult place_order(const OrderRequest& request) override;
    bool cancel(const std::string& order_ref) override;
    std::optional<FillResult> query(const std::string& order_ref) override;

    PaperBalance balance(Venue venue) const;

    // Cash plus both venues' contracts marked at mid
    Notional equity() const;

private:
    std::shared_ptr<const PriceFeed> prices_;
    std::shared_ptr<const ConfigManager> config_;

    mutable std::mutex mutex_;
    PaperBalance balances_[2];
    std::map<std::string, FillResult> orders_;
    std::atomic<uint64_t> next_order_{1};
};

} // namespace spreadarb

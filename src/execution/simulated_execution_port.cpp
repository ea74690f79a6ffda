#include "execution/simulated_execution_port.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <cmath>

namespace spreadarb {

SimulatedExecutionPort::SimulatedExecutionPort(std::shared_ptr<const PriceFeed> prices,
                                               std::shared_ptr<const ConfigManager> config)
    : prices_(std::move(prices))
    , config_(std::move(config))
{
}

FillResult SimulatedExecutionPort::place_order(const OrderRequest& request) {
    FillResult result;
    result.venue = request.venue;
    result.side = request.side;
    result.requested = request.contracts;
    result.timestamp = wall_now();
    result.order_ref = fmt::format("SIM-{}-{}", venue_to_string(request.venue), next_order_++);

    if (request.mode != TradingMode::SIMULATED) {
        result.status = FillStatus::REJECTED;
        result.error = "Simulated port received a REAL order";
        spdlog::error("{} ({})", result.error, request.client_order_id);
        return result;
    }

    if (request.contracts <= CONTRACT_EPSILON) {
        result.status = FillStatus::REJECTED;
        result.error = "Non-positive order size";
        return result;
    }

    auto quote = prices_->latest_quote(request.venue);
    if (!quote) {
        result.status = FillStatus::ERROR;
        result.error = "No quote for " + venue_to_string(request.venue);
        return result;
    }

    auto cfg = config_->current_config();
    Price touch = request.side == Side::BUY ? quote->ask : quote->bid;
    Price price = request.side == Side::BUY
        ? touch * (1.0 + cfg->simulated_slippage)
        : touch * (1.0 - cfg->simulated_slippage);

    result.status = FillStatus::FILLED;
    result.filled_contracts = request.contracts;
    result.avg_price = price;
    result.fee = price * request.contracts * cfg->fee_rate(request.venue);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        PaperBalance& bal = balances_[venue_index(request.venue)];
        Notional notional = price * request.contracts;
        if (request.side == Side::BUY) {
            bal.cash -= notional;
            bal.contracts += request.contracts;
        } else {
            bal.cash += notional;
            bal.contracts -= request.contracts;
        }
        bal.cash -= result.fee;
        bal.fees_paid += result.fee;
        bal.orders_filled++;
        orders_[result.order_ref] = result;
    }

    spdlog::debug("[SIM] {} {} {} @ {:.4f} fee={:.6f} ({})",
                  venue_to_string(request.venue), side_to_string(request.side),
                  request.contracts, price, result.fee, request.client_order_id);
    return result;
}

bool SimulatedExecutionPort::cancel(const std::string& order_ref) {
    // Paper orders fill immediately, there is never anything to cancel
    spdlog::debug("[SIM] cancel {} ignored", order_ref);
    return false;
}

std::optional<FillResult> SimulatedExecutionPort::query(const std::string& order_ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = orders_.find(order_ref);
    if (it == orders_.end()) return std::nullopt;
    return it->second;
}

PaperBalance SimulatedExecutionPort::balance(Venue venue) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return balances_[venue_index(venue)];
}

Notional SimulatedExecutionPort::equity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Notional total = 0.0;
    for (Venue v : {Venue::V1, Venue::V2}) {
        const PaperBalance& bal = balances_[venue_index(v)];
        total += bal.cash;
        auto quote = prices_->latest_quote(v);
        if (quote && std::abs(bal.contracts) > CONTRACT_EPSILON) {
            total += bal.contracts * quote->mid();
        }
    }
    return total;
}

} // namespace spreadarb

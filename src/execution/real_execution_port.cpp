#include "execution/real_execution_port.hpp"
#include <spdlog/spdlog.h>
#include <thread>

namespace spreadarb {

RealExecutionPort::RealExecutionPort(std::shared_ptr<ExchangeClient> v1_client,
                                     std::shared_ptr<ExchangeClient> v2_client,
                                     const ExecutionConfig& config)
    : v1_client_(std::move(v1_client))
    , v2_client_(std::move(v2_client))
    , config_(config)
{
    spdlog::info("RealExecutionPort initialized: V1={}, V2={}, fill_timeout={}ms",
                 v1_client_->name(), v2_client_->name(), config_.order_fill_timeout.count());
}

ExchangeClient& RealExecutionPort::client_for(Venue venue) const {
    return venue == Venue::V1 ? *v1_client_ : *v2_client_;
}

std::string RealExecutionPort::make_ref(Venue venue, const std::string& order_id) {
    return venue_to_string(venue) + ":" + order_id;
}

std::optional<std::pair<Venue, std::string>> RealExecutionPort::parse_ref(const std::string& order_ref) {
    if (order_ref.size() < 4 || order_ref[2] != ':') return std::nullopt;
    std::string prefix = order_ref.substr(0, 2);
    if (prefix == "V1") return std::make_pair(Venue::V1, order_ref.substr(3));
    if (prefix == "V2") return std::make_pair(Venue::V2, order_ref.substr(3));
    return std::nullopt;
}

bool RealExecutionPort::is_terminal(OrderState state) {
    return state == OrderState::FILLED ||
           state == OrderState::CANCELED ||
           state == OrderState::REJECTED ||
           state == OrderState::EXPIRED;
}

void RealExecutionPort::apply_venue_state(FillResult& result, const VenueOrder& order) {
    result.filled_contracts = order.filled_size;
    result.avg_price = order.avg_fill_price;
    result.fee = order.fee;
    result.timestamp = wall_now();

    if (order.state == OrderState::FILLED ||
        (result.requested > 0.0 && order.filled_size + CONTRACT_EPSILON >= result.requested)) {
        result.status = FillStatus::FILLED;
    } else if (is_terminal(order.state)) {
        result.status = order.filled_size > CONTRACT_EPSILON ? FillStatus::PARTIAL : FillStatus::REJECTED;
        if (result.status == FillStatus::REJECTED && result.error.empty()) {
            result.error = "Order ended " + order_state_to_string(order.state) + " without fills";
        }
    } else {
        result.status = FillStatus::TIMEOUT;
    }
}

FillResult RealExecutionPort::place_order(const OrderRequest& request) {
    FillResult result;
    result.venue = request.venue;
    result.side = request.side;
    result.requested = request.contracts;
    result.timestamp = wall_now();

    if (request.mode != TradingMode::REAL) {
        result.status = FillStatus::REJECTED;
        result.error = "Real port received a SIMULATED order";
        spdlog::error("{} ({})", result.error, request.client_order_id);
        return result;
    }

    ExchangeClient& client = client_for(request.venue);

    OrderAck ack;
    try {
        ack = client.submit_market_order(request.side, request.contracts,
                                         request.price_hint, request.client_order_id);
    } catch (const std::exception& e) {
        result.status = FillStatus::ERROR;
        result.error = std::string("Submit failed: ") + e.what();
        spdlog::error("[{}] {} {} {}: {}", client.name(), side_to_string(request.side),
                      request.contracts, request.client_order_id, result.error);
        return result;
    }

    if (!ack.success) {
        result.status = FillStatus::REJECTED;
        result.error = ack.error;
        spdlog::error("[{}] Order rejected {}: {}", client.name(), request.client_order_id, ack.error);
        return result;
    }

    orders_submitted_++;
    result.order_ref = make_ref(request.venue, ack.order_id);
    spdlog::info("[{}] Submitted {} {} contracts ({}) -> {}", client.name(),
                 side_to_string(request.side), request.contracts,
                 request.client_order_id, ack.order_id);

    auto deadline = std::chrono::steady_clock::now() + config_.order_fill_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        std::optional<VenueOrder> order;
        try {
            order = client.get_order(ack.order_id);
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Order status query failed for {}: {}", client.name(), ack.order_id, e.what());
        }

        if (order) {
            apply_venue_state(result, *order);
            if (result.status != FillStatus::TIMEOUT) {
                return result;
            }
        }
        std::this_thread::sleep_for(config_.order_poll_interval);
    }

    // Timed out: cancel, then re-check because it may have filled meanwhile
    spdlog::warn("[{}] Order {} not terminal after {}ms, canceling",
                 client.name(), ack.order_id, config_.order_fill_timeout.count());
    try {
        auto cancel_ack = client.cancel_order(ack.order_id);
        if (!cancel_ack.success) {
            spdlog::warn("[{}] Cancel of {} failed: {}", client.name(), ack.order_id, cancel_ack.error);
        }
        auto order = client.get_order(ack.order_id);
        if (order) {
            apply_venue_state(result, *order);
        }
    } catch (const std::exception& e) {
        spdlog::error("[{}] Cancel/re-check of {} failed: {}", client.name(), ack.order_id, e.what());
    }

    if (result.status == FillStatus::TIMEOUT) {
        orders_timed_out_++;
        result.error = "Fill not confirmed after cancel";
        spdlog::error("[{}] Order {} state unknown after cancel, filled so far {}",
                      client.name(), ack.order_id, result.filled_contracts);
    }
    return result;
}

bool RealExecutionPort::cancel(const std::string& order_ref) {
    auto parsed = parse_ref(order_ref);
    if (!parsed) return false;

    try {
        return client_for(parsed->first).cancel_order(parsed->second).success;
    } catch (const std::exception& e) {
        spdlog::error("Cancel {} failed: {}", order_ref, e.what());
        return false;
    }
}

std::optional<FillResult> RealExecutionPort::query(const std::string& order_ref) {
    auto parsed = parse_ref(order_ref);
    if (!parsed) return std::nullopt;

    std::optional<VenueOrder> order;
    try {
        order = client_for(parsed->first).get_order(parsed->second);
    } catch (const std::exception& e) {
        spdlog::error("Query {} failed: {}", order_ref, e.what());
        return std::nullopt;
    }
    if (!order) return std::nullopt;

    FillResult result;
    result.order_ref = order_ref;
    result.venue = parsed->first;
    apply_venue_state(result, *order);
    return result;
}

} // namespace spreadarb

#include "execution/execution_coordinator.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace spreadarb {

ExecutionCoordinator::ExecutionCoordinator(std::shared_ptr<ExecutionPort> simulated_port,
                                           std::shared_ptr<ExecutionPort> real_port,
                                           const Config& config)
    : simulated_port_(std::move(simulated_port))
    , real_port_(std::move(real_port))
    , config_(config)
{
    spdlog::info("ExecutionCoordinator initialized: simulated={}, real={}, async={}, inflight_timeout={}ms",
                 simulated_port_ != nullptr, real_port_ != nullptr,
                 config_.async_dispatch, config_.inflight_timeout.count());
}

ExecutionCoordinator::~ExecutionCoordinator() {
    wait_all();
}

ExecutionPort* ExecutionCoordinator::port_for(TradingMode mode) const {
    return mode == TradingMode::REAL ? real_port_.get() : simulated_port_.get();
}

FillResult ExecutionCoordinator::place_leg(ExecutionPort& port, const OrderRequest& order) {
    try {
        return port.place_order(order);
    } catch (const std::exception& e) {
        FillResult failed;
        failed.status = FillStatus::ERROR;
        failed.venue = order.venue;
        failed.side = order.side;
        failed.requested = order.contracts;
        failed.error = std::string("Port exception: ") + e.what();
        failed.timestamp = wall_now();
        spdlog::error("Leg {} {} {} failed: {}", venue_to_string(order.venue),
                      side_to_string(order.side), order.client_order_id, failed.error);
        return failed;
    }
}

FillResult ExecutionCoordinator::resolve_unknown(ExecutionPort& port, FillResult leg) {
    if (leg.status != FillStatus::TIMEOUT || leg.order_ref.empty()) {
        return leg;
    }

    try {
        port.cancel(leg.order_ref);
        auto latest = port.query(leg.order_ref);
        if (latest && latest->status != FillStatus::TIMEOUT) {
            leg.status = latest->status;
            leg.filled_contracts = latest->filled_contracts;
            leg.avg_price = latest->avg_price;
            leg.fee = latest->fee;
            if (leg.status == FillStatus::FILLED &&
                leg.filled_contracts + CONTRACT_EPSILON < leg.requested) {
                leg.status = FillStatus::PARTIAL;
            }
            spdlog::info("Leg {} resolved after cancel: {} filled={}",
                         leg.order_ref, fill_status_to_string(leg.status), leg.filled_contracts);
        }
    } catch (const std::exception& e) {
        spdlog::error("Cancel/re-check of {} failed: {}", leg.order_ref, e.what());
    }
    return leg;
}

LegFill ExecutionCoordinator::to_leg_fill(const FillResult& leg, Contracts contracts) {
    LegFill fill;
    fill.venue = leg.venue;
    fill.side = leg.side;
    fill.contracts = contracts;
    fill.price = leg.avg_price;
    fill.fee = leg.filled_contracts > 0.0 ? leg.fee * contracts / leg.filled_contracts : 0.0;
    fill.timestamp = leg.timestamp;
    fill.order_ref = leg.order_ref;
    return fill;
}

void ExecutionCoordinator::unwind_excess(ExecutionPort& port, const PairRequest& request,
                                         const FillResult& leg, Contracts excess,
                                         PairOutcome& outcome) {
    unwind_attempts_++;
    outcome.unwind_attempted = true;

    spdlog::warn("Position {}: {} leg on {} over-filled by {}, unwinding",
                 request.position_id, side_to_string(leg.side),
                 venue_to_string(leg.venue), excess);

    OrderRequest order;
    order.client_order_id = fmt::format("{}-UW", leg.order_ref);
    order.mode = request.mode;
    order.venue = leg.venue;
    order.side = opposite_side(leg.side);
    order.contracts = excess;
    order.price_hint = leg.avg_price;

    FillResult unwind = resolve_unknown(port, place_leg(port, order));

    Contracts unwound = unwind.status == FillStatus::TIMEOUT ? 0.0 : unwind.filled_contracts;
    outcome.unwind_contracts += unwound;

    if (unwound > CONTRACT_EPSILON) {
        Notional leg_fee = leg.filled_contracts > 0.0
            ? leg.fee * unwound / leg.filled_contracts : 0.0;
        Notional price_diff = leg.side == Side::BUY
            ? unwind.avg_price - leg.avg_price
            : leg.avg_price - unwind.avg_price;
        outcome.unwind_pnl += price_diff * unwound - leg_fee - unwind.fee;
    }

    outcome.unwind_succeeded = unwound + CONTRACT_EPSILON >= excess;
    if (outcome.unwind_succeeded) {
        spdlog::info("Position {}: unwound {} on {} @ {:.4f}, pnl={:.4f}",
                     request.position_id, unwound, venue_to_string(leg.venue),
                     unwind.avg_price, outcome.unwind_pnl);
    } else {
        spdlog::critical("Position {}: UNWIND FAILED on {}, {} of {} contracts unhedged: {}",
                         request.position_id, venue_to_string(leg.venue),
                         excess - unwound, excess, unwind.error);
    }
}

PairOutcome ExecutionCoordinator::execute(const PairRequest& request) {
    PairOutcome outcome;
    outcome.request = request;

    ExecutionPort* port = port_for(request.mode);
    if (!port) {
        outcome.error = ErrorCode::PORT_UNAVAILABLE;
        outcome.message = "No execution port for " + mode_to_string(request.mode);
        outcome.completed_at = wall_now();
        spdlog::error("Position {}: {}", request.position_id, outcome.message);
        return outcome;
    }

    std::string base = fmt::format("P{}-{}-{}", request.position_id,
                                   request.purpose == OrderPurpose::ENTRY ? "EN" : "EX",
                                   next_pair_++);

    OrderRequest buy;
    buy.client_order_id = base + "-B";
    buy.mode = request.mode;
    buy.venue = buy_venue(request.direction, request.purpose);
    buy.side = Side::BUY;
    buy.contracts = request.contracts;
    buy.price_hint = request.buy_price_hint;

    OrderRequest sell = buy;
    sell.client_order_id = base + "-S";
    sell.venue = sell_venue(request.direction, request.purpose);
    sell.side = Side::SELL;
    sell.price_hint = request.sell_price_hint;

    spdlog::info("Position {} {} {}: {} contracts, buy {} @~{:.4f}, sell {} @~{:.4f}",
                 request.position_id, purpose_to_string(request.purpose), mode_to_string(request.mode),
                 request.contracts, venue_to_string(buy.venue), buy.price_hint,
                 venue_to_string(sell.venue), sell.price_hint);

    // Both legs at once; the sell leg runs on its own thread
    auto sell_future = std::async(std::launch::async, [this, port, &sell] {
        return place_leg(*port, sell);
    });
    FillResult buy_result = place_leg(*port, buy);
    FillResult sell_result = sell_future.get();

    outcome.buy_result = resolve_unknown(*port, buy_result);
    outcome.sell_result = resolve_unknown(*port, sell_result);
    const FillResult& b = outcome.buy_result;
    const FillResult& s = outcome.sell_result;

    if (b.status == FillStatus::TIMEOUT || s.status == FillStatus::TIMEOUT) {
        // Unknown fill state: never assume success, never unwind blindly
        outcome.error = ErrorCode::PARTIAL_FILL_TIMEOUT;
        outcome.unhedged = b.has_fill() || s.has_fill();
        outcome.message = fmt::format("Fill unconfirmed: buy {} {}, sell {} {}",
                                      fill_status_to_string(b.status), b.filled_contracts,
                                      fill_status_to_string(s.status), s.filled_contracts);
        outcome.completed_at = wall_now();
        spdlog::error("Position {}: {}", request.position_id, outcome.message);
        return outcome;
    }

    Contracts matched = std::min(b.filled_contracts, s.filled_contracts);

    if (b.filled_contracts - matched > CONTRACT_EPSILON) {
        unwind_excess(*port, request, b, b.filled_contracts - matched, outcome);
    } else if (s.filled_contracts - matched > CONTRACT_EPSILON) {
        unwind_excess(*port, request, s, s.filled_contracts - matched, outcome);
    }

    if (matched > CONTRACT_EPSILON) {
        PairFill fill;
        fill.fill_id = b.order_ref + "/" + s.order_ref;
        fill.contracts = matched;
        fill.buy_leg = to_leg_fill(b, matched);
        fill.sell_leg = to_leg_fill(s, matched);
        fill.timestamp = wall_now();
        outcome.fill = fill;
        outcome.success = true;

        if (matched + CONTRACT_EPSILON < request.contracts) {
            outcome.message = fmt::format("Partial pair: {} of {} matched", matched, request.contracts);
        }
    } else {
        if (b.status == FillStatus::ERROR || s.status == FillStatus::ERROR) {
            outcome.error = ErrorCode::PORT_UNAVAILABLE;
        } else {
            outcome.error = ErrorCode::ORDER_REJECTED;
        }
        outcome.message = fmt::format("buy {} ({}), sell {} ({})",
                                      fill_status_to_string(b.status), b.error,
                                      fill_status_to_string(s.status), s.error);
    }

    if (outcome.unwind_attempted) {
        outcome.error = ErrorCode::LEG_MISMATCH;
        outcome.unhedged = !outcome.unwind_succeeded;
        if (outcome.message.empty()) {
            outcome.message = fmt::format("Leg mismatch: buy {} / sell {}",
                                          b.filled_contracts, s.filled_contracts);
        }
    }

    outcome.completed_at = wall_now();
    return outcome;
}

CheckResult ExecutionCoordinator::dispatch(const PairRequest& request, Timestamp now) {
    std::unique_lock<std::mutex> lock(mutex_);

    if (in_flight_.count(request.position_id)) {
        return {false, fmt::format("Position {} already has an order in flight", request.position_id)};
    }
    last_submission_[request.position_id] = now;

    if (!config_.async_dispatch) {
        lock.unlock();
        PairOutcome outcome = execute(request);
        lock.lock();
        completed_.push_back(std::move(outcome));
        return {true, ""};
    }

    auto future = std::async(std::launch::async, [this, request] {
        PairOutcome outcome = execute(request);
        {
            std::lock_guard<std::mutex> done_lock(mutex_);
            completed_.push_back(outcome);
        }
        return outcome;
    }).share();

    in_flight_.emplace(request.position_id, InFlight{request, now, future});
    return {true, ""};
}

std::vector<PairOutcome> ExecutionCoordinator::drain_completions(Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PairOutcome> out;

    auto is_ready = [](const InFlight& f) {
        return f.future.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    };

    // A ready future has already queued its outcome
    for (auto it = in_flight_.begin(); it != in_flight_.end();) {
        if (is_ready(it->second)) {
            it = in_flight_.erase(it);
        } else if (now - it->second.started_at > config_.inflight_timeout) {
            spdlog::error("Position {}: order in flight for over {}ms, releasing lock",
                          it->first, config_.inflight_timeout.count());

            PairOutcome timeout;
            timeout.request = it->second.request;
            timeout.error = ErrorCode::PARTIAL_FILL_TIMEOUT;
            timeout.message = "In-flight lock released; late result will still be applied";
            timeout.completed_at = wall_now();
            completed_.push_back(timeout);

            orphaned_.push_back(std::move(it->second));
            it = in_flight_.erase(it);
        } else {
            ++it;
        }
    }

    orphaned_.erase(std::remove_if(orphaned_.begin(), orphaned_.end(), is_ready), orphaned_.end());

    out.assign(std::make_move_iterator(completed_.begin()), std::make_move_iterator(completed_.end()));
    completed_.clear();
    return out;
}

bool ExecutionCoordinator::is_in_flight(PositionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.count(id) > 0;
}

std::optional<Timestamp> ExecutionCoordinator::last_submission(PositionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_submission_.find(id);
    if (it == last_submission_.end()) return std::nullopt;
    return it->second;
}

Contracts ExecutionCoordinator::pending_entry_contracts(Direction direction) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Contracts total = 0.0;
    auto add = [&](const PairRequest& r) {
        if (r.purpose == OrderPurpose::ENTRY && r.direction == direction) {
            total += r.contracts;
        }
    };
    for (const auto& [id, f] : in_flight_) add(f.request);
    for (const auto& f : orphaned_) add(f.request);
    return total;
}

size_t ExecutionCoordinator::in_flight_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size() + orphaned_.size();
}

void ExecutionCoordinator::set_inflight_timeout(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.inflight_timeout = timeout;
}

void ExecutionCoordinator::wait_all() {
    std::vector<std::shared_future<PairOutcome>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, f] : in_flight_) pending.push_back(f.future);
        for (const auto& f : orphaned_) pending.push_back(f.future);
    }
    for (auto& f : pending) {
        f.wait();
    }
}

} // namespace spreadarb

#include "position/position_ledger.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace spreadarb {

namespace {

Price weighted_price(const std::vector<PairFill>& fills, bool buy_leg) {
    Notional value = 0.0;
    Contracts total = 0.0;
    for (const auto& f : fills) {
        value += (buy_leg ? f.buy_leg.price : f.sell_leg.price) * f.contracts;
        total += f.contracts;
    }
    return total > 0.0 ? value / total : 0.0;
}

} // namespace

Price Position::avg_entry_buy_price() const {
    return weighted_price(entry_fills, true);
}

Price Position::avg_entry_sell_price() const {
    return weighted_price(entry_fills, false);
}

double Position::realized_entry_spread() const {
    Price buy = avg_entry_buy_price();
    return buy > 0.0 ? avg_entry_sell_price() / buy - 1.0 : 0.0;
}

PositionId PositionLedger::open_draft(Direction direction, TradingMode mode,
                                      const DraftParams& params, Timestamp now, WallClock wall) {
    if (params.target_contracts <= CONTRACT_EPSILON ||
        params.min_viable_contracts <= CONTRACT_EPSILON ||
        params.min_viable_contracts > params.target_contracts + CONTRACT_EPSILON) {
        throw InvariantViolation(fmt::format(
            "Invalid draft sizing: target={} min_viable={}",
            params.target_contracts, params.min_viable_contracts));
    }

    std::lock_guard<std::mutex> lock(mutex_);

    Position pos;
    pos.id = next_id_++;
    pos.direction = direction;
    pos.mode = mode;
    pos.target_contracts = params.target_contracts;
    pos.min_viable_contracts = params.min_viable_contracts;
    pos.exit_spread_target = params.exit_spread_target;
    pos.decision_spread = params.decision_spread;
    pos.opened_at = now;
    pos.opened_wall = wall;
    pos.state = PositionState::OPENING;

    spdlog::info("Position {} drafted: {} {} target={} min_viable={} spread={:.4f}%",
                 pos.id, direction_to_string(direction), mode_to_string(mode),
                 pos.target_contracts, pos.min_viable_contracts, pos.decision_spread * 100);

    PositionId id = pos.id;
    positions_.emplace(id, std::move(pos));
    return id;
}

Position& PositionLedger::find_locked(PositionId id) {
    auto it = positions_.find(id);
    if (it == positions_.end()) {
        throw InvariantViolation(fmt::format("Fill for unknown position {}", id));
    }
    return it->second;
}

void PositionLedger::validate_fill(const Position& pos, const PairFill& fill) {
    if (fill.contracts <= CONTRACT_EPSILON) {
        throw InvariantViolation(fmt::format(
            "Position {}: non-positive fill {} ({})", pos.id, fill.contracts, fill.fill_id));
    }
    if (fill.buy_leg.price <= 0.0 || fill.sell_leg.price <= 0.0) {
        throw InvariantViolation(fmt::format(
            "Position {}: fill {} has non-positive price", pos.id, fill.fill_id));
    }
    if (std::abs(fill.buy_leg.contracts - fill.contracts) > CONTRACT_EPSILON ||
        std::abs(fill.sell_leg.contracts - fill.contracts) > CONTRACT_EPSILON) {
        throw InvariantViolation(fmt::format(
            "Position {}: fill {} legs do not match ({} / {} / {})", pos.id, fill.fill_id,
            fill.contracts, fill.buy_leg.contracts, fill.sell_leg.contracts));
    }
}

bool PositionLedger::record_entry_fill(PositionId id, const PairFill& fill) {
    std::lock_guard<std::mutex> lock(mutex_);
    Position& pos = find_locked(id);

    auto& applied = applied_fills_[id];
    if (applied.count(fill.fill_id)) {
        spdlog::debug("Position {}: entry fill {} already applied", id, fill.fill_id);
        return false;
    }

    validate_fill(pos, fill);
    if (fill.buy_leg.venue != buy_venue(pos.direction, OrderPurpose::ENTRY)) {
        throw InvariantViolation(fmt::format(
            "Position {}: entry fill {} bought on the wrong venue", id, fill.fill_id));
    }
    if (pos.filled_contracts + fill.contracts > pos.target_contracts + CONTRACT_EPSILON) {
        throw InvariantViolation(fmt::format(
            "Position {}: entry fill {} would exceed target ({} + {} > {})",
            id, fill.fill_id, pos.filled_contracts, fill.contracts, pos.target_contracts));
    }

    applied.insert(fill.fill_id);
    pos.entry_fills.push_back(fill);
    pos.filled_contracts += fill.contracts;
    pos.total_fees += fill.buy_leg.fee + fill.sell_leg.fee;

    switch (pos.state) {
        case PositionState::OPENING:
            if (pos.filled_contracts + CONTRACT_EPSILON >= pos.min_viable_contracts) {
                pos.state = PositionState::OPEN;
            }
            break;
        case PositionState::CLOSED:
            // Late fill after the position was flat: exposure is back, exit it again
            spdlog::warn("Position {}: late entry fill {} after close, reopening exit", id, fill.fill_id);
            pos.state = PositionState::CLOSING;
            pos.closed_wall.reset();
            break;
        default:
            break;
    }

    spdlog::info("Position {} entry fill {}: +{} @ buy {:.4f} / sell {:.4f} (spread {:.4f}%) "
                 "filled={}/{} state={}",
                 id, fill.fill_id, fill.contracts, fill.buy_leg.price, fill.sell_leg.price,
                 fill.realized_spread() * 100, pos.filled_contracts, pos.target_contracts,
                 position_state_to_string(pos.state));
    return true;
}

std::optional<CloseResult> PositionLedger::record_exit_fill(PositionId id, const PairFill& fill) {
    std::lock_guard<std::mutex> lock(mutex_);
    Position& pos = find_locked(id);

    auto& applied = applied_fills_[id];
    if (applied.count(fill.fill_id)) {
        spdlog::debug("Position {}: exit fill {} already applied", id, fill.fill_id);
        return std::nullopt;
    }

    validate_fill(pos, fill);
    if (fill.buy_leg.venue != buy_venue(pos.direction, OrderPurpose::EXIT)) {
        throw InvariantViolation(fmt::format(
            "Position {}: exit fill {} bought on the wrong venue", id, fill.fill_id));
    }
    if (pos.exited_contracts + fill.contracts > pos.filled_contracts + CONTRACT_EPSILON) {
        throw InvariantViolation(fmt::format(
            "Position {}: exit fill {} would exit more than filled ({} + {} > {})",
            id, fill.fill_id, pos.exited_contracts, fill.contracts, pos.filled_contracts));
    }

    applied.insert(fill.fill_id);
    pos.exit_fills.push_back(fill);
    pos.exited_contracts += fill.contracts;
    pos.total_fees += fill.buy_leg.fee + fill.sell_leg.fee;

    if (pos.state == PositionState::OPENING || pos.state == PositionState::OPEN) {
        pos.state = PositionState::CLOSING;
    }

    spdlog::info("Position {} exit fill {}: -{} @ sell {:.4f} / buy {:.4f} remaining={}",
                 id, fill.fill_id, fill.contracts, fill.sell_leg.price, fill.buy_leg.price,
                 pos.remaining_contracts());

    if (pos.remaining_contracts() > CONTRACT_EPSILON) {
        return std::nullopt;
    }
    return settle_locked(pos, fill.timestamp);
}

std::optional<CloseResult> PositionLedger::settle_locked(Position& pos, WallClock wall) {
    if (pos.state != PositionState::FAILED_OPEN) {
        pos.state = PositionState::CLOSED;
    }
    pos.closed_wall = wall;
    pos.realized_pnl = compute_pnl(pos);

    Notional& reported = reported_pnl_[pos.id];
    CloseResult result;
    result.id = pos.id;
    result.final_state = pos.state;
    result.exit_reason = pos.exit_reason;
    result.realized_pnl = pos.realized_pnl - reported;
    result.fees = pos.total_fees;
    reported = pos.realized_pnl;

    spdlog::info("Position {} {}: reason={} pnl={:.4f} fees={:.4f} contracts={}",
                 pos.id, position_state_to_string(pos.state), exit_reason_to_string(pos.exit_reason),
                 pos.realized_pnl, pos.total_fees, pos.filled_contracts);
    return result;
}

Notional PositionLedger::compute_pnl(const Position& pos) {
    Notional pnl = 0.0;
    for (const auto& f : pos.entry_fills) {
        pnl += (f.sell_leg.price - f.buy_leg.price) * f.contracts;
    }
    for (const auto& f : pos.exit_fills) {
        pnl += (f.sell_leg.price - f.buy_leg.price) * f.contracts;
    }
    return pnl - pos.total_fees;
}

bool PositionLedger::mark_closing(PositionId id, ExitReason reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) return false;

    Position& pos = it->second;
    if (pos.state != PositionState::OPEN && pos.state != PositionState::OPENING) {
        return false;
    }
    if (pos.filled_contracts <= CONTRACT_EPSILON) {
        return false;
    }

    pos.state = PositionState::CLOSING;
    pos.exit_reason = reason;
    spdlog::info("Position {} closing: reason={} remaining={}",
                 id, exit_reason_to_string(reason), pos.remaining_contracts());
    return true;
}

Contracts PositionLedger::mark_failed_open(PositionId id, WallClock wall) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || it->second.state != PositionState::OPENING) {
        return 0.0;
    }

    Position& pos = it->second;
    pos.state = PositionState::FAILED_OPEN;
    pos.exit_reason = ExitReason::FAILED_OPEN;

    Contracts residual = pos.remaining_contracts();
    if (residual <= CONTRACT_EPSILON) {
        pos.closed_wall = wall;
    }

    spdlog::warn("Position {} FAILED_OPEN: filled {} of min viable {}, residual to unwind {}",
                 id, pos.filled_contracts, pos.min_viable_contracts, residual);
    return residual;
}

bool PositionLedger::request_close(PositionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end() || !it->second.is_active()) {
        return false;
    }
    it->second.close_requested = true;
    return true;
}

void PositionLedger::update_exit_spread(PositionId id, double spread) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) return;

    Position& pos = it->second;
    if (pos.exit_spread_updates == 0) {
        pos.best_exit_spread = spread;
        pos.worst_exit_spread = spread;
    } else {
        pos.best_exit_spread = std::max(pos.best_exit_spread, spread);
        pos.worst_exit_spread = std::min(pos.worst_exit_spread, spread);
    }
    pos.last_exit_spread = spread;
    pos.exit_spread_updates++;
}

std::optional<Position> PositionLedger::get(PositionId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) return std::nullopt;
    return it->second;
}

std::vector<Position> PositionLedger::list_open() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> result;
    for (const auto& [id, pos] : positions_) {
        if (pos.is_active()) {
            result.push_back(pos);
        }
    }
    return result;
}

std::vector<Position> PositionLedger::list_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Position> result;
    result.reserve(positions_.size());
    for (const auto& [id, pos] : positions_) {
        result.push_back(pos);
    }
    return result;
}

std::optional<Duration> PositionLedger::age_of(PositionId id, Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(id);
    if (it == positions_.end()) return std::nullopt;
    return now - it->second.opened_at;
}

Contracts PositionLedger::open_contracts(Direction direction) const {
    std::lock_guard<std::mutex> lock(mutex_);
    Contracts total = 0.0;
    for (const auto& [id, pos] : positions_) {
        if (pos.direction == direction && pos.is_active()) {
            total += pos.remaining_contracts();
        }
    }
    return total;
}

size_t PositionLedger::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(positions_.begin(), positions_.end(),
                         [](const auto& entry) { return entry.second.is_active(); });
}

std::optional<PositionId> PositionLedger::scalable_position(Direction direction) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, pos] : positions_) {
        if (pos.direction == direction && pos.can_scale_in()) {
            return id;
        }
    }
    return std::nullopt;
}

size_t PositionLedger::prune_closed(size_t keep) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<PositionId> finished;
    for (const auto& [id, pos] : positions_) {
        if (!pos.is_active()) {
            finished.push_back(id);
        }
    }
    if (finished.size() <= keep) return 0;

    size_t to_remove = finished.size() - keep;
    // Ids increase monotonically, so the front of the list is the oldest
    for (size_t i = 0; i < to_remove; ++i) {
        positions_.erase(finished[i]);
        applied_fills_.erase(finished[i]);
        reported_pnl_.erase(finished[i]);
    }
    return to_remove;
}

} // namespace spreadarb

#include "arbitrage/decision_engine.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <cmath>
#include <thread>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace spreadarb {

namespace {

constexpr size_t KEEP_CLOSED_POSITIONS = 500;

bool is_fresh(const std::optional<Quote>& q, Timestamp now, Duration window) {
    return q.has_value() && q->age(now) <= window;
}

} // namespace

DecisionEngine::DecisionEngine(std::shared_ptr<ConfigManager> config,
                               std::shared_ptr<const PriceFeed> prices,
                               std::shared_ptr<const AccountFeed> accounts,
                               std::shared_ptr<RiskManager> risk,
                               std::shared_ptr<PositionLedger> ledger,
                               std::shared_ptr<ExecutionCoordinator> executor,
                               std::shared_ptr<TradeJournal> journal,
                               std::shared_ptr<SpreadHistory> history)
    : config_(std::move(config))
    , prices_(std::move(prices))
    , accounts_(std::move(accounts))
    , risk_(std::move(risk))
    , ledger_(std::move(ledger))
    , executor_(std::move(executor))
    , journal_(std::move(journal))
    , history_(std::move(history))
{
    auto cfg = config_->current_config();
    spdlog::info("DecisionEngine initialized: mode={} enter={:.4f}% exit={:.4f}% max_pos={} "
                 "min_order={} max_concurrent={}",
                 mode_to_string(config_->current_mode()),
                 cfg->min_spread_enter * 100, cfg->min_spread_exit * 100,
                 cfg->max_position_contracts, cfg->min_order_contracts,
                 cfg->max_concurrent_positions);
}

TickReport DecisionEngine::tick(Timestamp now, WallClock wall) {
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);
    tick_count_++;

    TickContext ctx;
    ctx.now = now;
    ctx.wall = wall;
    ctx.cfg = config_->current_config();
    ctx.mode = config_->current_mode();

    try {
        executor_->set_inflight_timeout(ctx.cfg->inflight_timeout);
        apply_completions(ctx);
        risk_->daily_reset_if_needed(wall);
        read_market(ctx);

        if (risk_->is_halted()) {
            if (!halt_reported_) {
                halt_reported_ = true;
                emit(ctx, DecisionEvent{wall, DecisionKind::TRADING_HALTED,
                                        ErrorCode::INVARIANT_VIOLATION, std::nullopt, std::nullopt,
                                        0.0, risk_->state().disable_details});
            }
            candidate_.reset();
            entry_status_ = DecisionEvent{wall, DecisionKind::ENTRY_BLOCKED,
                                          ErrorCode::INVARIANT_VIOLATION, std::nullopt,
                                          std::nullopt, 0.0, "Trading halted"};
        } else {
            halt_reported_ = false;
            evaluate_exits(ctx);
            evaluate_entry(ctx);
            // Inline dispatch finishes immediately; record those results this tick
            apply_completions(ctx);
        }
    } catch (const InvariantViolation& e) {
        spdlog::critical("Invariant violation, halting all trading: {}", e.what());
        candidate_.reset();
        risk_->disable(DisableReason::INVARIANT_VIOLATION, e.what(), wall);
        halt_reported_ = true;
        emit(ctx, DecisionEvent{wall, DecisionKind::TRADING_HALTED,
                                ErrorCode::INVARIANT_VIOLATION, std::nullopt, std::nullopt,
                                0.0, e.what()});
    } catch (const std::exception& e) {
        spdlog::error("Tick {} aborted: {}", tick_count_.load(), e.what());
    }

    publish_snapshot(ctx);
    return std::move(ctx.report);
}

void DecisionEngine::read_market(TickContext& ctx) {
    ctx.v1 = prices_->latest_quote(Venue::V1);
    ctx.v2 = prices_->latest_quote(Venue::V2);

    Duration window = ctx.cfg->quote_freshness_window;
    ctx.v1_fresh = is_fresh(ctx.v1, ctx.now, window);
    ctx.v2_fresh = is_fresh(ctx.v2, ctx.now, window);

    if (ctx.v1 && ctx.v2 && ctx.v1->is_valid() && ctx.v2->is_valid()) {
        ctx.spreads = compute_spreads(*ctx.v1, *ctx.v2, *ctx.cfg);
    }
}

void DecisionEngine::apply_completions(TickContext& ctx) {
    std::optional<std::string> violation;

    // Drained outcomes exist nowhere else; every one is applied before any halt
    for (const auto& outcome : executor_->drain_completions(ctx.now)) {
        try {
            apply_outcome(ctx, outcome);
        } catch (const InvariantViolation& e) {
            spdlog::critical("Position {}: {}", outcome.request.position_id, e.what());
            if (!violation) {
                violation = e.what();
            }
        } catch (const std::exception& e) {
            spdlog::error("Position {}: failed to apply {} outcome: {}", outcome.request.position_id,
                          purpose_to_string(outcome.request.purpose), e.what());
        }
    }

    if (violation) {
        throw InvariantViolation(*violation);
    }
}

void DecisionEngine::apply_outcome(TickContext& ctx, const PairOutcome& outcome) {
    const PairRequest& req = outcome.request;

    if (outcome.fill) {
        ctx.report.fills_applied++;
        if (req.purpose == OrderPurpose::ENTRY) {
            if (ledger_->record_entry_fill(req.position_id, *outcome.fill) && journal_) {
                journal_->record_fill(req.position_id, req.purpose, *outcome.fill);
            }
        } else {
            auto closed = ledger_->record_exit_fill(req.position_id, *outcome.fill);
            if (journal_) {
                journal_->record_fill(req.position_id, req.purpose, *outcome.fill);
            }
            if (closed) {
                risk_->on_trade_closed(closed->realized_pnl, ctx.wall);
                emit(ctx, DecisionEvent{ctx.wall, DecisionKind::POSITION_CLOSED, ErrorCode::NONE,
                                        closed->id, req.direction, 0.0,
                                        fmt::format("{} pnl={:.4f} fees={:.4f}",
                                                    exit_reason_to_string(closed->exit_reason),
                                                    closed->realized_pnl, closed->fees)});
                auto pos = ledger_->get(closed->id);
                if (journal_ && pos) {
                    journal_->record_position_closed(*pos);
                }
            }
        }
        emit(ctx, DecisionEvent{ctx.wall, DecisionKind::FILL_APPLIED, outcome.error,
                                req.position_id, req.direction, outcome.fill->realized_spread(),
                                fmt::format("{} {} contracts", purpose_to_string(req.purpose),
                                            outcome.fill->contracts)});
    }

    if (outcome.unwind_attempted && std::abs(outcome.unwind_pnl) > 0.0) {
        risk_->on_trade_closed(outcome.unwind_pnl, ctx.wall);
    }

    if (!outcome.success || outcome.error != ErrorCode::NONE) {
        emit(ctx, DecisionEvent{ctx.wall, DecisionKind::ORDER_FAILED, outcome.error,
                                req.position_id, req.direction, 0.0, outcome.message});
    }

    if (outcome.unhedged) {
        risk_->disable(DisableReason::UNHEDGED_LEG,
                       fmt::format("Position {}: {}", req.position_id, outcome.message),
                       ctx.wall);
        emit(ctx, DecisionEvent{ctx.wall, DecisionKind::TRADING_DISABLED, outcome.error,
                                req.position_id, req.direction, 0.0, "Unhedged leg"});
    }
}

void DecisionEngine::evaluate_exits(TickContext& ctx) {
    const TradingConfig& cfg = *ctx.cfg;
    bool forced = risk_->forced_unwind_required();

    for (const auto& snapshot : ledger_->list_open()) {
        PositionId id = snapshot.id;
        if (executor_->is_in_flight(id)) {
            continue;
        }

        std::optional<Position> pos = snapshot;

        if (ctx.priced()) {
            ledger_->update_exit_spread(id, ctx.spreads->for_direction(pos->direction).exit_spread);
        }

        if (pos->state == PositionState::OPENING) {
            bool abandon = pos->close_requested || forced;
            bool timed_out = ctx.now - pos->opened_at > cfg.entry_fill_timeout;
            if (!abandon && !timed_out) {
                continue;
            }

            if (abandon && pos->filled_contracts > CONTRACT_EPSILON) {
                ExitReason reason = pos->close_requested ? ExitReason::MANUAL : ExitReason::RISK_UNWIND;
                ledger_->mark_closing(id, reason);
                emit(ctx, DecisionEvent{ctx.wall, DecisionKind::EXIT_TRIGGERED, ErrorCode::NONE, id,
                                        pos->direction, 0.0, exit_reason_to_string(reason)});
            } else {
                Contracts residual = ledger_->mark_failed_open(id, ctx.wall);
                emit(ctx, DecisionEvent{ctx.wall, DecisionKind::POSITION_FAILED_OPEN,
                                        ErrorCode::PARTIAL_FILL_TIMEOUT, id, pos->direction, 0.0,
                                        fmt::format("filled {} of min viable {}, unwinding {}",
                                                    pos->filled_contracts,
                                                    pos->min_viable_contracts, residual)});
                if (residual <= CONTRACT_EPSILON) {
                    auto failed = ledger_->get(id);
                    if (journal_ && failed) {
                        journal_->record_position_closed(*failed);
                    }
                    continue;
                }
            }
            pos = ledger_->get(id);
        } else if (pos->state == PositionState::OPEN) {
            ExitReason reason = ExitReason::NONE;
            double exit_spread = ctx.priced() ? ctx.spreads->for_direction(pos->direction).exit_spread : 0.0;

            if (pos->close_requested) {
                reason = ExitReason::MANUAL;
            } else if (forced) {
                reason = ExitReason::RISK_UNWIND;
            } else if (ctx.now - pos->opened_at >= cfg.max_position_age) {
                reason = ExitReason::MAX_AGE;
            } else if (ctx.priced() && exit_spread >= pos->exit_spread_target - EXIT_SPREAD_EPSILON) {
                reason = ExitReason::SPREAD_TARGET;
            }

            if (reason == ExitReason::NONE) {
                continue;
            }

            if (!ledger_->mark_closing(id, reason)) {
                continue;
            }
            emit(ctx, DecisionEvent{ctx.wall, DecisionKind::EXIT_TRIGGERED, ErrorCode::NONE, id,
                                    pos->direction, exit_spread,
                                    fmt::format("{} (target {:.4f}%)", exit_reason_to_string(reason),
                                                pos->exit_spread_target * 100)});
            pos = ledger_->get(id);
        }

        // CLOSING and unwinding FAILED_OPEN positions keep reducing until flat
        if (pos && pos->is_active() &&
            (pos->state == PositionState::CLOSING || pos->state == PositionState::FAILED_OPEN)) {
            if (submit_exit(ctx, *pos)) {
                ctx.report.exits_submitted++;
            }
        }
    }
}

bool DecisionEngine::submit_exit(TickContext& ctx, const Position& pos) {
    const TradingConfig& cfg = *ctx.cfg;

    auto last = executor_->last_submission(pos.id);
    if (last && ctx.now - *last < cfg.min_order_interval) {
        spdlog::debug("Position {} exit rate limited", pos.id);
        return false;
    }

    Contracts contracts = std::min(cfg.min_order_contracts, pos.remaining_contracts());
    if (pos.mode == TradingMode::REAL) {
        contracts = cap_to_account_exposure(pos, contracts);
    }
    if (contracts <= CONTRACT_EPSILON) {
        return false;
    }

    PairRequest req;
    req.position_id = pos.id;
    req.mode = pos.mode;
    req.purpose = OrderPurpose::EXIT;
    req.direction = pos.direction;
    req.contracts = contracts;
    req.buy_price_hint = touch_price(ctx, buy_venue(pos.direction, OrderPurpose::EXIT), Side::BUY);
    req.sell_price_hint = touch_price(ctx, sell_venue(pos.direction, OrderPurpose::EXIT), Side::SELL);

    auto dispatched = executor_->dispatch(req, ctx.now);
    if (!dispatched.allowed) {
        spdlog::debug("Position {} exit not dispatched: {}", pos.id, dispatched.reason);
        return false;
    }

    emit(ctx, DecisionEvent{ctx.wall, DecisionKind::EXIT_SUBMITTED, ErrorCode::NONE, pos.id,
                            pos.direction, 0.0,
                            fmt::format("{} of {} remaining ({})", contracts,
                                        pos.remaining_contracts(), exit_reason_to_string(pos.exit_reason))});
    return true;
}

Contracts DecisionEngine::cap_to_account_exposure(const Position& pos, Contracts contracts) const {
    if (!accounts_) return contracts;

    auto a1 = accounts_->latest_account_state(Venue::V1);
    auto a2 = accounts_->latest_account_state(Venue::V2);
    if (!a1 || !a2) return contracts;

    Contracts venue_exposure = std::min(std::abs(a1->open_position_size), std::abs(a2->open_position_size));
    if (venue_exposure <= CONTRACT_EPSILON) {
        spdlog::warn("Position {}: venues report no open exposure, sizing exit from ledger", pos.id);
        return contracts;
    }
    if (venue_exposure + CONTRACT_EPSILON < contracts) {
        spdlog::warn("Position {}: exit capped to venue-reported exposure {} (ledger {})",
                     pos.id, venue_exposure, pos.remaining_contracts());
        return venue_exposure;
    }
    return contracts;
}

Price DecisionEngine::touch_price(const TickContext& ctx, Venue venue, Side side) const {
    const auto& q = venue == Venue::V1 ? ctx.v1 : ctx.v2;
    if (!q) return 0.0;
    return side == Side::BUY ? q->ask : q->bid;
}

void DecisionEngine::evaluate_entry(TickContext& ctx) {
    const TradingConfig& cfg = *ctx.cfg;

    if (!ctx.spreads || !ctx.v1_fresh || !ctx.v2_fresh) {
        std::string details = fmt::format("V1 {}, V2 {}",
            !ctx.v1 ? "absent" : (ctx.v1_fresh ? "fresh" : "stale"),
            !ctx.v2 ? "absent" : (ctx.v2_fresh ? "fresh" : "stale"));
        if (candidate_) {
            discard_candidate(ctx, ErrorCode::STALE_DATA, details);
        }
        set_entry_status(ctx, DecisionKind::ENTRY_BLOCKED, ErrorCode::STALE_DATA,
                         std::nullopt, 0.0, details);
        return;
    }

    const DirectionalSpread& best = ctx.spreads->best_entry();
    Direction dir = best.direction;
    double spread = best.entry_spread;

    if (spread < cfg.min_spread_enter) {
        if (candidate_) {
            discard_candidate(ctx, ErrorCode::NONE,
                              fmt::format("spread fell to {:.4f}%", spread * 100));
        }
        set_entry_status(ctx, DecisionKind::NO_OPPORTUNITY, ErrorCode::NONE, dir, spread,
                         fmt::format("best {:.4f}% < {:.4f}%", spread * 100, cfg.min_spread_enter * 100));
        return;
    }

    if (!risk_->check_trading_allowed()) {
        candidate_.reset();
        set_entry_status(ctx, DecisionKind::ENTRY_BLOCKED, ErrorCode::RISK_LIMIT_BREACHED, dir, spread,
                         disable_reason_to_string(risk_->state().disable_reason));
        return;
    }

    Contracts committed = ledger_->open_contracts(dir) + executor_->pending_entry_contracts(dir);
    if (committed + cfg.min_order_contracts > cfg.max_position_contracts + CONTRACT_EPSILON) {
        candidate_.reset();
        set_entry_status(ctx, DecisionKind::ENTRY_BLOCKED, ErrorCode::POSITION_LIMIT, dir, spread,
                         fmt::format("{} committed, max {}", committed, cfg.max_position_contracts));
        return;
    }

    std::optional<PositionId> existing = ledger_->scalable_position(dir);
    std::optional<Position> scaling;
    if (existing) {
        scaling = ledger_->get(*existing);
    }

    if (!scaling && ledger_->active_count() >= static_cast<size_t>(cfg.max_concurrent_positions)) {
        candidate_.reset();
        set_entry_status(ctx, DecisionKind::ENTRY_BLOCKED, ErrorCode::CONCURRENCY_LIMIT, dir, spread,
                         fmt::format("{} active, max {}", ledger_->active_count(),
                                     cfg.max_concurrent_positions));
        return;
    }

    if (scaling) {
        if (executor_->is_in_flight(scaling->id)) {
            set_entry_status(ctx, DecisionKind::ENTRY_BLOCKED, ErrorCode::ORDER_IN_FLIGHT, dir, spread,
                             fmt::format("position {}", scaling->id));
            return;
        }
        auto last = executor_->last_submission(scaling->id);
        if (last && ctx.now - *last < cfg.min_order_interval) {
            set_entry_status(ctx, DecisionKind::ENTRY_BLOCKED, ErrorCode::RATE_LIMITED, dir, spread,
                             fmt::format("position {}", scaling->id));
            return;
        }
    }

    // Confirmation hold
    if (!candidate_ || candidate_->direction != dir) {
        candidate_ = EntryCandidate{dir, spread, ctx.now};
        emit(ctx, DecisionEvent{ctx.wall, DecisionKind::CANDIDATE_RAISED, ErrorCode::NONE, std::nullopt,
                                dir, spread, fmt::format("{:.4f}% >= {:.4f}%", spread * 100,
                                                         cfg.min_spread_enter * 100)});
        entry_status_ = ctx.report.events.back();
        if (cfg.confirmation_interval.count() > 0) {
            return;
        }
    }
    candidate_->spread = spread;

    if (ctx.now - candidate_->detected_at < cfg.confirmation_interval) {
        set_entry_status(ctx, DecisionKind::CANDIDATE_PENDING, ErrorCode::NONE, dir, spread,
                         "confirmation hold");
        return;
    }

    Duration bound = cfg.confirmation_staleness_bound;
    if (ctx.v1->age(ctx.now) > bound || ctx.v2->age(ctx.now) > bound) {
        discard_candidate(ctx, ErrorCode::STALE_DATA, "quotes too old at confirmation");
        set_entry_status(ctx, DecisionKind::ENTRY_BLOCKED, ErrorCode::STALE_DATA, dir, spread,
                         "quotes too old at confirmation");
        return;
    }

    Contracts contracts = cfg.min_order_contracts;
    if (scaling) {
        Contracts headroom = scaling->target_contracts - scaling->filled_contracts -
                             executor_->pending_entry_contracts(dir);
        contracts = std::min(contracts, headroom);
        if (contracts <= CONTRACT_EPSILON) {
            set_entry_status(ctx, DecisionKind::ENTRY_BLOCKED, ErrorCode::POSITION_LIMIT, dir, spread,
                             fmt::format("position {} at target", scaling->id));
            return;
        }
    }

    Venue buy_v = buy_venue(dir, OrderPurpose::ENTRY);
    Venue sell_v = sell_venue(dir, OrderPurpose::ENTRY);
    double buy_slip = prices_->estimate_slippage(buy_v, Side::BUY, contracts);
    double sell_slip = prices_->estimate_slippage(sell_v, Side::SELL, contracts);
    if (std::max(buy_slip, sell_slip) > cfg.max_slippage) {
        spdlog::warn("Entry {} blocked by slippage: buy {:.4f}% sell {:.4f}% max {:.4f}%",
                     direction_to_string(dir), buy_slip * 100, sell_slip * 100, cfg.max_slippage * 100);
        set_entry_status(ctx, DecisionKind::ENTRY_BLOCKED, ErrorCode::SLIPPAGE_EXCEEDED, dir, spread,
                         fmt::format("buy {:.4f}% sell {:.4f}%", buy_slip * 100, sell_slip * 100));
        return;
    }

    PositionId id;
    if (scaling) {
        id = scaling->id;
    } else {
        DraftParams params;
        params.target_contracts = cfg.max_position_contracts - committed;
        params.min_viable_contracts = std::min(cfg.min_order_contracts, params.target_contracts);
        params.exit_spread_target = cfg.min_spread_exit;
        params.decision_spread = spread;
        id = ledger_->open_draft(dir, ctx.mode, params, ctx.now, ctx.wall);
    }

    TradingMode mode = scaling ? scaling->mode : ctx.mode;

    PairRequest req;
    req.position_id = id;
    req.mode = mode;
    req.purpose = OrderPurpose::ENTRY;
    req.direction = dir;
    req.contracts = contracts;
    req.buy_price_hint = touch_price(ctx, buy_v, Side::BUY);
    req.sell_price_hint = touch_price(ctx, sell_v, Side::SELL);

    auto dispatched = executor_->dispatch(req, ctx.now);
    if (!dispatched.allowed) {
        set_entry_status(ctx, DecisionKind::ENTRY_BLOCKED, ErrorCode::ORDER_IN_FLIGHT, dir, spread,
                         dispatched.reason);
        return;
    }

    candidate_.reset();
    ctx.report.entries_submitted++;
    set_entry_status(ctx, DecisionKind::ENTRY_SUBMITTED, ErrorCode::NONE, dir, spread,
                     fmt::format("position {} +{} contracts ({})", id, contracts, mode_to_string(mode)));
    entry_status_.position_id = id;
}

void DecisionEngine::set_entry_status(TickContext& ctx, DecisionKind kind, ErrorCode reason,
                                      std::optional<Direction> direction, double spread,
                                      const std::string& details) {
    bool changed = entry_status_.kind != kind || entry_status_.reason != reason ||
                   kind == DecisionKind::ENTRY_SUBMITTED;

    DecisionEvent status{ctx.wall, kind, reason, std::nullopt, direction, spread, details};
    if (changed) {
        emit(ctx, status);
    }
    entry_status_ = status;
}

void DecisionEngine::discard_candidate(TickContext& ctx, ErrorCode reason, const std::string& details) {
    if (!candidate_) return;
    emit(ctx, DecisionEvent{ctx.wall, DecisionKind::CANDIDATE_DISCARDED, reason, std::nullopt,
                            candidate_->direction, candidate_->spread, details});
    candidate_.reset();
}

void DecisionEngine::emit(TickContext& ctx, DecisionEvent event) {
    switch (event.kind) {
        case DecisionKind::NO_OPPORTUNITY:
        case DecisionKind::CANDIDATE_PENDING:
            spdlog::debug("[{}] {}", decision_kind_to_string(event.kind), event.details);
            break;
        case DecisionKind::ENTRY_BLOCKED:
        case DecisionKind::CANDIDATE_DISCARDED:
            spdlog::info("[{}] {} {}", decision_kind_to_string(event.kind),
                         error_code_to_string(event.reason), event.details);
            break;
        case DecisionKind::ORDER_FAILED:
        case DecisionKind::POSITION_FAILED_OPEN:
        case DecisionKind::TRADING_DISABLED:
            spdlog::warn("[{}] position={} {} {}", decision_kind_to_string(event.kind),
                         event.position_id.value_or(0), error_code_to_string(event.reason), event.details);
            break;
        case DecisionKind::TRADING_HALTED:
            spdlog::critical("[{}] {}", decision_kind_to_string(event.kind), event.details);
            break;
        default:
            spdlog::info("[{}] position={} {}", decision_kind_to_string(event.kind),
                         event.position_id.value_or(0), event.details);
            break;
    }

    if (journal_ && event.kind != DecisionKind::CANDIDATE_PENDING) {
        journal_->record_decision(event);
    }

    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        recent_events_.push_back(event);
        while (recent_events_.size() > MAX_RECENT_EVENTS) {
            recent_events_.pop_front();
        }
    }
    ctx.report.events.push_back(std::move(event));
}

void DecisionEngine::record_command(const std::string& details) {
    DecisionEvent event{wall_now(), DecisionKind::OPERATOR_COMMAND, ErrorCode::NONE,
                        std::nullopt, std::nullopt, 0.0, details};
    spdlog::info("[OPERATOR] {}", details);
    if (journal_) {
        journal_->record_decision(event);
    }
    std::lock_guard<std::mutex> lock(events_mutex_);
    recent_events_.push_back(std::move(event));
    while (recent_events_.size() > MAX_RECENT_EVENTS) {
        recent_events_.pop_front();
    }
}

void DecisionEngine::publish_snapshot(const TickContext& ctx) {
    EngineSnapshot snap;
    snap.tick_count = tick_count_.load();
    snap.taken_at = ctx.wall;
    snap.mode = ctx.mode;
    snap.config = ctx.cfg;
    snap.v1_quote = ctx.v1;
    snap.v2_quote = ctx.v2;
    snap.quotes_fresh = ctx.v1_fresh && ctx.v2_fresh;
    snap.spreads = ctx.spreads;
    if (history_) {
        if (ctx.spreads) {
            history_->add(*ctx.spreads, ctx.v1_fresh, ctx.v2_fresh, ctx.wall);
        }
        snap.spread_stats = history_->statistics();
    }
    snap.candidate = candidate_;
    snap.entry_status = entry_status_;
    snap.risk = risk_->state();
    snap.positions = ledger_->list_open();
    snap.orders_in_flight = executor_->in_flight_count();
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        snap.recent_events.assign(recent_events_.begin(), recent_events_.end());
    }

    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    snapshot_ = std::move(snap);
}

EngineSnapshot DecisionEngine::snapshot() const {
    EngineSnapshot snap;
    {
        std::lock_guard<std::mutex> lock(snapshot_mutex_);
        snap = snapshot_;
    }
    // Commands issued since the last tick should be visible right away
    snap.risk = risk_->state();
    snap.mode = config_->current_mode();
    snap.config = config_->current_config();
    {
        std::lock_guard<std::mutex> lock(events_mutex_);
        snap.recent_events.assign(recent_events_.begin(), recent_events_.end());
    }
    return snap;
}

void DecisionEngine::pause_trading(const std::string& note) {
    record_command("pause_trading: " + note);
    risk_->pause_trading(note, wall_now());
}

CheckResult DecisionEngine::resume_trading(const std::string& note) {
    record_command("resume_trading: " + note);
    auto result = risk_->rearm(note, wall_now());
    if (!result.allowed) {
        spdlog::warn("Resume rejected: {}", result.reason);
    }
    return result;
}

CheckResult DecisionEngine::close_position(PositionId id) {
    record_command(fmt::format("close_position: {}", id));
    if (!ledger_->request_close(id)) {
        return {false, fmt::format("Position {} not found or already closed", id)};
    }
    return {true, ""};
}

CheckResult DecisionEngine::update_thresholds(const ThresholdUpdate& update) {
    auto result = config_->update_thresholds(update);
    record_command(result.allowed
        ? fmt::format("update_thresholds: now v{}", config_->version())
        : "update_thresholds rejected: " + result.reason);
    return result;
}

std::vector<std::string> DecisionEngine::diagnose(Timestamp now) const {
    std::vector<std::string> issues;
    auto cfg = config_->current_config();

    auto v1 = prices_->latest_quote(Venue::V1);
    auto v2 = prices_->latest_quote(Venue::V2);
    for (const auto& [name, q] : {std::make_pair("V1", v1), std::make_pair("V2", v2)}) {
        if (!q) {
            issues.push_back(fmt::format("{} quote absent", name));
        } else if (!is_fresh(q, now, cfg->quote_freshness_window)) {
            issues.push_back(fmt::format("{} quote stale for {}", name,
                                         time_utils::format_duration(q->age(now))));
        }
    }

    auto risk = risk_->state();
    if (!risk.trading_enabled) {
        issues.push_back(fmt::format("Trading disabled: {} ({})",
                                     disable_reason_to_string(risk.disable_reason), risk.disable_details));
    }

    for (const auto& pos : ledger_->list_open()) {
        Duration age = now - pos.opened_at;
        if (age > cfg->max_position_age + std::chrono::minutes(5)) {
            issues.push_back(fmt::format("Position {} ({}) open {} past max age",
                                         pos.id, position_state_to_string(pos.state),
                                         time_utils::format_duration(age)));
        }
        if (pos.state == PositionState::CLOSING || pos.state == PositionState::FAILED_OPEN) {
            auto last = executor_->last_submission(pos.id);
            if (last && now - *last > cfg->inflight_timeout * 2) {
                issues.push_back(fmt::format("Position {} exiting but no order for {}",
                                             pos.id, time_utils::format_duration(now - *last)));
            }
        }
    }

    return issues;
}

void DecisionEngine::run(const std::atomic<bool>& stop) {
    spdlog::info("Decision loop started");
    Timestamp next_diagnosis = spreadarb::now();

    while (!stop.load()) {
        Timestamp started = spreadarb::now();
        auto cfg = config_->current_config();

        try {
            tick(started, wall_now());
        } catch (const std::exception& e) {
            spdlog::error("Tick failed: {}", e.what());
        }

        if (started >= next_diagnosis) {
            for (const auto& issue : diagnose(started)) {
                spdlog::warn("[DIAG] {}", issue);
            }
            size_t pruned = ledger_->prune_closed(KEEP_CLOSED_POSITIONS);
            if (pruned > 0) {
                spdlog::debug("Pruned {} finished positions", pruned);
            }
            next_diagnosis = started + cfg->diagnosis_interval;
        }

        std::this_thread::sleep_until(started + cfg->tick_interval);
    }

    spdlog::info("Decision loop stopping, waiting for in-flight orders");
    executor_->wait_all();

    // Record whatever finished after the last tick
    std::lock_guard<std::mutex> tick_lock(tick_mutex_);
    TickContext ctx;
    ctx.now = spreadarb::now();
    ctx.wall = wall_now();
    ctx.cfg = config_->current_config();
    ctx.mode = config_->current_mode();
    try {
        apply_completions(ctx);
    } catch (const InvariantViolation& e) {
        spdlog::critical("Invariant violation while draining at shutdown: {}", e.what());
        risk_->disable(DisableReason::INVARIANT_VIOLATION, e.what(), ctx.wall);
    }
    spdlog::info("Decision loop stopped");
}

} // namespace spreadarb

#include "risk/risk_manager.hpp"
#include "utils/time_utils.hpp"
#include <fstream>
#include <algorithm>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace spreadarb {

DisableReason disable_reason_from_string(const std::string& s) {
    if (s == "MANUAL") return DisableReason::MANUAL;
    if (s == "UNHEDGED_LEG") return DisableReason::UNHEDGED_LEG;
    if (s == "DAILY_LOSS_LIMIT") return DisableReason::DAILY_LOSS_LIMIT;
    if (s == "INVARIANT_VIOLATION") return DisableReason::INVARIANT_VIOLATION;
    return DisableReason::NONE;
}

RiskManager::RiskManager(std::shared_ptr<const ConfigManager> config, WallClock now)
    : config_(std::move(config))
{
    state_.day_boundary = time_utils::next_utc_midnight(now);
    spdlog::info("RiskManager initialized: daily_loss_limit={:.2f}, day ends {}",
                 config_->current_config()->daily_loss_limit,
                 time_utils::to_iso8601(state_.day_boundary));
}

void RiskManager::on_trade_closed(Notional realized_pnl, WallClock now) {
    bool activated = false;
    std::string details;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        reset_locked(now);

        double limit = config_->current_config()->daily_loss_limit;

        state_.trades_today++;
        state_.daily_realized_pnl += realized_pnl;

        if (realized_pnl < 0.0) {
            state_.daily_loss_accumulated += -realized_pnl;
            state_.consecutive_losses++;
            state_.max_single_loss = std::max(state_.max_single_loss, -realized_pnl);
        } else {
            state_.winning_trades_today++;
            state_.consecutive_losses = 0;
        }

        state_.peak_daily_pnl = std::max(state_.peak_daily_pnl, state_.daily_realized_pnl);
        state_.max_drawdown = std::max(state_.max_drawdown,
                                       state_.peak_daily_pnl - state_.daily_realized_pnl);

        spdlog::info("Trade closed: pnl={:.4f} daily_loss={:.4f}/{:.2f} trades_today={} "
                     "consecutive_losses={}",
                     realized_pnl, state_.daily_loss_accumulated, limit,
                     state_.trades_today, state_.consecutive_losses);

        if (state_.daily_loss_accumulated >= limit) {
            details = fmt::format("Daily loss {:.2f} reached limit {:.2f}",
                                  state_.daily_loss_accumulated, limit);
            activated = disable_locked(DisableReason::DAILY_LOSS_LIMIT, details, now);
        }

        persist_locked();
    }

    if (activated && callback_) {
        callback_(DisableReason::DAILY_LOSS_LIMIT, details);
    }
}

bool RiskManager::daily_reset_if_needed(WallClock now) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool reset = reset_locked(now);
    if (reset) {
        persist_locked();
    }
    return reset;
}

bool RiskManager::reset_locked(WallClock now) {
    if (now < state_.day_boundary) {
        return false;
    }

    spdlog::info("Daily risk reset: previous day loss={:.4f} pnl={:.4f} trades={}",
                 state_.daily_loss_accumulated, state_.daily_realized_pnl, state_.trades_today);

    state_.daily_loss_accumulated = 0.0;
    state_.daily_realized_pnl = 0.0;
    state_.trades_today = 0;
    state_.winning_trades_today = 0;
    state_.max_single_loss = 0.0;
    state_.peak_daily_pnl = 0.0;
    state_.max_drawdown = 0.0;
    state_.day_boundary = time_utils::next_utc_midnight(now);

    if (!state_.trading_enabled) {
        spdlog::warn("Trading remains disabled ({}) after daily reset; operator re-arm required",
                     disable_reason_to_string(state_.disable_reason));
    }
    return true;
}

bool RiskManager::forced_unwind_required() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.disable_reason == DisableReason::DAILY_LOSS_LIMIT ||
           state_.disable_reason == DisableReason::UNHEDGED_LEG;
}

bool RiskManager::is_halted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.disable_reason == DisableReason::INVARIANT_VIOLATION;
}

void RiskManager::disable(DisableReason reason, const std::string& details, WallClock now) {
    bool activated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        activated = disable_locked(reason, details, now);
        if (activated) {
            persist_locked();
        }
    }
    if (activated && callback_) {
        callback_(reason, details);
    }
}

void RiskManager::pause_trading(const std::string& operator_note, WallClock now) {
    disable(DisableReason::MANUAL, operator_note.empty() ? "Manual pause" : operator_note, now);
}

bool RiskManager::disable_locked(DisableReason reason, const std::string& details, WallClock now) {
    if (reason == DisableReason::NONE) {
        return false;
    }

    if (!state_.trading_enabled && reason <= state_.disable_reason) {
        spdlog::debug("Trading already disabled ({}), ignoring {}: {}",
                      disable_reason_to_string(state_.disable_reason),
                      disable_reason_to_string(reason), details);
        return false;
    }

    state_.trading_enabled = false;
    state_.disable_reason = reason;
    state_.disable_details = details;
    trading_enabled_.store(false, std::memory_order_release);

    history_.push_back({now, reason, details, true});

    if (reason == DisableReason::MANUAL) {
        spdlog::warn("Trading paused by operator: {}", details);
    } else {
        spdlog::critical("TRADING DISABLED: reason={}, details={}",
                         disable_reason_to_string(reason), details);
    }
    return true;
}

CheckResult RiskManager::rearm(const std::string& operator_note, WallClock now) {
    std::lock_guard<std::mutex> lock(mutex_);
    reset_locked(now);

    if (state_.trading_enabled) {
        return {false, "Trading already enabled"};
    }

    double limit = config_->current_config()->daily_loss_limit;
    if (state_.daily_loss_accumulated >= limit) {
        auto reason = fmt::format("Daily loss {:.2f} still at or above limit {:.2f}",
                                  state_.daily_loss_accumulated, limit);
        spdlog::warn("Re-arm rejected: {}", reason);
        return {false, reason};
    }

    DisableReason previous = state_.disable_reason;
    state_.trading_enabled = true;
    state_.disable_reason = DisableReason::NONE;
    state_.disable_details.clear();
    trading_enabled_.store(true, std::memory_order_release);

    history_.push_back({now, previous, operator_note, false});
    spdlog::warn("Trading re-armed by operator (was {}): {}",
                 disable_reason_to_string(previous), operator_note);

    persist_locked();
    return {true, ""};
}

RiskState RiskManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::vector<RiskEvent> RiskManager::event_history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_;
}

void RiskManager::set_persistence_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    persistence_path_ = path;
}

nlohmann::json RiskManager::to_json_locked() const {
    return nlohmann::json{
        {"date", time_utils::utc_date(state_.day_boundary - std::chrono::hours(24))},
        {"day_boundary_ms", time_utils::to_epoch_ms(state_.day_boundary)},
        {"daily_loss_accumulated", state_.daily_loss_accumulated},
        {"daily_realized_pnl", state_.daily_realized_pnl},
        {"trading_enabled", state_.trading_enabled},
        {"disable_reason", disable_reason_to_string(state_.disable_reason)},
        {"disable_details", state_.disable_details},
        {"trades_today", state_.trades_today},
        {"winning_trades_today", state_.winning_trades_today},
        {"consecutive_losses", state_.consecutive_losses},
        {"max_single_loss", state_.max_single_loss},
        {"max_drawdown", state_.max_drawdown}
    };
}

void RiskManager::persist_locked() const {
    if (persistence_path_.empty()) return;

    std::ofstream file(persistence_path_, std::ios::trunc);
    if (!file.is_open()) {
        spdlog::error("Failed to write risk state: {}", persistence_path_);
        return;
    }
    file << to_json_locked().dump(2);
}

void RiskManager::save_state(const std::string& path) const {
    nlohmann::json j;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        j = to_json_locked();
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write risk state: " + path);
    }
    file << j.dump(2);
}

bool RiskManager::load_state(const std::string& path, WallClock now) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::info("No saved risk state at {}", path);
        return false;
    }

    RiskState loaded;
    bool same_day = false;
    try {
        nlohmann::json j;
        file >> j;

        auto boundary = time_utils::from_epoch_ms(j.value("day_boundary_ms", int64_t{0}));
        same_day = now < boundary;

        std::lock_guard<std::mutex> lock(mutex_);
        loaded = state_;

        // Daily counters only carry over within the same day; a disable always does
        if (same_day) {
            loaded.day_boundary = boundary;
            loaded.daily_loss_accumulated = j.value("daily_loss_accumulated", 0.0);
            loaded.daily_realized_pnl = j.value("daily_realized_pnl", 0.0);
            loaded.trades_today = j.value("trades_today", 0);
            loaded.winning_trades_today = j.value("winning_trades_today", 0);
            loaded.max_single_loss = j.value("max_single_loss", 0.0);
            loaded.max_drawdown = j.value("max_drawdown", 0.0);
        }
        loaded.consecutive_losses = j.value("consecutive_losses", 0);

        if (!j.value("trading_enabled", true)) {
            loaded.trading_enabled = false;
            loaded.disable_reason = disable_reason_from_string(
                j.value("disable_reason", std::string{"MANUAL"}));
            if (loaded.disable_reason == DisableReason::NONE) {
                loaded.disable_reason = DisableReason::MANUAL;
            }
            loaded.disable_details = j.value("disable_details", std::string{});
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Corrupt risk state {}: {}", path, e.what());
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = loaded;
        trading_enabled_.store(state_.trading_enabled, std::memory_order_release);
    }

    spdlog::info("Risk state restored from {}: daily_loss={:.4f} trading_enabled={} ({})",
                 path, loaded.daily_loss_accumulated, loaded.trading_enabled,
                 same_day ? "same day" : "new day, counters reset");
    return true;
}

} // namespace spreadarb

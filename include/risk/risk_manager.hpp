#pragma once

#include <atomic>
#include <mutex>
#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "config/config_manager.hpp"

namespace spreadarb {

/**
 * Why trading is disabled, ordered by severity. A more severe reason
 * replaces a milder one; never the other way round.
 */
enum class DisableReason {
    NONE,
    MANUAL,              // Operator pause: blocks entries, positions still managed
    UNHEDGED_LEG,        // Leg unwind failed: blocks entries, open positions unwound
    DAILY_LOSS_LIMIT,    // Loss cap reached: blocks entries, open positions unwound
    INVARIANT_VIOLATION  // Internal corruption: no orders at all
};

inline std::string disable_reason_to_string(DisableReason r) {
    switch (r) {
        case DisableReason::NONE: return "NONE";
        case DisableReason::MANUAL: return "MANUAL";
        case DisableReason::UNHEDGED_LEG: return "UNHEDGED_LEG";
        case DisableReason::DAILY_LOSS_LIMIT: return "DAILY_LOSS_LIMIT";
        case DisableReason::INVARIANT_VIOLATION: return "INVARIANT_VIOLATION";
    }
    return "UNKNOWN";
}

DisableReason disable_reason_from_string(const std::string& s);

struct RiskState {
    Notional daily_loss_accumulated{0.0};   // Sum of losses only, never reduced by gains
    Notional daily_realized_pnl{0.0};
    WallClock day_boundary;                 // Next UTC midnight
    bool trading_enabled{true};
    DisableReason disable_reason{DisableReason::NONE};
    std::string disable_details;

    // Stats
    int trades_today{0};
    int winning_trades_today{0};
    int consecutive_losses{0};
    Notional max_single_loss{0.0};
    Notional peak_daily_pnl{0.0};
    Notional max_drawdown{0.0};
};

// Audit trail entry
struct RiskEvent {
    WallClock timestamp;
    DisableReason reason;
    std::string details;
    bool is_activation;  // true = disabled, false = re-armed
};

/**
 * Daily loss accounting and the trading on/off switch.
 *
 * DESIGN:
 * - Only losses accumulate; a profitable close never frees up loss budget
 * - Crossing the limit disables trading on that exact close
 * - The daily counter resets once per UTC day, but a disable does not
 *   lift itself: re-arming is an explicit operator action
 * - Disabling is immediate and every transition is recorded
 */
class RiskManager {
public:
    using Callback = std::function<void(DisableReason, const std::string&)>;

    RiskManager(std::shared_ptr<const ConfigManager> config, WallClock now);

    // Realized PnL of a closed position or unwind (negative = loss)
    void on_trade_closed(Notional realized_pnl, WallClock now);

    // Rolls the daily counter if `now` is past the day boundary.
    // Returns true if a reset happened.
    bool daily_reset_if_needed(WallClock now);

    // Entries allowed
    bool check_trading_allowed() const { return trading_enabled_.load(std::memory_order_acquire); }

    // Open positions must be unwound (loss limit or unhedged leg)
    bool forced_unwind_required() const;

    // No orders of any kind
    bool is_halted() const;

    void disable(DisableReason reason, const std::string& details, WallClock now);
    void pause_trading(const std::string& operator_note, WallClock now);

    // Rejected while the daily loss is still at or above the limit
    CheckResult rearm(const std::string& operator_note, WallClock now);

    RiskState state() const;
    std::vector<RiskEvent> event_history() const;

    void set_callback(Callback cb) { callback_ = std::move(cb); }

    // Persistence across restarts within the same UTC day
    void set_persistence_path(const std::string& path);
    void save_state(const std::string& path) const;
    bool load_state(const std::string& path, WallClock now);

private:
    std::shared_ptr<const ConfigManager> config_;

    std::atomic<bool> trading_enabled_{true};

    mutable std::mutex mutex_;
    RiskState state_;
    std::vector<RiskEvent> history_;
    std::string persistence_path_;

    Callback callback_;

    bool reset_locked(WallClock now);
    bool disable_locked(DisableReason reason, const std::string& details, WallClock now);
    nlohmann::json to_json_locked() const;
    void persist_locked() const;
};

} // namespace spreadarb

#pragma once

#include <map>
#include <set>
#include <mutex>
#include <vector>
#include <string>
#include <optional>
#include "common/types.hpp"
#include "common/errors.hpp"

namespace spreadarb {

enum class PositionState {
    OPENING,      // Entry orders working, below minimum viable size
    OPEN,         // At or above minimum viable size, may keep scaling in
    CLOSING,      // Exit triggered, reducing
    CLOSED,       // Fully exited
    FAILED_OPEN   // Never reached viable size; residual is unwound
};

inline std::string position_state_to_string(PositionState s) {
    switch (s) {
        case PositionState::OPENING: return "OPENING";
        case PositionState::OPEN: return "OPEN";
        case PositionState::CLOSING: return "CLOSING";
        case PositionState::CLOSED: return "CLOSED";
        case PositionState::FAILED_OPEN: return "FAILED_OPEN";
    }
    return "UNKNOWN";
}

enum class ExitReason {
    NONE,
    SPREAD_TARGET,   // Exit spread reached the target
    MAX_AGE,
    RISK_UNWIND,     // Forced by a risk disable
    MANUAL,          // Operator close command
    FAILED_OPEN      // Unwinding the residual of a failed open
};

inline std::string exit_reason_to_string(ExitReason r) {
    switch (r) {
        case ExitReason::NONE: return "NONE";
        case ExitReason::SPREAD_TARGET: return "SPREAD_TARGET";
        case ExitReason::MAX_AGE: return "MAX_AGE";
        case ExitReason::RISK_UNWIND: return "RISK_UNWIND";
        case ExitReason::MANUAL: return "MANUAL";
        case ExitReason::FAILED_OPEN: return "FAILED_OPEN";
    }
    return "UNKNOWN";
}

/**
 * One directional arbitrage position, possibly built from several paired
 * fills. Contracts only ever move forward: filled grows during entry,
 * exited grows during exit, and exited <= filled <= target at all times.
 */
struct Position {
    PositionId id{0};
    Direction direction{Direction::V1_TO_V2};
    TradingMode mode{TradingMode::SIMULATED};   // Fixed at creation

    Contracts target_contracts{0.0};
    Contracts min_viable_contracts{0.0};
    Contracts filled_contracts{0.0};
    Contracts exited_contracts{0.0};

    std::vector<PairFill> entry_fills;
    std::vector<PairFill> exit_fills;

    Timestamp opened_at;
    WallClock opened_wall;
    std::optional<WallClock> closed_wall;

    double decision_spread{0.0};       // Entry spread that triggered the position
    double exit_spread_target{0.0};

    PositionState state{PositionState::OPENING};
    ExitReason exit_reason{ExitReason::NONE};
    bool close_requested{false};

    // Exit spread tracking
    std::optional<double> last_exit_spread;
    double best_exit_spread{0.0};
    double worst_exit_spread{0.0};
    uint64_t exit_spread_updates{0};

    Notional realized_pnl{0.0};
    Notional total_fees{0.0};

    Contracts remaining_contracts() const { return filled_contracts - exited_contracts; }

    // Still owns exposure or may still acquire it
    bool is_active() const {
        if (state == PositionState::CLOSED) return false;
        if (state == PositionState::FAILED_OPEN) return remaining_contracts() > CONTRACT_EPSILON;
        return true;
    }

    bool can_scale_in() const {
        return (state == PositionState::OPENING || state == PositionState::OPEN) &&
               !close_requested &&
               filled_contracts + CONTRACT_EPSILON < target_contracts;
    }

    Price avg_entry_buy_price() const;
    Price avg_entry_sell_price() const;

    // Spread actually captured across all entry fills
    double realized_entry_spread() const;
};

struct DraftParams {
    Contracts target_contracts{0.0};
    Contracts min_viable_contracts{0.0};
    double exit_spread_target{0.0};
    double decision_spread{0.0};
};

// Emitted once per position when its last contract is exited
struct CloseResult {
    PositionId id{0};
    PositionState final_state{PositionState::CLOSED};
    ExitReason exit_reason{ExitReason::NONE};
    Notional realized_pnl{0.0};   // Not yet reported to risk
    Notional fees{0.0};
};

/**
 * Authoritative record of all positions. Every mutation is serialized and
 * validated; a mutation that would break a contract invariant throws
 * InvariantViolation and leaves the position untouched.
 *
 * Fill application is idempotent per fill id, so a replayed completion
 * never double-counts.
 */
class PositionLedger {
public:
    PositionLedger() = default;

    PositionId open_draft(Direction direction, TradingMode mode,
                          const DraftParams& params, Timestamp now, WallClock wall);

    // Returns false for an already-applied fill id
    bool record_entry_fill(PositionId id, const PairFill& fill);

    // Returns the close result when this fill exits the last contract
    std::optional<CloseResult> record_exit_fill(PositionId id, const PairFill& fill);

    // OPEN/OPENING -> CLOSING. False if not in a closable state.
    bool mark_closing(PositionId id, ExitReason reason);

    // OPENING -> FAILED_OPEN. Returns contracts left to unwind.
    Contracts mark_failed_open(PositionId id, WallClock wall);

    bool request_close(PositionId id);

    void update_exit_spread(PositionId id, double spread);

    std::optional<Position> get(PositionId id) const;
    std::vector<Position> list_open() const;
    std::vector<Position> list_all() const;
    std::optional<Duration> age_of(PositionId id, Timestamp now) const;

    // Net contracts held across active positions in one direction
    Contracts open_contracts(Direction direction) const;
    size_t active_count() const;

    // Active position in this direction still below its target
    std::optional<PositionId> scalable_position(Direction direction) const;

    // Drop CLOSED and fully unwound positions older than the newest `keep`
    size_t prune_closed(size_t keep);

private:
    mutable std::mutex mutex_;
    std::map<PositionId, Position> positions_;
    std::map<PositionId, std::set<std::string>> applied_fills_;
    std::map<PositionId, Notional> reported_pnl_;
    PositionId next_id_{1};

    Position& find_locked(PositionId id);
    static void validate_fill(const Position& pos, const PairFill& fill);
    std::optional<CloseResult> settle_locked(Position& pos, WallClock wall);
    static Notional compute_pnl(const Position& pos);
};

} // namespace spreadarb

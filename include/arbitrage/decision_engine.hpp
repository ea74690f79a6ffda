#pragma once

#include <deque>
#include <mutex>
#include <atomic>
#include <memory>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "config/config_manager.hpp"
#include "market_data/feed_ports.hpp"
#include "arbitrage/decision_event.hpp"
#include "arbitrage/spread_calculator.hpp"
#include "arbitrage/spread_history.hpp"
#include "risk/risk_manager.hpp"
#include "position/position_ledger.hpp"
#include "execution/execution_coordinator.hpp"
#include "persistence/trade_journal.hpp"

namespace spreadarb {

// Exit spread within this of the target counts as reached
constexpr double EXIT_SPREAD_EPSILON = 0.00001;

// Opportunity seen but not yet confirmed
struct EntryCandidate {
    Direction direction{Direction::V1_TO_V2};
    double spread{0.0};
    Timestamp detected_at;
};

// Read-only view for dashboards and operators
struct EngineSnapshot {
    uint64_t tick_count{0};
    WallClock taken_at;
    TradingMode mode{TradingMode::SIMULATED};
    std::shared_ptr<const TradingConfig> config;
    std::optional<Quote> v1_quote;
    std::optional<Quote> v2_quote;
    bool quotes_fresh{false};
    std::optional<SpreadSnapshot> spreads;
    std::optional<SpreadStats> spread_stats;   // Set when a history is attached
    std::optional<EntryCandidate> candidate;
    DecisionEvent entry_status;
    RiskState risk;
    std::vector<Position> positions;          // Active only
    std::vector<DecisionEvent> recent_events;
    size_t orders_in_flight{0};
};

struct TickReport {
    std::vector<DecisionEvent> events;
    int entries_submitted{0};
    int exits_submitted{0};
    int fills_applied{0};
};

/**
 * The trading loop.
 *
 * Each tick, in order:
 *   1. apply finished order results to the ledger and risk
 *   2. roll the daily risk counter if the day changed
 *   3. read one config snapshot and the latest quotes
 *   4. evaluate exits for every active position
 *   5. evaluate at most one entry
 *
 * DESIGN:
 * - Stale or missing quotes suppress entries and spread-triggered exits;
 *   age, risk and operator exits still go out
 * - Entries need a confirmation hold and pass every gate on the same tick
 *   they are submitted
 * - Orders follow the mode a position was opened in, never the live mode
 * - A broken ledger invariant halts all order flow until re-armed
 */
class DecisionEngine {
public:
    DecisionEngine(std::shared_ptr<ConfigManager> config,
                   std::shared_ptr<const PriceFeed> prices,
                   std::shared_ptr<const AccountFeed> accounts,
                   std::shared_ptr<RiskManager> risk,
                   std::shared_ptr<PositionLedger> ledger,
                   std::shared_ptr<ExecutionCoordinator> executor,
                   std::shared_ptr<TradeJournal> journal = nullptr,
                   std::shared_ptr<SpreadHistory> history = nullptr);

    // One decision cycle at the given instants
    TickReport tick(Timestamp now, WallClock wall);

    // Loop at tick_interval until stop is set
    void run(const std::atomic<bool>& stop);

    // Operator commands
    void pause_trading(const std::string& note);
    CheckResult resume_trading(const std::string& note);
    CheckResult close_position(PositionId id);
    CheckResult update_thresholds(const ThresholdUpdate& update);

    EngineSnapshot snapshot() const;

    // Human-readable issues worth an operator's attention
    std::vector<std::string> diagnose(Timestamp now) const;

private:
    struct TickContext {
        Timestamp now;
        WallClock wall;
        std::shared_ptr<const TradingConfig> cfg;
        TradingMode mode{TradingMode::SIMULATED};
        std::optional<Quote> v1;
        std::optional<Quote> v2;
        bool v1_fresh{false};
        bool v2_fresh{false};
        std::optional<SpreadSnapshot> spreads;
        TickReport report;

        bool priced() const { return spreads.has_value() && v1_fresh && v2_fresh; }
    };

    std::shared_ptr<ConfigManager> config_;
    std::shared_ptr<const PriceFeed> prices_;
    std::shared_ptr<const AccountFeed> accounts_;
    std::shared_ptr<RiskManager> risk_;
    std::shared_ptr<PositionLedger> ledger_;
    std::shared_ptr<ExecutionCoordinator> executor_;
    std::shared_ptr<TradeJournal> journal_;
    std::shared_ptr<SpreadHistory> history_;

    std::mutex tick_mutex_;

    // Owned by the tick thread
    std::optional<EntryCandidate> candidate_;
    DecisionEvent entry_status_;
    bool halt_reported_{false};

    mutable std::mutex events_mutex_;
    std::deque<DecisionEvent> recent_events_;
    static constexpr size_t MAX_RECENT_EVENTS = 256;

    mutable std::mutex snapshot_mutex_;
    EngineSnapshot snapshot_;

    std::atomic<uint64_t> tick_count_{0};

    void read_market(TickContext& ctx);
    void apply_completions(TickContext& ctx);
    void apply_outcome(TickContext& ctx, const PairOutcome& outcome);
    void evaluate_exits(TickContext& ctx);
    void evaluate_entry(TickContext& ctx);

    bool submit_exit(TickContext& ctx, const Position& pos);
    Contracts cap_to_account_exposure(const Position& pos, Contracts contracts) const;
    Price touch_price(const TickContext& ctx, Venue venue, Side side) const;

    void set_entry_status(TickContext& ctx, DecisionKind kind, ErrorCode reason,
                          std::optional<Direction> direction, double spread,
                          const std::string& details);
    void discard_candidate(TickContext& ctx, ErrorCode reason, const std::string& details);
    void emit(TickContext& ctx, DecisionEvent event);
    void record_command(const std::string& details);
    void publish_snapshot(const TickContext& ctx);
};

} // namespace spreadarb

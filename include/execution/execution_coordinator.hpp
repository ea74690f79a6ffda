#pragma once

#include <map>
#include <deque>
#include <mutex>
#include <atomic>
#include <memory>
#include <future>
#include <vector>
#include <optional>
#include "common/types.hpp"
#include "common/errors.hpp"
#include "execution/execution_port.hpp"

namespace spreadarb {

// One paired order for a position: both legs, same size
struct PairRequest {
    PositionId position_id{0};
    TradingMode mode{TradingMode::SIMULATED};   // Position's mode, never the live one
    OrderPurpose purpose{OrderPurpose::ENTRY};
    Direction direction{Direction::V1_TO_V2};
    Contracts contracts{0.0};
    Price buy_price_hint{0.0};
    Price sell_price_hint{0.0};
};

struct PairOutcome {
    PairRequest request;
    bool success{false};                // At least some contracts matched on both legs
    ErrorCode error{ErrorCode::NONE};
    std::string message;

    std::optional<PairFill> fill;       // Matched portion, if any

    FillResult buy_result;
    FillResult sell_result;

    // Excess on one leg is unwound immediately
    bool unwind_attempted{false};
    bool unwind_succeeded{false};
    Contracts unwind_contracts{0.0};
    Notional unwind_pnl{0.0};           // Realized by the unwind, fees included

    // Exposure the coordinator could not flatten or could not confirm
    bool unhedged{false};

    WallClock completed_at;
};

/**
 * Places both legs of a paired order and resolves the result.
 *
 * DESIGN:
 * - Both legs go out concurrently on the port matching the position's mode
 * - The pair only counts as a fill for the contracts matched on both legs
 * - Excess on one leg (including one leg filled, other failed) is unwound
 *   with an opposite order on the same venue; a failed unwind is flagged
 *   as unhedged so trading can be disabled
 * - A leg whose fill cannot be confirmed is never assumed filled
 * - At most one order in flight per position; a lock older than the
 *   in-flight timeout is released so the position can be re-evaluated
 * - Completions are handed back in arrival order via drain_completions()
 */
class ExecutionCoordinator {
public:
    struct Config {
        bool async_dispatch{true};          // false = run pairs inline (replay, tests)
        std::chrono::milliseconds inflight_timeout{15000};
    };

    ExecutionCoordinator(std::shared_ptr<ExecutionPort> simulated_port,
                         std::shared_ptr<ExecutionPort> real_port,
                         const Config& config);
    ~ExecutionCoordinator();

    // Runs the pair to completion on the calling thread
    PairOutcome execute(const PairRequest& request);

    // Starts the pair; refused if the position already has one in flight
    CheckResult dispatch(const PairRequest& request, Timestamp now);

    // Finished outcomes since the last call, in completion order.
    // Also releases in-flight locks older than the in-flight timeout.
    std::vector<PairOutcome> drain_completions(Timestamp now);

    bool is_in_flight(PositionId id) const;
    std::optional<Timestamp> last_submission(PositionId id) const;

    // Entry contracts submitted but not yet resolved, per direction
    Contracts pending_entry_contracts(Direction direction) const;

    size_t in_flight_count() const;

    void set_inflight_timeout(std::chrono::milliseconds timeout);

    // Blocks until every dispatched pair has finished
    void wait_all();

    uint64_t unwind_attempts() const { return unwind_attempts_.load(); }

private:
    struct InFlight {
        PairRequest request;
        Timestamp started_at;
        std::shared_future<PairOutcome> future;
    };

    std::shared_ptr<ExecutionPort> simulated_port_;
    std::shared_ptr<ExecutionPort> real_port_;
    Config config_;

    mutable std::mutex mutex_;
    std::map<PositionId, InFlight> in_flight_;
    std::vector<InFlight> orphaned_;                 // Lock released, still running
    std::deque<PairOutcome> completed_;
    std::map<PositionId, Timestamp> last_submission_;

    std::atomic<uint64_t> next_pair_{1};
    std::atomic<uint64_t> unwind_attempts_{0};

    ExecutionPort* port_for(TradingMode mode) const;
    FillResult place_leg(ExecutionPort& port, const OrderRequest& order);
    FillResult resolve_unknown(ExecutionPort& port, FillResult leg);
    void unwind_excess(ExecutionPort& port, const PairRequest& request,
                       const FillResult& leg, Contracts excess, PairOutcome& outcome);
    static LegFill to_leg_fill(const FillResult& leg, Contracts contracts);
};

} // namespace spreadarb

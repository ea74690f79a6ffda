#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "arbitrage/decision_event.hpp"
#include "position/position_ledger.hpp"

namespace spreadarb {

/**
 * Append-only record of trading activity, one JSON object per line:
 *   {"event_type": ..., "timestamp": ISO-8601, "data": {...}}
 */
class TradeJournal {
public:
    explicit TradeJournal(const std::string& path);
    ~TradeJournal();

    void record_fill(PositionId id, OrderPurpose purpose, const PairFill& fill);
    void record_position_closed(const Position& position);
    void record_decision(const DecisionEvent& event);

    // Generic event recording
    void record_event(const std::string& event_type, const nlohmann::json& data);

    struct DailySummary {
        std::string date;            // YYYY-MM-DD, UTC
        int positions_closed{0};
        int winning{0};
        int losing{0};
        int failed_opens{0};
        Notional pnl{0.0};
        Notional fees{0.0};
        Contracts contracts{0.0};
    };

    // Built from position_closed records of one UTC day
    DailySummary daily_summary(WallClock day) const;

    void flush();
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream file_;
    mutable std::mutex mutex_;

    void open_file();
    void write_line(const nlohmann::json& j);
};

// JSON serialization for journal records
void to_json(nlohmann::json& j, const LegFill& f);
void to_json(nlohmann::json& j, const PairFill& f);
void to_json(nlohmann::json& j, const Position& p);
void to_json(nlohmann::json& j, const DecisionEvent& e);

} // namespace spreadarb

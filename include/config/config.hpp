#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "common/errors.hpp"

namespace spreadarb {

using Millis = std::chrono::milliseconds;

/**
 * Immutable trading parameters. Published as a whole by ConfigManager; the
 * decision engine reads one snapshot per tick so no decision ever sees a
 * mix of old and new values.
 */
struct TradingConfig {
    uint64_t version{1};

    // Entry/exit thresholds, as fractions (0.001 = 0.1%)
    double min_spread_enter{0.001};
    double min_spread_exit{-0.0002};

    // Sizing
    Contracts max_position_contracts{0.02};   // Per direction
    Contracts min_order_contracts{0.01};      // Scale-in/scale-out increment
    int max_concurrent_positions{1};

    // Guards
    double max_slippage{0.002};               // Per leg, fraction of best price
    Millis max_position_age{std::chrono::hours(4)};
    Millis min_order_interval{3000};          // Per position
    double daily_loss_limit{100.0};           // Quote currency

    // Quote freshness and entry confirmation
    Millis quote_freshness_window{5000};
    Millis confirmation_interval{500};
    Millis confirmation_staleness_bound{1000};

    // Execution timing
    Millis entry_fill_timeout{10000};         // OPENING position must reach min viable size
    Millis inflight_timeout{15000};           // Per-position order lock is released after this
    Millis tick_interval{100};
    Millis diagnosis_interval{30000};

    // Fees
    double fee_offset_v1_to_v2{0.0};          // Subtracted from the gross entry spread
    double fee_offset_v2_to_v1{0.0};
    double fee_rate_v1{0.00006};              // Taker fee, fraction of notional
    double fee_rate_v2{0.00005};

    // Paper execution
    double simulated_slippage{0.0001};

    double fee_offset(Direction d) const {
        return d == Direction::V1_TO_V2 ? fee_offset_v1_to_v2 : fee_offset_v2_to_v1;
    }

    double fee_rate(Venue v) const {
        return v == Venue::V1 ? fee_rate_v1 : fee_rate_v2;
    }

    // Range checks; reason names the first offending field
    CheckResult validate() const;
};

/**
 * Partial threshold update from an operator. Absent fields keep their
 * current value.
 */
struct ThresholdUpdate {
    std::optional<double> min_spread_enter;
    std::optional<double> min_spread_exit;
    std::optional<Contracts> max_position_contracts;
    std::optional<Contracts> min_order_contracts;
    std::optional<double> max_slippage;
    std::optional<int> max_concurrent_positions;
    std::optional<Millis> max_position_age;
    std::optional<Millis> min_order_interval;
    std::optional<double> daily_loss_limit;

    bool empty() const;
};

// Returns a copy of base with the update applied and the version bumped
TradingConfig apply_update(const TradingConfig& base, const ThresholdUpdate& update);

struct ExecutionConfig {
    Millis order_fill_timeout{5000};          // Per order on a real venue
    Millis order_poll_interval{50};
};

struct LoggingConfig {
    std::string log_dir{"./logs"};
    std::string log_level{"info"};           // debug, info, warn, error
    bool log_to_console{true};
    bool log_to_file{true};
    bool json_format{true};                  // JSON lines format
    int max_log_file_size_mb{100};
    int max_log_files{5};
};

struct PersistenceConfig {
    std::string trade_journal_path{"./data/trades.jsonl"};
    std::string risk_state_path{"./data/risk_state.json"};
    std::string spread_history_path{"./data/spreads_history.json"};
    int spread_history_points{1000};
    int spread_history_save_interval_sec{60};
};

struct AppConfig {
    TradingMode mode{TradingMode::SIMULATED};
    std::string instrument{"NVDA"};
    std::string v1_name{"bitget"};
    std::string v2_name{"hyperliquid"};

    TradingConfig trading;
    ExecutionConfig execution;
    LoggingConfig logging;
    PersistenceConfig persistence;

    // Throws ConfigError on unreadable file or out-of-range values
    static AppConfig load(const std::string& path);

    void save(const std::string& path) const;

    CheckResult validate() const;

    // Get environment variable with default
    static std::string get_env(const std::string& name, const std::string& default_val = "");
};

TradingMode mode_from_string(const std::string& s);

// JSON serialization; durations are integer milliseconds under *_ms keys
void to_json(nlohmann::json& j, const TradingConfig& c);
void from_json(const nlohmann::json& j, TradingConfig& c);
void from_json(const nlohmann::json& j, ThresholdUpdate& u);
void to_json(nlohmann::json& j, const ExecutionConfig& c);
void from_json(const nlohmann::json& j, ExecutionConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void from_json(const nlohmann::json& j, LoggingConfig& c);
void to_json(nlohmann::json& j, const PersistenceConfig& c);
void from_json(const nlohmann::json& j, PersistenceConfig& c);
void to_json(nlohmann::json& j, const AppConfig& c);
void from_json(const nlohmann::json& j, AppConfig& c);

} // namespace spreadarb

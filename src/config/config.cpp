#include "config/config.hpp"
#include <fstream>
#include <cstdlib>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace spreadarb {

namespace {

void read_ms(const nlohmann::json& j, const char* key, Millis& out) {
    if (j.contains(key)) out = Millis(j.at(key).get<int64_t>());
}

void read_ms(const nlohmann::json& j, const char* key, std::optional<Millis>& out) {
    if (j.contains(key)) out = Millis(j.at(key).get<int64_t>());
}

template <typename T>
void read_opt(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key)) out = j.at(key).get<T>();
}

CheckResult out_of_range(const char* field, double value, double lo, double hi) {
    return {false, fmt::format("{}={} outside [{}, {}]", field, value, lo, hi)};
}

double hours_of(Millis d) {
    return std::chrono::duration<double, std::ratio<3600>>(d).count();
}

} // namespace

CheckResult TradingConfig::validate() const {
    if (min_spread_enter < 0.0001 || min_spread_enter > 0.01) {
        return out_of_range("min_spread_enter", min_spread_enter, 0.0001, 0.01);
    }
    if (min_spread_exit < -0.01 || min_spread_exit > 0.0001) {
        return out_of_range("min_spread_exit", min_spread_exit, -0.01, 0.0001);
    }
    if (min_order_contracts <= 0.0) {
        return {false, "min_order_contracts must be positive"};
    }
    if (max_position_contracts < min_order_contracts) {
        return {false, fmt::format("max_position_contracts={} below min_order_contracts={}",
                                   max_position_contracts, min_order_contracts)};
    }
    if (max_concurrent_positions < 1 || max_concurrent_positions > 10) {
        return out_of_range("max_concurrent_positions", max_concurrent_positions, 1, 10);
    }
    if (max_slippage <= 0.0 || max_slippage > 0.05) {
        return {false, fmt::format("max_slippage={} outside (0, 0.05]", max_slippage)};
    }
    double age_hours = hours_of(max_position_age);
    if (age_hours < 0.5 || age_hours > 24.0) {
        return out_of_range("max_position_age_hours", age_hours, 0.5, 24.0);
    }
    // Zero turns per-position order pacing off
    if (min_order_interval.count() < 0) {
        return {false, "min_order_interval must be non-negative"};
    }
    if (daily_loss_limit < 10.0 || daily_loss_limit > 10000.0) {
        return out_of_range("daily_loss_limit", daily_loss_limit, 10.0, 10000.0);
    }
    if (quote_freshness_window.count() <= 0 || confirmation_staleness_bound.count() <= 0) {
        return {false, "quote freshness bounds must be positive"};
    }
    if (confirmation_interval.count() < 0) {
        return {false, "confirmation_interval must be non-negative"};
    }
    if (entry_fill_timeout.count() <= 0 || inflight_timeout.count() <= 0 ||
        tick_interval.count() <= 0 || diagnosis_interval.count() <= 0) {
        return {false, "timeouts and intervals must be positive"};
    }
    if (fee_rate_v1 < 0.0 || fee_rate_v2 < 0.0 || simulated_slippage < 0.0) {
        return {false, "fee rates and simulated slippage must be non-negative"};
    }
    return {true, ""};
}

bool ThresholdUpdate::empty() const {
    return !min_spread_enter && !min_spread_exit && !max_position_contracts &&
           !min_order_contracts && !max_slippage && !max_concurrent_positions &&
           !max_position_age && !min_order_interval && !daily_loss_limit;
}

TradingConfig apply_update(const TradingConfig& base, const ThresholdUpdate& update) {
    TradingConfig next = base;
    if (update.min_spread_enter) next.min_spread_enter = *update.min_spread_enter;
    if (update.min_spread_exit) next.min_spread_exit = *update.min_spread_exit;
    if (update.max_position_contracts) next.max_position_contracts = *update.max_position_contracts;
    if (update.min_order_contracts) next.min_order_contracts = *update.min_order_contracts;
    if (update.max_slippage) next.max_slippage = *update.max_slippage;
    if (update.max_concurrent_positions) next.max_concurrent_positions = *update.max_concurrent_positions;
    if (update.max_position_age) next.max_position_age = *update.max_position_age;
    if (update.min_order_interval) next.min_order_interval = *update.min_order_interval;
    if (update.daily_loss_limit) next.daily_loss_limit = *update.daily_loss_limit;
    next.version = base.version + 1;
    return next;
}

TradingMode mode_from_string(const std::string& s) {
    if (s == "simulated" || s == "SIMULATED" || s == "paper") return TradingMode::SIMULATED;
    if (s == "real" || s == "REAL" || s == "live") return TradingMode::REAL;
    throw ConfigError("Unknown trading mode: " + s);
}

void to_json(nlohmann::json& j, const TradingConfig& c) {
    j = nlohmann::json{
        {"version", c.version},
        {"min_spread_enter", c.min_spread_enter},
        {"min_spread_exit", c.min_spread_exit},
        {"max_position_contracts", c.max_position_contracts},
        {"min_order_contracts", c.min_order_contracts},
        {"max_concurrent_positions", c.max_concurrent_positions},
        {"max_slippage", c.max_slippage},
        {"max_position_age_ms", c.max_position_age.count()},
        {"min_order_interval_ms", c.min_order_interval.count()},
        {"daily_loss_limit", c.daily_loss_limit},
        {"quote_freshness_window_ms", c.quote_freshness_window.count()},
        {"confirmation_interval_ms", c.confirmation_interval.count()},
        {"confirmation_staleness_bound_ms", c.confirmation_staleness_bound.count()},
        {"entry_fill_timeout_ms", c.entry_fill_timeout.count()},
        {"inflight_timeout_ms", c.inflight_timeout.count()},
        {"tick_interval_ms", c.tick_interval.count()},
        {"diagnosis_interval_ms", c.diagnosis_interval.count()},
        {"fee_offset_v1_to_v2", c.fee_offset_v1_to_v2},
        {"fee_offset_v2_to_v1", c.fee_offset_v2_to_v1},
        {"fee_rate_v1", c.fee_rate_v1},
        {"fee_rate_v2", c.fee_rate_v2},
        {"simulated_slippage", c.simulated_slippage}
    };
}

void from_json(const nlohmann::json& j, TradingConfig& c) {
    if (j.contains("min_spread_enter")) j.at("min_spread_enter").get_to(c.min_spread_enter);
    if (j.contains("min_spread_exit")) j.at("min_spread_exit").get_to(c.min_spread_exit);
    if (j.contains("max_position_contracts")) j.at("max_position_contracts").get_to(c.max_position_contracts);
    if (j.contains("min_order_contracts")) j.at("min_order_contracts").get_to(c.min_order_contracts);
    if (j.contains("max_concurrent_positions")) j.at("max_concurrent_positions").get_to(c.max_concurrent_positions);
    if (j.contains("max_slippage")) j.at("max_slippage").get_to(c.max_slippage);
    read_ms(j, "max_position_age_ms", c.max_position_age);
    read_ms(j, "min_order_interval_ms", c.min_order_interval);
    if (j.contains("daily_loss_limit")) j.at("daily_loss_limit").get_to(c.daily_loss_limit);
    read_ms(j, "quote_freshness_window_ms", c.quote_freshness_window);
    read_ms(j, "confirmation_interval_ms", c.confirmation_interval);
    read_ms(j, "confirmation_staleness_bound_ms", c.confirmation_staleness_bound);
    read_ms(j, "entry_fill_timeout_ms", c.entry_fill_timeout);
    read_ms(j, "inflight_timeout_ms", c.inflight_timeout);
    read_ms(j, "tick_interval_ms", c.tick_interval);
    read_ms(j, "diagnosis_interval_ms", c.diagnosis_interval);
    if (j.contains("fee_offset_v1_to_v2")) j.at("fee_offset_v1_to_v2").get_to(c.fee_offset_v1_to_v2);
    if (j.contains("fee_offset_v2_to_v1")) j.at("fee_offset_v2_to_v1").get_to(c.fee_offset_v2_to_v1);
    if (j.contains("fee_rate_v1")) j.at("fee_rate_v1").get_to(c.fee_rate_v1);
    if (j.contains("fee_rate_v2")) j.at("fee_rate_v2").get_to(c.fee_rate_v2);
    if (j.contains("simulated_slippage")) j.at("simulated_slippage").get_to(c.simulated_slippage);
}

void from_json(const nlohmann::json& j, ThresholdUpdate& u) {
    read_opt(j, "min_spread_enter", u.min_spread_enter);
    read_opt(j, "min_spread_exit", u.min_spread_exit);
    read_opt(j, "max_position_contracts", u.max_position_contracts);
    read_opt(j, "min_order_contracts", u.min_order_contracts);
    read_opt(j, "max_slippage", u.max_slippage);
    read_opt(j, "max_concurrent_positions", u.max_concurrent_positions);
    read_ms(j, "max_position_age_ms", u.max_position_age);
    read_ms(j, "min_order_interval_ms", u.min_order_interval);
    read_opt(j, "daily_loss_limit", u.daily_loss_limit);
}

void to_json(nlohmann::json& j, const ExecutionConfig& c) {
    j = nlohmann::json{
        {"order_fill_timeout_ms", c.order_fill_timeout.count()},
        {"order_poll_interval_ms", c.order_poll_interval.count()}
    };
}

void from_json(const nlohmann::json& j, ExecutionConfig& c) {
    read_ms(j, "order_fill_timeout_ms", c.order_fill_timeout);
    read_ms(j, "order_poll_interval_ms", c.order_poll_interval);
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = nlohmann::json{
        {"log_dir", c.log_dir},
        {"log_level", c.log_level},
        {"log_to_console", c.log_to_console},
        {"log_to_file", c.log_to_file},
        {"json_format", c.json_format},
        {"max_log_file_size_mb", c.max_log_file_size_mb},
        {"max_log_files", c.max_log_files}
    };
}

void from_json(const nlohmann::json& j, LoggingConfig& c) {
    if (j.contains("log_dir")) j.at("log_dir").get_to(c.log_dir);
    if (j.contains("log_level")) j.at("log_level").get_to(c.log_level);
    if (j.contains("log_to_console")) j.at("log_to_console").get_to(c.log_to_console);
    if (j.contains("log_to_file")) j.at("log_to_file").get_to(c.log_to_file);
    if (j.contains("json_format")) j.at("json_format").get_to(c.json_format);
    if (j.contains("max_log_file_size_mb")) j.at("max_log_file_size_mb").get_to(c.max_log_file_size_mb);
    if (j.contains("max_log_files")) j.at("max_log_files").get_to(c.max_log_files);
}

void to_json(nlohmann::json& j, const PersistenceConfig& c) {
    j = nlohmann::json{
        {"trade_journal_path", c.trade_journal_path},
        {"risk_state_path", c.risk_state_path},
        {"spread_history_path", c.spread_history_path},
        {"spread_history_points", c.spread_history_points},
        {"spread_history_save_interval_sec", c.spread_history_save_interval_sec}
    };
}

void from_json(const nlohmann::json& j, PersistenceConfig& c) {
    if (j.contains("trade_journal_path")) j.at("trade_journal_path").get_to(c.trade_journal_path);
    if (j.contains("risk_state_path")) j.at("risk_state_path").get_to(c.risk_state_path);
    if (j.contains("spread_history_path")) j.at("spread_history_path").get_to(c.spread_history_path);
    if (j.contains("spread_history_points")) j.at("spread_history_points").get_to(c.spread_history_points);
    if (j.contains("spread_history_save_interval_sec")) {
        j.at("spread_history_save_interval_sec").get_to(c.spread_history_save_interval_sec);
    }
}

void to_json(nlohmann::json& j, const AppConfig& c) {
    j = nlohmann::json{
        {"mode", c.mode == TradingMode::REAL ? "real" : "simulated"},
        {"instrument", c.instrument},
        {"v1_name", c.v1_name},
        {"v2_name", c.v2_name},
        {"trading", c.trading},
        {"execution", c.execution},
        {"logging", c.logging},
        {"persistence", c.persistence}
    };
}

void from_json(const nlohmann::json& j, AppConfig& c) {
    if (j.contains("mode")) c.mode = mode_from_string(j.at("mode").get<std::string>());
    if (j.contains("instrument")) j.at("instrument").get_to(c.instrument);
    if (j.contains("v1_name")) j.at("v1_name").get_to(c.v1_name);
    if (j.contains("v2_name")) j.at("v2_name").get_to(c.v2_name);
    if (j.contains("trading")) j.at("trading").get_to(c.trading);
    if (j.contains("execution")) j.at("execution").get_to(c.execution);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
    if (j.contains("persistence")) j.at("persistence").get_to(c.persistence);
}

AppConfig AppConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open config file: " + path);
    }

    AppConfig config;
    try {
        nlohmann::json j;
        file >> j;
        from_json(j, config);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(fmt::format("Malformed config {}: {}", path, e.what()));
    }

    auto check = config.validate();
    if (!check.allowed) {
        throw ConfigError(fmt::format("Invalid configuration in {}: {}", path, check.reason));
    }

    return config;
}

void AppConfig::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to create config file: " + path);
    }

    nlohmann::json j;
    to_json(j, *this);
    file << j.dump(2);
}

CheckResult AppConfig::validate() const {
    auto check = trading.validate();
    if (!check.allowed) {
        spdlog::error("Config validation failed: {}", check.reason);
        return check;
    }

    if (execution.order_fill_timeout.count() <= 0 || execution.order_poll_interval.count() <= 0) {
        return {false, "execution timeouts must be positive"};
    }

    if (persistence.spread_history_points <= 0 || persistence.spread_history_save_interval_sec <= 0) {
        return {false, "spread history size and save interval must be positive"};
    }

    if (mode == TradingMode::REAL) {
        spdlog::warn("Configured for REAL trading on {} / {}", v1_name, v2_name);
    }

    return {true, ""};
}

std::string AppConfig::get_env(const std::string& name, const std::string& default_val) {
    const char* val = std::getenv(name.c_str());
    return val ? std::string(val) : default_val;
}

} // namespace spreadarb

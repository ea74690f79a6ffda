#include "config/config_manager.hpp"
#include <spdlog/spdlog.h>

namespace spreadarb {

ConfigManager::ConfigManager(const TradingConfig& initial, TradingMode mode)
    : mode_(mode)
{
    auto check = initial.validate();
    if (!check.allowed) {
        throw ConfigError("Invalid trading config: " + check.reason);
    }
    current_ = std::make_shared<const TradingConfig>(initial);
}

std::shared_ptr<const TradingConfig> ConfigManager::current_config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

CheckResult ConfigManager::update_thresholds(const ThresholdUpdate& update) {
    if (update.empty()) {
        return {false, "Empty threshold update"};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    TradingConfig next = apply_update(*current_, update);
    auto check = next.validate();
    if (!check.allowed) {
        spdlog::warn("Threshold update rejected: {}", check.reason);
        return check;
    }

    spdlog::info("Thresholds updated to v{}: enter={:.4f}% exit={:.4f}% max_pos={} min_order={} "
                 "max_concurrent={} daily_loss_limit={:.2f}",
                 next.version, next.min_spread_enter * 100, next.min_spread_exit * 100,
                 next.max_position_contracts, next.min_order_contracts,
                 next.max_concurrent_positions, next.daily_loss_limit);

    current_ = std::make_shared<const TradingConfig>(next);
    return {true, ""};
}

void ConfigManager::set_mode(TradingMode mode) {
    TradingMode previous = mode_.exchange(mode);
    if (previous != mode) {
        spdlog::warn("Trading mode changed {} -> {} (applies to new positions only)",
                     mode_to_string(previous), mode_to_string(mode));
    }
}

} // namespace spreadarb

#pragma once

#include <memory>
#include <mutex>
#include <atomic>
#include "config/config.hpp"

namespace spreadarb {

/**
 * Holder of the live TradingConfig.
 *
 * Readers take a shared_ptr snapshot and keep it for the whole decision;
 * an update builds a new validated config and swaps the pointer, so a
 * reader never observes a partially applied update.
 *
 * The trading mode lives here too. Changing it only affects positions
 * opened afterwards; each position keeps the mode it was created with.
 */
class ConfigManager {
public:
    // Throws ConfigError if initial fails validation
    explicit ConfigManager(const TradingConfig& initial,
                           TradingMode mode = TradingMode::SIMULATED);

    std::shared_ptr<const TradingConfig> current_config() const;

    // Validates, then publishes atomically. Rejected updates leave the
    // current config untouched.
    CheckResult update_thresholds(const ThresholdUpdate& update);

    TradingMode current_mode() const { return mode_.load(); }
    void set_mode(TradingMode mode);

    uint64_t version() const { return current_config()->version; }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<const TradingConfig> current_;
    std::atomic<TradingMode> mode_;
};

} // namespace spreadarb

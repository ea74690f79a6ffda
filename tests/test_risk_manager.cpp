#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <filesystem>
#include "risk/risk_manager.hpp"
#include "utils/time_utils.hpp"

using namespace spreadarb;

class RiskManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        TradingConfig cfg;
        cfg.daily_loss_limit = 100.0;
        config_ = std::make_shared<ConfigManager>(cfg);

        morning_ = time_utils::from_iso8601("2025-03-10T09:00:00");
        risk_ = std::make_unique<RiskManager>(config_, morning_);
    }

    void TearDown() override {
        if (!state_path_.empty()) {
            std::remove(state_path_.c_str());
        }
    }

    std::shared_ptr<ConfigManager> config_;
    std::unique_ptr<RiskManager> risk_;
    WallClock morning_;
    std::string state_path_;
};

TEST_F(RiskManagerTest, StartsEnabled) {
    EXPECT_TRUE(risk_->check_trading_allowed());
    EXPECT_FALSE(risk_->forced_unwind_required());
    EXPECT_FALSE(risk_->is_halted());
    EXPECT_EQ(risk_->state().day_boundary, time_utils::from_iso8601("2025-03-11T00:00:00"));
}

TEST_F(RiskManagerTest, GainsDoNotOffsetLosses) {
    risk_->on_trade_closed(-60.0, morning_);
    risk_->on_trade_closed(+50.0, morning_);

    auto state = risk_->state();
    EXPECT_DOUBLE_EQ(state.daily_loss_accumulated, 60.0);
    EXPECT_DOUBLE_EQ(state.daily_realized_pnl, -10.0);
    EXPECT_EQ(state.trades_today, 2);
    EXPECT_EQ(state.winning_trades_today, 1);
    EXPECT_TRUE(risk_->check_trading_allowed());

    // Cumulative 100 reaches the limit although net PnL is only -50
    risk_->on_trade_closed(-40.0, morning_);
    EXPECT_FALSE(risk_->check_trading_allowed());
    EXPECT_EQ(risk_->state().disable_reason, DisableReason::DAILY_LOSS_LIMIT);
    EXPECT_TRUE(risk_->forced_unwind_required());
}

TEST_F(RiskManagerTest, LimitBreachedOnExactClose) {
    risk_->on_trade_closed(-99.99, morning_);
    EXPECT_TRUE(risk_->check_trading_allowed());

    risk_->on_trade_closed(-0.01, morning_);
    EXPECT_FALSE(risk_->check_trading_allowed());
}

TEST_F(RiskManagerTest, TracksStreaksAndDrawdown) {
    risk_->on_trade_closed(10.0, morning_);
    risk_->on_trade_closed(-4.0, morning_);
    risk_->on_trade_closed(-7.0, morning_);

    auto state = risk_->state();
    EXPECT_EQ(state.consecutive_losses, 2);
    EXPECT_DOUBLE_EQ(state.max_single_loss, 7.0);
    EXPECT_DOUBLE_EQ(state.peak_daily_pnl, 10.0);
    EXPECT_DOUBLE_EQ(state.max_drawdown, 11.0);

    risk_->on_trade_closed(1.0, morning_);
    EXPECT_EQ(risk_->state().consecutive_losses, 0);
}

TEST_F(RiskManagerTest, DailyResetClearsCounterButNotDisable) {
    risk_->on_trade_closed(-150.0, morning_);
    ASSERT_FALSE(risk_->check_trading_allowed());

    WallClock next_day = time_utils::from_iso8601("2025-03-11T00:00:01");
    EXPECT_TRUE(risk_->daily_reset_if_needed(next_day));
    EXPECT_FALSE(risk_->daily_reset_if_needed(next_day));

    auto state = risk_->state();
    EXPECT_DOUBLE_EQ(state.daily_loss_accumulated, 0.0);
    EXPECT_EQ(state.trades_today, 0);
    EXPECT_FALSE(state.trading_enabled);

    // Counter is clear now, so the operator may re-arm
    auto result = risk_->rearm("new day", next_day);
    EXPECT_TRUE(result.allowed) << result.reason;
    EXPECT_TRUE(risk_->check_trading_allowed());
}

TEST_F(RiskManagerTest, RearmRejectedWhileLossAtLimit) {
    risk_->on_trade_closed(-120.0, morning_);

    auto result = risk_->rearm("try", morning_);
    EXPECT_FALSE(result.allowed);
    EXPECT_FALSE(result.reason.empty());
    EXPECT_FALSE(risk_->check_trading_allowed());
}

TEST_F(RiskManagerTest, RearmWhenEnabledIsNoOp) {
    auto result = risk_->rearm("nothing to do", morning_);
    EXPECT_FALSE(result.allowed);
    EXPECT_TRUE(risk_->event_history().empty());
}

TEST_F(RiskManagerTest, ManualPauseDoesNotForceUnwind) {
    risk_->pause_trading("lunch", morning_);

    EXPECT_FALSE(risk_->check_trading_allowed());
    EXPECT_EQ(risk_->state().disable_reason, DisableReason::MANUAL);
    EXPECT_FALSE(risk_->forced_unwind_required());

    EXPECT_TRUE(risk_->rearm("back", morning_).allowed);
    EXPECT_TRUE(risk_->check_trading_allowed());
}

TEST_F(RiskManagerTest, DisableOnlyEscalates) {
    risk_->disable(DisableReason::UNHEDGED_LEG, "leg B missing", morning_);
    risk_->pause_trading("ignored", morning_);

    EXPECT_EQ(risk_->state().disable_reason, DisableReason::UNHEDGED_LEG);
    EXPECT_EQ(risk_->state().disable_details, "leg B missing");

    risk_->disable(DisableReason::INVARIANT_VIOLATION, "exited > filled", morning_);
    EXPECT_TRUE(risk_->is_halted());
    EXPECT_EQ(risk_->event_history().size(), 2u);
}

TEST_F(RiskManagerTest, CallbackFiresOnActivation) {
    DisableReason seen = DisableReason::NONE;
    int calls = 0;
    risk_->set_callback([&](DisableReason reason, const std::string&) {
        seen = reason;
        calls++;
    });

    risk_->on_trade_closed(-100.0, morning_);
    risk_->on_trade_closed(-1.0, morning_);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(seen, DisableReason::DAILY_LOSS_LIMIT);
}

TEST_F(RiskManagerTest, AuditTrailRecordsDisableAndRearm) {
    risk_->pause_trading("maintenance", morning_);
    risk_->rearm("done", morning_ + std::chrono::minutes(5));

    auto history = risk_->event_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_TRUE(history[0].is_activation);
    EXPECT_EQ(history[0].reason, DisableReason::MANUAL);
    EXPECT_FALSE(history[1].is_activation);
    EXPECT_EQ(history[1].details, "done");
}

TEST_F(RiskManagerTest, StateSurvivesRestartSameDay) {
    state_path_ = (std::filesystem::temp_directory_path() / "spreadarb_risk_same_day.json").string();
    risk_->set_persistence_path(state_path_);
    risk_->on_trade_closed(-30.0, morning_);
    risk_->pause_trading("before restart", morning_);

    RiskManager restored(config_, morning_);
    ASSERT_TRUE(restored.load_state(state_path_, morning_ + std::chrono::hours(1)));

    auto state = restored.state();
    EXPECT_DOUBLE_EQ(state.daily_loss_accumulated, 30.0);
    EXPECT_FALSE(state.trading_enabled);
    EXPECT_EQ(state.disable_reason, DisableReason::MANUAL);
    EXPECT_FALSE(restored.check_trading_allowed());
}

TEST_F(RiskManagerTest, RestartNextDayKeepsDisableOnly) {
    state_path_ = (std::filesystem::temp_directory_path() / "spreadarb_risk_next_day.json").string();
    risk_->on_trade_closed(-200.0, morning_);
    risk_->save_state(state_path_);

    WallClock tomorrow = time_utils::from_iso8601("2025-03-11T08:00:00");
    RiskManager restored(config_, tomorrow);
    ASSERT_TRUE(restored.load_state(state_path_, tomorrow));

    auto state = restored.state();
    EXPECT_DOUBLE_EQ(state.daily_loss_accumulated, 0.0);
    EXPECT_EQ(state.disable_reason, DisableReason::DAILY_LOSS_LIMIT);
    EXPECT_TRUE(restored.rearm("fresh day", tomorrow).allowed);
}

TEST_F(RiskManagerTest, LoadMissingFileReturnsFalse) {
    EXPECT_FALSE(risk_->load_state("/nonexistent/spreadarb/risk.json", morning_));
    EXPECT_TRUE(risk_->check_trading_allowed());
}

TEST_F(RiskManagerTest, WrongFieldTypeTreatedAsCorrupt) {
    state_path_ = (std::filesystem::temp_directory_path() / "spreadarb_risk_bad_type.json").string();
    {
        std::ofstream out(state_path_);
        out << R"({"day_boundary_ms": )"
            << time_utils::to_epoch_ms(time_utils::from_iso8601("2025-03-11T00:00:00"))
            << R"(, "daily_loss_accumulated": "lots", "trading_enabled": false,)"
            << R"( "disable_reason": "DAILY_LOSS_LIMIT"})";
    }

    EXPECT_FALSE(risk_->load_state(state_path_, morning_));

    // Nothing from the file is applied
    auto state = risk_->state();
    EXPECT_TRUE(state.trading_enabled);
    EXPECT_DOUBLE_EQ(state.daily_loss_accumulated, 0.0);
    EXPECT_TRUE(risk_->check_trading_allowed());
}

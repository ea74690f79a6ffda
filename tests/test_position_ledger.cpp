#include <gtest/gtest.h>
#include "position/position_ledger.hpp"

using namespace spreadarb;

class PositionLedgerTest : public ::testing::Test {
protected:
    void SetUp() override {
        t0_ = Timestamp{} + std::chrono::hours(1);
        wall_ = WallClock{} + std::chrono::hours(24 * 365 * 50);
    }

    PositionId draft(Direction dir = Direction::V1_TO_V2, Contracts target = 0.02,
                     Contracts min_viable = 0.01) {
        DraftParams params;
        params.target_contracts = target;
        params.min_viable_contracts = min_viable;
        params.exit_spread_target = -0.0002;
        params.decision_spread = 0.0055;
        return ledger_.open_draft(dir, TradingMode::SIMULATED, params, t0_, wall_);
    }

    // Entry V1_TO_V2 buys V1 / sells V2; exit reverses
    PairFill fill(const std::string& id, Contracts c, Venue buy, Price buy_px, Price sell_px,
                  Notional fee_per_leg = 0.0) {
        PairFill f;
        f.fill_id = id;
        f.contracts = c;
        f.buy_leg = LegFill{buy, Side::BUY, c, buy_px, fee_per_leg, wall_, id + "-B"};
        f.sell_leg = LegFill{other_venue(buy), Side::SELL, c, sell_px, fee_per_leg, wall_, id + "-S"};
        f.timestamp = wall_;
        return f;
    }

    PositionLedger ledger_;
    Timestamp t0_;
    WallClock wall_;
};

TEST_F(PositionLedgerTest, DraftStartsOpening) {
    auto id = draft();
    auto pos = ledger_.get(id);

    ASSERT_TRUE(pos.has_value());
    EXPECT_EQ(pos->state, PositionState::OPENING);
    EXPECT_DOUBLE_EQ(pos->filled_contracts, 0.0);
    EXPECT_TRUE(pos->is_active());
    EXPECT_EQ(ledger_.active_count(), 1u);
}

TEST_F(PositionLedgerTest, InvalidDraftSizingThrows) {
    EXPECT_THROW(draft(Direction::V1_TO_V2, 0.0, 0.0), InvariantViolation);
    EXPECT_THROW(draft(Direction::V1_TO_V2, 0.01, 0.02), InvariantViolation);
}

TEST_F(PositionLedgerTest, OpensOnceMinViableFilled) {
    auto id = draft(Direction::V1_TO_V2, 0.03, 0.02);

    ledger_.record_entry_fill(id, fill("e1", 0.01, Venue::V1, 99.95, 100.50));
    EXPECT_EQ(ledger_.get(id)->state, PositionState::OPENING);

    ledger_.record_entry_fill(id, fill("e2", 0.01, Venue::V1, 99.97, 100.48));
    auto pos = ledger_.get(id);
    EXPECT_EQ(pos->state, PositionState::OPEN);
    EXPECT_NEAR(pos->filled_contracts, 0.02, 1e-12);
    EXPECT_NEAR(pos->avg_entry_buy_price(), 99.96, 1e-9);
    EXPECT_NEAR(pos->avg_entry_sell_price(), 100.49, 1e-9);
}

TEST_F(PositionLedgerTest, DuplicateFillIgnored) {
    auto id = draft();
    auto f = fill("e1", 0.01, Venue::V1, 99.95, 100.50);

    EXPECT_TRUE(ledger_.record_entry_fill(id, f));
    EXPECT_FALSE(ledger_.record_entry_fill(id, f));
    EXPECT_NEAR(ledger_.get(id)->filled_contracts, 0.01, 1e-12);
}

TEST_F(PositionLedgerTest, FillBeyondTargetThrowsAndLeavesPositionUntouched) {
    auto id = draft(Direction::V1_TO_V2, 0.02, 0.01);
    ledger_.record_entry_fill(id, fill("e1", 0.015, Venue::V1, 99.95, 100.50));

    EXPECT_THROW(ledger_.record_entry_fill(id, fill("e2", 0.01, Venue::V1, 99.95, 100.50)),
                 InvariantViolation);
    EXPECT_NEAR(ledger_.get(id)->filled_contracts, 0.015, 1e-12);
}

TEST_F(PositionLedgerTest, WrongVenueOrMismatchedLegsThrow) {
    auto id = draft();

    // V1_TO_V2 entry must buy on V1
    EXPECT_THROW(ledger_.record_entry_fill(id, fill("e1", 0.01, Venue::V2, 100.0, 100.5)),
                 InvariantViolation);

    auto mismatched = fill("e2", 0.01, Venue::V1, 100.0, 100.5);
    mismatched.sell_leg.contracts = 0.008;
    EXPECT_THROW(ledger_.record_entry_fill(id, mismatched), InvariantViolation);
}

TEST_F(PositionLedgerTest, UnknownPositionThrows) {
    EXPECT_THROW(ledger_.record_entry_fill(42, fill("e1", 0.01, Venue::V1, 100.0, 100.5)),
                 InvariantViolation);
}

TEST_F(PositionLedgerTest, ExitBeyondFilledThrows) {
    auto id = draft();
    ledger_.record_entry_fill(id, fill("e1", 0.01, Venue::V1, 99.95, 100.50));

    EXPECT_THROW(ledger_.record_exit_fill(id, fill("x1", 0.02, Venue::V2, 100.0, 100.0)),
                 InvariantViolation);
    EXPECT_DOUBLE_EQ(ledger_.get(id)->exited_contracts, 0.0);
}

TEST_F(PositionLedgerTest, FullExitClosesWithRealizedPnl) {
    auto id = draft();
    ledger_.record_entry_fill(id, fill("e1", 0.01, Venue::V1, 99.95, 100.50, 0.01));
    ASSERT_TRUE(ledger_.mark_closing(id, ExitReason::SPREAD_TARGET));

    // Exit buys back on V2, sells on V1
    auto result = ledger_.record_exit_fill(id, fill("x1", 0.01, Venue::V2, 100.02, 100.00, 0.01));

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->final_state, PositionState::CLOSED);
    EXPECT_EQ(result->exit_reason, ExitReason::SPREAD_TARGET);

    // (100.50 - 99.95) * 0.01 + (100.00 - 100.02) * 0.01 - 4 * 0.01
    double expected = 0.0055 - 0.0002 - 0.04;
    EXPECT_NEAR(result->realized_pnl, expected, 1e-9);
    EXPECT_NEAR(result->fees, 0.04, 1e-12);

    auto pos = ledger_.get(id);
    EXPECT_EQ(pos->state, PositionState::CLOSED);
    EXPECT_FALSE(pos->is_active());
    EXPECT_TRUE(pos->closed_wall.has_value());
    EXPECT_EQ(ledger_.active_count(), 0u);
}

TEST_F(PositionLedgerTest, PartialExitMovesToClosing) {
    auto id = draft();
    ledger_.record_entry_fill(id, fill("e1", 0.02, Venue::V1, 99.95, 100.50));

    auto result = ledger_.record_exit_fill(id, fill("x1", 0.01, Venue::V2, 100.0, 100.0));

    EXPECT_FALSE(result.has_value());
    auto pos = ledger_.get(id);
    EXPECT_EQ(pos->state, PositionState::CLOSING);
    EXPECT_NEAR(pos->remaining_contracts(), 0.01, 1e-12);
    EXPECT_NEAR(ledger_.open_contracts(Direction::V1_TO_V2), 0.01, 1e-12);
}

TEST_F(PositionLedgerTest, FailedOpenWithoutFillsIsDone) {
    auto id = draft();

    EXPECT_DOUBLE_EQ(ledger_.mark_failed_open(id, wall_), 0.0);

    auto pos = ledger_.get(id);
    EXPECT_EQ(pos->state, PositionState::FAILED_OPEN);
    EXPECT_FALSE(pos->is_active());
    EXPECT_TRUE(ledger_.list_open().empty());
}

TEST_F(PositionLedgerTest, FailedOpenResidualStaysActiveUntilUnwound) {
    auto id = draft(Direction::V1_TO_V2, 0.02, 0.02);
    ledger_.record_entry_fill(id, fill("e1", 0.01, Venue::V1, 99.95, 100.50));

    EXPECT_NEAR(ledger_.mark_failed_open(id, wall_), 0.01, 1e-12);
    EXPECT_TRUE(ledger_.get(id)->is_active());

    auto result = ledger_.record_exit_fill(id, fill("x1", 0.01, Venue::V2, 100.0, 99.99));
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->final_state, PositionState::FAILED_OPEN);
    EXPECT_EQ(result->exit_reason, ExitReason::FAILED_OPEN);
    EXPECT_FALSE(ledger_.get(id)->is_active());
}

TEST_F(PositionLedgerTest, MarkClosingNeedsFilledContracts) {
    auto id = draft();
    EXPECT_FALSE(ledger_.mark_closing(id, ExitReason::MANUAL));

    ledger_.record_entry_fill(id, fill("e1", 0.01, Venue::V1, 99.95, 100.50));
    EXPECT_TRUE(ledger_.mark_closing(id, ExitReason::MANUAL));
    EXPECT_FALSE(ledger_.mark_closing(id, ExitReason::MAX_AGE));
    EXPECT_EQ(ledger_.get(id)->exit_reason, ExitReason::MANUAL);
}

TEST_F(PositionLedgerTest, LateEntryFillAfterCloseReopensExit) {
    auto id = draft();
    ledger_.record_entry_fill(id, fill("e1", 0.01, Venue::V1, 99.95, 100.50));
    ledger_.mark_closing(id, ExitReason::MANUAL);
    auto first = ledger_.record_exit_fill(id, fill("x1", 0.01, Venue::V2, 100.0, 100.0));
    ASSERT_TRUE(first.has_value());

    ledger_.record_entry_fill(id, fill("e2", 0.01, Venue::V1, 99.95, 100.50));
    EXPECT_EQ(ledger_.get(id)->state, PositionState::CLOSING);

    auto second = ledger_.record_exit_fill(id, fill("x2", 0.01, Venue::V2, 100.0, 100.0));
    ASSERT_TRUE(second.has_value());
    // Only the PnL added since the first close is reported again
    EXPECT_NEAR(second->realized_pnl, 0.0055, 1e-9);
    EXPECT_NEAR(ledger_.get(id)->realized_pnl, 0.011, 1e-9);
}

TEST_F(PositionLedgerTest, ScalableOnlyWhileBelowTarget) {
    auto id = draft(Direction::V2_TO_V1, 0.02, 0.01);
    EXPECT_EQ(ledger_.scalable_position(Direction::V2_TO_V1), id);
    EXPECT_FALSE(ledger_.scalable_position(Direction::V1_TO_V2).has_value());

    ledger_.record_entry_fill(id, fill("e1", 0.02, Venue::V2, 100.0, 100.5));
    EXPECT_FALSE(ledger_.scalable_position(Direction::V2_TO_V1).has_value());
}

TEST_F(PositionLedgerTest, CloseRequestBlocksScaling) {
    auto id = draft();
    EXPECT_TRUE(ledger_.request_close(id));
    EXPECT_TRUE(ledger_.get(id)->close_requested);
    EXPECT_FALSE(ledger_.scalable_position(Direction::V1_TO_V2).has_value());
    EXPECT_FALSE(ledger_.request_close(999));
}

TEST_F(PositionLedgerTest, ExitSpreadStatistics) {
    auto id = draft();
    ledger_.update_exit_spread(id, -0.004);
    ledger_.update_exit_spread(id, -0.001);
    ledger_.update_exit_spread(id, -0.006);

    auto pos = ledger_.get(id);
    EXPECT_EQ(pos->exit_spread_updates, 3u);
    EXPECT_DOUBLE_EQ(*pos->last_exit_spread, -0.006);
    EXPECT_DOUBLE_EQ(pos->best_exit_spread, -0.001);
    EXPECT_DOUBLE_EQ(pos->worst_exit_spread, -0.006);
}

TEST_F(PositionLedgerTest, AgeMeasuredFromOpen) {
    auto id = draft();
    auto age = ledger_.age_of(id, t0_ + std::chrono::minutes(90));
    ASSERT_TRUE(age.has_value());
    EXPECT_EQ(*age, std::chrono::minutes(90));
    EXPECT_FALSE(ledger_.age_of(77, t0_).has_value());
}

TEST_F(PositionLedgerTest, PruneKeepsActiveAndNewestFinished) {
    std::vector<PositionId> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(draft());
        ledger_.mark_failed_open(ids.back(), wall_);
    }
    auto active = draft();

    EXPECT_EQ(ledger_.prune_closed(1), 3u);
    EXPECT_FALSE(ledger_.get(ids[0]).has_value());
    EXPECT_TRUE(ledger_.get(ids[3]).has_value());
    EXPECT_TRUE(ledger_.get(active).has_value());
}

#include <gtest/gtest.h>
#include "market_data/order_book.hpp"

using namespace spreadarb;

class OrderBookTest : public ::testing::Test {
protected:
    OrderBook book_{10};
};

TEST_F(OrderBookTest, EmptyBook_ReturnsDefaultEstimate) {
    EXPECT_DOUBLE_EQ(book_.estimate_slippage(Side::BUY, 1.0), DEFAULT_SLIPPAGE_ESTIMATE);
    EXPECT_DOUBLE_EQ(book_.estimate_slippage(Side::SELL, 1.0), DEFAULT_SLIPPAGE_ESTIMATE);
}

TEST_F(OrderBookTest, Slippage_ZeroWhenTouchCoversOrder) {
    book_.apply_snapshot({{100.0, 1.0}}, {{101.0, 1.0}});

    EXPECT_DOUBLE_EQ(book_.estimate_slippage(Side::BUY, 0.5), 0.0);
    EXPECT_DOUBLE_EQ(book_.estimate_slippage(Side::SELL, 1.0), 0.0);
}

TEST_F(OrderBookTest, Slippage_WalksAskLevels) {
    book_.apply_snapshot({}, {{100.0, 1.0}, {101.0, 1.0}});

    // 1 @ 100 + 1 @ 101 = avg 100.5
    EXPECT_NEAR(book_.estimate_slippage(Side::BUY, 2.0), 0.005, 1e-12);
}

TEST_F(OrderBookTest, Slippage_WalksBidLevels) {
    book_.apply_snapshot({{100.0, 1.0}, {98.0, 1.0}}, {});

    // avg 99 against best 100
    EXPECT_NEAR(book_.estimate_slippage(Side::SELL, 2.0), 0.01, 1e-12);
}

TEST_F(OrderBookTest, Slippage_ThinBookPricesRemainderAtLastLevel) {
    book_.apply_snapshot({}, {{100.0, 1.0}, {102.0, 1.0}});

    // 1 @ 100, 3 @ 102 = avg 101.5
    EXPECT_NEAR(book_.estimate_slippage(Side::BUY, 4.0), 0.015, 1e-12);
}

TEST_F(OrderBookTest, Slippage_DefaultWhenSideEmpty) {
    book_.apply_snapshot({{100.0, 1.0}}, {});

    EXPECT_DOUBLE_EQ(book_.estimate_slippage(Side::BUY, 1.0), DEFAULT_SLIPPAGE_ESTIMATE);
    EXPECT_DOUBLE_EQ(book_.estimate_slippage(Side::SELL, 1.0), 0.0);
}

TEST_F(OrderBookTest, Snapshot_ReplacesBookAndDropsBadLevels) {
    book_.apply_snapshot({{90.0, 1.0}}, {{110.0, 1.0}});

    // Zero and negative levels are ignored; 102 becomes the best bid
    book_.apply_snapshot({{102.0, 1.0}, {101.0, 0.0}, {-1.0, 2.0}, {100.0, 1.0}},
                         {{103.0, 4.0}});

    // avg (102 + 100) / 2 = 101 against best 102
    EXPECT_NEAR(book_.estimate_slippage(Side::SELL, 2.0), 1.0 - 101.0 / 102.0, 1e-12);
    EXPECT_DOUBLE_EQ(book_.estimate_slippage(Side::BUY, 4.0), 0.0);
}

TEST_F(OrderBookTest, MaxLevels_KeepsLevelsNearestTouch) {
    OrderBook small(2);
    small.apply_snapshot({}, {{100.0, 1.0}, {101.0, 1.0}, {150.0, 1.0}});

    // 150 is trimmed, so the third contract prices at 101
    EXPECT_NEAR(small.estimate_slippage(Side::BUY, 3.0), (100.0 + 101.0 + 101.0) / 3.0 / 100.0 - 1.0, 1e-12);
}

TEST_F(OrderBookTest, Clear_EmptiesBook) {
    book_.apply_snapshot({{100.0, 5.0}}, {{101.0, 5.0}});

    book_.clear();

    EXPECT_DOUBLE_EQ(book_.estimate_slippage(Side::BUY, 1.0), DEFAULT_SLIPPAGE_ESTIMATE);
}

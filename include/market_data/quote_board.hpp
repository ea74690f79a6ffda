#pragma once

#include <array>
#include <mutex>
#include <atomic>
#include <vector>
#include "market_data/feed_ports.hpp"
#include "market_data/order_book.hpp"

namespace spreadarb {

/**
 * Latest quote and depth per venue.
 *
 * Each venue is written by exactly one feed thread and read by the decision
 * engine. A quote replaces the previous one in a single locked store; readers
 * get a copy and never see a half-written quote.
 */
class QuoteBoard : public PriceFeed {
public:
    QuoteBoard();

    // Rejects non-positive or crossed quotes, and quotes received before the
    // stored one; the previous quote is kept
    bool publish_quote(const Quote& quote);

    void publish_depth(Venue venue,
                       const std::vector<PriceLevel>& bids,
                       const std::vector<PriceLevel>& asks);

    // Feed disconnected: drop the quote so readers see it as absent
    void clear(Venue venue);

    std::optional<Quote> latest_quote(Venue venue) const override;
    double estimate_slippage(Venue venue, Side side, Contracts contracts) const override;

    uint64_t rejected_quotes() const { return rejected_.load(); }
    uint64_t accepted_quotes() const { return accepted_.load(); }
    uint64_t superseded_quotes() const { return superseded_.load(); }

private:
    struct Cell {
        mutable std::mutex mutex;
        std::optional<Quote> quote;
    };

    std::array<Cell, 2> cells_;
    OrderBook v1_book_;
    OrderBook v2_book_;

    std::atomic<uint64_t> accepted_{0};
    std::atomic<uint64_t> rejected_{0};
    std::atomic<uint64_t> superseded_{0};

    const OrderBook& book(Venue venue) const;
    OrderBook& book(Venue venue);
};

/**
 * Latest account state per venue, same single-writer discipline as
 * QuoteBoard.
 */
class AccountBoard : public AccountFeed {
public:
    void publish(Venue venue, const AccountState& state);
    void clear(Venue venue);

    std::optional<AccountState> latest_account_state(Venue venue) const override;

private:
    struct Cell {
        mutable std::mutex mutex;
        std::optional<AccountState> state;
    };

    std::array<Cell, 2> cells_;
};

} // namespace spreadarb

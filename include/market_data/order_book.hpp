#pragma once

#include <map>
#include <vector>
#include <mutex>
#include "common/types.hpp"

namespace spreadarb {

// Slippage assumed when the book cannot answer (empty side, no snapshot yet)
constexpr double DEFAULT_SLIPPAGE_ESTIMATE = 0.001;

/**
 * Depth snapshot for one venue, used only to price how far a market order
 * of a given size would walk the book.
 */
class OrderBook {
public:
    explicit OrderBook(int max_levels = 20);

    // Replaces both sides; non-positive levels are dropped
    void apply_snapshot(const std::vector<PriceLevel>& bids,
                        const std::vector<PriceLevel>& asks);
    void clear();

    /**
     * Fractional price impact of a market order, never negative:
     *   BUY:  avg / best_ask - 1
     *   SELL: 1 - avg / best_bid
     * If the book is too thin, the remainder is priced at the deepest level.
     * Falls back to DEFAULT_SLIPPAGE_ESTIMATE when the side is empty.
     */
    double estimate_slippage(Side side, Contracts contracts) const;

private:
    size_t max_levels_;

    // Bids sorted descending (highest first)
    std::map<Price, Contracts, std::greater<Price>> bids_;
    // Asks sorted ascending (lowest first)
    std::map<Price, Contracts> asks_;

    mutable std::mutex mutex_;

    template <typename Levels>
    static void load(Levels& side, const std::vector<PriceLevel>& levels, size_t max_levels);

    template <typename Levels>
    static double impact(const Levels& side, Contracts contracts);
};

} // namespace spreadarb

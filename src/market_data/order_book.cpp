#include "market_data/order_book.hpp"
#include <algorithm>
#include <cmath>

namespace spreadarb {

OrderBook::OrderBook(int max_levels)
    : max_levels_(static_cast<size_t>(std::max(1, max_levels)))
{
}

template <typename Levels>
void OrderBook::load(Levels& side, const std::vector<PriceLevel>& levels, size_t max_levels) {
    side.clear();
    for (const auto& level : levels) {
        if (level.price > 0.0 && level.size > 0.0) {
            side[level.price] = level.size;
        }
    }
    // Keep the levels nearest the touch
    while (side.size() > max_levels) {
        side.erase(std::prev(side.end()));
    }
}

void OrderBook::apply_snapshot(const std::vector<PriceLevel>& bids,
                               const std::vector<PriceLevel>& asks) {
    std::lock_guard<std::mutex> lock(mutex_);
    load(bids_, bids, max_levels_);
    load(asks_, asks, max_levels_);
}

void OrderBook::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    bids_.clear();
    asks_.clear();
}

template <typename Levels>
double OrderBook::impact(const Levels& side, Contracts contracts) {
    if (side.empty() || contracts <= 0.0) return DEFAULT_SLIPPAGE_ESTIMATE;

    Price best = side.begin()->first;
    Contracts remaining = contracts;
    Notional cost = 0.0;
    Price last_price = best;

    for (const auto& [price, size] : side) {
        if (remaining <= 0.0) break;
        Contracts take = std::min(size, remaining);
        cost += price * take;
        remaining -= take;
        last_price = price;
    }

    // Book too thin: price the rest at the deepest level seen
    if (remaining > 0.0) {
        cost += last_price * remaining;
    }

    Price avg = cost / contracts;
    return std::abs(avg / best - 1.0);
}

double OrderBook::estimate_slippage(Side side, Contracts contracts) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return side == Side::BUY ? impact(asks_, contracts) : impact(bids_, contracts);
}

} // namespace spreadarb

#include "market_data/quote_board.hpp"
#include <spdlog/spdlog.h>

namespace spreadarb {

QuoteBoard::QuoteBoard()
{
}

bool QuoteBoard::publish_quote(const Quote& quote) {
    if (!quote.is_valid()) {
        uint64_t count = ++rejected_;
        // Bad ticks tend to come in bursts
        if (count == 1 || count % 100 == 0) {
            spdlog::warn("Rejected invalid quote from {}: bid={} ask={} (total rejected: {})",
                         venue_to_string(quote.venue), quote.bid, quote.ask, count);
        }
        return false;
    }

    auto& cell = cells_[venue_index(quote.venue)];
    {
        std::lock_guard<std::mutex> lock(cell.mutex);
        if (cell.quote && quote.received_at < cell.quote->received_at) {
            ++superseded_;
            return false;
        }
        cell.quote = quote;
    }
    ++accepted_;
    return true;
}

void QuoteBoard::publish_depth(Venue venue,
                               const std::vector<PriceLevel>& bids,
                               const std::vector<PriceLevel>& asks) {
    book(venue).apply_snapshot(bids, asks);
}

void QuoteBoard::clear(Venue venue) {
    auto& cell = cells_[venue_index(venue)];
    {
        std::lock_guard<std::mutex> lock(cell.mutex);
        cell.quote.reset();
    }
    book(venue).clear();
    spdlog::warn("Quote feed for {} cleared", venue_to_string(venue));
}

std::optional<Quote> QuoteBoard::latest_quote(Venue venue) const {
    const auto& cell = cells_[venue_index(venue)];
    std::lock_guard<std::mutex> lock(cell.mutex);
    return cell.quote;
}

double QuoteBoard::estimate_slippage(Venue venue, Side side, Contracts contracts) const {
    return book(venue).estimate_slippage(side, contracts);
}

const OrderBook& QuoteBoard::book(Venue venue) const {
    return venue == Venue::V1 ? v1_book_ : v2_book_;
}

OrderBook& QuoteBoard::book(Venue venue) {
    return venue == Venue::V1 ? v1_book_ : v2_book_;
}

void AccountBoard::publish(Venue venue, const AccountState& state) {
    auto& cell = cells_[venue_index(venue)];
    std::lock_guard<std::mutex> lock(cell.mutex);
    cell.state = state;
}

void AccountBoard::clear(Venue venue) {
    auto& cell = cells_[venue_index(venue)];
    std::lock_guard<std::mutex> lock(cell.mutex);
    cell.state.reset();
}

std::optional<AccountState> AccountBoard::latest_account_state(Venue venue) const {
    const auto& cell = cells_[venue_index(venue)];
    std::lock_guard<std::mutex> lock(cell.mutex);
    return cell.state;
}

} // namespace spreadarb

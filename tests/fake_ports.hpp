#pragma once

#include <map>
#include <mutex>
#include <atomic>
#include <vector>
#include <functional>
#include <condition_variable>
#include "execution/execution_port.hpp"
#include "market_data/feed_ports.hpp"

namespace spreadarb {
namespace fakes {

/**
 * ExecutionPort whose answers are scripted per order. By default every
 * order fills completely at its price hint (100 when no hint was given).
 * Can be held closed so orders stay in flight until release().
 */
class ScriptedPort : public ExecutionPort {
public:
    using Handler = std::function<FillResult(const OrderRequest&)>;

    explicit ScriptedPort(TradingMode mode = TradingMode::SIMULATED) : mode_(mode) {}

    TradingMode mode() const override { return mode_; }

    FillResult place_order(const OrderRequest& request) override {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            orders_.push_back(request);
            gate_cv_.wait(lock, [this] { return !held_; });
        }

        FillResult result = handler_ ? handler_(request) : fill(request, request.contracts);
        if (result.order_ref.empty()) {
            result.order_ref = request.client_order_id;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        results_[result.order_ref] = result;
        return result;
    }

    bool cancel(const std::string& order_ref) override {
        std::lock_guard<std::mutex> lock(mutex_);
        cancels_.push_back(order_ref);
        return false;
    }

    std::optional<FillResult> query(const std::string& order_ref) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = query_overrides_.find(order_ref);
        if (it != query_overrides_.end()) return it->second;
        return std::nullopt;
    }

    static FillResult fill(const OrderRequest& request, Contracts contracts,
                           Price price = 0.0, Notional fee = 0.0) {
        FillResult r;
        r.status = contracts + CONTRACT_EPSILON >= request.contracts ? FillStatus::FILLED
                 : contracts > CONTRACT_EPSILON ? FillStatus::PARTIAL
                 : FillStatus::REJECTED;
        r.order_ref = request.client_order_id;
        r.venue = request.venue;
        r.side = request.side;
        r.requested = request.contracts;
        r.filled_contracts = contracts;
        r.avg_price = price > 0.0 ? price : (request.price_hint > 0.0 ? request.price_hint : 100.0);
        r.fee = fee;
        r.timestamp = wall_now();
        return r;
    }

    static FillResult status(const OrderRequest& request, FillStatus s, const std::string& error = "") {
        FillResult r = fill(request, 0.0);
        r.status = s;
        r.error = error;
        return r;
    }

    void set_handler(Handler h) { handler_ = std::move(h); }

    void set_query_result(const std::string& order_ref, const FillResult& r) {
        std::lock_guard<std::mutex> lock(mutex_);
        query_overrides_[order_ref] = r;
    }

    void hold() {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            held_ = false;
        }
        gate_cv_.notify_all();
    }

    std::vector<OrderRequest> orders() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return orders_;
    }

    std::vector<std::string> cancels() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cancels_;
    }

private:
    TradingMode mode_;
    Handler handler_;

    mutable std::mutex mutex_;
    std::condition_variable gate_cv_;
    bool held_{false};
    std::vector<OrderRequest> orders_;
    std::vector<std::string> cancels_;
    std::map<std::string, FillResult> results_;
    std::map<std::string, FillResult> query_overrides_;
};

// Price feed with directly settable quotes and slippage
class FakePriceFeed : public PriceFeed {
public:
    void set_quote(Venue venue, Price bid, Price ask, Timestamp at) {
        std::lock_guard<std::mutex> lock(mutex_);
        Quote q;
        q.venue = venue;
        q.bid = bid;
        q.ask = ask;
        q.received_at = at;
        quotes_[venue_index(venue)] = q;
    }

    void clear(Venue venue) {
        std::lock_guard<std::mutex> lock(mutex_);
        quotes_[venue_index(venue)].reset();
    }

    void set_slippage(Venue venue, double slippage) {
        std::lock_guard<std::mutex> lock(mutex_);
        slippage_[venue_index(venue)] = slippage;
    }

    std::optional<Quote> latest_quote(Venue venue) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return quotes_[venue_index(venue)];
    }

    double estimate_slippage(Venue venue, Side, Contracts) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return slippage_[venue_index(venue)];
    }

private:
    mutable std::mutex mutex_;
    std::optional<Quote> quotes_[2];
    double slippage_[2]{0.0, 0.0};
};

} // namespace fakes
} // namespace spreadarb

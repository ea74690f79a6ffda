#include <gtest/gtest.h>
#include <deque>
#include <mutex>
#include <stdexcept>
#include "execution/real_execution_port.hpp"

using namespace spreadarb;

namespace {

// Venue client that walks an order through a scripted list of states
class FakeExchangeClient : public ExchangeClient {
public:
    explicit FakeExchangeClient(std::string name) : name_(std::move(name)) {}

    std::string name() const override { return name_; }

    OrderAck submit_market_order(Side side, Contracts contracts, Price,
                                 const std::string& client_order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (throw_on_submit) throw std::runtime_error("socket closed");
        last_side = side;
        last_contracts = contracts;
        last_client_id = client_order_id;
        if (!accept) return {false, "", "insufficient balance"};
        return {true, "ord-1", ""};
    }

    std::optional<VenueOrder> get_order(const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queried.push_back(order_id);
        if (canceled && after_cancel) return after_cancel;
        if (states.empty()) return std::nullopt;
        VenueOrder o = states.front();
        if (states.size() > 1) states.pop_front();
        return o;
    }

    OrderAck cancel_order(const std::string& order_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        canceled = true;
        cancel_ids.push_back(order_id);
        return {true, order_id, ""};
    }

    static VenueOrder order(OrderState state, Contracts filled, Price px = 100.0, Notional fee = 0.0) {
        return VenueOrder{"ord-1", state, filled, px, fee};
    }

    bool accept{true};
    bool throw_on_submit{false};
    std::deque<VenueOrder> states;
    std::optional<VenueOrder> after_cancel;

    bool canceled{false};
    std::vector<std::string> cancel_ids;
    std::vector<std::string> queried;
    Side last_side{Side::BUY};
    Contracts last_contracts{0.0};
    std::string last_client_id;

private:
    std::string name_;
    std::mutex mutex_;
};

} // namespace

class RealExecutionPortTest : public ::testing::Test {
protected:
    void SetUp() override {
        v1_ = std::make_shared<FakeExchangeClient>("venue-one");
        v2_ = std::make_shared<FakeExchangeClient>("venue-two");

        ExecutionConfig cfg;
        cfg.order_fill_timeout = std::chrono::milliseconds(40);
        cfg.order_poll_interval = std::chrono::milliseconds(1);
        port_ = std::make_unique<RealExecutionPort>(v1_, v2_, cfg);
    }

    OrderRequest request(Venue venue = Venue::V1, Side side = Side::BUY) {
        OrderRequest r;
        r.client_order_id = "P1-EN-1-B";
        r.mode = TradingMode::REAL;
        r.venue = venue;
        r.side = side;
        r.contracts = 0.01;
        r.price_hint = 100.0;
        return r;
    }

    std::shared_ptr<FakeExchangeClient> v1_;
    std::shared_ptr<FakeExchangeClient> v2_;
    std::unique_ptr<RealExecutionPort> port_;
};

TEST_F(RealExecutionPortTest, FilledAfterPolling) {
    v1_->states = {FakeExchangeClient::order(OrderState::ACKNOWLEDGED, 0.0),
                   FakeExchangeClient::order(OrderState::FILLED, 0.01, 100.02, 0.0006)};

    auto result = port_->place_order(request());

    EXPECT_EQ(result.status, FillStatus::FILLED);
    EXPECT_DOUBLE_EQ(result.filled_contracts, 0.01);
    EXPECT_DOUBLE_EQ(result.avg_price, 100.02);
    EXPECT_DOUBLE_EQ(result.fee, 0.0006);
    EXPECT_EQ(result.order_ref, "V1:ord-1");
    EXPECT_EQ(v1_->last_client_id, "P1-EN-1-B");
    EXPECT_TRUE(v2_->queried.empty());
    EXPECT_EQ(port_->orders_submitted(), 1u);
}

TEST_F(RealExecutionPortTest, RoutesToVenueClient) {
    v2_->states = {FakeExchangeClient::order(OrderState::FILLED, 0.01)};

    auto result = port_->place_order(request(Venue::V2, Side::SELL));

    EXPECT_EQ(result.status, FillStatus::FILLED);
    EXPECT_EQ(result.order_ref, "V2:ord-1");
    EXPECT_EQ(v2_->last_side, Side::SELL);
    EXPECT_TRUE(v1_->queried.empty());
}

TEST_F(RealExecutionPortTest, RejectsSimulatedOrders) {
    auto req = request();
    req.mode = TradingMode::SIMULATED;

    auto result = port_->place_order(req);

    EXPECT_EQ(result.status, FillStatus::REJECTED);
    EXPECT_TRUE(v1_->last_client_id.empty());
}

TEST_F(RealExecutionPortTest, VenueRejectionReported) {
    v1_->accept = false;

    auto result = port_->place_order(request());

    EXPECT_EQ(result.status, FillStatus::REJECTED);
    EXPECT_EQ(result.error, "insufficient balance");
    EXPECT_FALSE(result.has_fill());
}

TEST_F(RealExecutionPortTest, SubmitExceptionIsError) {
    v1_->throw_on_submit = true;

    auto result = port_->place_order(request());

    EXPECT_EQ(result.status, FillStatus::ERROR);
    EXPECT_NE(result.error.find("socket closed"), std::string::npos);
}

TEST_F(RealExecutionPortTest, CanceledWithPartialFill) {
    v1_->states = {FakeExchangeClient::order(OrderState::CANCELED, 0.004)};

    auto result = port_->place_order(request());

    EXPECT_EQ(result.status, FillStatus::PARTIAL);
    EXPECT_DOUBLE_EQ(result.filled_contracts, 0.004);
}

TEST_F(RealExecutionPortTest, TimeoutCancelsAndPicksUpLateFill) {
    v1_->states = {FakeExchangeClient::order(OrderState::ACKNOWLEDGED, 0.0)};
    v1_->after_cancel = FakeExchangeClient::order(OrderState::FILLED, 0.01, 100.1);

    auto result = port_->place_order(request());

    EXPECT_TRUE(v1_->canceled);
    EXPECT_EQ(result.status, FillStatus::FILLED);
    EXPECT_DOUBLE_EQ(result.avg_price, 100.1);
    EXPECT_EQ(port_->orders_timed_out(), 0u);
}

TEST_F(RealExecutionPortTest, TimeoutWithUnknownStateNeverClaimsFill) {
    v1_->states = {FakeExchangeClient::order(OrderState::PARTIAL, 0.003)};

    auto result = port_->place_order(request());

    EXPECT_TRUE(v1_->canceled);
    EXPECT_EQ(result.status, FillStatus::TIMEOUT);
    EXPECT_EQ(port_->orders_timed_out(), 1u);
}

TEST_F(RealExecutionPortTest, CancelAndQueryRouteByRef) {
    v2_->states = {FakeExchangeClient::order(OrderState::FILLED, 0.01, 99.0)};

    EXPECT_TRUE(port_->cancel("V2:ord-1"));
    ASSERT_EQ(v2_->cancel_ids.size(), 1u);
    EXPECT_EQ(v2_->cancel_ids[0], "ord-1");

    v2_->canceled = false;
    auto result = port_->query("V2:ord-1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->status, FillStatus::FILLED);
    EXPECT_EQ(result->venue, Venue::V2);

    EXPECT_FALSE(port_->cancel("garbage"));
    EXPECT_FALSE(port_->query("V9:x").has_value());
}

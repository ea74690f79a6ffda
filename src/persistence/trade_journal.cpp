#include "persistence/trade_journal.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

namespace spreadarb {

void to_json(nlohmann::json& j, const LegFill& f) {
    j = nlohmann::json{
        {"venue", venue_to_string(f.venue)},
        {"side", side_to_string(f.side)},
        {"contracts", f.contracts},
        {"price", f.price},
        {"fee", f.fee},
        {"order_ref", f.order_ref},
        {"timestamp", time_utils::to_iso8601(f.timestamp)}
    };
}

void to_json(nlohmann::json& j, const PairFill& f) {
    j = nlohmann::json{
        {"fill_id", f.fill_id},
        {"contracts", f.contracts},
        {"realized_spread", f.realized_spread()},
        {"buy", f.buy_leg},
        {"sell", f.sell_leg},
        {"timestamp", time_utils::to_iso8601(f.timestamp)}
    };
}

void to_json(nlohmann::json& j, const Position& p) {
    j = nlohmann::json{
        {"id", p.id},
        {"direction", direction_to_string(p.direction)},
        {"mode", mode_to_string(p.mode)},
        {"state", position_state_to_string(p.state)},
        {"exit_reason", exit_reason_to_string(p.exit_reason)},
        {"target_contracts", p.target_contracts},
        {"filled_contracts", p.filled_contracts},
        {"exited_contracts", p.exited_contracts},
        {"decision_spread", p.decision_spread},
        {"realized_entry_spread", p.realized_entry_spread()},
        {"exit_spread_target", p.exit_spread_target},
        {"best_exit_spread", p.best_exit_spread},
        {"worst_exit_spread", p.worst_exit_spread},
        {"realized_pnl", p.realized_pnl},
        {"total_fees", p.total_fees},
        {"entry_fills", p.entry_fills},
        {"exit_fills", p.exit_fills},
        {"opened_at", time_utils::to_iso8601(p.opened_wall)}
    };
    if (p.last_exit_spread) {
        j["last_exit_spread"] = *p.last_exit_spread;
    }
    if (p.closed_wall) {
        j["closed_at"] = time_utils::to_iso8601(*p.closed_wall);
        j["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
            *p.closed_wall - p.opened_wall).count();
    }
}

void to_json(nlohmann::json& j, const DecisionEvent& e) {
    j = nlohmann::json{
        {"kind", decision_kind_to_string(e.kind)},
        {"reason", error_code_to_string(e.reason)},
        {"spread", e.spread},
        {"details", e.details},
        {"timestamp", time_utils::to_iso8601(e.timestamp)}
    };
    if (e.position_id) j["position_id"] = *e.position_id;
    if (e.direction) j["direction"] = direction_to_string(*e.direction);
}

TradeJournal::TradeJournal(const std::string& path)
    : path_(path)
{
    open_file();
}

TradeJournal::~TradeJournal() {
    flush();
}

void TradeJournal::open_file() {
    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    file_.open(path_, std::ios::app);
    if (!file_.is_open()) {
        spdlog::error("Failed to open trade journal: {}", path_);
    } else {
        spdlog::info("Trade journal opened: {}", path_);
    }
}

void TradeJournal::write_line(const nlohmann::json& j) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    try {
        // Venue text may carry invalid UTF-8; replace it rather than drop the record
        file_ << j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Journal write failed: {}", e.what());
    }
}

void TradeJournal::record_fill(PositionId id, OrderPurpose purpose, const PairFill& fill) {
    nlohmann::json data = fill;
    data["position_id"] = id;
    data["purpose"] = purpose_to_string(purpose);
    record_event("fill", data);
}

void TradeJournal::record_position_closed(const Position& position) {
    record_event("position_closed", position);
    flush();
}

void TradeJournal::record_decision(const DecisionEvent& event) {
    nlohmann::json j;
    j["event_type"] = "decision";
    j["timestamp"] = time_utils::to_iso8601(event.timestamp);
    j["data"] = event;
    write_line(j);
}

void TradeJournal::record_event(const std::string& event_type, const nlohmann::json& data) {
    nlohmann::json j;
    j["event_type"] = event_type;
    j["timestamp"] = time_utils::now_iso8601();
    j["data"] = data;
    write_line(j);
}

void TradeJournal::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

TradeJournal::DailySummary TradeJournal::daily_summary(WallClock day) const {
    DailySummary summary;
    summary.date = time_utils::utc_date(day);

    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream file(path_);
    std::string line;
    int malformed = 0;

    while (std::getline(file, line)) {
        nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
        if (j.is_discarded()) {
            malformed++;
            continue;
        }
        if (j.value("event_type", "") != "position_closed" || !j.contains("data")) {
            continue;
        }

        const auto& data = j["data"];
        std::string closed_at = data.value("closed_at", "");
        if (closed_at.compare(0, summary.date.size(), summary.date) != 0) {
            continue;
        }

        double pnl = data.value("realized_pnl", 0.0);
        summary.positions_closed++;
        summary.pnl += pnl;
        summary.fees += data.value("total_fees", 0.0);
        summary.contracts += data.value("filled_contracts", 0.0);
        if (data.value("state", "") == "FAILED_OPEN") {
            summary.failed_opens++;
        }
        if (pnl > 0.0) {
            summary.winning++;
        } else if (pnl < 0.0) {
            summary.losing++;
        }
    }

    if (malformed > 0) {
        spdlog::warn("Skipped {} malformed lines in {}", malformed, path_);
    }
    return summary;
}

} // namespace spreadarb

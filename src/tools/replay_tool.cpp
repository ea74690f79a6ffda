#include <iostream>
#include <iomanip>
#include <fstream>
#include <filesystem>
#include <map>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "common/types.hpp"
#include "config/config.hpp"
#include "config/config_manager.hpp"
#include "market_data/quote_board.hpp"
#include "risk/risk_manager.hpp"
#include "position/position_ledger.hpp"
#include "execution/simulated_execution_port.hpp"
#include "execution/execution_coordinator.hpp"
#include "arbitrage/decision_engine.hpp"
#include "utils/logging.hpp"
#include "utils/time_utils.hpp"

using namespace spreadarb;

/**
 * Replays recorded quotes through the decision engine in SIMULATED mode.
 *
 * Input is JSON lines:
 *   {"venue":"v1","bid":100.1,"ask":100.2,"ts_ms":1700000000000,
 *    "bids":[[100.1,0.5]],"asks":[[100.2,0.4]]}
 *
 * Usage:
 *   ./spreadarb_replay --input data/quotes.jsonl --config configs/spreadarb.json
 */

struct ReplayStats {
    int lines_read{0};
    int lines_skipped{0};
    int ticks{0};
    int entries_submitted{0};
    int exits_submitted{0};
    int fills_applied{0};
    std::map<std::string, int> blocked_by_reason;
};

namespace {

std::vector<PriceLevel> parse_levels(const nlohmann::json& j) {
    std::vector<PriceLevel> levels;
    for (const auto& level : j) {
        PriceLevel pl;
        if (level.is_array() && level.size() >= 2) {
            pl.price = level[0].get<double>();
            pl.size = level[1].get<double>();
        } else {
            pl.price = level.value("price", 0.0);
            pl.size = level.value("size", 0.0);
        }
        if (pl.price > 0 && pl.size > 0) levels.push_back(pl);
    }
    return levels;
}

Venue parse_venue(const std::string& s) {
    if (s == "v1" || s == "V1") return Venue::V1;
    if (s == "v2" || s == "V2") return Venue::V2;
    throw std::invalid_argument("unknown venue: " + s);
}

} // namespace

int run_replay(const std::string& input_file, const AppConfig& config, bool verbose, bool save_history) {
    spdlog::info("Starting replay from: {}", input_file);

    std::ifstream file(input_file);
    if (!file.is_open()) {
        spdlog::error("Failed to open input file: {}", input_file);
        return 1;
    }

    auto config_manager = std::make_shared<ConfigManager>(config.trading, TradingMode::SIMULATED);
    auto quotes = std::make_shared<QuoteBoard>();
    auto ledger = std::make_shared<PositionLedger>();
    auto sim_port = std::make_shared<SimulatedExecutionPort>(quotes, config_manager);

    ExecutionCoordinator::Config exec_config;
    exec_config.async_dispatch = false;
    exec_config.inflight_timeout = config.trading.inflight_timeout;
    auto executor = std::make_shared<ExecutionCoordinator>(sim_port, nullptr, exec_config);

    auto history = std::make_shared<SpreadHistory>(
        static_cast<size_t>(config.persistence.spread_history_points),
        save_history ? config.persistence.spread_history_path : "",
        std::chrono::seconds(config.persistence.spread_history_save_interval_sec));

    std::shared_ptr<RiskManager> risk;
    DecisionEngine* engine = nullptr;
    std::unique_ptr<DecisionEngine> engine_holder;

    ReplayStats stats;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;
        stats.lines_read++;

        Venue venue;
        Quote quote;
        int64_t ts_ms = 0;
        std::vector<PriceLevel> bids, asks;
        try {
            auto j = nlohmann::json::parse(line);
            venue = parse_venue(j.at("venue").get<std::string>());
            ts_ms = j.at("ts_ms").get<int64_t>();
            quote.venue = venue;
            quote.bid = j.at("bid").get<double>();
            quote.ask = j.at("ask").get<double>();
            quote.received_at = Timestamp{} + std::chrono::milliseconds(ts_ms);
            if (j.contains("bids")) bids = parse_levels(j["bids"]);
            if (j.contains("asks")) asks = parse_levels(j["asks"]);
        } catch (const std::exception& e) {
            stats.lines_skipped++;
            if (verbose) {
                spdlog::debug("Skipping line {}: {}", stats.lines_read, e.what());
            }
            continue;
        }

        WallClock wall = time_utils::from_epoch_ms(ts_ms);
        if (!engine) {
            // Risk day boundaries follow the recording's clock
            risk = std::make_shared<RiskManager>(config_manager, wall);
            engine_holder = std::make_unique<DecisionEngine>(
                config_manager, quotes, nullptr, risk, ledger, executor, nullptr, history);
            engine = engine_holder.get();
        }

        if (!quotes->publish_quote(quote)) {
            stats.lines_skipped++;
            continue;
        }
        if (!bids.empty() || !asks.empty()) {
            quotes->publish_depth(venue, bids, asks);
        }

        TickReport report = engine->tick(quote.received_at, wall);
        stats.ticks++;
        stats.entries_submitted += report.entries_submitted;
        stats.exits_submitted += report.exits_submitted;
        stats.fills_applied += report.fills_applied;

        for (const auto& event : report.events) {
            if (event.kind == DecisionKind::ENTRY_BLOCKED) {
                stats.blocked_by_reason[error_code_to_string(event.reason)]++;
            }
            if (verbose && event.kind != DecisionKind::NO_OPPORTUNITY &&
                event.kind != DecisionKind::CANDIDATE_PENDING) {
                std::cout << "[" << time_utils::to_iso8601(event.timestamp) << "] "
                          << decision_kind_to_string(event.kind)
                          << " " << event.details << "\n";
            }
        }

        if (stats.lines_read % 10000 == 0) {
            spdlog::info("Processed {} lines, {} entries, {} exits",
                         stats.lines_read, stats.entries_submitted, stats.exits_submitted);
        }
    }

    if (save_history) {
        try {
            history->save();
        } catch (const std::runtime_error& e) {
            spdlog::error("{}", e.what());
        }
    }

    int closed = 0, winners = 0, still_open = 0;
    double pnl = 0.0, fees = 0.0;
    for (const auto& pos : ledger->list_all()) {
        if (pos.is_active()) {
            still_open++;
            continue;
        }
        closed++;
        pnl += pos.realized_pnl;
        fees += pos.total_fees;
        if (pos.realized_pnl > 0) winners++;
    }

    std::cout << "\n";
    std::cout << "════════════════════════════════════════════════════════\n";
    std::cout << "                    REPLAY RESULTS                       \n";
    std::cout << "════════════════════════════════════════════════════════\n";
    std::cout << "Lines read:         " << stats.lines_read << " (" << stats.lines_skipped << " skipped)\n";
    std::cout << "Ticks:              " << stats.ticks << "\n";
    std::cout << "Entries submitted:  " << stats.entries_submitted << "\n";
    std::cout << "Exits submitted:    " << stats.exits_submitted << "\n";
    std::cout << "Fills applied:      " << stats.fills_applied << "\n";
    std::cout << "────────────────────────────────────────────────────────\n";
    std::cout << "Positions closed:   " << closed << " (" << winners << " winning)\n";
    std::cout << "Positions open:     " << still_open << "\n";
    std::cout << "Realized PnL:       $" << std::fixed << std::setprecision(4) << pnl << "\n";
    std::cout << "Fees:               $" << fees << "\n";
    if (risk) {
        auto state = risk->state();
        std::cout << "Trading enabled:    " << (state.trading_enabled ? "yes" : "no");
        if (!state.trading_enabled) {
            std::cout << " (" << disable_reason_to_string(state.disable_reason) << ")";
        }
        std::cout << "\n";
    }
    auto spreads = history->statistics();
    if (spreads.count > 0) {
        std::cout << "────────────────────────────────────────────────────────\n";
        std::cout << "Spread points:      " << spreads.count << " (" << spreads.positive_entries
                  << " with positive entry)\n";
        std::cout << std::setprecision(4);
        std::cout << "Entry spread:       avg " << spreads.avg_entry * 100 << "%, max "
                  << spreads.max_entry * 100 << "%, vol " << spreads.entry_volatility * 100 << "%\n";
        std::cout << "Exit spread:        avg " << spreads.avg_exit * 100 << "%, max "
                  << spreads.max_exit * 100 << "%\n";
    }
    if (!stats.blocked_by_reason.empty()) {
        std::cout << "────────────────────────────────────────────────────────\n";
        std::cout << "Entries blocked:\n";
        for (const auto& [reason, count] : stats.blocked_by_reason) {
            std::cout << "  " << std::left << std::setw(22) << reason << count << "\n";
        }
    }
    std::cout << "════════════════════════════════════════════════════════\n";
    return 0;
}

int main(int argc, char* argv[]) {
    CLI::App app{"spreadarb replay - run recorded quotes through the decision engine"};

    std::string input_file;
    std::string config_path = AppConfig::get_env("SPREADARB_CONFIG", "configs/spreadarb.json");
    bool verbose = false;
    bool save_history = false;

    app.add_option("-i,--input", input_file, "JSON lines file with recorded quotes")
        ->required()
        ->check(CLI::ExistingFile);
    app.add_option("-c,--config", config_path, "Path to configuration file");
    app.add_flag("-v,--verbose", verbose, "Print every decision event");
    app.add_flag("--save-spreads", save_history, "Write the spread history file named in the config");

    CLI11_PARSE(app, argc, argv);

    AppConfig config;
    if (std::filesystem::exists(config_path)) {
        try {
            config = AppConfig::load(config_path);
        } catch (const ConfigError& e) {
            std::cerr << "Config error: " << e.what() << "\n";
            return 1;
        }
    } else {
        std::cerr << "Config " << config_path << " not found, using defaults\n";
    }

    config.logging.log_to_file = false;
    config.logging.log_level = verbose ? "debug" : "warn";
    setup_logging(config.logging);

    return run_replay(input_file, config, verbose, save_history);
}

#include "arbitrage/spread_history.hpp"
#include "utils/time_utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <cmath>

namespace spreadarb {

void to_json(nlohmann::json& j, const SpreadPoint& p) {
    j = nlohmann::json{
        {"timestamp_ms", time_utils::to_epoch_ms(p.at)},
        {"time", time_utils::to_iso8601(p.at)},
        {"entry_v1_to_v2", p.entry_v1_to_v2},
        {"entry_v2_to_v1", p.entry_v2_to_v1},
        {"exit_v1_to_v2", p.exit_v1_to_v2},
        {"exit_v2_to_v1", p.exit_v2_to_v1},
        {"best_entry", p.best_entry},
        {"best_exit", p.best_exit},
        {"v1_healthy", p.v1_healthy},
        {"v2_healthy", p.v2_healthy}
    };
}

void from_json(const nlohmann::json& j, SpreadPoint& p) {
    p.at = time_utils::from_epoch_ms(j.at("timestamp_ms").get<int64_t>());
    j.at("entry_v1_to_v2").get_to(p.entry_v1_to_v2);
    j.at("entry_v2_to_v1").get_to(p.entry_v2_to_v1);
    j.at("exit_v1_to_v2").get_to(p.exit_v1_to_v2);
    j.at("exit_v2_to_v1").get_to(p.exit_v2_to_v1);
    p.best_entry = j.value("best_entry", std::max(p.entry_v1_to_v2, p.entry_v2_to_v1));
    p.best_exit = j.value("best_exit", std::max(p.exit_v1_to_v2, p.exit_v2_to_v1));
    p.v1_healthy = j.value("v1_healthy", false);
    p.v2_healthy = j.value("v2_healthy", false);
}

SpreadHistory::SpreadHistory(size_t max_points, std::string path, Duration save_interval)
    : max_points_(std::max<size_t>(max_points, 1))
    , path_(std::move(path))
    , save_interval_(save_interval)
{
    spdlog::info("Spread history: keeping {} points{}", max_points_,
                 path_.empty() ? "" : ", saving to " + path_);
}

void SpreadHistory::add(const SpreadSnapshot& spreads, bool v1_healthy, bool v2_healthy, WallClock at) {
    SpreadPoint point;
    point.at = at;
    point.entry_v1_to_v2 = spreads.v1_to_v2.entry_spread;
    point.entry_v2_to_v1 = spreads.v2_to_v1.entry_spread;
    point.exit_v1_to_v2 = spreads.v1_to_v2.exit_spread;
    point.exit_v2_to_v1 = spreads.v2_to_v1.exit_spread;
    point.best_entry = spreads.best_entry().entry_spread;
    point.best_exit = std::max(point.exit_v1_to_v2, point.exit_v2_to_v1);
    point.v1_healthy = v1_healthy;
    point.v2_healthy = v2_healthy;

    bool save_due = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        points_.push_back(point);
        while (points_.size() > max_points_) {
            points_.pop_front();
        }
        record_bests_locked(spreads, at);

        if (!path_.empty() && (!last_save_ || at - *last_save_ >= save_interval_)) {
            last_save_ = at;
            save_due = true;
        }
    }

    if (save_due) {
        try {
            save();
        } catch (const std::exception& e) {
            spdlog::error("Error saving spread history: {}", e.what());
        }
    }
}

void SpreadHistory::record_bests_locked(const SpreadSnapshot& spreads, WallClock at) {
    const DirectionalSpread& best = spreads.best_entry();
    if (!best_entry_ || best.entry_spread > *best_entry_) {
        // Only improvements of more than 10% are worth a log line
        if (best_entry_ && best.entry_spread > 0.0 &&
            best.entry_spread - *best_entry_ > 0.1 * std::abs(*best_entry_)) {
            spdlog::info("New session best entry spread {:.4f}% ({})",
                         best.entry_spread * 100.0, direction_to_string(best.direction));
        }
        best_entry_ = best.entry_spread;
        best_entry_direction_ = best.direction;
        best_entry_at_ = at;
    }

    for (const DirectionalSpread* d : {&spreads.v1_to_v2, &spreads.v2_to_v1}) {
        auto& slot = best_exit_[d->direction == Direction::V1_TO_V2 ? 0 : 1];
        if (!slot || d->exit_spread > *slot) {
            slot = d->exit_spread;
        }
    }
}

SpreadStats SpreadHistory::statistics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    SpreadStats stats;
    stats.count = points_.size();
    stats.best_entry_spread = best_entry_;
    stats.best_entry_direction = best_entry_direction_;
    stats.best_entry_at = best_entry_at_;
    stats.best_exit_v1_to_v2 = best_exit_[0];
    stats.best_exit_v2_to_v1 = best_exit_[1];

    if (points_.empty()) {
        return stats;
    }

    double entry_sum = 0.0, exit_sum = 0.0;
    stats.max_entry = points_.front().best_entry;
    stats.max_exit = points_.front().best_exit;
    for (const auto& p : points_) {
        entry_sum += p.best_entry;
        exit_sum += p.best_exit;
        stats.max_entry = std::max(stats.max_entry, p.best_entry);
        stats.max_exit = std::max(stats.max_exit, p.best_exit);
        if (p.best_entry > 0.0) stats.positive_entries++;
        if (p.best_exit >= 0.0) stats.converged_exits++;
    }
    stats.avg_entry = entry_sum / points_.size();
    stats.avg_exit = exit_sum / points_.size();

    double sq_sum = 0.0;
    for (const auto& p : points_) {
        sq_sum += (p.best_entry - stats.avg_entry) * (p.best_entry - stats.avg_entry);
    }
    stats.entry_volatility = std::sqrt(sq_sum / points_.size());

    size_t first = points_.size() > RECENT_POINTS ? points_.size() - RECENT_POINTS : 0;
    for (size_t i = first; i < points_.size(); ++i) {
        stats.recent_entries.push_back(points_[i].best_entry);
    }
    return stats;
}

SpreadChart SpreadHistory::chart_data(size_t limit) const {
    std::lock_guard<std::mutex> lock(mutex_);

    SpreadChart chart;
    size_t first = points_.size() > limit ? points_.size() - limit : 0;
    for (size_t i = first; i < points_.size(); ++i) {
        const SpreadPoint& p = points_[i];
        chart.at.push_back(p.at);
        chart.entry_v1_to_v2.push_back(p.entry_v1_to_v2);
        chart.entry_v2_to_v1.push_back(p.entry_v2_to_v1);
        chart.exit_v1_to_v2.push_back(p.exit_v1_to_v2);
        chart.exit_v2_to_v1.push_back(p.exit_v2_to_v1);
        chart.best_entry.push_back(p.best_entry);
        chart.best_exit.push_back(p.best_exit);
        chart.v1_healthy.push_back(p.v1_healthy);
        chart.v2_healthy.push_back(p.v2_healthy);
    }
    return chart;
}

size_t SpreadHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return points_.size();
}

void SpreadHistory::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    points_.clear();
    best_entry_.reset();
    best_entry_direction_.reset();
    best_entry_at_.reset();
    best_exit_[0].reset();
    best_exit_[1].reset();
    spdlog::info("Spread history cleared");
}

nlohmann::json SpreadHistory::to_json_locked() const {
    nlohmann::json j;
    j["last_saved"] = time_utils::now_iso8601();
    j["max_points"] = max_points_;
    j["data"] = nlohmann::json::array();
    for (const auto& p : points_) {
        j["data"].push_back(p);
    }
    return j;
}

void SpreadHistory::save() const {
    if (path_.empty()) {
        return;
    }

    nlohmann::json j;
    size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        j = to_json_locked();
        count = points_.size();
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write spread history: " + path_);
    }
    file << j.dump(2);
    spdlog::debug("Saved {} spread history points", count);
}

bool SpreadHistory::load() {
    if (path_.empty()) {
        return false;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        spdlog::info("No saved spread history at {}", path_);
        return false;
    }

    std::deque<SpreadPoint> loaded;
    try {
        nlohmann::json j;
        file >> j;
        const auto& data = j.at("data");
        size_t first = data.size() > max_points_ ? data.size() - max_points_ : 0;
        for (size_t i = first; i < data.size(); ++i) {
            loaded.push_back(data[i].get<SpreadPoint>());
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Error loading spread history {}: {}", path_, e.what());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    points_ = std::move(loaded);
    spdlog::info("Loaded {} spread history points", points_.size());
    return true;
}

} // namespace spreadarb

#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "common/types.hpp"
#include "arbitrage/spread_calculator.hpp"

namespace spreadarb {

// One tick's spreads in both directions plus feed health
struct SpreadPoint {
    WallClock at;
    double entry_v1_to_v2{0.0};
    double entry_v2_to_v1{0.0};
    double exit_v1_to_v2{0.0};
    double exit_v2_to_v1{0.0};
    double best_entry{0.0};        // Larger of the two entry spreads
    double best_exit{0.0};         // Larger of the two exit spreads
    bool v1_healthy{false};
    bool v2_healthy{false};
};

struct SpreadStats {
    size_t count{0};
    double avg_entry{0.0};
    double max_entry{0.0};
    double entry_volatility{0.0};  // Population std dev of best_entry
    double avg_exit{0.0};
    double max_exit{0.0};
    size_t positive_entries{0};
    size_t converged_exits{0};     // best_exit >= 0

    // Session records, kept even after their point is trimmed
    std::optional<double> best_entry_spread;
    std::optional<Direction> best_entry_direction;
    std::optional<WallClock> best_entry_at;
    std::optional<double> best_exit_v1_to_v2;
    std::optional<double> best_exit_v2_to_v1;

    std::vector<double> recent_entries;   // Newest last
};

// Column-wise view of the newest points, oldest first
struct SpreadChart {
    std::vector<WallClock> at;
    std::vector<double> entry_v1_to_v2;
    std::vector<double> entry_v2_to_v1;
    std::vector<double> exit_v1_to_v2;
    std::vector<double> exit_v2_to_v1;
    std::vector<double> best_entry;
    std::vector<double> best_exit;
    std::vector<bool> v1_healthy;
    std::vector<bool> v2_healthy;
};

/**
 * Bounded per-tick spread history for charts and session statistics.
 *
 * DESIGN:
 * - Holds at most max_points points; the oldest is dropped first
 * - Saved to a JSON file at most once per save_interval from add(),
 *   and restored by load() on startup
 * - All methods are safe to call from any thread
 */
class SpreadHistory {
public:
    static constexpr size_t RECENT_POINTS = 20;

    explicit SpreadHistory(size_t max_points = 1000, std::string path = "",
                           Duration save_interval = std::chrono::seconds(60));

    void add(const SpreadSnapshot& spreads, bool v1_healthy, bool v2_healthy, WallClock at);

    SpreadStats statistics() const;
    SpreadChart chart_data(size_t limit = 100) const;

    size_t size() const;
    void clear();

    // Throws std::runtime_error when the file cannot be written
    void save() const;

    // False when the file is missing or unreadable; history is left untouched
    bool load();

    const std::string& path() const { return path_; }

private:
    size_t max_points_;
    std::string path_;
    Duration save_interval_;

    mutable std::mutex mutex_;
    std::deque<SpreadPoint> points_;
    std::optional<WallClock> last_save_;

    std::optional<double> best_entry_;
    std::optional<Direction> best_entry_direction_;
    std::optional<WallClock> best_entry_at_;
    std::optional<double> best_exit_[2];

    void record_bests_locked(const SpreadSnapshot& spreads, WallClock at);
    nlohmann::json to_json_locked() const;
};

void to_json(nlohmann::json& j, const SpreadPoint& p);
void from_json(const nlohmann::json& j, SpreadPoint& p);

} // namespace spreadarb

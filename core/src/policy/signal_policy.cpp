#include <policy/signal_policy.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace tp {
    namespace {
        bool in_window(int hour, const HourWindow& w) {
            return hour >= w.start_hour && hour < w.end_hour;
        }

        int clamp_round(double raw, int lo, int hi) {
            if (!std::isfinite(raw)) raw = static_cast<double>(lo);
            const double clamped = std::clamp(raw, static_cast<double>(lo), static_cast<double>(hi));
            return static_cast<int>(std::lround(clamped));
        }

        std::string lower(std::string s) {
            std::transform(s.begin(),
                           s.end(),
                           s.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return s;
        }
    } // namespace

    const char* to_string(Direction d) {
        switch (d) {
            case Direction::North: return "north";
            case Direction::South: return "south";
            case Direction::East: return "east";
            case Direction::West: return "west";
        }
        return "north";
    }

    std::optional<Direction> direction_from_string(const std::string& s) {
        const std::string k = lower(s);
        if (k == "north" || k == "lane1") return Direction::North;
        if (k == "west" || k == "lane2") return Direction::West;
        if (k == "east" || k == "lane3") return Direction::East;
        if (k == "south" || k == "lane4") return Direction::South;
        return std::nullopt;
    }

    Direction opposite_of(Direction d) {
        switch (d) {
            case Direction::North: return Direction::South;
            case Direction::South: return Direction::North;
            case Direction::East: return Direction::West;
            case Direction::West: return Direction::East;
        }
        return d;
    }

    const std::array<Direction, 4>& report_order() {
        static const std::array<Direction, 4> kOrder = {
            Direction::North, Direction::West, Direction::East, Direction::South
        };
        return kOrder;
    }

    SignalPolicy::SignalPolicy(PolicyConfig cfg)
        : cfg_(std::move(cfg)) {}

    int SignalPolicy::time_of_day_adjustment(int hour) const {
        if (hour < 0 || hour > 23) return 0;
        for (const auto& w : cfg_.peak_hours) {
            if (in_window(hour, w)) return cfg_.peak_adjustment;
        }
        for (const auto& w : cfg_.off_peak_hours) {
            if (in_window(hour, w)) return cfg_.off_peak_adjustment;
        }
        return 0;
    }

    int SignalPolicy::video_green_time(int64_t vehicle_count,
                                       double slope,
                                       int time_of_day_adjustment,
                                       bool emergency) const {
        if (!std::isfinite(slope)) slope = 0.0;
        double raw = cfg_.base_seconds +
                     cfg_.slope_gain * slope +
                     cfg_.count_gain * static_cast<double>(vehicle_count - cfg_.count_pivot) +
                     static_cast<double>(time_of_day_adjustment);
        if (emergency) raw += static_cast<double>(cfg_.emergency_bonus);
        return clamp_round(raw, cfg_.min_seconds, cfg_.max_seconds);
    }

    int SignalPolicy::image_green_time(int64_t vehicle_count, bool emergency) const {
        double raw = cfg_.image_base_seconds +
                     cfg_.image_count_gain * static_cast<double>(std::max<int64_t>(0, vehicle_count));
        if (emergency) raw += static_cast<double>(cfg_.emergency_bonus);
        return clamp_round(raw, cfg_.image_min_seconds, cfg_.image_max_seconds);
    }

    SignalDecision SignalPolicy::decide(const std::string& lane,
                                        int64_t vehicle_count,
                                        double rate,
                                        double slope,
                                        bool emergency,
                                        int hour) const {
        SignalDecision d;
        d.lane = lane;
        d.vehicle_count = vehicle_count;
        d.rate = rate;
        d.slope = slope;
        d.emergency_detected = emergency;
        d.green_time_seconds = video_green_time(vehicle_count, slope, time_of_day_adjustment(hour), emergency);
        return d;
    }

    void apply_opposing_pair_fairness(std::map<Direction, int>& green_times) {
        const std::pair<Direction, Direction> pairs[] = {
            {Direction::North, Direction::South},
            {Direction::East, Direction::West},
        };

        for (const auto& p : pairs) {
            auto a = green_times.find(p.first);
            auto b = green_times.find(p.second);
            if (a == green_times.end() || b == green_times.end()) continue;
            const int m = std::max(a->second, b->second);
            a->second = m;
            b->second = m;
        }
    }
}

#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include <common/config.hpp>

namespace tp {
    enum class Direction {
        North,
        South,
        East,
        West
    };

    const char* to_string(Direction d);

    // Accepts north/south/east/west and the lane1..lane4 aliases.
    std::optional<Direction> direction_from_string(const std::string& s);

    Direction opposite_of(Direction d);

    // Order in which batch results are reported: north, west, east, south.
    const std::array<Direction, 4>& report_order();

    struct SignalDecision {
        std::string lane;
        int64_t vehicle_count = 0;
        double rate = 0.0;
        double slope = 0.0;
        bool emergency_detected = false;
        int green_time_seconds = 0;
    };

    // Maps counts and trend to a bounded green time. Stateless apart from its
    // configuration.
    class SignalPolicy {
    public:
        explicit SignalPolicy(PolicyConfig cfg = {});

        int time_of_day_adjustment(int hour) const;

        // clamp(33 + 10*slope + 2*(count - 10) + tod [+ emergency], 15, 65)
        int video_green_time(int64_t vehicle_count, double slope, int time_of_day_adjustment, bool emergency) const;

        // clamp(10 + 2*count [+ emergency], 10, 65)
        int image_green_time(int64_t vehicle_count, bool emergency) const;

        SignalDecision decide(const std::string& lane,
                              int64_t vehicle_count,
                              double rate,
                              double slope,
                              bool emergency,
                              int hour) const;

        const PolicyConfig& config() const { return cfg_; }

    private:
        PolicyConfig cfg_;
    };

    // A shared phase cannot give opposing directions different durations:
    // north/south and east/west both take the larger of the pair.
    void apply_opposing_pair_fairness(std::map<Direction, int>& green_times);
}

#include <policy/signal_policy.hpp>

#include <iostream>
#include <map>
#include <string>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    void test_video_baseline() {
        const tp::SignalPolicy policy;
        check(policy.video_green_time(10, 0.0, 0, false) == 33, "10 vehicles, flat trend, off-hours neutral -> 33");
        check(policy.video_green_time(12, 0.5, 0, false) == 42, "33 + 5 + 4");
        check(policy.video_green_time(10, 0.0, 3, false) == 36, "peak adds 3");
        check(policy.video_green_time(10, 0.0, -3, false) == 30, "off-peak subtracts 3");
        check(policy.video_green_time(10, 0.0, 0, true) == 43, "emergency adds 10");
    }

    void test_video_clamped() {
        const tp::SignalPolicy policy;
        check(policy.video_green_time(100, 0.0, 0, false) == 65, "heavy traffic clamps to 65");
        check(policy.video_green_time(0, -5.0, -3, false) == 15, "empty falling lane clamps to 15");
        check(policy.video_green_time(30, 2.0, 3, true) == 65, "emergency never exceeds the maximum");

        bool in_range = true;
        for (int64_t count = 0; count <= 60; count += 3) {
            for (double slope = -4.0; slope <= 4.0; slope += 0.5) {
                for (int tod : {-3, 0, 3}) {
                    for (bool emergency : {false, true}) {
                        const int g = policy.video_green_time(count, slope, tod, emergency);
                        if (g < 15 || g > 65) in_range = false;
                    }
                }
            }
        }
        check(in_range, "video green time always within [15, 65]");
    }

    void test_image_path() {
        const tp::SignalPolicy policy;
        check(policy.image_green_time(0, false) == 10, "no vehicles -> minimum 10");
        check(policy.image_green_time(5, false) == 20, "10 + 2 * 5");
        check(policy.image_green_time(5, true) == 30, "emergency on image adds 10");
        check(policy.image_green_time(40, false) == 65, "image path clamps to 65");
        check(policy.image_green_time(-4, false) == 10, "negative counts treated as 0");
    }

    void test_time_of_day_windows() {
        const tp::SignalPolicy policy;
        check(policy.time_of_day_adjustment(8) == 3, "08:00 is peak");
        check(policy.time_of_day_adjustment(10) == 3, "10:00 is peak");
        check(policy.time_of_day_adjustment(11) == 0, "11:00 is neutral");
        check(policy.time_of_day_adjustment(18) == 3, "18:00 is peak");
        check(policy.time_of_day_adjustment(21) == 3, "21:00 is peak");
        check(policy.time_of_day_adjustment(22) == -3, "22:00 is off-peak");
        check(policy.time_of_day_adjustment(0) == -3, "midnight is off-peak");
        check(policy.time_of_day_adjustment(6) == -3, "06:00 is off-peak");
        check(policy.time_of_day_adjustment(7) == 0, "07:00 is neutral");
        check(policy.time_of_day_adjustment(14) == 0, "afternoon is neutral");
        check(policy.time_of_day_adjustment(30) == 0, "invalid hour is neutral");
    }

    void test_custom_windows() {
        tp::PolicyConfig cfg;
        cfg.peak_hours = {{7, 9}};
        cfg.off_peak_hours = {};
        cfg.peak_adjustment = 5;
        const tp::SignalPolicy policy(cfg);
        check(policy.time_of_day_adjustment(7) == 5, "configured peak window applies");
        check(policy.time_of_day_adjustment(23) == 0, "no off-peak windows configured");
    }

    void test_decide() {
        const tp::SignalPolicy policy;
        const auto d = policy.decide("north", 10, 1.5, 0.0, false, 9);
        check(d.lane == "north", "decision carries the lane");
        check(d.rate == 1.5 && d.vehicle_count == 10, "decision carries its inputs");
        check(d.green_time_seconds == 36, "decision at 09:00 includes the peak adjustment");
    }

    void test_opposing_pairs() {
        std::map<tp::Direction, int> g = {
            {tp::Direction::North, 40},
            {tp::Direction::South, 25},
            {tp::Direction::East, 20},
        };
        tp::apply_opposing_pair_fairness(g);
        check(g[tp::Direction::North] == 40 && g[tp::Direction::South] == 40, "north/south share the max");
        check(g[tp::Direction::East] == 20, "lone east keeps its own time");
        check(g.count(tp::Direction::West) == 0, "absent direction not invented");

        std::map<tp::Direction, int> h = {
            {tp::Direction::East, 20},
            {tp::Direction::West, 30},
            {tp::Direction::North, 15},
        };
        tp::apply_opposing_pair_fairness(h);
        check(h[tp::Direction::East] == 30 && h[tp::Direction::West] == 30, "east/west share the max");
        check(h[tp::Direction::North] == 15, "pairs are independent");
    }

    void test_directions() {
        using tp::Direction;
        check(tp::direction_from_string("north") == Direction::North, "north");
        check(tp::direction_from_string("SOUTH") == Direction::South, "case-insensitive");
        check(tp::direction_from_string("lane1") == Direction::North, "lane1 is north");
        check(tp::direction_from_string("lane2") == Direction::West, "lane2 is west");
        check(tp::direction_from_string("lane3") == Direction::East, "lane3 is east");
        check(tp::direction_from_string("lane4") == Direction::South, "lane4 is south");
        check(!tp::direction_from_string("up").has_value(), "unknown key rejected");
        check(tp::opposite_of(Direction::East) == Direction::West, "east opposes west");

        const auto& order = tp::report_order();
        check(order[0] == Direction::North && order[1] == Direction::West &&
              order[2] == Direction::East && order[3] == Direction::South,
              "results reported north, west, east, south");
        check(std::string(tp::to_string(Direction::West)) == "west", "direction names");
    }
}

int main() {
    test_video_baseline();
    test_video_clamped();
    test_image_path();
    test_time_of_day_windows();
    test_custom_windows();
    test_decide();
    test_opposing_pairs();
    test_directions();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all policy tests passed\n";
    return 0;
}

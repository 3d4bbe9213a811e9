#include <aggregation/rate_aggregator.hpp>
#include <aggregation/trend_estimator.hpp>

#include <cmath>
#include <deque>
#include <iostream>
#include <string>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    bool near(double a, double b, double eps = 1e-9) {
        return std::fabs(a - b) <= eps;
    }

    tp::RateAggregatorOptions options(size_t capacity = 600) {
        tp::RateAggregatorOptions opt;
        opt.alpha = 0.3;
        opt.bucket_seconds = 1.0;
        opt.capacity = capacity;
        return opt;
    }

    void test_no_rate_before_first_close() {
        auto agg = tp::RateAggregator::live(options());
        check(!agg.observe(3, 10.1), "first frame never closes a bucket");
        check(!agg.observe(3, 10.6), "same bucket does not close");
        check(!agg.has_rate(), "no rate before a bucket closes");
        check(agg.smoothed_rate() == 0.0, "smoothed rate reads 0 before the first sample");
        check(agg.series().empty(), "series empty before the first close");
        check(agg.open_bucket().frame_count == 2, "both frames land in the open bucket");
        check(agg.open_bucket().sum_detections == 6, "open bucket sums detections");
    }

    void test_live_rate_uses_observed_frequency() {
        auto agg = tp::RateAggregator::live(options());
        agg.observe(2, 0.0);
        agg.observe(4, 0.5);
        check(agg.observe(0, 1.0), "crossing into bucket 1 closes bucket 0");

        // avg 3 per frame, 2 frames over 1 s
        check(agg.has_rate(), "rate available after first close");
        check(near(agg.last_instantaneous_rate(), 6.0), "instantaneous rate 3 * 2 Hz");
        check(near(agg.smoothed_rate(), 6.0), "EMA seeded with the first rate");
        check(agg.series().size() == 1 && agg.series().samples().back().bucket_index == 0,
              "first sample tagged with the closed bucket index");
        check(agg.open_bucket().index == 1 && agg.open_bucket().frame_count == 1,
              "closing frame opens the next bucket");

        agg.observe(2, 1.5);
        check(agg.observe(0, 2.0), "crossing into bucket 2 closes bucket 1");
        // bucket 1: frames 0 and 2 over 1 s -> 1 per frame at 2 Hz
        check(near(agg.last_instantaneous_rate(), 2.0), "second instantaneous rate");
        check(near(agg.smoothed_rate(), 0.3 * 2.0 + 0.7 * 6.0), "EMA recurrence with alpha 0.3");
        check(agg.closed_buckets() == 2, "two buckets closed");
    }

    void test_offline_rate_uses_fixed_frequency() {
        // 30 fps video sampled every 6th frame -> 5 Hz
        auto agg = tp::RateAggregator::offline(30.0, 6, options(0));
        check(near(agg.sampling_frequency_hint(), 5.0), "offline sampling frequency is fps / stride");

        for (int frame = 0; frame <= 60; frame += 6) {
            agg.observe(2, static_cast<double>(frame) / 30.0);
        }
        check(agg.closed_buckets() == 2, "two whole seconds of video close two buckets");
        check(near(agg.smoothed_rate(), 10.0), "2 per frame at 5 Hz");
        check(near(agg.series().samples().front().smoothed_rate, 10.0), "first sample equals its rate");
    }

    void test_gap_skips_bucket_indices() {
        auto agg = tp::RateAggregator::offline(10.0, 1, options(0));
        agg.observe(1, 0.0);
        agg.observe(1, 5.0);
        check(agg.series().size() == 1, "only the bucket with frames produces a sample");
        check(agg.open_bucket().index == 5, "open bucket jumps to the new index");
    }

    void test_backward_time_feeds_open_bucket() {
        auto agg = tp::RateAggregator::live(options());
        agg.observe(1, 5.2);
        check(!agg.observe(1, 3.9), "a clock stepping back never closes");
        check(agg.open_bucket().index == 5 && agg.open_bucket().frame_count == 2,
              "earlier time stays in the open bucket");
    }

    void test_capacity_drops_oldest() {
        auto agg = tp::RateAggregator::live(options(3));
        for (int t = 0; t <= 5; ++t) agg.observe(1, static_cast<double>(t));

        check(agg.closed_buckets() == 5, "five buckets closed");
        check(agg.series().size() == 3, "series bounded by capacity");
        check(agg.series().samples().front().bucket_index == 2, "oldest samples evicted first");
    }

    void test_series_rejects_non_increasing_index() {
        tp::RateSeries s;
        check(s.append({4, 1.0}), "first sample accepted");
        check(!s.append({4, 2.0}), "repeated index rejected");
        check(!s.append({3, 2.0}), "older index rejected");
        check(s.append({7, 2.0}), "newer index accepted");
        check(s.size() == 2, "only accepted samples kept");
    }

    std::deque<tp::RateSample> linear(int64_t first_index, int n, double slope, double intercept) {
        std::deque<tp::RateSample> out;
        for (int i = 0; i < n; ++i) {
            out.push_back({first_index + i, intercept + slope * static_cast<double>(i)});
        }
        return out;
    }

    void test_slope_degenerate_inputs() {
        std::deque<tp::RateSample> samples;
        check(tp::least_squares_slope(samples, 12) == 0.0, "no samples -> 0");
        samples.push_back({3, 4.0});
        check(tp::least_squares_slope(samples, 12) == 0.0, "one sample -> 0");
        samples.push_back({9, 8.0});
        check(tp::least_squares_slope(samples, 2) == 0.0, "one sample inside the window -> 0");
    }

    void test_slope_of_line() {
        check(near(tp::least_squares_slope(linear(0, 6, 2.0, 1.0), 12), 2.0), "rising line");
        check(near(tp::least_squares_slope(linear(0, 6, -0.5, 9.0), 12), -0.5), "falling line");
        check(near(tp::least_squares_slope(linear(0, 6, 0.0, 3.0), 12), 0.0), "flat line");
    }

    void test_slope_shift_invariant() {
        const double a = tp::least_squares_slope(linear(0, 8, 1.25, 0.0), 12);
        const double b = tp::least_squares_slope(linear(1000000, 8, 1.25, 0.0), 12);
        check(near(a, b, 1e-9), "slope independent of absolute bucket index");
    }

    void test_slope_window_limits_history() {
        std::deque<tp::RateSample> samples;
        for (int64_t i = 0; i < 10; ++i) {
            samples.push_back({i, i < 7 ? static_cast<double>(i) : 100.0});
        }
        check(near(tp::least_squares_slope(samples, 2), 0.0), "window of 2 sees only the flat tail");
        check(tp::least_squares_slope(samples, 20) > 0.0, "wide window sees the rise");

        const tp::TrendEstimator trend(2);
        tp::RateSeries series;
        for (const auto& s : samples) series.append(s);
        check(near(trend.slope(series), 0.0), "estimator applies its window");
    }
}

int main() {
    test_no_rate_before_first_close();
    test_live_rate_uses_observed_frequency();
    test_offline_rate_uses_fixed_frequency();
    test_gap_skips_bucket_indices();
    test_backward_time_feeds_open_bucket();
    test_capacity_drops_oldest();
    test_series_rejects_non_increasing_index();
    test_slope_degenerate_inputs();
    test_slope_of_line();
    test_slope_shift_invariant();
    test_slope_window_limits_history();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all aggregation tests passed\n";
    return 0;
}

#pragma once

#include <cstdint>
#include <deque>

#include <aggregation/rate_aggregator.hpp>

namespace tp {
    // Ordinary least-squares slope of smoothed rate over bucket index, using the
    // samples whose index is within `window` of the newest one. Returns 0 for
    // fewer than two samples or a negligible index variance.
    double least_squares_slope(const std::deque<RateSample>& samples, int64_t window);

    class TrendEstimator {
    public:
        explicit TrendEstimator(int64_t window_buckets) : window_(window_buckets) {}

        double slope(const RateSeries& series) const {
            return least_squares_slope(series.samples(), window_);
        }

        int64_t window() const { return window_; }

    private:
        int64_t window_;
    };
}

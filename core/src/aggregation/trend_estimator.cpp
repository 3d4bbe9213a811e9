#include <aggregation/trend_estimator.hpp>

#include <iterator>

namespace tp {
    double least_squares_slope(const std::deque<RateSample>& samples, int64_t window) {
        if (samples.size() < 2) return 0.0;

        const int64_t newest = samples.back().bucket_index;
        const int64_t window_start = newest - window;

        // samples are index-ordered, so the window is a suffix
        auto first = samples.end();
        while (first != samples.begin() && std::prev(first)->bucket_index >= window_start) --first;

        const auto n = std::distance(first, samples.end());
        if (n < 2) return 0.0;

        // x measured from the newest index; the slope does not depend on the origin
        double x_mean = 0.0;
        double y_mean = 0.0;
        for (auto it = first; it != samples.end(); ++it) {
            x_mean += static_cast<double>(it->bucket_index - newest);
            y_mean += it->smoothed_rate;
        }
        x_mean /= static_cast<double>(n);
        y_mean /= static_cast<double>(n);

        double var_x = 0.0;
        double cov_xy = 0.0;
        for (auto it = first; it != samples.end(); ++it) {
            const double dx = static_cast<double>(it->bucket_index - newest) - x_mean;
            var_x += dx * dx;
            cov_xy += dx * (it->smoothed_rate - y_mean);
        }

        if (var_x <= 1e-9) return 0.0;
        return cov_xy / var_x;
    }
}

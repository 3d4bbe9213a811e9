#include <aggregation/rate_aggregator.hpp>

#include <algorithm>
#include <cmath>

namespace tp {
    bool RateSeries::append(const RateSample& s) {
        if (!samples_.empty() && s.bucket_index <= samples_.back().bucket_index) return false;
        samples_.push_back(s);
        if (cap_ > 0) {
            while (samples_.size() > cap_) samples_.pop_front();
        }
        return true;
    }

    RateAggregator RateAggregator::live(const RateAggregatorOptions& opt) {
        return RateAggregator(FrequencyMode::Observed, 0.0, opt);
    }

    RateAggregator RateAggregator::offline(double video_fps, int stride, const RateAggregatorOptions& opt) {
        const double fps = video_fps > 0.0 ? video_fps : 1.0;
        return RateAggregator(FrequencyMode::Fixed, fps / static_cast<double>(std::max(1, stride)), opt);
    }

    RateAggregator::RateAggregator(FrequencyMode mode, double fixed_hz, const RateAggregatorOptions& opt)
        : mode_(mode),
          fixed_hz_(fixed_hz),
          alpha_(std::clamp(opt.alpha, 1e-6, 1.0)),
          bucket_seconds_(opt.bucket_seconds > 0.0 ? opt.bucket_seconds : 1.0),
          series_(opt.capacity) {}

    int64_t RateAggregator::bucket_index_for(double time_s) const {
        return static_cast<int64_t>(std::floor(time_s / bucket_seconds_));
    }

    bool RateAggregator::observe(int64_t frame_detection_count, double time_s) {
        const int64_t idx = bucket_index_for(time_s);
        const int64_t count = std::max<int64_t>(0, frame_detection_count);

        if (!bucket_open_) {
            bucket_ = Bucket{};
            bucket_.index = idx;
            bucket_.opened_at = time_s;
            bucket_open_ = true;
        }

        bool closed = false;
        // a clock stepping backwards keeps feeding the open bucket
        if (idx > bucket_.index) {
            close_(time_s);
            bucket_ = Bucket{};
            bucket_.index = idx;
            bucket_.opened_at = time_s;
            closed = true;
        }

        bucket_.sum_detections += count;
        bucket_.frame_count += 1;
        return closed;
    }

    void RateAggregator::close_(double now) {
        double hz = fixed_hz_;
        if (mode_ == FrequencyMode::Observed) {
            const double elapsed = std::max(1e-6, now - bucket_.opened_at);
            hz = static_cast<double>(bucket_.frame_count) / elapsed;
        }

        const double rate = bucket_.avg_per_frame() * hz;
        last_rate_ = rate;

        if (!has_ema_) {
            ema_ = rate;
            has_ema_ = true;
        } else {
            ema_ = alpha_ * rate + (1.0 - alpha_) * ema_;
        }

        series_.append(RateSample{bucket_.index, ema_});
        ++closed_;
    }
}

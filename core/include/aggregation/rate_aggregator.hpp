#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace tp {
    struct RateSample {
        int64_t bucket_index = 0;
        double smoothed_rate = 0.0;
    };

    // Time-ordered rate samples with strictly increasing bucket index.
    // A capacity of 0 keeps every sample; otherwise the oldest is dropped.
    class RateSeries {
    public:
        explicit RateSeries(size_t capacity = 0) : cap_(capacity) {}

        // Rejects samples that do not advance the bucket index.
        bool append(const RateSample& s);

        const std::deque<RateSample>& samples() const { return samples_; }
        size_t size() const { return samples_.size(); }
        bool empty() const { return samples_.empty(); }
        size_t capacity() const { return cap_; }

    private:
        size_t cap_;
        std::deque<RateSample> samples_;
    };

    // Frames accumulated since the previous bucket closed.
    struct Bucket {
        int64_t index = 0;
        int64_t sum_detections = 0;
        int64_t frame_count = 0;
        double opened_at = 0.0; // time coordinate of the first frame after the last close

        double avg_per_frame() const {
            return static_cast<double>(sum_detections) /
                   static_cast<double>(frame_count > 0 ? frame_count : 1);
        }
    };

    struct RateAggregatorOptions {
        double alpha = 0.3;
        double bucket_seconds = 1.0;
        size_t capacity = 600;
    };

    // Buckets per-frame detection counts by time, turns each closed bucket into
    // a vehicles-per-second rate and smooths it with an EMA.
    class RateAggregator {
    public:
        // Sampling frequency measured from frames per elapsed time in each bucket.
        static RateAggregator live(const RateAggregatorOptions& opt);

        // Sampling frequency fixed at video_fps / stride.
        static RateAggregator offline(double video_fps, int stride, const RateAggregatorOptions& opt);

        // Adds one processed frame at time coordinate time_s (seconds).
        // Returns true when this call closed the previous bucket.
        bool observe(int64_t frame_detection_count, double time_s);

        int64_t bucket_index_for(double time_s) const;

        bool has_rate() const { return has_ema_; }
        double smoothed_rate() const { return has_ema_ ? ema_ : 0.0; }
        double last_instantaneous_rate() const { return last_rate_; }

        const RateSeries& series() const { return series_; }
        const Bucket& open_bucket() const { return bucket_; }
        bool bucket_open() const { return bucket_open_; }

        // Buckets closed over the aggregator's lifetime, including evicted ones.
        int64_t closed_buckets() const { return closed_; }

        double sampling_frequency_hint() const { return fixed_hz_; }

    private:
        enum class FrequencyMode {
            Observed,
            Fixed
        };

        RateAggregator(FrequencyMode mode, double fixed_hz, const RateAggregatorOptions& opt);

        void close_(double now);

        FrequencyMode mode_;
        double fixed_hz_;
        double alpha_;
        double bucket_seconds_;

        Bucket bucket_;
        bool bucket_open_ = false;

        bool has_ema_ = false;
        double ema_ = 0.0;
        double last_rate_ = 0.0;
        int64_t closed_ = 0;

        RateSeries series_;
    };
}

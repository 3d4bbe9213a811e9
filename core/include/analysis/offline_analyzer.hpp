#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <annotation/annotator.hpp>
#include <common/config.hpp>
#include <encode/video_converter.hpp>
#include <inference/detector.hpp>
#include <ingest/video_reader.hpp>
#include <policy/signal_policy.hpp>

namespace tp {
    struct LaneAnalysis {
        std::string lane;
        double smoothed_rate = 0.0;    // vehicles per second (EMA)
        double slope = 0.0;            // change of smoothed rate per bucket
        int64_t vehicle_count = 0;     // unique vehicles seen in the analyzed span
        int64_t peak_frame_count = 0;  // most vehicles in a single processed frame
        bool emergency_detected = false;
        int green_time_seconds = 0;
        size_t data_points = 0;        // closed buckets
        int64_t frames_processed = 0;
        int64_t annotated_frames = 0;
        std::string annotated_video_path;
    };

    struct LaneUpload {
        std::string lane_key; // north|south|east|west|lane1..lane4
        std::string video_path;
        std::string annotated_output_path; // empty: no artifact
    };

    using VideoReaderFactory = std::function<std::unique_ptr<IVideoReader>(const std::string&)>;

    // Replays a finite video through detection, deduplication, bucketing and
    // trend estimation on the video's own timebase, stopping early at the
    // configured deadline.
    class OfflineAnalyzer {
    public:
        OfflineAnalyzer(DetectorBinding vehicles,
                        DetectorBinding emergency,
                        SignalPolicy policy,
                        OfflineConfig cfg,
                        TrackerConfig tracker,
                        std::shared_ptr<IVideoConverter> converter = nullptr,
                        VideoReaderFactory open_reader = open_video_file);

        LaneAnalysis analyze(IVideoReader& reader, const std::string& annotated_output_path) const;

        // Unopenable files yield a zeroed result, not an error.
        LaneAnalysis analyze_file(const std::string& path, const std::string& annotated_output_path) const;

        // Up to four lanes, one per direction. Opposing directions share the
        // longer green time. Results come back north, west, east, south.
        // Throws TrafficError(InputError) for an empty, oversized or ambiguous batch.
        std::vector<LaneAnalysis> analyze_batch(const std::vector<LaneUpload>& lanes) const;

        static int subsample_stride(double video_fps, double target_fps);

    private:
        int hour_() const;
        void finalize_(LaneAnalysis& out) const;

        DetectorBinding vehicles_;
        DetectorBinding emergency_;
        SignalPolicy policy_;
        OfflineConfig cfg_;
        TrackerConfig tracker_cfg_;
        std::shared_ptr<IVideoConverter> converter_;
        VideoReaderFactory open_reader_;
        Annotator annotator_;
    };
}

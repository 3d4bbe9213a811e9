#include <analysis/offline_analyzer.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <utility>

#include <aggregation/rate_aggregator.hpp>
#include <aggregation/trend_estimator.hpp>
#include <common/errors.hpp>
#include <common/resize.hpp>
#include <common/time_util.hpp>
#include <encode/annotated_video_writer.hpp>
#include <tracking/vehicle_deduplicator.hpp>

namespace tp {
    static constexpr size_t kMaxBatchLanes = 4;

    OfflineAnalyzer::OfflineAnalyzer(DetectorBinding vehicles,
                                     DetectorBinding emergency,
                                     SignalPolicy policy,
                                     OfflineConfig cfg,
                                     TrackerConfig tracker,
                                     std::shared_ptr<IVideoConverter> converter,
                                     VideoReaderFactory open_reader)
        : vehicles_(std::move(vehicles)),
          emergency_(std::move(emergency)),
          policy_(std::move(policy)),
          cfg_(std::move(cfg)),
          tracker_cfg_(std::move(tracker)),
          converter_(std::move(converter)),
          open_reader_(std::move(open_reader)) {}

    int OfflineAnalyzer::subsample_stride(double video_fps, double target_fps) {
        const double ratio = video_fps / std::max(1.0, target_fps);
        return std::max(1, static_cast<int>(std::lround(ratio)));
    }

    int OfflineAnalyzer::hour_() const {
        return cfg_.fixed_hour >= 0 ? cfg_.fixed_hour : local_hour_now();
    }

    void OfflineAnalyzer::finalize_(LaneAnalysis& out) const {
        out.green_time_seconds = policy_.video_green_time(out.vehicle_count,
                                                          out.slope,
                                                          policy_.time_of_day_adjustment(hour_()),
                                                          out.emergency_detected);
    }

    LaneAnalysis OfflineAnalyzer::analyze(IVideoReader& reader, const std::string& annotated_output_path) const {
        LaneAnalysis out;
        if (!reader.is_open()) {
            std::cerr << "[Offline](analyze) video could not be opened\n";
            finalize_(out);
            return out;
        }

        double video_fps = reader.fps();
        if (!(video_fps > 1e-3)) video_fps = std::max(1.0, cfg_.target_fps);
        const int stride = subsample_stride(video_fps, cfg_.target_fps);

        RateAggregatorOptions ropt;
        ropt.alpha = cfg_.ema_alpha;
        ropt.bucket_seconds = cfg_.bucket_seconds;
        ropt.capacity = 0;
        RateAggregator aggregator = RateAggregator::offline(video_fps, stride, ropt);
        VehicleDeduplicator dedup(tracker_cfg_);
        const TrendEstimator trend(cfg_.slope_window);

        std::unique_ptr<AnnotatedVideoWriter> writer;
        if (cfg_.annotate && !annotated_output_path.empty()) {
            writer = std::make_unique<AnnotatedVideoWriter>(annotated_output_path, video_fps);
        }

        const auto started = std::chrono::steady_clock::now();
        int64_t frame_index = 0;
        cv::Mat frame;

        while (true) {
            if (cfg_.max_buckets > 0 && aggregator.closed_buckets() >= cfg_.max_buckets) break;
            if (cfg_.max_wall_ms > 0) {
                const auto spent = std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - started).count();
                if (spent >= cfg_.max_wall_ms) break;
            }

            if (!reader.read(frame) || frame.empty()) break;
            frame = limit_longest_side(frame, cfg_.max_side);

            const double t = static_cast<double>(frame_index) / video_fps;

            const DetectionSet vehicles = vehicles_.run(frame);
            const auto count = static_cast<int64_t>(count_in_classes(vehicles, vehicles_.classes));
            out.peak_frame_count = std::max(out.peak_frame_count, count);

            dedup.observe(vehicles, aggregator.bucket_index_for(t));
            aggregator.observe(count, t);
            ++out.frames_processed;

            DetectionSet emergency = std::vector<UntrackedDetection>{};
            if (emergency_.enabled()) {
                emergency = emergency_.run(frame);
                if (count_in_classes(emergency, emergency_.classes) > 0) out.emergency_detected = true;
            }

            if (writer) {
                cv::Mat annotated = frame.clone();
                annotator_.draw_vehicles(annotated, vehicles);
                annotator_.draw_emergency(annotated, emergency);
                writer->write(annotated);
            }

            ++frame_index;
            // skipped frames still advance the timebase
            bool more = true;
            for (int i = 1; i < stride; ++i) {
                if (!reader.grab()) {
                    more = false;
                    break;
                }
                ++frame_index;
            }
            if (!more) break;
        }

        out.smoothed_rate = aggregator.smoothed_rate();
        out.slope = trend.slope(aggregator.series());
        out.vehicle_count = dedup.unique_count();
        out.data_points = aggregator.series().size();

        if (writer) {
            out.annotated_frames = writer->frames_written();
            out.annotated_video_path = writer->finish(converter_.get());
        }

        finalize_(out);
        return out;
    }

    LaneAnalysis OfflineAnalyzer::analyze_file(const std::string& path, const std::string& annotated_output_path) const {
        std::unique_ptr<IVideoReader> reader;
        try {
            reader = open_reader_(path);
        } catch (const std::exception& e) {
            std::cerr << "[Offline](analyze_file) cannot open " << path << ": " << e.what() << "\n";
        }
        if (!reader) {
            LaneAnalysis out;
            finalize_(out);
            return out;
        }
        return analyze(*reader, annotated_output_path);
    }

    std::vector<LaneAnalysis> OfflineAnalyzer::analyze_batch(const std::vector<LaneUpload>& lanes) const {
        if (lanes.empty()) {
            throw TrafficError(ErrorKind::InputError, "no lane videos supplied");
        }
        if (lanes.size() > kMaxBatchLanes) {
            throw TrafficError(ErrorKind::InputError,
                               "at most " + std::to_string(kMaxBatchLanes) + " lane videos are accepted");
        }

        std::map<Direction, const LaneUpload*> by_direction;
        for (const auto& lane : lanes) {
            const auto dir = direction_from_string(lane.lane_key);
            if (!dir) {
                throw TrafficError(ErrorKind::InputError, "unknown lane '" + lane.lane_key + "'");
            }
            if (lane.video_path.empty()) {
                throw TrafficError(ErrorKind::InputError, "lane '" + lane.lane_key + "' has no video");
            }
            if (!by_direction.emplace(*dir, &lane).second) {
                throw TrafficError(ErrorKind::InputError,
                                   std::string("direction '") + to_string(*dir) + "' given twice");
            }
        }

        std::map<Direction, LaneAnalysis> results;
        std::map<Direction, int> green_times;
        for (const auto& kv : by_direction) {
            LaneAnalysis r = analyze_file(kv.second->video_path, kv.second->annotated_output_path);
            r.lane = to_string(kv.first);
            green_times[kv.first] = r.green_time_seconds;
            results.emplace(kv.first, std::move(r));
        }

        apply_opposing_pair_fairness(green_times);

        std::vector<LaneAnalysis> out;
        out.reserve(results.size());
        for (Direction d : report_order()) {
            auto it = results.find(d);
            if (it == results.end()) continue;
            it->second.green_time_seconds = green_times[d];
            out.push_back(std::move(it->second));
        }
        return out;
    }
}

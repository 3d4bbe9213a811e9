#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <opencv2/core.hpp>

#include <inference/detector.hpp>
#include <ingest/frame_source.hpp>
#include <ingest/video_reader.hpp>

namespace tp_test {
    // One vehicle per `rows_per_vehicle` frame rows, laid out as disjoint boxes
    // so every frame of the same size yields the same set.
    class RowsDetector final : public tp::IDetector {
    public:
        explicit RowsDetector(int rows_per_vehicle, int class_id = 2)
            : rows_per_vehicle_(rows_per_vehicle), class_id_(class_id) {}

        tp::DetectionMode mode() const override { return tp::DetectionMode::Untracked; }

        tp::DetectionSet detect(const cv::Mat& bgr,
                                const tp::ClassFilter& classes,
                                float) const override {
            calls.fetch_add(1);
            std::vector<tp::UntrackedDetection> out;
            if (!classes.empty() && classes.count(class_id_) == 0) return out;

            const int n = rows_per_vehicle_ > 0 ? bgr.rows / rows_per_vehicle_ : 0;
            for (int i = 0; i < n; ++i) {
                tp::UntrackedDetection d;
                d.class_id = class_id_;
                d.confidence = 0.9f;
                d.box = tp::Box{static_cast<float>(i * 20), 0.0f, static_cast<float>(i * 20 + 10), 10.0f};
                out.push_back(d);
            }
            return out;
        }

        mutable std::atomic<int> calls{0};

    private:
        int rows_per_vehicle_;
        int class_id_;
    };

    inline tp::DetectorBinding bind(std::shared_ptr<const tp::IDetector> det, std::vector<int> classes) {
        tp::DetectorBinding b;
        b.detector = std::move(det);
        b.classes = tp::make_class_filter(classes);
        b.confidence = 0.3f;
        return b;
    }

    // Finite in-memory video of identical frames.
    class FakeVideoReader final : public tp::IVideoReader {
    public:
        FakeVideoReader(double fps, int total_frames, int rows, bool open = true)
            : fps_(fps), total_(total_frames), rows_(rows), open_(open) {}

        bool is_open() const override { return open_; }
        double fps() const override { return fps_; }

        bool read(cv::Mat& out) override {
            if (!open_ || pos_ >= total_) return false;
            ++pos_;
            ++decoded;
            out = cv::Mat(rows_, 64, CV_8UC3, cv::Scalar(40, 80, 120));
            return true;
        }

        bool grab() override {
            if (!open_ || pos_ >= total_) return false;
            ++pos_;
            return true;
        }

        int decoded = 0;

    private:
        double fps_;
        int total_;
        int rows_;
        bool open_;
        int pos_ = 0;
    };

    // Live source delivering a fixed frame every `interval_ms`. With
    // `frames_until_end` >= 0 it reports EOS after that many frames.
    class FakeFrameSource final : public tp::IFrameSource {
    public:
        FakeFrameSource(bool start_ok, int rows, int interval_ms, int frames_until_end = -1)
            : start_ok_(start_ok), rows_(rows), interval_ms_(interval_ms), frames_until_end_(frames_until_end) {}

        bool start() override {
            ++start_calls;
            return start_ok_;
        }
        void stop() override { stopped = true; }

        bool read(tp::FramePacket& out, int timeout_ms) override {
            if (ended()) return false;
            if (rows_ <= 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(timeout_ms));
                return false;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(interval_ms_));
            out.bgr = cv::Mat(rows_, 64, CV_8UC3, cv::Scalar(0, 0, 0));
            out.frame_id = delivered++;
            return true;
        }

        bool ended() const override {
            return frames_until_end_ >= 0 && delivered >= frames_until_end_;
        }

        const std::string& id() const override { return id_; }

        std::atomic<int> start_calls{0};
        std::atomic<bool> stopped{false};
        std::atomic<int64_t> delivered{0};

    private:
        bool start_ok_;
        int rows_;
        int interval_ms_;
        int frames_until_end_;
        std::string id_ = "fake";
    };
}

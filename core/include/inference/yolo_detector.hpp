#pragma once

#include <memory>

#include <opencv2/core.hpp>

#include <common/config.hpp>
#include <inference/detector.hpp>

namespace tp {
    // YOLOv8 exported to ncnn: one output blob of shape [4 + num_classes, anchors].
    class YoloDetector final : public IDetector {
    public:
        explicit YoloDetector(DetectorConfig cfg);
        ~YoloDetector() override;

        YoloDetector(const YoloDetector&) = delete;
        YoloDetector& operator=(const YoloDetector&) = delete;

        DetectionMode mode() const override { return DetectionMode::Untracked; }

        DetectionSet detect(const cv::Mat& bgr,
                            const ClassFilter& classes,
                            float confidence_threshold) const override;

    private:
        DetectorConfig cfg_;
        class Impl;
        std::unique_ptr<Impl> impl_;
    };
}

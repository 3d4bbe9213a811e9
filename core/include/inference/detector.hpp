#pragma once

#include <memory>

#include <opencv2/core.hpp>

#include <pipeline/types.hpp>

namespace tp {
    // Object detection capability. Implementations are loaded once and shared
    // read-only by every request and session, so detect() must be safe to call
    // concurrently.
    class IDetector {
    public:
        virtual ~IDetector() = default;

        virtual DetectionMode mode() const = 0;

        virtual DetectionSet detect(const cv::Mat& bgr,
                                    const ClassFilter& classes,
                                    float confidence_threshold) const = 0;
    };

    using DetectorHandle = std::shared_ptr<const IDetector>;

    // A shared detector plus what to ask it for. An empty handle disables it.
    struct DetectorBinding {
        DetectorHandle detector;
        ClassFilter classes;
        float confidence = 0.3f;

        bool enabled() const { return detector != nullptr; }

        DetectionSet run(const cv::Mat& bgr) const {
            if (!detector) return std::vector<UntrackedDetection>{};
            return detector->detect(bgr, classes, confidence);
        }
    };
}

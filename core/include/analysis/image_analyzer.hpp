#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

#include <annotation/annotator.hpp>
#include <inference/detector.hpp>
#include <policy/signal_policy.hpp>

namespace tp {
    struct ImageAnalysis {
        int64_t vehicle_count = 0;
        bool emergency_detected = false;
        int green_time_seconds = 0;
        std::string annotated_image_path; // empty when nothing was written
    };

    // Single still image: count vehicles, look for emergency vehicles and
    // derive a green time without any trend signal.
    class ImageAnalyzer {
    public:
        ImageAnalyzer(DetectorBinding vehicles,
                      DetectorBinding emergency,
                      SignalPolicy policy,
                      Annotator annotator = Annotator{});

        // Throws TrafficError(InputError) for an empty image.
        ImageAnalysis analyze(const cv::Mat& image, const std::string& annotated_output_path) const;

    private:
        DetectorBinding vehicles_;
        DetectorBinding emergency_;
        SignalPolicy policy_;
        Annotator annotator_;
    };
}

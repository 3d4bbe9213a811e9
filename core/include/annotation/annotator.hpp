#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

#include <pipeline/types.hpp>

namespace tp {
    struct AnnotatorConfig {
        std::unordered_map<int, std::string> labels = {
            {2, "car"}, {3, "motorcycle"}, {5, "bus"}, {7, "truck"},
            {80, "ambulance"}, {81, "fire truck"},
        };
        int thickness = 2;
        double font_scale = 0.6;
    };

    // Draws detection boxes and labels onto frames for the result artifacts.
    class Annotator {
    public:
        explicit Annotator(AnnotatorConfig cfg = {});

        // Vehicle boxes: thin green outline with a plain label.
        void draw_vehicles(cv::Mat& frame, const DetectionSet& detections) const;

        // Emergency boxes: red outline with a filled label banner.
        void draw_emergency(cv::Mat& frame, const DetectionSet& detections) const;

        std::string label_for(int class_id, float confidence) const;

    private:
        cv::Rect to_rect_(const Box& b, int frame_w, int frame_h) const;
        void draw_box_(cv::Mat& frame, const LabeledBox& b, const cv::Scalar& color, bool banner) const;

        AnnotatorConfig cfg_;
    };
}

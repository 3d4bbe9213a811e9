#include <annotation/annotator.hpp>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <utility>

#include <opencv2/imgproc.hpp>

namespace tp {
    namespace {
        const cv::Scalar kVehicleColor(0, 200, 0);
        const cv::Scalar kEmergencyColor(0, 0, 255);
        const cv::Scalar kTextColor(255, 255, 255);
    } // namespace

    Annotator::Annotator(AnnotatorConfig cfg)
        : cfg_(std::move(cfg)) {
        cfg_.thickness = std::max(1, cfg_.thickness);
        if (cfg_.font_scale <= 0.0) cfg_.font_scale = 0.6;
    }

    std::string Annotator::label_for(int class_id, float confidence) const {
        auto it = cfg_.labels.find(class_id);
        const std::string name = it != cfg_.labels.end() ? it->second : "cls" + std::to_string(class_id);

        char buf[16];
        std::snprintf(buf, sizeof(buf), " %.2f", static_cast<double>(confidence));
        return name + buf;
    }

    void Annotator::draw_vehicles(cv::Mat& frame, const DetectionSet& detections) const {
        if (frame.empty()) return;
        for (const auto& b : labeled_boxes(detections)) draw_box_(frame, b, kVehicleColor, false);
    }

    void Annotator::draw_emergency(cv::Mat& frame, const DetectionSet& detections) const {
        if (frame.empty()) return;
        for (const auto& b : labeled_boxes(detections)) draw_box_(frame, b, kEmergencyColor, true);
    }

    cv::Rect Annotator::to_rect_(const Box& b, int frame_w, int frame_h) const {
        const int x = static_cast<int>(std::lround(b.x1));
        const int y = static_cast<int>(std::lround(b.y1));
        const int w = static_cast<int>(std::lround(b.x2 - b.x1));
        const int h = static_cast<int>(std::lround(b.y2 - b.y1));

        cv::Rect r(x, y, w, h);
        r &= cv::Rect(0, 0, frame_w, frame_h);
        return r;
    }

    void Annotator::draw_box_(cv::Mat& frame, const LabeledBox& b, const cv::Scalar& color, bool banner) const {
        const cv::Rect r = to_rect_(b.box, frame.cols, frame.rows);
        if (r.width < 2 || r.height < 2) return;

        cv::rectangle(frame, r, color, cfg_.thickness);

        const std::string text = label_for(b.class_id, b.confidence);
        int baseline = 0;
        const cv::Size ts = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, cfg_.font_scale, 2, &baseline);
        const int text_y = std::max(ts.height + baseline, r.y);

        if (banner) {
            const cv::Rect bg(r.x, text_y - ts.height - baseline - 3, ts.width, ts.height + baseline + 3);
            cv::rectangle(frame, bg & cv::Rect(0, 0, frame.cols, frame.rows), color, cv::FILLED);
            cv::putText(frame, text, {r.x, text_y - baseline - 2},
                        cv::FONT_HERSHEY_SIMPLEX, cfg_.font_scale, kTextColor, 2);
        } else {
            cv::putText(frame, text, {r.x, text_y - baseline - 2},
                        cv::FONT_HERSHEY_SIMPLEX, cfg_.font_scale, color, 2);
        }
    }
}

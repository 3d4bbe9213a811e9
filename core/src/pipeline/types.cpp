#include <pipeline/types.hpp>

#include <algorithm>

namespace tp {
    float area_of(const Box& b) {
        return std::max(0.0f, b.x2 - b.x1) * std::max(0.0f, b.y2 - b.y1);
    }

    float iou_of(const Box& a, const Box& b) {
        const float xx1 = std::max(a.x1, b.x1);
        const float yy1 = std::max(a.y1, b.y1);
        const float xx2 = std::min(a.x2, b.x2);
        const float yy2 = std::min(a.y2, b.y2);

        const float iw = std::max(0.0f, xx2 - xx1);
        const float ih = std::max(0.0f, yy2 - yy1);
        const float inter = iw * ih;
        if (inter <= 0.0f) return 0.0f;

        const float uni = area_of(a) + area_of(b) - inter;
        if (uni <= 0.0f) return 0.0f;
        return inter / uni;
    }

    ClassFilter make_class_filter(const std::vector<int>& ids) {
        return ClassFilter(ids.begin(), ids.end());
    }

    size_t detection_count(const DetectionSet& set) {
        return std::visit([](const auto& dets) { return dets.size(); }, set);
    }

    size_t count_in_classes(const DetectionSet& set, const ClassFilter& classes) {
        return std::visit([&classes](const auto& dets) {
            if (classes.empty()) return dets.size();
            return static_cast<size_t>(std::count_if(dets.begin(), dets.end(), [&classes](const auto& d) {
                return classes.count(d.class_id) > 0;
            }));
        }, set);
    }

    std::vector<LabeledBox> labeled_boxes(const DetectionSet& set) {
        return std::visit([](const auto& dets) {
            std::vector<LabeledBox> out;
            out.reserve(dets.size());
            for (const auto& d : dets) {
                out.push_back(LabeledBox{d.box, d.class_id, d.confidence});
            }
            return out;
        }, set);
    }
}

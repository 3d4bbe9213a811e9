#pragma once

#include <cstddef>
#include <cstdint>
#include <unordered_set>
#include <variant>
#include <vector>

namespace tp {
    // Axis-aligned box in frame pixel coordinates.
    struct Box {
        float x1 = 0.0f;
        float y1 = 0.0f;
        float x2 = 0.0f;
        float y2 = 0.0f;
    };

    float area_of(const Box& b);
    float iou_of(const Box& a, const Box& b);

    struct UntrackedDetection {
        int class_id = -1;
        float confidence = 0.0f;
        Box box;
    };

    struct TrackedDetection {
        int class_id = -1;
        float confidence = 0.0f;
        Box box;
        int64_t track_id = -1;
    };

    // One frame worth of detections. An adapter produces either alternative,
    // fixed for its lifetime, never a mix.
    using DetectionSet = std::variant<std::vector<UntrackedDetection>,
                                      std::vector<TrackedDetection>>;

    enum class DetectionMode {
        Untracked,
        Tracked
    };

    using ClassFilter = std::unordered_set<int>;

    ClassFilter make_class_filter(const std::vector<int>& ids);

    size_t detection_count(const DetectionSet& set);

    // Counts detections whose class is in the filter; an empty filter accepts all.
    size_t count_in_classes(const DetectionSet& set, const ClassFilter& classes);

    struct LabeledBox {
        Box box;
        int class_id = -1;
        float confidence = 0.0f;
    };

    std::vector<LabeledBox> labeled_boxes(const DetectionSet& set);
}

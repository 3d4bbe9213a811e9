#include <inference/yolo_detector.hpp>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <ncnn/allocator.h>
#include <ncnn/net.h>

namespace tp {
    namespace {
        std::string resolve_path_or_throw(const std::string& p) {
            namespace fs = std::filesystem;
            if (fs::exists(fs::path(p))) return p;
            const fs::path alt = fs::path("../") / p;
            if (fs::exists(alt)) return alt.string();
            throw std::runtime_error("Model path not found: " + p);
        }

        struct Letterbox {
            float scale = 1.0f;
            int pad_left = 0;
            int pad_top = 0;
        };
    } // namespace

    class YoloDetector::Impl {
    public:
        explicit Impl(const DetectorConfig& cfg) {
            net_.opt.use_vulkan_compute = false;
            net_.opt.num_threads = std::max(1, cfg.ncnn_threads);
            workspace_pool_allocator_.set_size_compare_ratio(0.0f);

            const std::string param = resolve_path_or_throw(cfg.param_path);
            const std::string bin = resolve_path_or_throw(cfg.bin_path);

            if (net_.load_param(param.c_str()) != 0) {
                throw std::runtime_error("Failed to load YOLO param: " + param);
            }
            if (net_.load_model(bin.c_str()) != 0) {
                throw std::runtime_error("Failed to load YOLO weights: " + bin);
            }
        }

        std::vector<UntrackedDetection> detect(const cv::Mat& bgr,
                                               const ClassFilter& classes,
                                               float conf_thresh,
                                               const DetectorConfig& cfg) const {
            if (bgr.empty()) return {};

            Letterbox lb;
            lb.scale = std::min(static_cast<float>(cfg.input_w) / static_cast<float>(bgr.cols),
                                static_cast<float>(cfg.input_h) / static_cast<float>(bgr.rows));
            const int new_w = std::max(1, static_cast<int>(bgr.cols * lb.scale));
            const int new_h = std::max(1, static_cast<int>(bgr.rows * lb.scale));
            const int pad_w = cfg.input_w - new_w;
            const int pad_h = cfg.input_h - new_h;
            lb.pad_left = pad_w / 2;
            lb.pad_top = pad_h / 2;

            ncnn::Mat in = ncnn::Mat::from_pixels_resize(
                bgr.data,
                ncnn::Mat::PIXEL_BGR2RGB,
                bgr.cols,
                bgr.rows,
                new_w,
                new_h);

            ncnn::Mat in_pad;
            ncnn::copy_make_border(in, in_pad,
                                   lb.pad_top, pad_h - lb.pad_top,
                                   lb.pad_left, pad_w - lb.pad_left,
                                   ncnn::BORDER_CONSTANT, 114.0f);
            static const float kNorm[3] = {1.0f / 255.0f, 1.0f / 255.0f, 1.0f / 255.0f};
            in_pad.substract_mean_normalize(nullptr, kNorm);

            ncnn::Extractor ex = net_.create_extractor();
            ex.set_light_mode(true);
            thread_local ncnn::UnlockedPoolAllocator blob_pool_allocator;
            thread_local bool blob_pool_initialized = false;
            if (!blob_pool_initialized) {
                blob_pool_allocator.set_size_compare_ratio(0.0f);
                blob_pool_initialized = true;
            }
            ex.set_blob_allocator(&blob_pool_allocator);
            ex.set_workspace_allocator(&workspace_pool_allocator_);
            if (ex.input(cfg.input_blob.c_str(), in_pad) != 0) {
                return {};
            }

            ncnn::Mat out;
            if (ex.extract(cfg.output_blob.c_str(), out) != 0) return {};
            if (out.h < 4 + cfg.num_classes) return {};

            const int anchors = out.w;
            const float max_x = static_cast<float>(bgr.cols);
            const float max_y = static_cast<float>(bgr.rows);

            std::vector<UntrackedDetection> candidates;
            candidates.reserve(256);

            for (int a = 0; a < anchors; ++a) {
                int best_cls = -1;
                float best_score = 0.0f;
                for (int c = 0; c < cfg.num_classes; ++c) {
                    if (!classes.empty() && classes.count(c) == 0) continue;
                    const float s = out.row(4 + c)[a];
                    if (s > best_score) {
                        best_score = s;
                        best_cls = c;
                    }
                }
                if (best_cls < 0 || best_score < conf_thresh) continue;

                const float cx = out.row(0)[a];
                const float cy = out.row(1)[a];
                const float w = out.row(2)[a];
                const float h = out.row(3)[a];

                UntrackedDetection d;
                d.class_id = best_cls;
                d.confidence = best_score;
                d.box.x1 = std::clamp((cx - w * 0.5f - lb.pad_left) / lb.scale, 0.0f, max_x);
                d.box.y1 = std::clamp((cy - h * 0.5f - lb.pad_top) / lb.scale, 0.0f, max_y);
                d.box.x2 = std::clamp((cx + w * 0.5f - lb.pad_left) / lb.scale, 0.0f, max_x);
                d.box.y2 = std::clamp((cy + h * 0.5f - lb.pad_top) / lb.scale, 0.0f, max_y);
                if (d.box.x2 <= d.box.x1 || d.box.y2 <= d.box.y1) continue;
                candidates.push_back(d);
            }

            std::sort(candidates.begin(),
                      candidates.end(),
                      [](const UntrackedDetection& a, const UntrackedDetection& b) {
                          return a.confidence > b.confidence;
                      });

            // class-aware greedy NMS
            std::vector<UntrackedDetection> kept;
            kept.reserve(candidates.size());
            for (const auto& cand : candidates) {
                bool keep = true;
                for (const auto& k : kept) {
                    if (k.class_id == cand.class_id && iou_of(cand.box, k.box) > cfg.nms_threshold) {
                        keep = false;
                        break;
                    }
                }
                if (keep) kept.push_back(cand);
            }
            return kept;
        }

    private:
        ncnn::Net net_;
        mutable ncnn::PoolAllocator workspace_pool_allocator_;
    };

    YoloDetector::YoloDetector(DetectorConfig cfg)
        : cfg_(std::move(cfg)),
          impl_(std::make_unique<Impl>(cfg_)) {}

    YoloDetector::~YoloDetector() = default;

    DetectionSet YoloDetector::detect(const cv::Mat& bgr,
                                      const ClassFilter& classes,
                                      float confidence_threshold) const {
        return impl_->detect(bgr, classes, confidence_threshold, cfg_);
    }
}

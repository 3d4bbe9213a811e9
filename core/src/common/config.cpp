#include <common/config.hpp>

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace tp {
    static bool get_bool(
        const YAML::Node& n, const char* key, bool def) {
        return (n && n[key]) ? n[key].as<bool>() : def;
    }

    static int get_int(
        const YAML::Node& n, const char* key, int def) {
        return (n && n[key]) ? n[key].as<int>() : def;
    }

    static int64_t get_int64(
        const YAML::Node& n, const char* key, int64_t def) {
        return (n && n[key]) ? n[key].as<int64_t>() : def;
    }

    static double get_double(
        const YAML::Node& n, const char* key, double def) {
        return (n && n[key]) ? n[key].as<double>() : def;
    }

    static std::string get_str(
        const YAML::Node& n, const char* key, const std::string& def) {
        return (n && n[key]) ? n[key].as<std::string>() : def;
    }

    static std::vector<int> get_int_list(
        const YAML::Node& n, const char* key, const std::vector<int>& def) {
        if (!n || !n[key]) return def;
        if (!n[key].IsSequence()) {
            throw std::runtime_error(std::string("[Config] ") + key + " must be a list!");
        }
        return n[key].as<std::vector<int>>();
    }

    static DetectorConfig parse_detector_config(const YAML::Node& d, const DetectorConfig& def) {
        DetectorConfig c = def;
        if (!d) return c;
        c.param_path = get_str(d, "param_path", c.param_path);
        c.bin_path = get_str(d, "bin_path", c.bin_path);
        c.input_blob = get_str(d, "input_blob", c.input_blob);
        c.output_blob = get_str(d, "output_blob", c.output_blob);
        c.input_w = get_int(d, "input_w", c.input_w);
        c.input_h = get_int(d, "input_h", c.input_h);
        c.num_classes = get_int(d, "num_classes", c.num_classes);
        c.score_threshold = static_cast<float>(get_double(d, "score_threshold", c.score_threshold));
        c.nms_threshold = static_cast<float>(get_double(d, "nms_threshold", c.nms_threshold));
        c.ncnn_threads = get_int(d, "ncnn_threads", c.ncnn_threads);
        c.classes = get_int_list(d, "classes", c.classes);

        if (c.input_w <= 0 || c.input_h <= 0) {
            throw std::runtime_error("[Config] detector input size must be positive!");
        }
        if (c.num_classes <= 0) {
            throw std::runtime_error("[Config] detector num_classes must be positive!");
        }
        if (c.classes.empty()) {
            throw std::runtime_error("[Config] detector classes must not be empty!");
        }
        return c;
    }

    static EmergencyConfig parse_emergency_config(const YAML::Node& e) {
        EmergencyConfig c;
        c.detector.param_path = "models/emergency.ncnn.param";
        c.detector.bin_path = "models/emergency.ncnn.bin";
        c.detector.num_classes = 82;
        c.detector.classes = {80, 81}; // ambulance, fire truck
        if (!e) return c;
        c.enabled = get_bool(e, "enabled", true);
        c.detector = parse_detector_config(e, c.detector);
        return c;
    }

    static CaptureConfig parse_capture_config(const YAML::Node& cc) {
        CaptureConfig c;
        if (!cc) return c;
        c.webcam_width = get_int(cc, "webcam_width", c.webcam_width);
        c.webcam_height = get_int(cc, "webcam_height", c.webcam_height);
        c.webcam_fps = get_int(cc, "webcam_fps", c.webcam_fps);
        c.webcam_mjpg = get_bool(cc, "webcam_mjpg", c.webcam_mjpg);
        c.rtsp_latency_ms = get_int(cc, "rtsp_latency_ms", c.rtsp_latency_ms);
        c.rtsp_tcp = get_bool(cc, "rtsp_tcp", c.rtsp_tcp);
        c.read_timeout_ms = get_int(cc, "read_timeout_ms", c.read_timeout_ms);
        return c;
    }

    static void check_alpha(double alpha, const char* section) {
        if (!(alpha > 0.0 && alpha <= 1.0)) {
            throw std::runtime_error(std::string("[Config] ") + section + ".ema_alpha must be in (0, 1]!");
        }
    }

    static StreamConfig parse_stream_config(const YAML::Node& s) {
        StreamConfig c;
        if (!s) return c;
        c.target_fps = get_double(s, "target_fps", c.target_fps);
        c.bucket_seconds = get_double(s, "bucket_seconds", c.bucket_seconds);
        c.ema_alpha = get_double(s, "ema_alpha", c.ema_alpha);
        c.slope_window = get_int64(s, "slope_window", c.slope_window);
        c.capacity = get_int(s, "capacity", c.capacity);
        c.stop_grace_ms = get_int(s, "stop_grace_ms", c.stop_grace_ms);
        c.probe_on_start = get_bool(s, "probe_on_start", c.probe_on_start);
        c.max_side = get_int(s, "max_side", c.max_side);
        c.capture = parse_capture_config(s["capture"]);

        if (c.target_fps <= 0.0) throw std::runtime_error("[Config] stream.target_fps must be > 0!");
        if (c.bucket_seconds <= 0.0) throw std::runtime_error("[Config] stream.bucket_seconds must be > 0!");
        if (c.capacity <= 0) throw std::runtime_error("[Config] stream.capacity must be > 0!");
        if (c.slope_window < 1) throw std::runtime_error("[Config] stream.slope_window must be >= 1!");
        check_alpha(c.ema_alpha, "stream");
        return c;
    }

    static OfflineConfig parse_offline_config(const YAML::Node& o) {
        OfflineConfig c;
        if (!o) return c;
        c.target_fps = get_double(o, "target_fps", c.target_fps);
        c.bucket_seconds = get_double(o, "bucket_seconds", c.bucket_seconds);
        c.ema_alpha = get_double(o, "ema_alpha", c.ema_alpha);
        c.slope_window = get_int64(o, "slope_window", c.slope_window);
        c.max_buckets = get_int(o, "max_buckets", c.max_buckets);
        c.max_wall_ms = get_int64(o, "max_wall_ms", c.max_wall_ms);
        c.max_side = get_int(o, "max_side", c.max_side);
        c.annotate = get_bool(o, "annotate", c.annotate);
        c.fixed_hour = get_int(o, "fixed_hour", c.fixed_hour);

        if (c.target_fps <= 0.0) throw std::runtime_error("[Config] offline.target_fps must be > 0!");
        if (c.bucket_seconds <= 0.0) throw std::runtime_error("[Config] offline.bucket_seconds must be > 0!");
        if (c.slope_window < 1) throw std::runtime_error("[Config] offline.slope_window must be >= 1!");
        if (c.fixed_hour > 23) throw std::runtime_error("[Config] offline.fixed_hour must be < 24!");
        check_alpha(c.ema_alpha, "offline");
        return c;
    }

    static TrackerConfig parse_tracker_config(const YAML::Node& t) {
        TrackerConfig c;
        if (!t) return c;
        c.iou_threshold = static_cast<float>(get_double(t, "iou_threshold", c.iou_threshold));
        c.confirm_hits = get_int(t, "confirm_hits", c.confirm_hits);
        c.stale_buckets = get_int64(t, "stale_buckets", c.stale_buckets);
        if (c.iou_threshold < 0.0f || c.iou_threshold >= 1.0f) {
            throw std::runtime_error("[Config] tracker.iou_threshold must be in [0, 1)!");
        }
        if (c.confirm_hits < 1) throw std::runtime_error("[Config] tracker.confirm_hits must be >= 1!");
        if (c.stale_buckets < 0) throw std::runtime_error("[Config] tracker.stale_buckets must be >= 0!");
        return c;
    }

    static std::vector<HourWindow> parse_hour_windows(const YAML::Node& w, const std::vector<HourWindow>& def) {
        if (!w) return def;
        if (!w.IsSequence()) {
            throw std::runtime_error("[Config] hour windows must be a list of [start, end] pairs!");
        }
        std::vector<HourWindow> out;
        for (const auto& item : w) {
            const auto pair = item.as<std::vector<int>>();
            if (pair.size() != 2) {
                throw std::runtime_error("[Config] hour window needs exactly two values!");
            }
            HourWindow hw{pair[0], pair[1]};
            if (hw.start_hour < 0 || hw.end_hour > 24 || hw.start_hour >= hw.end_hour) {
                throw std::runtime_error("[Config] invalid hour window [" + std::to_string(hw.start_hour) +
                                         ", " + std::to_string(hw.end_hour) + ")!");
            }
            out.push_back(hw);
        }
        return out;
    }

    static PolicyConfig parse_policy_config(const YAML::Node& p) {
        PolicyConfig c;
        if (!p) return c;
        c.base_seconds = get_double(p, "base_seconds", c.base_seconds);
        c.slope_gain = get_double(p, "slope_gain", c.slope_gain);
        c.count_gain = get_double(p, "count_gain", c.count_gain);
        c.count_pivot = get_int64(p, "count_pivot", c.count_pivot);
        c.min_seconds = get_int(p, "min_seconds", c.min_seconds);
        c.max_seconds = get_int(p, "max_seconds", c.max_seconds);
        c.image_base_seconds = get_double(p, "image_base_seconds", c.image_base_seconds);
        c.image_count_gain = get_double(p, "image_count_gain", c.image_count_gain);
        c.image_min_seconds = get_int(p, "image_min_seconds", c.image_min_seconds);
        c.image_max_seconds = get_int(p, "image_max_seconds", c.image_max_seconds);
        c.emergency_bonus = get_int(p, "emergency_bonus", c.emergency_bonus);
        c.peak_adjustment = get_int(p, "peak_adjustment", c.peak_adjustment);
        c.off_peak_adjustment = get_int(p, "off_peak_adjustment", c.off_peak_adjustment);
        c.peak_hours = parse_hour_windows(p["peak_hours"], c.peak_hours);
        c.off_peak_hours = parse_hour_windows(p["off_peak_hours"], c.off_peak_hours);

        if (c.min_seconds > c.max_seconds || c.image_min_seconds > c.image_max_seconds) {
            throw std::runtime_error("[Config] policy min_seconds must not exceed max_seconds!");
        }
        return c;
    }

    static ConverterConfig parse_converter_config(const YAML::Node& cv) {
        ConverterConfig c;
        if (!cv) return c;
        c.enabled = get_bool(cv, "enabled", c.enabled);
        c.binary = get_str(cv, "binary", c.binary);
        c.crf = get_int(cv, "crf", c.crf);
        if (c.enabled && c.binary.empty()) {
            throw std::runtime_error("[Config] converter.binary is empty!");
        }
        return c;
    }

    AppConfig load_config_yaml(const std::string& path) {
        AppConfig cfg;
        YAML::Node root = YAML::LoadFile(path);

        const YAML::Node srv = root["server"];
        cfg.server.host = get_str(srv, "host", cfg.server.host);
        cfg.server.port = get_int(srv, "port", cfg.server.port);
        if (cfg.server.port <= 0 || cfg.server.port > 65535) {
            throw std::runtime_error("[Config] server.port out of range!");
        }

        const YAML::Node st = root["storage"];
        cfg.storage.upload_dir = get_str(st, "upload_dir", cfg.storage.upload_dir);
        cfg.storage.result_dir = get_str(st, "result_dir", cfg.storage.result_dir);

        cfg.detector = parse_detector_config(root["detector"], DetectorConfig{});
        cfg.emergency = parse_emergency_config(root["emergency"]);
        cfg.stream = parse_stream_config(root["stream"]);
        cfg.offline = parse_offline_config(root["offline"]);
        cfg.tracker = parse_tracker_config(root["tracker"]);
        cfg.policy = parse_policy_config(root["policy"]);
        cfg.converter = parse_converter_config(root["converter"]);
        return cfg;
    }
}

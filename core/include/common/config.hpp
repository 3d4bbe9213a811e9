#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace tp {
    struct ServerConfig {
        std::string host = "0.0.0.0";
        int port = 5000;
    };

    struct StorageConfig {
        std::string upload_dir = "uploads";
        std::string result_dir = "results";
    };

    struct DetectorConfig {
        std::string param_path = "models/yolov8n.ncnn.param";
        std::string bin_path = "models/yolov8n.ncnn.bin";
        std::string input_blob = "in0";
        std::string output_blob = "out0";
        int input_w = 640;
        int input_h = 640;
        int num_classes = 80;
        float score_threshold = 0.3f;
        float nms_threshold = 0.45f;
        int ncnn_threads = 1;
        std::vector<int> classes = {2, 3, 5, 7}; // car, motorcycle, bus, truck
    };

    struct EmergencyConfig {
        bool enabled = false;
        DetectorConfig detector;
    };

    // GStreamer capture parameters for live sources
    struct CaptureConfig {
        int webcam_width = 1280;
        int webcam_height = 720;
        int webcam_fps = 30;
        bool webcam_mjpg = true;
        int rtsp_latency_ms = 200;
        bool rtsp_tcp = true;
        int read_timeout_ms = 100;
    };

    struct StreamConfig {
        double target_fps = 5.0;
        double bucket_seconds = 1.0;
        double ema_alpha = 0.3;
        int64_t slope_window = 12; // buckets
        int capacity = 600;        // rate samples kept per session
        int stop_grace_ms = 2000;
        bool probe_on_start = true;
        int max_side = 640;
        CaptureConfig capture;
    };

    struct OfflineConfig {
        double target_fps = 5.0;
        double bucket_seconds = 1.0;
        double ema_alpha = 0.3;
        int64_t slope_window = 10;
        int max_buckets = 8;   // <= 0 disables the bucket deadline
        int64_t max_wall_ms = 0; // <= 0 disables the wall-clock deadline
        int max_side = 640;
        bool annotate = true;
        int fixed_hour = -1; // >= 0 pins the time-of-day used by the policy
    };

    struct TrackerConfig {
        float iou_threshold = 0.3f;
        int confirm_hits = 2;
        int64_t stale_buckets = 3;
    };

    // [start_hour, end_hour) on a 24h clock
    struct HourWindow {
        int start_hour = 0;
        int end_hour = 0;
    };

    struct PolicyConfig {
        double base_seconds = 33.0;
        double slope_gain = 10.0;
        double count_gain = 2.0;
        int64_t count_pivot = 10;
        int min_seconds = 15;
        int max_seconds = 65;

        double image_base_seconds = 10.0;
        double image_count_gain = 2.0;
        int image_min_seconds = 10;
        int image_max_seconds = 65;

        int emergency_bonus = 10;
        int peak_adjustment = 3;
        int off_peak_adjustment = -3;
        std::vector<HourWindow> peak_hours = {{8, 11}, {18, 22}};
        std::vector<HourWindow> off_peak_hours = {{22, 24}, {0, 7}};
    };

    struct ConverterConfig {
        bool enabled = true;
        std::string binary = "ffmpeg";
        int crf = 18;
    };

    struct AppConfig {
        ServerConfig server;
        StorageConfig storage;
        DetectorConfig detector;
        EmergencyConfig emergency;
        StreamConfig stream;
        OfflineConfig offline;
        TrackerConfig tracker;
        PolicyConfig policy;
        ConverterConfig converter;
    };

    AppConfig load_config_yaml(const std::string& path);
}

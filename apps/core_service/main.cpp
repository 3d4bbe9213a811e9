#include <analysis/image_analyzer.hpp>
#include <analysis/offline_analyzer.hpp>
#include <common/config.hpp>
#include <encode/video_converter.hpp>
#include <inference/yolo_detector.hpp>
#include <ingest/frame_source_factory.hpp>
#include <policy/signal_policy.hpp>
#include <server/api_server.hpp>
#include <session/session_manager.hpp>

#include <yaml-cpp/exceptions.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

static std::atomic<bool> g_running(true);
static void handle_sigint(int) { g_running = false; }

static tp::DetectorBinding bind_detector(const tp::DetectorConfig& cfg) {
    tp::DetectorBinding b;
    b.detector = std::make_shared<tp::YoloDetector>(cfg);
    b.classes = tp::make_class_filter(cfg.classes);
    b.confidence = cfg.score_threshold;
    return b;
}

int main(int argc, char** argv) {
    std::signal(SIGINT, handle_sigint);
    std::signal(SIGTERM, handle_sigint);

    std::string cfg_path = "configs/traffic.yaml";
    if (argc >= 2) cfg_path = argv[1];
    else std::cerr << "Using default config: " << cfg_path << "\n";

    tp::AppConfig cfg;
    try {
        cfg = tp::load_config_yaml(cfg_path);
    } catch (const YAML::Exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        return 1;
    }

    // models are loaded once and shared by every request and session
    tp::DetectorBinding vehicles;
    tp::DetectorBinding emergency;
    try {
        vehicles = bind_detector(cfg.detector);
        if (cfg.emergency.enabled) emergency = bind_detector(cfg.emergency.detector);
    } catch (const std::exception& e) {
        std::cerr << "Model load failed: " << e.what() << "\n";
        return 1;
    }

    const tp::SignalPolicy policy(cfg.policy);
    const auto converter = tp::make_video_converter(cfg.converter);

    const tp::ImageAnalyzer images(vehicles, emergency, policy);
    const tp::OfflineAnalyzer videos(vehicles, emergency, policy, cfg.offline, cfg.tracker, converter);

    const tp::CaptureConfig capture = cfg.stream.capture;
    tp::SessionManager sessions(
        vehicles,
        [capture](const std::string& source) { return tp::make_frame_source(source, capture); },
        cfg.stream,
        cfg.tracker);

    tp::ApiServer server(cfg.server, cfg.storage, images, videos, sessions, policy);
    if (!server.start()) {
        std::cerr << "Failed to start API server\n";
        return 1;
    }

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "Shutting down...\n";
    server.stop();
    sessions.stop_all();

    return 0;
}

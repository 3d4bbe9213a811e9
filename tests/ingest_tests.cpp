#include <common/errors.hpp>
#include <ingest/frame_source_factory.hpp>

#include <iostream>
#include <string>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    bool contains(const std::string& s, const std::string& part) {
        return s.find(part) != std::string::npos;
    }

    size_t count_of(const std::string& s, const std::string& part) {
        size_t n = 0;
        for (size_t pos = s.find(part); pos != std::string::npos; pos = s.find(part, pos + part.size())) ++n;
        return n;
    }

    bool rejected_as_input(const std::string& source) {
        try {
            (void)tp::build_pipeline(source, tp::CaptureConfig{}, "sink_0");
        } catch (const tp::TrafficError& e) {
            return e.kind() == tp::ErrorKind::InputError;
        }
        return false;
    }

    void test_classify_source() {
        check(tp::classify_source("0") == tp::SourceKind::Webcam, "digit string is a webcam index");
        check(tp::classify_source("12") == tp::SourceKind::Webcam, "multi-digit webcam index");
        check(tp::classify_source("rtsp://cam/live") == tp::SourceKind::Rtsp, "rtsp url");
        check(tp::classify_source("https://host/v.mp4") == tp::SourceKind::Uri, "http(s) url");
        check(tp::classify_source("/videos/a.mp4") == tp::SourceKind::File, "anything else is a file");
        check(tp::classify_source("0a") == tp::SourceKind::File, "mixed string is not a webcam");
    }

    void test_pipelines_per_kind() {
        const tp::CaptureConfig cfg;
        const std::string cam = tp::build_pipeline("2", cfg, "sink_7");
        check(contains(cam, "v4l2src device=/dev/video2"), "webcam pipeline opens /dev/videoN");
        check(contains(cam, "appsink name=sink_7"), "pipeline ends in the named appsink");

        const std::string rtsp = tp::build_pipeline("rtsp://cam/live", cfg, "s");
        check(contains(rtsp, "rtspsrc location=\"rtsp://cam/live\""), "rtsp source element");
        check(contains(rtsp, "protocols=tcp"), "rtsp over tcp by default");

        const std::string file = tp::build_pipeline("/videos/my clip.mp4", cfg, "s");
        check(contains(file, "filesrc location=\"/videos/my clip.mp4\""), "spaces stay inside the quoted path");
        check(count_of(file, "appsink") == 1 && count_of(file, "src ") == 1, "single source, single sink");
    }

    void test_launch_syntax_rejected() {
        check(rejected_as_input("/dev/zero\" ! filesink location=\"/tmp/x\" filesrc location=\"/dev/null"),
              "closing quote and extra elements rejected");
        check(rejected_as_input("a.mp4 ! filesink location=/tmp/x"), "element link rejected");
        check(rejected_as_input("rtsp://cam/live' latency=0"), "single quote rejected");
        check(rejected_as_input("C:\\videos\\a.mp4"), "backslash escapes rejected");
        check(rejected_as_input("a.mp4\nfilesink"), "control characters rejected");
        check(rejected_as_input(""), "empty source rejected");
    }

    void test_factory_propagates_rejection() {
        bool threw = false;
        try {
            (void)tp::make_frame_source("x\" ! fakesink", tp::CaptureConfig{});
        } catch (const tp::TrafficError& e) {
            threw = e.kind() == tp::ErrorKind::InputError;
        }
        check(threw, "factory never builds a source from launch syntax");
    }
}

int main() {
    test_classify_source();
    test_pipelines_per_kind();
    test_launch_syntax_rejected();
    test_factory_propagates_rejection();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all ingest tests passed\n";
    return 0;
}

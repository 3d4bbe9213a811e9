#include <common/errors.hpp>
#include <session/session_manager.hpp>
#include <session/stream_session.hpp>
#include <ingest/frame_source_factory.hpp>

#include "fakes.hpp"

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

namespace {
    int g_failures = 0;

    void check(bool condition, const std::string& message) {
        if (!condition) {
            ++g_failures;
            std::cerr << "[FAIL] " << message << "\n";
        }
    }

    tp::StreamConfig fast_stream_config() {
        tp::StreamConfig cfg;
        cfg.target_fps = 20.0;
        cfg.stop_grace_ms = 1000;
        cfg.capture.read_timeout_ms = 20;
        return cfg;
    }

    std::shared_ptr<const tp_test::RowsDetector> g_detector = std::make_shared<tp_test::RowsDetector>(8);

    tp::SessionManager make_manager(tp::FrameSourceFactory factory, tp::StreamConfig cfg = fast_stream_config()) {
        return tp::SessionManager(tp_test::bind(g_detector, {2}), std::move(factory), cfg, tp::TrackerConfig{});
    }

    template <class F>
    bool throws_kind(tp::ErrorKind kind, F&& f) {
        try {
            f();
        } catch (const tp::TrafficError& e) {
            return e.kind() == kind;
        }
        return false;
    }

    void test_empty_source_rejected() {
        auto mgr = make_manager([](const std::string&) {
            return std::make_unique<tp_test::FakeFrameSource>(true, 24, 10);
        });
        check(throws_kind(tp::ErrorKind::InputError, [&] { mgr.start_session(""); }),
              "empty source is an input error");
        check(mgr.active_sessions() == 0, "no session registered for bad input");
    }

    void test_probe_failure_is_resource_unavailable() {
        auto mgr = make_manager([](const std::string&) {
            return std::make_unique<tp_test::FakeFrameSource>(false, 24, 10);
        });
        check(throws_kind(tp::ErrorKind::ResourceUnavailable, [&] { mgr.start_session("rtsp://nowhere/x"); }),
              "unopenable source reported at start");
        check(mgr.active_sessions() == 0, "failed probe registers nothing");
    }

    void test_factory_failure_is_resource_unavailable() {
        auto mgr = make_manager([](const std::string&) -> std::unique_ptr<tp::IFrameSource> {
            throw std::runtime_error("pipeline parse failed");
        });
        check(throws_kind(tp::ErrorKind::ResourceUnavailable, [&] { mgr.start_session("bogus"); }),
              "factory exception reported as unavailable");
    }

    void test_launch_syntax_source_is_input_error() {
        auto mgr = make_manager([](const std::string& source) {
            return tp::make_frame_source(source, tp::CaptureConfig{});
        });
        check(throws_kind(tp::ErrorKind::InputError,
                          [&] { mgr.start_session("/dev/zero\" ! filesink location=\"/tmp/x"); }),
              "source that splices pipeline elements is an input error");
        check(mgr.active_sessions() == 0, "nothing registered for it");
    }

    void test_without_probe_bad_source_stays_silent() {
        tp::StreamConfig cfg = fast_stream_config();
        cfg.probe_on_start = false;
        auto mgr = make_manager([](const std::string&) {
            return std::make_unique<tp_test::FakeFrameSource>(false, 24, 10);
        }, cfg);

        const std::string id = mgr.start_session("0");
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        const auto m = mgr.get_metrics(id);
        check(m.has_value(), "session exists even though its source never opened");
        check(m && m->sample_count == 0 && m->smoothed_rate == 0.0, "and it never produces samples");
        check(mgr.stop_session(id), "silent session can still be stopped");
    }

    void test_metrics_zero_before_first_bucket() {
        // never delivers a frame
        auto mgr = make_manager([](const std::string&) {
            return std::make_unique<tp_test::FakeFrameSource>(true, 0, 10);
        });
        const std::string id = mgr.start_session("0");
        check(id.size() == 32, "session ids are 32 hex characters");

        const auto m = mgr.get_metrics(id);
        check(m.has_value(), "metrics available immediately");
        check(m && m->session_id == id, "metrics carry the session id");
        check(m && m->current_frame_vehicle_count == 0, "no frame yet");
        check(m && m->smoothed_rate == 0.0 && m->slope == 0.0 && m->sample_count == 0,
              "zero rate, slope and samples before any bucket closes");
        check(mgr.stop_session(id), "stop succeeds");
    }

    void test_samples_accumulate() {
        auto mgr = make_manager([](const std::string&) {
            return std::make_unique<tp_test::FakeFrameSource>(true, 24, 10);
        });
        const std::string id = mgr.start_session("0");
        std::this_thread::sleep_for(std::chrono::milliseconds(2600));

        const auto m = mgr.get_metrics(id);
        check(m.has_value(), "running session reports metrics");
        check(m && m->current_frame_vehicle_count == 3, "latest frame count from the detector");
        check(m && m->sample_count >= 1, "closed buckets produce samples");
        check(m && m->smoothed_rate > 0.0, "smoothed rate rises with traffic");
        check(m && m->unique_vehicle_count == 3, "the same three vehicles are counted once");
        check(mgr.stop_session(id), "stop running session");
    }

    void test_stop_semantics() {
        auto mgr = make_manager([](const std::string&) {
            return std::make_unique<tp_test::FakeFrameSource>(true, 24, 10);
        });
        check(!mgr.stop_session("deadbeef"), "unknown id is not stopped");

        const std::string id = mgr.start_session("0");
        check(mgr.list_sessions().size() == 1, "session listed");
        check(mgr.stop_session(id), "first stop succeeds");
        check(!mgr.stop_session(id), "second stop reports unknown");
        check(!mgr.get_metrics(id).has_value(), "metrics gone after stop");
        check(mgr.active_sessions() == 0, "no active sessions left");
    }

    void test_sessions_are_independent() {
        auto mgr = make_manager([](const std::string& src) {
            return std::make_unique<tp_test::FakeFrameSource>(true, src == "a" ? 8 : 40, 10);
        });
        const std::string a = mgr.start_session("a");
        const std::string b = mgr.start_session("b");
        check(a != b, "distinct ids");
        std::this_thread::sleep_for(std::chrono::milliseconds(300));

        const auto ma = mgr.get_metrics(a);
        const auto mb = mgr.get_metrics(b);
        check(ma && ma->current_frame_vehicle_count == 1, "session a sees its own source");
        check(mb && mb->current_frame_vehicle_count == 5, "session b sees its own source");
        mgr.stop_all();
        check(mgr.active_sessions() == 0, "stop_all drains the table");
    }

    void test_loop_ends_with_source() {
        auto src = std::make_unique<tp_test::FakeFrameSource>(true, 24, 5, 3);
        auto* raw = src.get();
        tp::StreamSession session("s1", "file.mp4", std::move(src), false,
                                  tp_test::bind(g_detector, {2}), fast_stream_config(), tp::TrackerConfig{});
        session.start();
        check(session.state() == tp::SessionState::Running, "started session is running");
        std::this_thread::sleep_for(std::chrono::milliseconds(400));

        check(raw->start_calls == 1, "loop opens an unprobed source itself");
        check(raw->stopped, "capture released once the source ends");
        check(session.stop(std::chrono::milliseconds(500)), "stop after end joins promptly");
        check(session.state() == tp::SessionState::Stopped, "stopped state");
    }

    void test_hung_capture_detached() {
        // every read blocks well past the grace period
        auto src = std::make_unique<tp_test::FakeFrameSource>(true, 24, 600);
        tp::StreamSession session("s2", "0", std::move(src), true,
                                  tp_test::bind(g_detector, {2}), fast_stream_config(), tp::TrackerConfig{});
        session.start();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));

        check(!session.stop(std::chrono::milliseconds(50)), "stop gives up after the grace period");
        check(session.state() == tp::SessionState::Stopped, "session marked stopped anyway");
        // let the abandoned loop observe the stop flag before exit
        std::this_thread::sleep_for(std::chrono::milliseconds(800));
    }
}

int main() {
    test_empty_source_rejected();
    test_probe_failure_is_resource_unavailable();
    test_factory_failure_is_resource_unavailable();
    test_launch_syntax_source_is_input_error();
    test_without_probe_bad_source_stays_silent();
    test_metrics_zero_before_first_bucket();
    test_samples_accumulate();
    test_stop_semantics();
    test_sessions_are_independent();
    test_loop_ends_with_source();
    test_hung_capture_detached();

    if (g_failures != 0) {
        std::cerr << "[FAIL] total failures: " << g_failures << "\n";
        return 1;
    }

    std::cout << "[OK] all session tests passed\n";
    return 0;
}

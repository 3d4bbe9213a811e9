#include <session/stream_session.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <utility>

#include <aggregation/rate_aggregator.hpp>
#include <aggregation/trend_estimator.hpp>
#include <common/resize.hpp>
#include <common/time_util.hpp>
#include <tracking/vehicle_deduplicator.hpp>

namespace tp {
    const char* to_string(SessionState s) {
        switch (s) {
            case SessionState::Created: return "created";
            case SessionState::Running: return "running";
            case SessionState::Stopped: return "stopped";
        }
        return "unknown";
    }

    // State reachable from the loop thread; outlives the session object if the
    // loop has to be abandoned on a hung capture.
    struct StreamSession::Shared {
        std::string id;
        std::unique_ptr<IFrameSource> capture;
        bool source_started = false;
        DetectorBinding vehicles;
        StreamConfig cfg;

        std::atomic<bool> stop_requested{false};
        std::atomic<SessionState> state{SessionState::Created};

        // guards everything below
        mutable std::mutex mtx;
        std::condition_variable done_cv;
        bool done = false;

        int64_t latest_count = 0;
        RateAggregator aggregator;
        VehicleDeduplicator dedup;
        TrendEstimator trend;

        Shared(const StreamConfig& c, const TrackerConfig& t)
            : cfg(c),
              aggregator(RateAggregator::live(RateAggregatorOptions{
                  c.ema_alpha, c.bucket_seconds, static_cast<size_t>(std::max(1, c.capacity))})),
              dedup(t),
              trend(c.slope_window) {}
    };

    StreamSession::StreamSession(std::string id,
                                 std::string source,
                                 std::unique_ptr<IFrameSource> capture,
                                 bool source_started,
                                 DetectorBinding vehicles,
                                 StreamConfig cfg,
                                 TrackerConfig tracker)
        : id_(std::move(id)),
          source_(std::move(source)),
          shared_(std::make_shared<Shared>(cfg, tracker)) {
        shared_->id = id_;
        shared_->capture = std::move(capture);
        shared_->source_started = source_started;
        shared_->vehicles = std::move(vehicles);
    }

    StreamSession::~StreamSession() {
        stop(std::chrono::milliseconds(shared_->cfg.stop_grace_ms));
    }

    void StreamSession::start() {
        if (thr_.joinable() || shared_->state.load() != SessionState::Created) return;
        shared_->state = SessionState::Running;
        thr_ = std::thread([shared = shared_] { run_(shared); });
    }

    bool StreamSession::stop(std::chrono::milliseconds grace) {
        shared_->stop_requested = true;
        if (!thr_.joinable()) {
            shared_->state = SessionState::Stopped;
            return true;
        }

        bool finished = false;
        {
            std::unique_lock lk(shared_->mtx);
            finished = shared_->done_cv.wait_for(lk, grace, [this] { return shared_->done; });
        }

        if (finished) {
            thr_.join();
        } else {
            // a blocked capture read cannot be interrupted; the loop keeps its
            // own reference to the shared state and exits on its next iteration
            std::cerr << "[Session](stop) " << id_ << " did not stop within "
                      << grace.count() << " ms, detaching\n";
            thr_.detach();
        }
        shared_->state = SessionState::Stopped;
        return finished;
    }

    SessionState StreamSession::state() const {
        return shared_->state.load();
    }

    SessionMetrics StreamSession::metrics() const {
        SessionMetrics m;
        m.session_id = id_;

        std::lock_guard lk(shared_->mtx);
        m.current_frame_vehicle_count = shared_->latest_count;
        m.smoothed_rate = shared_->aggregator.smoothed_rate();
        m.slope = shared_->trend.slope(shared_->aggregator.series());
        m.sample_count = shared_->aggregator.series().size();
        m.unique_vehicle_count = shared_->dedup.unique_count();
        return m;
    }

    void StreamSession::run_(std::shared_ptr<Shared> s) {
        auto finish = [&s] {
            {
                std::lock_guard lk(s->mtx);
                s->done = true;
            }
            s->done_cv.notify_all();
        };

        if (!s->capture) {
            finish();
            return;
        }

        if (!s->source_started && !s->capture->start()) {
            // unopenable source: the session simply never produces samples
            std::cerr << "[Session](run_) " << s->id << " capture could not be opened\n";
            finish();
            return;
        }

        const auto target_interval = std::chrono::duration<double>(1.0 / std::max(1e-6, s->cfg.target_fps));
        bool detector_error_logged = false;

        FramePacket fp;
        while (!s->stop_requested.load(std::memory_order_relaxed)) {
            const auto loop_start = std::chrono::steady_clock::now();

            if (!s->capture->read(fp, s->cfg.capture.read_timeout_ms)) {
                if (s->capture->ended()) {
                    std::cerr << "[Session](run_) " << s->id << " source ended\n";
                    break;
                }
                continue;
            }
            if (fp.bgr.empty()) continue;

            const cv::Mat frame = limit_longest_side(fp.bgr, s->cfg.max_side);

            DetectionSet dets;
            try {
                dets = s->vehicles.run(frame);
            } catch (const std::exception& e) {
                if (!detector_error_logged) {
                    std::cerr << "[Session](run_) " << s->id << " detector failed: " << e.what() << "\n";
                    detector_error_logged = true;
                }
                continue;
            }
            const auto count = static_cast<int64_t>(count_in_classes(dets, s->vehicles.classes));
            const double now = wall_seconds_now();

            {
                std::lock_guard lk(s->mtx);
                s->latest_count = count;
                s->dedup.observe(dets, s->aggregator.bucket_index_for(now));
                s->aggregator.observe(count, now);
            }

            // pacing keeps detection near target_fps
            const auto spent = std::chrono::steady_clock::now() - loop_start;
            if (spent < target_interval && !s->stop_requested.load(std::memory_order_relaxed)) {
                std::this_thread::sleep_for(target_interval - spent);
            }
        }

        s->capture->stop();
        finish();
    }
}

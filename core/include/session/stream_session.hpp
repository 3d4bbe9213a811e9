#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include <common/config.hpp>
#include <inference/detector.hpp>
#include <ingest/frame_source.hpp>

namespace tp {
    enum class SessionState {
        Created,
        Running,
        Stopped
    };

    const char* to_string(SessionState s);

    struct SessionMetrics {
        std::string session_id;
        int64_t current_frame_vehicle_count = 0;
        double smoothed_rate = 0.0;
        double slope = 0.0;
        size_t sample_count = 0;
        int64_t unique_vehicle_count = 0;
    };

    // One live ingestion: a background capture -> detect -> aggregate loop
    // with its own bucket, rate and track state.
    class StreamSession {
    public:
        // `source_started` tells whether start() was already called on the
        // source (synchronous probe). Otherwise the loop opens it and exits
        // silently on failure.
        StreamSession(std::string id,
                      std::string source,
                      std::unique_ptr<IFrameSource> capture,
                      bool source_started,
                      DetectorBinding vehicles,
                      StreamConfig cfg,
                      TrackerConfig tracker);
        ~StreamSession();

        StreamSession(const StreamSession&) = delete;
        StreamSession& operator=(const StreamSession&) = delete;

        void start();

        // Cooperative cancel. Waits up to `grace` for the loop to finish;
        // returns false if it had to be abandoned still running.
        bool stop(std::chrono::milliseconds grace);

        SessionMetrics metrics() const;
        SessionState state() const;

        const std::string& id() const { return id_; }
        const std::string& source() const { return source_; }

    private:
        struct Shared;
        static void run_(std::shared_ptr<Shared> shared);

        std::string id_;
        std::string source_;
        std::shared_ptr<Shared> shared_;
        std::thread thr_;
    };
}

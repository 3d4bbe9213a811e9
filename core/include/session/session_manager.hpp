#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <common/config.hpp>
#include <inference/detector.hpp>
#include <ingest/frame_source.hpp>
#include <session/stream_session.hpp>

namespace tp {
    using FrameSourceFactory = std::function<std::unique_ptr<IFrameSource>(const std::string& source)>;

    // Owns every live session, keyed by session id.
    class SessionManager {
    public:
        SessionManager(DetectorBinding vehicles,
                       FrameSourceFactory make_source,
                       StreamConfig cfg,
                       TrackerConfig tracker);
        ~SessionManager();

        SessionManager(const SessionManager&) = delete;
        SessionManager& operator=(const SessionManager&) = delete;

        // Returns the new session id without waiting for any frame.
        // Throws TrafficError: InputError for an empty source, and
        // ResourceUnavailable when probing is enabled and the source won't open.
        std::string start_session(const std::string& source);

        // nullopt for unknown or already stopped ids
        std::optional<SessionMetrics> get_metrics(const std::string& session_id) const;

        // false for unknown or already stopped ids
        bool stop_session(const std::string& session_id);

        void stop_all();

        std::vector<std::string> list_sessions() const;
        size_t active_sessions() const;

    private:
        std::shared_ptr<StreamSession> find_(const std::string& session_id) const;

        DetectorBinding vehicles_;
        FrameSourceFactory make_source_;
        StreamConfig cfg_;
        TrackerConfig tracker_;

        mutable std::mutex mtx_;
        std::unordered_map<std::string, std::shared_ptr<StreamSession>> sessions_;
    };
}

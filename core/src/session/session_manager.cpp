#include <session/session_manager.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

#include <common/errors.hpp>
#include <common/time_util.hpp>

namespace tp {
    SessionManager::SessionManager(DetectorBinding vehicles,
                                   FrameSourceFactory make_source,
                                   StreamConfig cfg,
                                   TrackerConfig tracker)
        : vehicles_(std::move(vehicles)),
          make_source_(std::move(make_source)),
          cfg_(std::move(cfg)),
          tracker_(std::move(tracker)) {}

    SessionManager::~SessionManager() {
        stop_all();
    }

    std::string SessionManager::start_session(const std::string& source) {
        if (source.empty()) {
            throw TrafficError(ErrorKind::InputError, "source is required");
        }

        std::unique_ptr<IFrameSource> capture;
        try {
            capture = make_source_(source);
        } catch (const TrafficError&) {
            throw;
        } catch (const std::exception& e) {
            throw TrafficError(ErrorKind::ResourceUnavailable,
                               "cannot create capture for '" + source + "': " + e.what());
        }
        if (!capture) {
            throw TrafficError(ErrorKind::ResourceUnavailable, "cannot create capture for '" + source + "'");
        }

        bool started = false;
        if (cfg_.probe_on_start) {
            if (!capture->start()) {
                throw TrafficError(ErrorKind::ResourceUnavailable, "capture source '" + source + "' could not be opened");
            }
            started = true;
        }

        std::shared_ptr<StreamSession> session;
        std::string id;
        {
            std::lock_guard lk(mtx_);
            do {
                id = random_hex_id();
            } while (sessions_.count(id) > 0);

            session = std::make_shared<StreamSession>(id, source, std::move(capture), started,
                                                      vehicles_, cfg_, tracker_);
            session->start();
            sessions_.emplace(id, session);
        }

        std::cout << "[Sessions](start_session) " << id << " <- " << source << "\n";
        return id;
    }

    std::shared_ptr<StreamSession> SessionManager::find_(const std::string& session_id) const {
        std::lock_guard lk(mtx_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) return nullptr;
        return it->second;
    }

    std::optional<SessionMetrics> SessionManager::get_metrics(const std::string& session_id) const {
        auto session = find_(session_id);
        if (!session) return std::nullopt;
        return session->metrics();
    }

    bool SessionManager::stop_session(const std::string& session_id) {
        std::shared_ptr<StreamSession> session;
        {
            std::lock_guard lk(mtx_);
            auto it = sessions_.find(session_id);
            if (it == sessions_.end()) return false;
            session = std::move(it->second);
            sessions_.erase(it);
        }

        // outside the map lock: stopping may block up to the grace period
        session->stop(std::chrono::milliseconds(cfg_.stop_grace_ms));
        std::cout << "[Sessions](stop_session) " << session_id << " stopped\n";
        return true;
    }

    void SessionManager::stop_all() {
        std::unordered_map<std::string, std::shared_ptr<StreamSession>> drained;
        {
            std::lock_guard lk(mtx_);
            drained.swap(sessions_);
        }
        for (auto& kv : drained) {
            kv.second->stop(std::chrono::milliseconds(cfg_.stop_grace_ms));
        }
    }

    std::vector<std::string> SessionManager::list_sessions() const {
        std::lock_guard lk(mtx_);
        std::vector<std::string> out;
        out.reserve(sessions_.size());
        for (const auto& kv : sessions_) out.push_back(kv.first);
        std::sort(out.begin(), out.end());
        return out;
    }

    size_t SessionManager::active_sessions() const {
        std::lock_guard lk(mtx_);
        return sessions_.size();
    }
}

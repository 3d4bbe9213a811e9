#include <server/api_server.hpp>

#include <cctype>
#include <cstdio>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

#include <httplib.h>
#include <opencv2/imgcodecs.hpp>

#include <common/errors.hpp>
#include <common/time_util.hpp>

namespace tp {
    namespace {
        std::string json_escape(const std::string& s) {
            std::string out;
            out.reserve(s.size() + 2);
            for (const char c : s) {
                switch (c) {
                    case '"': out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\n': out += "\\n"; break;
                    case '\r': out += "\\r"; break;
                    case '\t': out += "\\t"; break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20) {
                            char buf[8];
                            std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                            out += buf;
                        } else {
                            out += c;
                        }
                }
            }
            return out;
        }

        std::string jstr(const std::string& s) { return "\"" + json_escape(s) + "\""; }

        std::string jnum(double v) {
            if (!std::isfinite(v)) return "0";
            std::ostringstream oss;
            oss.precision(6);
            oss << v;
            return oss.str();
        }

        std::string jbool(bool b) { return b ? "true" : "false"; }

        std::string error_json(const std::string& message) {
            return "{\"error\":" + jstr(message) + "}";
        }

        int status_for(ErrorKind k) {
            switch (k) {
                case ErrorKind::InputError: return 400;
                case ErrorKind::NotFound: return 404;
                case ErrorKind::ResourceUnavailable: return 503;
            }
            return 500;
        }

        // Runs a handler body, turning exceptions into JSON error responses.
        template <class F>
        void guarded(httplib::Response& res, const char* route, F&& body) {
            try {
                body();
            } catch (const TrafficError& e) {
                res.status = status_for(e.kind());
                res.set_content(error_json(e.what()), "application/json");
            } catch (const std::exception& e) {
                std::cerr << "[Api](" << route << ") " << e.what() << "\n";
                res.status = 500;
                res.set_content(error_json("internal error"), "application/json");
            }
        }

        std::string safe_extension(const std::string& filename, const std::string& fallback) {
            const std::string ext = std::filesystem::path(filename).extension().string();
            if (ext.size() < 2 || ext.size() > 6) return fallback;
            for (size_t i = 1; i < ext.size(); ++i) {
                if (!std::isalnum(static_cast<unsigned char>(ext[i]))) return fallback;
            }
            return ext;
        }

        std::string param_or_empty(const httplib::Request& req, const char* key) {
            return req.has_param(key) ? req.get_param_value(key) : std::string();
        }

        std::string lane_json(const LaneAnalysis& r, const std::string& ref) {
            std::string s =
                std::string("{") +
                R"("lane":)" + jstr(r.lane) + "," +
                R"("smoothedRate":)" + jnum(r.smoothed_rate) + "," +
                R"("slope":)" + jnum(r.slope) + "," +
                R"("vehicleCount":)" + std::to_string(r.vehicle_count) + "," +
                R"("peakFrameCount":)" + std::to_string(r.peak_frame_count) + "," +
                R"("emergencyDetected":)" + jbool(r.emergency_detected) + "," +
                R"("greenTimeSeconds":)" + std::to_string(r.green_time_seconds) + "," +
                R"("dataPoints":)" + std::to_string(r.data_points) + "," +
                R"("framesProcessed":)" + std::to_string(r.frames_processed) + "," +
                R"("annotatedFrames":)" + std::to_string(r.annotated_frames);
            if (!ref.empty()) s += std::string(",") + R"("annotatedVideoRef":)" + jstr(ref);
            return s + "}";
        }

        std::string metrics_json(const SessionMetrics& m) {
            return std::string("{") +
                   R"("sessionId":)" + jstr(m.session_id) + "," +
                   R"("currentFrameVehicleCount":)" + std::to_string(m.current_frame_vehicle_count) + "," +
                   R"("smoothedRate":)" + jnum(m.smoothed_rate) + "," +
                   R"("slope":)" + jnum(m.slope) + "," +
                   R"("sampleCount":)" + std::to_string(m.sample_count) + "," +
                   R"("uniqueVehicleCount":)" + std::to_string(m.unique_vehicle_count) +
                   "}";
        }

        // Uploaded inputs are only needed while their request is analyzed.
        class UploadCleanup {
        public:
            UploadCleanup() = default;
            ~UploadCleanup() {
                for (const auto& p : paths_) {
                    std::error_code ec;
                    std::filesystem::remove(p, ec);
                    if (ec) std::cerr << "[Api](UploadCleanup) cannot remove " << p << ": " << ec.message() << "\n";
                }
            }
            UploadCleanup(const UploadCleanup&) = delete;
            UploadCleanup& operator=(const UploadCleanup&) = delete;

            std::string track(std::string path) {
                paths_.push_back(path);
                return path;
            }

        private:
            std::vector<std::string> paths_;
        };

        const char* kLaneKeys[] = {"north", "south", "east", "west", "lane1", "lane2", "lane3", "lane4"};
    } // namespace

    struct ApiServer::Impl {
        httplib::Server svr;
    };

    ApiServer::ApiServer(ServerConfig server,
                         StorageConfig storage,
                         const ImageAnalyzer& images,
                         const OfflineAnalyzer& videos,
                         SessionManager& sessions,
                         SignalPolicy policy)
        : impl_(std::make_unique<Impl>()),
          server_cfg_(std::move(server)),
          storage_(std::move(storage)),
          images_(images),
          videos_(videos),
          sessions_(sessions),
          policy_(std::move(policy)) {}

    ApiServer::~ApiServer() {
        stop();
    }

    std::string ApiServer::save_upload_(const std::string& content,
                                        const std::string& filename,
                                        const std::string& default_ext) const {
        namespace fs = std::filesystem;
        const fs::path path = fs::path(storage_.upload_dir) / (random_hex_id() + safe_extension(filename, default_ext));

        std::ofstream out(path, std::ios::binary);
        if (!out.is_open()) {
            throw std::runtime_error("failed to open upload file: " + path.string());
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        out.close();
        if (!out) {
            throw std::runtime_error("failed to write upload file: " + path.string());
        }
        return path.string();
    }

    std::string ApiServer::result_path_(const std::string& name) const {
        return (std::filesystem::path(storage_.result_dir) / name).string();
    }

    std::string ApiServer::result_ref_(const std::string& path) {
        if (path.empty()) return {};
        return "/results/" + std::filesystem::path(path).filename().string();
    }

    void ApiServer::register_routes_() {
        auto& svr = impl_->svr;

        svr.set_default_headers({
            {"Access-Control-Allow-Origin", "*"},
            {"Access-Control-Allow-Headers", "Content-Type"},
            {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
        });
        svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) { res.status = 204; });

        svr.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        });

        // /api/detect -> single image analysis
        svr.Post("/api/detect", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "detect", [&] {
                if (!req.has_file("image")) {
                    throw TrafficError(ErrorKind::InputError, "No image part in request");
                }
                const auto file = req.get_file_value("image");
                if (file.filename.empty() || file.content.empty()) {
                    throw TrafficError(ErrorKind::InputError, "No file selected");
                }

                const std::vector<uint8_t> bytes(file.content.begin(), file.content.end());
                const cv::Mat image = cv::imdecode(bytes, cv::IMREAD_COLOR);

                const std::string out_path = result_path_(random_hex_id() + ".jpg");
                const ImageAnalysis r = images_.analyze(image, out_path);

                std::string body =
                    std::string("{") +
                    R"("vehicleCount":)" + std::to_string(r.vehicle_count) + "," +
                    R"("emergencyDetected":)" + jbool(r.emergency_detected) + "," +
                    R"("greenTimeSeconds":)" + std::to_string(r.green_time_seconds);
                const std::string ref = result_ref_(r.annotated_image_path);
                if (!ref.empty()) body += std::string(",") + R"("annotatedImageRef":)" + jstr(ref);
                body += "}";
                res.set_content(body, "application/json");
            });
        });

        // /api/video/analyze -> one finite video
        svr.Post("/api/video/analyze", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "video/analyze", [&] {
                if (!req.has_file("video")) {
                    throw TrafficError(ErrorKind::InputError, "No video part in request");
                }
                const auto file = req.get_file_value("video");
                if (file.content.empty()) {
                    throw TrafficError(ErrorKind::InputError, "No file selected");
                }

                UploadCleanup uploads;
                const std::string path = uploads.track(save_upload_(file.content, file.filename, ".mp4"));
                const LaneAnalysis r = videos_.analyze_file(path, result_path_(random_hex_id() + ".mp4"));
                res.set_content(lane_json(r, result_ref_(r.annotated_video_path)), "application/json");
            });
        });

        // /api/video/analyze-multi -> up to four directions
        svr.Post("/api/video/analyze-multi", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "video/analyze-multi", [&] {
                UploadCleanup uploads;
                std::vector<LaneUpload> lanes;
                for (const char* key : kLaneKeys) {
                    if (!req.has_file(key)) continue;
                    const auto file = req.get_file_value(key);
                    if (file.content.empty()) continue;

                    LaneUpload lane;
                    lane.lane_key = key;
                    lane.video_path = uploads.track(save_upload_(file.content, file.filename, ".mp4"));
                    lane.annotated_output_path = result_path_(random_hex_id() + ".mp4");
                    lanes.push_back(std::move(lane));
                }

                const auto results = videos_.analyze_batch(lanes);
                std::string body = R"({"lanes":[)";
                for (size_t i = 0; i < results.size(); ++i) {
                    body += lane_json(results[i], result_ref_(results[i].annotated_video_path));
                    if (i + 1 < results.size()) body += ",";
                }
                body += "]}";
                res.set_content(body, "application/json");
            });
        });

        svr.Post("/api/stream/start", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "stream/start", [&] {
                const std::string source = param_or_empty(req, "source");
                const std::string id = sessions_.start_session(source);
                res.set_content(std::string("{") + R"("sessionId":)" + jstr(id) + "}", "application/json");
            });
        });

        svr.Get(R"(/api/stream/metrics/([0-9a-f]+))", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "stream/metrics", [&] {
                const auto m = sessions_.get_metrics(req.matches[1].str());
                if (!m) throw TrafficError(ErrorKind::NotFound, "session not found");
                res.set_content(metrics_json(*m), "application/json");
                res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
            });
        });

        svr.Get(R"(/api/stream/decision/([0-9a-f]+))", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "stream/decision", [&] {
                const auto m = sessions_.get_metrics(req.matches[1].str());
                if (!m) throw TrafficError(ErrorKind::NotFound, "session not found");

                const SignalDecision d = policy_.decide(m->session_id,
                                                        m->current_frame_vehicle_count,
                                                        m->smoothed_rate,
                                                        m->slope,
                                                        false,
                                                        local_hour_now());
                const std::string body =
                    std::string("{") +
                    R"("laneOrDirection":)" + jstr(d.lane) + "," +
                    R"("vehicleCount":)" + std::to_string(d.vehicle_count) + "," +
                    R"("rate":)" + jnum(d.rate) + "," +
                    R"("slope":)" + jnum(d.slope) + "," +
                    R"("emergencyDetected":)" + jbool(d.emergency_detected) + "," +
                    R"("greenTimeSeconds":)" + std::to_string(d.green_time_seconds) +
                    "}";
                res.set_content(body, "application/json");
            });
        });

        svr.Post("/api/stream/stop", [this](const httplib::Request& req, httplib::Response& res) {
            guarded(res, "stream/stop", [&] {
                const std::string id = param_or_empty(req, "sessionId");
                if (id.empty()) throw TrafficError(ErrorKind::InputError, "sessionId is required");
                const bool stopped = sessions_.stop_session(id);
                if (!stopped) res.status = 404;
                res.set_content(std::string("{") + R"("stopped":)" + jbool(stopped) + "}", "application/json");
            });
        });

        svr.Get("/api/stream/sessions", [this](const httplib::Request&, httplib::Response& res) {
            const auto ids = sessions_.list_sessions();
            std::string body = "[";
            for (size_t i = 0; i < ids.size(); ++i) {
                body += jstr(ids[i]);
                if (i + 1 < ids.size()) body += ",";
            }
            body += "]";
            res.set_content(body, "application/json");
            res.set_header("Cache-Control", "no-cache");
        });

        // static artifacts; httplib answers Range requests with 206
        if (!svr.set_mount_point("/results", storage_.result_dir)) {
            std::cerr << "[Api](register_routes_) cannot mount " << storage_.result_dir << "\n";
        }
    }

    bool ApiServer::start() {
        if (running_) return true;

        namespace fs = std::filesystem;
        std::error_code ec;
        fs::create_directories(storage_.upload_dir, ec);
        if (ec) {
            std::cerr << "[Api](start) cannot create " << storage_.upload_dir << ": " << ec.message() << "\n";
            return false;
        }
        fs::create_directories(storage_.result_dir, ec);
        if (ec) {
            std::cerr << "[Api](start) cannot create " << storage_.result_dir << ": " << ec.message() << "\n";
            return false;
        }

        register_routes_();
        // port 0 picks a free port
        if (server_cfg_.port == 0) {
            bound_port_ = impl_->svr.bind_to_any_port(server_cfg_.host);
        } else if (impl_->svr.bind_to_port(server_cfg_.host, server_cfg_.port)) {
            bound_port_ = server_cfg_.port;
        }
        if (bound_port_ <= 0) {
            std::cerr << "[Api](start) cannot bind " << server_cfg_.host << ":" << server_cfg_.port << "\n";
            bound_port_ = -1;
            return false;
        }

        running_ = true;
        server_thread_ = std::thread([this] {
            std::cout << "[Api] Listening on http://" << server_cfg_.host << ":" << bound_port_ << "\n";
            impl_->svr.listen_after_bind();
        });
        return true;
    }

    void ApiServer::stop() {
        if (!running_) return;
        running_ = false;

        if (impl_) impl_->svr.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }
}

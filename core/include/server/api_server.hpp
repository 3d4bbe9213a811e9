#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include <analysis/image_analyzer.hpp>
#include <analysis/offline_analyzer.hpp>
#include <common/config.hpp>
#include <policy/signal_policy.hpp>
#include <session/session_manager.hpp>

namespace tp {
    // HTTP front of the service. Uploads land in storage.upload_dir, produced
    // artifacts in storage.result_dir, served under /results with byte ranges.
    class ApiServer {
    public:
        ApiServer(ServerConfig server,
                  StorageConfig storage,
                  const ImageAnalyzer& images,
                  const OfflineAnalyzer& videos,
                  SessionManager& sessions,
                  SignalPolicy policy);
        ~ApiServer();

        ApiServer(const ApiServer&) = delete;
        ApiServer& operator=(const ApiServer&) = delete;

        // Start http server in bg thread
        bool start();
        void stop();

        // Port actually listened on; -1 before a successful start().
        int bound_port() const { return bound_port_; }

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;

        void register_routes_();

        std::string save_upload_(const std::string& content,
                                 const std::string& filename,
                                 const std::string& default_ext) const;
        std::string result_path_(const std::string& name) const;
        static std::string result_ref_(const std::string& path);

        ServerConfig server_cfg_;
        StorageConfig storage_;
        const ImageAnalyzer& images_;
        const OfflineAnalyzer& videos_;
        SessionManager& sessions_;
        SignalPolicy policy_;

        std::thread server_thread_;
        std::atomic<bool> running_{false};
        int bound_port_ = -1;
    };
}

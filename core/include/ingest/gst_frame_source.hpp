#pragma once

#include <cstdint>
#include <string>

#include <ingest/frame_source.hpp>

struct _GstElement;
using GstElement = _GstElement;

namespace tp {
    // Pulls BGR frames from a gst-launch pipeline ending in a named appsink.
    class GstFrameSource: public IFrameSource {
    public:
        GstFrameSource(std::string pipeline, std::string source_id, std::string sink_name);
        ~GstFrameSource() override;

        // Blocks until the pipeline prerolls, so a dead source fails here.
        bool start() override;
        void stop() override;
        bool read(FramePacket& out, int timeout_ms = 1000) override;
        bool ended() const override { return ended_; }
        const std::string& id() const override { return id_; }

    private:
        bool build_();
        // drains the bus; flags EOS and errors
        void poll_bus_();

        std::string pipeline_str_;
        std::string id_;
        std::string sink_name_;

        GstElement* pipeline_ = nullptr;
        GstElement* sink_ = nullptr;

        int64_t frame_id_ = 0;
        bool ended_ = false;
    };
}

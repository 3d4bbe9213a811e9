#pragma once

#include <memory>
#include <string>

#include <common/config.hpp>
#include <ingest/frame_source.hpp>

namespace tp {
    enum class SourceKind {
        Webcam, // "0", "1", ... -> /dev/videoN
        Rtsp,
        Uri,    // http(s)://
        File
    };

    SourceKind classify_source(const std::string& source);

    // Builds the GStreamer launch line for a session source.
    std::string build_pipeline(const std::string& source,
                               const CaptureConfig& cfg,
                               const std::string& sink_name);

    std::unique_ptr<IFrameSource> make_frame_source(const std::string& source,
                                                    const CaptureConfig& cfg);
}

#include <ingest/frame_source_factory.hpp>
#include <ingest/gst_frame_source.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>

#include <common/errors.hpp>

namespace tp {
    static std::string appsink(const std::string& sink_name) {
        return "appsink name=" + sink_name + " max-buffers=2 drop=true sync=false";
    }

    static bool starts_with(const std::string& s, const char* prefix) {
        return s.rfind(prefix, 0) == 0;
    }

    static std::string webcam_pipeline(const std::string& index, const CaptureConfig& c, const std::string& sink_name) {
        const std::string device = "/dev/video" + index;
        if (c.webcam_mjpg) {
            return "v4l2src device=" + device + " ! "
                   "image/jpeg,width=" + std::to_string(c.webcam_width)
                   + ",height=" + std::to_string(c.webcam_height)
                   + ",framerate=" + std::to_string(c.webcam_fps) + "/1 ! "
                   "jpegdec ! videoconvert ! video/x-raw,format=BGR ! " + appsink(sink_name);
        }
        return "v4l2src device=" + device + " ! "
               "video/x-raw,width=" + std::to_string(c.webcam_width)
               + ",height=" + std::to_string(c.webcam_height) + " ! "
               "videoconvert ! video/x-raw,format=BGR ! " + appsink(sink_name);
    }

    static std::string rtsp_pipeline(const std::string& url, const CaptureConfig& c, const std::string& sink_name) {
        const std::string proto = c.rtsp_tcp ? "tcp" : "udp";
        return "rtspsrc location=\"" + url +
               "\" latency=" + std::to_string(c.rtsp_latency_ms) +
               " protocols=" + proto + " drop-on-latency=true ! "
               "decodebin ! videoconvert ! video/x-raw,format=BGR ! " + appsink(sink_name);
    }

    static std::string uri_pipeline(const std::string& uri, const std::string& sink_name) {
        return "uridecodebin uri=\"" + uri + "\" ! "
               "videoconvert ! video/x-raw,format=BGR ! " + appsink(sink_name);
    }

    static std::string file_pipeline(const std::string& path, const std::string& sink_name) {
        return "filesrc location=\"" + path + "\" ! "
               "decodebin ! videoconvert ! video/x-raw,format=BGR ! " + appsink(sink_name);
    }

    // The source lands inside a quoted gst-launch property; quotes, escapes and
    // element links would let it splice extra elements into the pipeline.
    static bool safe_for_launch(const std::string& source) {
        return std::none_of(source.begin(), source.end(), [](unsigned char c) {
            return c == '"' || c == '\'' || c == '\\' || c == '!' || std::iscntrl(c) != 0;
        });
    }

    SourceKind classify_source(const std::string& source) {
        if (!source.empty() &&
            std::all_of(source.begin(), source.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return SourceKind::Webcam;
        }
        if (starts_with(source, "rtsp://") || starts_with(source, "rtsps://")) return SourceKind::Rtsp;
        if (starts_with(source, "http://") || starts_with(source, "https://")) return SourceKind::Uri;
        return SourceKind::File;
    }

    std::string build_pipeline(const std::string& source,
                               const CaptureConfig& cfg,
                               const std::string& sink_name) {
        if (source.empty()) {
            throw TrafficError(ErrorKind::InputError, "stream source is empty");
        }
        if (!safe_for_launch(source)) {
            throw TrafficError(ErrorKind::InputError, "stream source contains forbidden characters");
        }
        switch (classify_source(source)) {
            case SourceKind::Webcam: return webcam_pipeline(source, cfg, sink_name);
            case SourceKind::Rtsp: return rtsp_pipeline(source, cfg, sink_name);
            case SourceKind::Uri: return uri_pipeline(source, sink_name);
            case SourceKind::File: return file_pipeline(source, sink_name);
        }
        return file_pipeline(source, sink_name);
    }

    std::unique_ptr<IFrameSource> make_frame_source(const std::string& source,
                                                    const CaptureConfig& cfg) {
        // appsink name must be unique per process
        static std::atomic<int> next_sink{0};
        const std::string sink_name = "sink_" + std::to_string(next_sink.fetch_add(1));
        return std::make_unique<GstFrameSource>(build_pipeline(source, cfg, sink_name), source, sink_name);
    }
}

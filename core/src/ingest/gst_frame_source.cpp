#include <ingest/gst_frame_source.hpp>

#include <gst/gst.h>
#include <gst/app/gstappsink.h>
#include <gst/video/video.h>
#include <opencv2/core.hpp>
#include <iostream>
#include <mutex>

namespace tp {
    namespace {
        constexpr GstClockTime kPrerollTimeout = 5 * GST_SECOND;

        void ensure_gst_initialized() {
            static std::once_flag flag;
            std::call_once(flag, [] { gst_init(nullptr, nullptr); });
        }

        // Maps a sample buffer for reading for the lifetime of the object.
        class MappedSample {
        public:
            explicit MappedSample(GstSample* s) : sample_(s) {
                buffer_ = sample_ ? gst_sample_get_buffer(sample_) : nullptr;
                mapped_ = buffer_ && gst_buffer_map(buffer_, &map_, GST_MAP_READ) && map_.data && map_.size > 0;
            }
            ~MappedSample() {
                if (mapped_) gst_buffer_unmap(buffer_, &map_);
                if (sample_) gst_sample_unref(sample_);
            }
            MappedSample(const MappedSample&) = delete;
            MappedSample& operator=(const MappedSample&) = delete;

            bool ok() const { return mapped_; }
            GstBuffer* buffer() const { return buffer_; }
            GstCaps* caps() const { return gst_sample_get_caps(sample_); }
            const guint8* data() const { return map_.data; }
            size_t size() const { return map_.size; }

        private:
            GstSample* sample_;
            GstBuffer* buffer_ = nullptr;
            GstMapInfo map_{};
            bool mapped_ = false;
        };

        // Copies a packed BGR sample into a Mat, honoring the row stride.
        bool copy_bgr(const MappedSample& m, cv::Mat& out) {
            GstCaps* caps = m.caps();
            if (!caps) return false;

            GstVideoInfo vinfo;
            if (!gst_video_info_from_caps(&vinfo, caps)) return false;

            const int width = GST_VIDEO_INFO_WIDTH(&vinfo);
            const int height = GST_VIDEO_INFO_HEIGHT(&vinfo);
            if (width <= 0 || height <= 0) return false;

            int stride = GST_VIDEO_INFO_PLANE_STRIDE(&vinfo, 0);
            if (stride <= 0) stride = width * 3;
            if (m.size() < static_cast<size_t>(stride) * static_cast<size_t>(height)) return false;

            const cv::Mat view(height, width, CV_8UC3,
                               const_cast<guint8*>(m.data()), static_cast<size_t>(stride));
            out = view.clone();
            return true;
        }
    } // namespace

    GstFrameSource::GstFrameSource(std::string pipeline, std::string id, std::string sink_name)
        : pipeline_str_(std::move(pipeline)), id_(std::move(id)), sink_name_(std::move(sink_name)) {}

    GstFrameSource::~GstFrameSource() {
        stop();
    }

    bool GstFrameSource::build_() {
        GError* err = nullptr;
        pipeline_ = gst_parse_launch(pipeline_str_.c_str(), &err);
        if (err) {
            // a partially parsed pipeline is not trusted either
            std::cerr << "[Capture](" << id_ << ") launch error: " << err->message << "\n";
            g_error_free(err);
            return false;
        }
        if (!pipeline_) return false;

        sink_ = gst_bin_get_by_name(GST_BIN(pipeline_), sink_name_.c_str());
        if (!sink_) {
            std::cerr << "[Capture](" << id_ << ") no appsink named " << sink_name_ << "\n";
            return false;
        }

        // keep only the freshest frames; the session pulls at its own pace
        GstAppSink* appsink = GST_APP_SINK(sink_);
        gst_app_sink_set_emit_signals(appsink, FALSE);
        gst_app_sink_set_max_buffers(appsink, 2);
        gst_app_sink_set_drop(appsink, TRUE);
        return true;
    }

    bool GstFrameSource::start() {
        ensure_gst_initialized();
        ended_ = false;
        frame_id_ = 0;

        if (!build_()) {
            stop();
            return false;
        }

        if (gst_element_set_state(pipeline_, GST_STATE_PLAYING) == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[Capture](" << id_ << ") refused to play\n";
            stop();
            return false;
        }

        // an unopenable device or URL fails preroll
        GstState current = GST_STATE_NULL;
        if (gst_element_get_state(pipeline_, &current, nullptr, kPrerollTimeout) == GST_STATE_CHANGE_FAILURE) {
            std::cerr << "[Capture](" << id_ << ") source could not be opened\n";
            poll_bus_();
            stop();
            return false;
        }
        return true;
    }

    void GstFrameSource::poll_bus_() {
        if (!pipeline_) return;
        GstBus* bus = gst_element_get_bus(pipeline_);
        if (!bus) return;

        const auto wanted = static_cast<GstMessageType>(GST_MESSAGE_EOS | GST_MESSAGE_ERROR);
        for (GstMessage* msg = gst_bus_pop_filtered(bus, wanted); msg; msg = gst_bus_pop_filtered(bus, wanted)) {
            if (GST_MESSAGE_TYPE(msg) == GST_MESSAGE_ERROR) {
                GError* err = nullptr;
                gst_message_parse_error(msg, &err, nullptr);
                std::cerr << "[Capture](" << id_ << ") " << (err ? err->message : "pipeline error") << "\n";
                if (err) g_error_free(err);
            } else {
                std::cerr << "[Capture](" << id_ << ") end of stream\n";
            }
            ended_ = true;
            gst_message_unref(msg);
        }
        gst_object_unref(bus);
    }

    bool GstFrameSource::read(FramePacket& out, int timeout_ms) {
        if (!sink_ || ended_) return false;

        GstAppSink* appsink = GST_APP_SINK(sink_);
        GstSample* sample = gst_app_sink_try_pull_sample(appsink, static_cast<GstClockTime>(timeout_ms) * GST_MSECOND);
        if (!sample) {
            if (gst_app_sink_is_eos(appsink)) ended_ = true;
            poll_bus_();
            return false;
        }

        const MappedSample mapped(sample);
        if (!mapped.ok() || !copy_bgr(mapped, out.bgr)) return false;

        const GstClockTime pts = GST_BUFFER_PTS(mapped.buffer());
        out.pts_ns = GST_CLOCK_TIME_IS_VALID(pts) ? static_cast<int64_t>(pts) : 0;
        out.frame_id = frame_id_++;
        return true;
    }

    void GstFrameSource::stop() {
        if (!pipeline_) return;
        gst_element_set_state(pipeline_, GST_STATE_NULL);

        if (sink_) {
            gst_object_unref(sink_);
            sink_ = nullptr;
        }
        gst_object_unref(pipeline_);
        pipeline_ = nullptr;
    }
}

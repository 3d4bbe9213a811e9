#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include <encode/video_converter.hpp>

namespace tp {
    // Writes annotated frames to an MJPG AVI next to the requested output path.
    // The writer opens lazily on the first frame, which fixes the frame size.
    class AnnotatedVideoWriter {
    public:
        AnnotatedVideoWriter(std::string requested_path, double fps);
        ~AnnotatedVideoWriter();

        AnnotatedVideoWriter(const AnnotatedVideoWriter&) = delete;
        AnnotatedVideoWriter& operator=(const AnnotatedVideoWriter&) = delete;

        void write(const cv::Mat& frame);

        // Closes the AVI and, when a converter is given and the requested path
        // is an .mp4, converts it. Returns the path of the artifact that exists,
        // or an empty string when nothing was written.
        std::string finish(IVideoConverter* converter);

        int64_t frames_written() const { return frames_written_; }
        const std::string& avi_path() const { return avi_path_; }

    private:
        bool open_(const cv::Size& size);

        std::string requested_path_;
        std::string avi_path_;
        double fps_;
        cv::Size size_;
        bool failed_ = false;
        int64_t frames_written_ = 0;

        struct Impl;
        std::unique_ptr<Impl> impl_;
    };
}

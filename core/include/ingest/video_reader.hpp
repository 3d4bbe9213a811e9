#pragma once

#include <memory>
#include <string>

#include <opencv2/core.hpp>

namespace tp {
    // Finite, seekable-forward video used by offline analysis.
    class IVideoReader {
    public:
        virtual ~IVideoReader() = default;

        virtual bool is_open() const = 0;
        // Container frame rate; <= 0 when unknown.
        virtual double fps() const = 0;
        // Decodes the next frame.
        virtual bool read(cv::Mat& out) = 0;
        // Advances one frame without decoding it.
        virtual bool grab() = 0;
    };

    std::unique_ptr<IVideoReader> open_video_file(const std::string& path);
}

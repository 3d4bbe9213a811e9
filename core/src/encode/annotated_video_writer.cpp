#include <encode/annotated_video_writer.hpp>

#include <filesystem>
#include <iostream>
#include <utility>

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

#include <common/resize.hpp>

namespace tp {
    struct AnnotatedVideoWriter::Impl {
        cv::VideoWriter writer;
    };

    AnnotatedVideoWriter::AnnotatedVideoWriter(std::string requested_path, double fps)
        : requested_path_(std::move(requested_path)),
          fps_(fps > 0.0 ? fps : 1.0),
          impl_(std::make_unique<Impl>()) {
        avi_path_ = std::filesystem::path(requested_path_).replace_extension(".avi").string();
    }

    AnnotatedVideoWriter::~AnnotatedVideoWriter() {
        if (impl_ && impl_->writer.isOpened()) impl_->writer.release();
    }

    bool AnnotatedVideoWriter::open_(const cv::Size& size) {
        const int fourcc = cv::VideoWriter::fourcc('M', 'J', 'P', 'G');
        if (!impl_->writer.open(avi_path_, fourcc, fps_, size) || !impl_->writer.isOpened()) {
            std::cerr << "[VideoWriter](open_) cannot open " << avi_path_ << "\n";
            failed_ = true;
            return false;
        }
        size_ = size;
        return true;
    }

    void AnnotatedVideoWriter::write(const cv::Mat& frame) {
        if (failed_ || frame.empty()) return;

        cv::Mat out = frame;
        if (!impl_->writer.isOpened()) {
            out = to_even_size(frame);
            if (!open_(out.size())) return;
        }
        if (out.size() != size_) {
            cv::Mat resized;
            cv::resize(out, resized, size_);
            out = resized;
        }
        impl_->writer.write(out);
        ++frames_written_;
    }

    std::string AnnotatedVideoWriter::finish(IVideoConverter* converter) {
        namespace fs = std::filesystem;
        if (impl_->writer.isOpened()) impl_->writer.release();
        if (frames_written_ == 0) return {};

        const fs::path requested(requested_path_);
        if (!converter || requested.extension() != ".mp4") return avi_path_;

        if (!converter->convert(avi_path_, requested_path_)) {
            std::cerr << "[VideoWriter](finish) conversion failed, keeping " << avi_path_ << "\n";
            return avi_path_;
        }

        std::error_code ec;
        fs::remove(avi_path_, ec);
        if (ec) {
            std::cerr << "[VideoWriter](finish) could not remove " << avi_path_ << ": " << ec.message() << "\n";
        }
        return requested_path_;
    }
}

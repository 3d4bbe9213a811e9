#pragma once

#include <opencv2/imgproc.hpp>
#include <algorithm>

namespace tp {
    // Shrinks the frame so its longest side is at most max_side.
    // Frames already within bounds (or max_side <= 0) are returned as-is.
    inline cv::Mat limit_longest_side(const cv::Mat& src, int max_side) {
        if (src.empty() || max_side <= 0) return src;

        const int longest = std::max(src.cols, src.rows);
        if (longest <= max_side) return src;

        const double s = static_cast<double>(max_side) / static_cast<double>(longest);
        const int new_w = std::max(1, static_cast<int>(src.cols * s));
        const int new_h = std::max(1, static_cast<int>(src.rows * s));

        cv::Mat dst;
        cv::resize(src, dst, {new_w, new_h}, 0, 0, cv::INTER_AREA);
        return dst;
    }

    // Even dimensions keep MJPG/H.264 encoders happy.
    inline cv::Mat to_even_size(const cv::Mat& src) {
        if (src.empty()) return src;
        const int w = src.cols - (src.cols % 2);
        const int h = src.rows - (src.rows % 2);
        if (w == src.cols && h == src.rows) return src;
        if (w <= 0 || h <= 0) return src;

        cv::Mat dst;
        cv::resize(src, dst, {w, h}, 0, 0, cv::INTER_LINEAR);
        return dst;
    }
}

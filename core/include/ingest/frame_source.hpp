#pragma once

#include <cstdint>
#include <string>

#include <opencv2/core.hpp>

namespace tp {
    struct FramePacket {
        cv::Mat bgr;
        int64_t pts_ns = 0;
        int64_t frame_id = 0;
    };

    // Live capture source. start() opens the device or stream; read() blocks
    // for at most timeout_ms.
    struct IFrameSource {
        virtual ~IFrameSource() = default;
        virtual bool start() = 0;
        virtual void stop() = 0;
        virtual bool read(FramePacket& out, int timeout_ms) = 0;
        // True once the source can never deliver another frame (EOS or error).
        virtual bool ended() const = 0;
        virtual const std::string& id() const = 0;
    };
}

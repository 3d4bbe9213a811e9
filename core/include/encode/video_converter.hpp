#pragma once

#include <memory>
#include <string>

#include <common/config.hpp>

namespace tp {
    // Post-processing of annotated videos into a browser friendly container.
    // Failure is reported, never thrown; callers keep the unconverted file.
    class IVideoConverter {
    public:
        virtual ~IVideoConverter() = default;
        virtual bool convert(const std::string& input_path, const std::string& output_path) = 0;
    };

    // Runs an external ffmpeg binary: libx264 at the configured crf.
    class FfmpegConverter final : public IVideoConverter {
    public:
        explicit FfmpegConverter(ConverterConfig cfg);

        bool convert(const std::string& input_path, const std::string& output_path) override;

    private:
        ConverterConfig cfg_;
    };

    // nullptr when conversion is disabled in the configuration
    std::shared_ptr<IVideoConverter> make_video_converter(const ConverterConfig& cfg);
}

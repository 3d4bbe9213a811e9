#include <encode/video_converter.hpp>

#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <spawn.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

namespace tp {
    FfmpegConverter::FfmpegConverter(ConverterConfig cfg)
        : cfg_(std::move(cfg)) {}

    bool FfmpegConverter::convert(const std::string& input_path, const std::string& output_path) {
        namespace fs = std::filesystem;
        if (!fs::exists(input_path)) return false;

        const std::string crf = std::to_string(cfg_.crf);
        std::vector<std::string> args = {
            cfg_.binary, "-y", "-loglevel", "error",
            "-i", input_path,
            "-vcodec", "libx264", "-crf", crf, "-pix_fmt", "yuv420p",
            output_path
        };
        std::vector<char*> argv;
        argv.reserve(args.size() + 1);
        for (auto& a : args) argv.push_back(a.data());
        argv.push_back(nullptr);

        posix_spawn_file_actions_t actions;
        posix_spawn_file_actions_init(&actions);
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

        pid_t pid = 0;
        const int rc = posix_spawnp(&pid, cfg_.binary.c_str(), &actions, nullptr, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);
        if (rc != 0) {
            std::cerr << "[Converter](convert) failed to launch " << cfg_.binary << " (errno " << rc << ")\n";
            return false;
        }

        int status = 0;
        if (waitpid(pid, &status, 0) < 0) {
            std::cerr << "[Converter](convert) waitpid failed for " << cfg_.binary << "\n";
            return false;
        }
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            std::cerr << "[Converter](convert) " << cfg_.binary << " exited with failure for " << input_path << "\n";
            return false;
        }

        std::error_code ec;
        const auto size = fs::file_size(output_path, ec);
        return !ec && size > 0;
    }

    std::shared_ptr<IVideoConverter> make_video_converter(const ConverterConfig& cfg) {
        if (!cfg.enabled) return nullptr;
        return std::make_shared<FfmpegConverter>(cfg);
    }
}

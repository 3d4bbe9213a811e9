#include <ingest/video_reader.hpp>

#include <opencv2/videoio.hpp>

namespace tp {
    namespace {
        class OpenCvVideoReader final : public IVideoReader {
        public:
            explicit OpenCvVideoReader(const std::string& path) : cap_(path) {}

            ~OpenCvVideoReader() override {
                if (cap_.isOpened()) cap_.release();
            }

            bool is_open() const override { return cap_.isOpened(); }

            double fps() const override {
                return cap_.isOpened() ? cap_.get(cv::CAP_PROP_FPS) : 0.0;
            }

            bool read(cv::Mat& out) override {
                if (!cap_.isOpened()) return false;
                return cap_.read(out) && !out.empty();
            }

            bool grab() override {
                return cap_.isOpened() && cap_.grab();
            }

        private:
            cv::VideoCapture cap_;
        };
    } // namespace

    std::unique_ptr<IVideoReader> open_video_file(const std::string& path) {
        return std::make_unique<OpenCvVideoReader>(path);
    }
}

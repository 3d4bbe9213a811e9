#include <analysis/image_analyzer.hpp>

#include <iostream>
#include <utility>

#include <opencv2/imgcodecs.hpp>

#include <common/errors.hpp>

namespace tp {
    ImageAnalyzer::ImageAnalyzer(DetectorBinding vehicles,
                                 DetectorBinding emergency,
                                 SignalPolicy policy,
                                 Annotator annotator)
        : vehicles_(std::move(vehicles)),
          emergency_(std::move(emergency)),
          policy_(std::move(policy)),
          annotator_(std::move(annotator)) {}

    ImageAnalysis ImageAnalyzer::analyze(const cv::Mat& image, const std::string& annotated_output_path) const {
        if (image.empty()) {
            throw TrafficError(ErrorKind::InputError, "image is empty or could not be decoded");
        }

        ImageAnalysis out;

        const DetectionSet vehicles = vehicles_.run(image);
        out.vehicle_count = static_cast<int64_t>(count_in_classes(vehicles, vehicles_.classes));

        DetectionSet emergency = std::vector<UntrackedDetection>{};
        if (emergency_.enabled()) {
            emergency = emergency_.run(image);
            out.emergency_detected = count_in_classes(emergency, emergency_.classes) > 0;
        }

        out.green_time_seconds = policy_.image_green_time(out.vehicle_count, out.emergency_detected);

        if (!annotated_output_path.empty()) {
            cv::Mat annotated = image.clone();
            annotator_.draw_vehicles(annotated, vehicles);
            annotator_.draw_emergency(annotated, emergency);
            try {
                if (cv::imwrite(annotated_output_path, annotated)) {
                    out.annotated_image_path = annotated_output_path;
                } else {
                    std::cerr << "[ImageAnalyzer](analyze) imwrite failed for " << annotated_output_path << "\n";
                }
            } catch (const cv::Exception& e) {
                std::cerr << "[ImageAnalyzer](analyze) imwrite error: " << e.what() << "\n";
            }
        }
        return out;
    }
}

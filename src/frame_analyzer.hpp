#ifndef FRAME_ANALYZER_HPP
#define FRAME_ANALYZER_HPP

#include "face_detector.hpp"
#include "session_registry.hpp"
#include <opencv2/opencv.hpp>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct FrameAnalysis {
    int faces_count;
    double motion_score;
    std::optional<std::vector<float>> face_signature;
    bool detection_enabled;

    FrameAnalysis() : faces_count(0), motion_score(0.0), detection_enabled(true) {}
};

class FrameAnalyzer {
public:
    explicit FrameAnalyzer(std::shared_ptr<FaceDetector> detector);
    ~FrameAnalyzer() = default;

    // Decodes and analyzes one frame. Updates the session's motion cache.
    // Throws InvalidFrameError for empty, oversized or undecodable payloads.
    FrameAnalysis analyze(const std::string& frame_bytes, SessionRuntime& runtime);

    bool detectionEnabled() const { return detector_->isEnabled(); }
    std::string detectorName() const { return detector_->name(); }

    static cv::Mat decodeFrame(const std::string& frame_bytes);

    // Accepts a data URL ("data:image/...;base64,...") or bare base64.
    static std::string decodeBase64Payload(const std::string& payload);

    // 32-bin L2-normalized histogram of the face crop resized to 64x64.
    static std::optional<std::vector<float>> faceSignature(const cv::Mat& gray, const cv::Rect& box);

    // Mean absolute difference against previous_small, scaled to [0, 1].
    // previous_small is replaced with the downsampled current frame.
    static double motionScore(const cv::Mat& gray, cv::Mat& previous_small);

    // Cosine similarity. std::nullopt when either side is empty, lengths
    // differ or the norm product is not positive.
    static std::optional<double> compareSignatures(const std::vector<float>& a, const std::vector<float>& b);

    static constexpr size_t MAX_FRAME_BYTES = 10 * 1024 * 1024;
    static constexpr int SIGNATURE_BINS = 32;
    static constexpr int SIGNATURE_CROP_SIZE = 64;
    static constexpr int MOTION_WIDTH = 160;
    static constexpr int MOTION_HEIGHT = 90;

private:
    std::shared_ptr<FaceDetector> detector_;
};

#endif // FRAME_ANALYZER_HPP

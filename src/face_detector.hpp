#ifndef FACE_DETECTOR_HPP
#define FACE_DETECTOR_HPP

#include <opencv2/opencv.hpp>
#include <dlib/image_processing/frontal_face_detector.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Face detection capability. Implementations are selected once at startup.
class FaceDetector {
public:
    virtual ~FaceDetector() = default;

    // Face boxes in the 8-bit grayscale frame.
    virtual std::vector<cv::Rect> detect(const cv::Mat& gray) = 0;

    // False for the pass-through detector.
    virtual bool isEnabled() const = 0;

    virtual std::string name() const = 0;
};

// Haar cascade detector.
class CascadeFaceDetector : public FaceDetector {
public:
    CascadeFaceDetector() = default;

    // Loads the given cascade file, or searches the usual install locations
    // when path is empty.
    bool initialize(const std::string& cascade_path = "");

    std::vector<cv::Rect> detect(const cv::Mat& gray) override;
    bool isEnabled() const override { return loaded_; }
    std::string name() const override { return "cascade"; }

    const std::string& cascadePath() const { return cascade_path_; }

    static const std::vector<std::string>& defaultCascadePaths();

private:
    cv::CascadeClassifier face_cascade_;
    std::string cascade_path_;
    bool loaded_ = false;
    std::mutex mutex_;

    static constexpr double SCALE_FACTOR = 1.2;
    static constexpr int MIN_NEIGHBORS = 5;
    static constexpr int MIN_FACE_SIZE = 50;
};

// dlib HOG frontal face detector.
class DlibFaceDetector : public FaceDetector {
public:
    DlibFaceDetector();

    std::vector<cv::Rect> detect(const cv::Mat& gray) override;
    bool isEnabled() const override { return true; }
    std::string name() const override { return "dlib"; }

private:
    dlib::frontal_face_detector face_detector;
    std::mutex mutex_;
};

// Used when no real detector is available. Frames are reported as one face.
class PassThroughFaceDetector : public FaceDetector {
public:
    std::vector<cv::Rect> detect(const cv::Mat&) override { return {}; }
    bool isEnabled() const override { return false; }
    std::string name() const override { return "none"; }
};

// kind is "cascade", "dlib" or "none". Falls back to pass-through with a
// warning when the requested detector cannot be set up.
std::shared_ptr<FaceDetector> createFaceDetector(const std::string& kind, const std::string& cascade_path = "");

#endif // FACE_DETECTOR_HPP

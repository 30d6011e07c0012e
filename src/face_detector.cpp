#include "face_detector.hpp"
#include "text_utils.hpp"
#include <dlib/opencv.h>
#include <algorithm>
#include <fstream>
#include <iostream>

const std::vector<std::string>& CascadeFaceDetector::defaultCascadePaths() {
    static const std::vector<std::string> paths = {
        "/usr/share/opencv4/haarcascades/haarcascade_frontalface_default.xml",
        "/usr/local/share/opencv4/haarcascades/haarcascade_frontalface_default.xml",
        "/opt/homebrew/share/opencv4/haarcascades/haarcascade_frontalface_default.xml",
        "/usr/share/opencv/haarcascades/haarcascade_frontalface_default.xml",
        "/usr/share/opencv4/haarcascades/haarcascade_frontalface_alt.xml"
    };
    return paths;
}

bool CascadeFaceDetector::initialize(const std::string& cascade_path) {
    std::vector<std::string> candidates;
    if (!cascade_path.empty()) {
        candidates.push_back(cascade_path);
    } else {
        candidates = defaultCascadePaths();
    }

    for (const auto& path : candidates) {
        std::ifstream cascade_file(path);
        if (!cascade_file.good()) {
            continue;
        }
        try {
            if (face_cascade_.load(path)) {
                cascade_path_ = path;
                loaded_ = true;
                std::cout << "Face cascade loaded from: " << path << std::endl;
                return true;
            }
        } catch (const cv::Exception& e) {
            std::cerr << "Failed to load cascade " << path << ": " << e.what() << std::endl;
        }
    }

    std::cerr << "No usable face cascade found" << std::endl;
    loaded_ = false;
    return false;
}

std::vector<cv::Rect> CascadeFaceDetector::detect(const cv::Mat& gray) {
    std::vector<cv::Rect> faces;
    if (!loaded_ || gray.empty()) {
        return faces;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    face_cascade_.detectMultiScale(gray, faces, SCALE_FACTOR, MIN_NEIGHBORS, 0,
                                   cv::Size(MIN_FACE_SIZE, MIN_FACE_SIZE));
    return faces;
}

DlibFaceDetector::DlibFaceDetector() {
    face_detector = dlib::get_frontal_face_detector();
}

std::vector<cv::Rect> DlibFaceDetector::detect(const cv::Mat& gray) {
    std::vector<cv::Rect> faces;
    if (gray.empty() || gray.type() != CV_8UC1) {
        return faces;
    }

    std::vector<dlib::rectangle> detections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dlib::cv_image<unsigned char> dlib_image(gray);
        detections = face_detector(dlib_image);
    }

    const cv::Rect bounds(0, 0, gray.cols, gray.rows);
    for (const auto& rect : detections) {
        cv::Rect box(static_cast<int>(rect.left()), static_cast<int>(rect.top()),
                     static_cast<int>(rect.width()), static_cast<int>(rect.height()));
        box &= bounds;
        if (box.area() > 0) {
            faces.push_back(box);
        }
    }
    return faces;
}

std::shared_ptr<FaceDetector> createFaceDetector(const std::string& kind, const std::string& cascade_path) {
    std::string lower = normalizeText(kind);

    if (lower == "none") {
        std::cout << "Face detection disabled" << std::endl;
        return std::make_shared<PassThroughFaceDetector>();
    }

    if (lower == "dlib") {
        try {
            auto detector = std::make_shared<DlibFaceDetector>();
            std::cout << "Using dlib HOG face detector" << std::endl;
            return detector;
        } catch (const std::exception& e) {
            std::cerr << "Warning: dlib face detector unavailable: " << e.what() << std::endl;
            return std::make_shared<PassThroughFaceDetector>();
        }
    }

    if (lower != "cascade") {
        std::cerr << "Warning: unknown detector '" << kind << "', using cascade" << std::endl;
    }

    auto cascade = std::make_shared<CascadeFaceDetector>();
    if (cascade->initialize(cascade_path)) {
        return cascade;
    }
    std::cerr << "Warning: face detection disabled, frames will not be analyzed for faces" << std::endl;
    return std::make_shared<PassThroughFaceDetector>();
}

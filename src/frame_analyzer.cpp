#include "frame_analyzer.hpp"
#include "interview_errors.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>

FrameAnalyzer::FrameAnalyzer(std::shared_ptr<FaceDetector> detector)
    : detector_(detector ? std::move(detector) : std::make_shared<PassThroughFaceDetector>()) {
}

cv::Mat FrameAnalyzer::decodeFrame(const std::string& frame_bytes) {
    if (frame_bytes.empty()) {
        throw InvalidFrameError("Invalid frame payload");
    }
    if (frame_bytes.size() > MAX_FRAME_BYTES) {
        std::cerr << "Frame size exceeds limit: " << frame_bytes.size() << " bytes" << std::endl;
        throw InvalidFrameError("Frame exceeds maximum size of 10MB");
    }

    std::vector<uchar> buffer(frame_bytes.begin(), frame_bytes.end());
    cv::Mat image;
    try {
        image = cv::imdecode(buffer, cv::IMREAD_COLOR);
    } catch (const cv::Exception& e) {
        std::cerr << "Error decoding frame: " << e.what() << std::endl;
        throw InvalidFrameError("Invalid frame payload");
    }
    if (image.empty()) {
        throw InvalidFrameError("Invalid frame payload");
    }
    return image;
}

std::string FrameAnalyzer::decodeBase64Payload(const std::string& payload) {
    std::string base64_data = payload;
    size_t comma_pos = payload.find("base64,");
    if (payload.rfind("data:", 0) == 0) {
        if (comma_pos == std::string::npos) {
            throw InvalidFrameError("Frame data URL is not base64 encoded");
        }
        base64_data = payload.substr(comma_pos + 7);
    }

    static const std::string chars = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::vector<int> lookup(256, -1);
    for (int i = 0; i < 64; i++) {
        lookup[static_cast<unsigned char>(chars[i])] = i;
    }

    std::string decoded;
    decoded.reserve((base64_data.length() * 3) / 4);

    int val = 0, valb = -8;
    for (unsigned char c : base64_data) {
        if (c == '=') break;
        if (std::isspace(c)) continue;
        if (lookup[c] == -1) {
            throw InvalidFrameError("Frame payload is not valid base64");
        }
        val = (val << 6) + lookup[c];
        valb += 6;
        if (valb >= 0) {
            decoded.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }

    if (decoded.size() > MAX_FRAME_BYTES) {
        throw InvalidFrameError("Frame exceeds maximum size of 10MB");
    }
    return decoded;
}

FrameAnalysis FrameAnalyzer::analyze(const std::string& frame_bytes, SessionRuntime& runtime) {
    cv::Mat image = decodeFrame(frame_bytes);

    FrameAnalysis result;
    if (!detector_->isEnabled()) {
        result.faces_count = 1;
        result.motion_score = 0.0;
        result.detection_enabled = false;
        return result;
    }

    cv::Mat gray;
    if (image.channels() == 3) {
        cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
    } else {
        gray = image;
    }

    std::vector<cv::Rect> faces = detector_->detect(gray);
    result.faces_count = static_cast<int>(faces.size());
    if (faces.size() == 1) {
        result.face_signature = faceSignature(gray, faces.front());
    }

    {
        std::lock_guard<std::mutex> lock(runtime.frame_mutex);
        result.motion_score = motionScore(gray, runtime.last_small_frame);
    }
    return result;
}

std::optional<std::vector<float>> FrameAnalyzer::faceSignature(const cv::Mat& gray, const cv::Rect& box) {
    if (box.width <= 0 || box.height <= 0) {
        return std::nullopt;
    }
    cv::Rect clipped = box & cv::Rect(0, 0, gray.cols, gray.rows);
    if (clipped.area() <= 0) {
        return std::nullopt;
    }

    cv::Mat roi;
    cv::resize(gray(clipped), roi, cv::Size(SIGNATURE_CROP_SIZE, SIGNATURE_CROP_SIZE));

    cv::Mat hist;
    int channels[] = {0};
    int hist_size[] = {SIGNATURE_BINS};
    float range[] = {0.0f, 256.0f};
    const float* ranges[] = {range};
    cv::calcHist(&roi, 1, channels, cv::Mat(), hist, 1, hist_size, ranges);
    cv::normalize(hist, hist, 1.0, 0.0, cv::NORM_L2);

    std::vector<float> signature;
    signature.reserve(SIGNATURE_BINS);
    for (int i = 0; i < hist.rows; ++i) {
        signature.push_back(hist.at<float>(i));
    }
    return signature;
}

double FrameAnalyzer::motionScore(const cv::Mat& gray, cv::Mat& previous_small) {
    cv::Mat small;
    cv::resize(gray, small, cv::Size(MOTION_WIDTH, MOTION_HEIGHT));

    cv::Mat previous = previous_small;
    previous_small = small;
    if (previous.empty() || previous.size() != small.size() || previous.type() != small.type()) {
        return 0.0;
    }

    cv::Mat diff;
    cv::absdiff(previous, small, diff);
    return cv::mean(diff)[0] / 255.0;
}

std::optional<double> FrameAnalyzer::compareSignatures(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.empty() || b.empty() || a.size() != b.size()) {
        return std::nullopt;
    }
    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    double denom = std::sqrt(norm_a) * std::sqrt(norm_b);
    if (denom <= 1e-8) {
        return std::nullopt;
    }
    double similarity = dot / denom;
    return std::max(-1.0, std::min(1.0, similarity));
}

#include "src/frame_analyzer.hpp"
#include "src/interview_errors.hpp"
#include "src/session_registry.hpp"
#include <opencv2/opencv.hpp>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Reports whatever boxes the test sets.
class ScriptedFaceDetector : public FaceDetector {
public:
    std::vector<cv::Rect> faces;

    std::vector<cv::Rect> detect(const cv::Mat&) override { return faces; }
    bool isEnabled() const override { return true; }
    std::string name() const override { return "scripted"; }
};

namespace {

std::string encodeFrame(const cv::Scalar& color) {
    cv::Mat image(240, 320, CV_8UC3, color);
    cv::rectangle(image, cv::Rect(100, 60, 120, 120), cv::Scalar(200, 200, 200), cv::FILLED);
    std::vector<uchar> buffer;
    cv::imencode(".png", image, buffer);
    return std::string(buffer.begin(), buffer.end());
}

bool throwsInvalidFrame(FrameAnalyzer& analyzer, const std::string& bytes, SessionRuntime& runtime) {
    try {
        analyzer.analyze(bytes, runtime);
    } catch (const InvalidFrameError&) {
        return true;
    }
    return false;
}

}  // namespace

int main() {
    std::cout << "=== Testing Frame Analyzer ===" << std::endl;

    int failures = 0;
    auto check = [&failures](const std::string& name, bool condition) {
        std::cout << (condition ? "✅ " : "❌ ") << name << std::endl;
        if (!condition) {
            ++failures;
        }
    };

    auto detector = std::make_shared<ScriptedFaceDetector>();
    detector->faces = {cv::Rect(100, 60, 120, 120)};
    FrameAnalyzer analyzer(detector);

    const std::string gray_frame = encodeFrame(cv::Scalar(90, 90, 90));
    const std::string white_frame = encodeFrame(cv::Scalar(255, 255, 255));
    const std::string black_frame = encodeFrame(cv::Scalar(0, 0, 0));

    std::cout << "\n--- Motion ---" << std::endl;
    {
        SessionRuntime runtime(1);
        FrameAnalysis first = analyzer.analyze(gray_frame, runtime);
        check("First frame has no motion", first.motion_score == 0.0);
        check("Motion cache is filled", !runtime.last_small_frame.empty());

        FrameAnalysis same = analyzer.analyze(gray_frame, runtime);
        check("Identical frame has no motion", same.motion_score == 0.0);

        SessionRuntime other(2);
        analyzer.analyze(white_frame, other);
        FrameAnalysis flipped = analyzer.analyze(black_frame, other);
        check("White to black is high motion", flipped.motion_score > 0.5 && flipped.motion_score <= 1.0);

        check("Sessions keep separate caches", analyzer.analyze(gray_frame, runtime).motion_score == 0.0);
    }

    std::cout << "\n--- Faces and signatures ---" << std::endl;
    {
        SessionRuntime runtime(3);
        FrameAnalysis one = analyzer.analyze(gray_frame, runtime);
        check("One face reported", one.faces_count == 1);
        check("Detection enabled", one.detection_enabled);
        check("Signature captured", one.face_signature &&
              one.face_signature->size() == static_cast<size_t>(FrameAnalyzer::SIGNATURE_BINS));
        if (one.face_signature) {
            double norm = 0.0;
            for (float v : *one.face_signature) {
                norm += static_cast<double>(v) * v;
            }
            check("Signature is L2 normalized", std::fabs(std::sqrt(norm) - 1.0) < 1e-4);

            auto self = FrameAnalyzer::compareSignatures(*one.face_signature, *one.face_signature);
            check("Signature matches itself", self && std::fabs(*self - 1.0) < 1e-6);
        }

        detector->faces = {};
        FrameAnalysis none = analyzer.analyze(gray_frame, runtime);
        check("No face reported", none.faces_count == 0);
        check("No signature without a face", !none.face_signature);

        detector->faces = {cv::Rect(0, 0, 60, 60), cv::Rect(200, 100, 60, 60)};
        FrameAnalysis two = analyzer.analyze(gray_frame, runtime);
        check("Two faces reported", two.faces_count == 2);
        check("No signature with two faces", !two.face_signature);

        detector->faces = {cv::Rect(100, 60, 120, 120)};
    }

    std::cout << "\n--- Detection disabled ---" << std::endl;
    {
        FrameAnalyzer disabled(std::make_shared<PassThroughFaceDetector>());
        SessionRuntime runtime(4);
        FrameAnalysis result = disabled.analyze(gray_frame, runtime);
        check("Disabled detection assumes one face", result.faces_count == 1);
        check("Disabled detection reports no motion", result.motion_score == 0.0);
        check("Disabled detection is flagged", !result.detection_enabled);
        check("Disabled detection has no signature", !result.face_signature);
        check("Disabled detection still rejects garbage", throwsInvalidFrame(disabled, "not an image", runtime));

        FrameAnalyzer defaulted(nullptr);
        check("Null detector becomes pass-through", !defaulted.detectionEnabled() && defaulted.detectorName() == "none");
    }

    std::cout << "\n--- Invalid payloads ---" << std::endl;
    {
        SessionRuntime runtime(5);
        check("Empty payload rejected", throwsInvalidFrame(analyzer, "", runtime));
        check("Garbage payload rejected", throwsInvalidFrame(analyzer, "definitely not a jpeg", runtime));
        check("Oversized payload rejected",
              throwsInvalidFrame(analyzer, std::string(FrameAnalyzer::MAX_FRAME_BYTES + 1, 'x'), runtime));
        check("Rejected frames leave the motion cache alone", runtime.last_small_frame.empty());
    }

    std::cout << "\n--- Base64 payloads ---" << std::endl;
    check("Data URL decoded", FrameAnalyzer::decodeBase64Payload("data:image/png;base64,aGVsbG8=") == "hello");
    check("Bare base64 decoded", FrameAnalyzer::decodeBase64Payload("aGVs\nbG8=") == "hello");
    {
        bool rejected = false;
        try {
            FrameAnalyzer::decodeBase64Payload("@@@@");
        } catch (const InvalidFrameError&) {
            rejected = true;
        }
        check("Invalid base64 rejected", rejected);
    }

    std::cout << "\n--- Signature comparison ---" << std::endl;
    {
        auto orthogonal = FrameAnalyzer::compareSignatures({1.0f, 0.0f}, {0.0f, 1.0f});
        check("Orthogonal signatures are 0", orthogonal && std::fabs(*orthogonal) < 1e-9);
        auto opposite = FrameAnalyzer::compareSignatures({1.0f, 0.0f}, {-1.0f, 0.0f});
        check("Opposite signatures are -1", opposite && std::fabs(*opposite + 1.0) < 1e-9);
        check("Empty signature is not comparable", !FrameAnalyzer::compareSignatures({}, {1.0f}));
        check("Length mismatch is not comparable", !FrameAnalyzer::compareSignatures({1.0f}, {1.0f, 0.0f}));
        check("Zero signature is not comparable", !FrameAnalyzer::compareSignatures({0.0f, 0.0f}, {1.0f, 0.0f}));

        cv::Mat gray(100, 100, CV_8UC1, cv::Scalar(50));
        check("Box outside the frame has no signature",
              !FrameAnalyzer::faceSignature(gray, cv::Rect(200, 200, 20, 20)));
        check("Empty box has no signature", !FrameAnalyzer::faceSignature(gray, cv::Rect(10, 10, 0, 10)));
        check("Partially visible box is clipped", FrameAnalyzer::faceSignature(gray, cv::Rect(80, 80, 40, 40)).has_value());
    }

    std::cout << "\n--- Detector selection ---" << std::endl;
    {
        auto none = createFaceDetector("none");
        check("'none' is pass-through", !none->isEnabled() && none->name() == "none");
        check("Detector kind ignores case and spaces", !createFaceDetector(" NONE ")->isEnabled());
        check("Non-ASCII detector kind falls back", !createFaceDetector("d\xC3\xA9tecteur", "/nonexistent/haarcascade.xml")->isEnabled());

        auto missing = createFaceDetector("cascade", "/nonexistent/haarcascade.xml");
        check("Missing cascade falls back to pass-through", !missing->isEnabled());

        auto hog = createFaceDetector("dlib");
        check("dlib detector selected", hog->isEnabled() && hog->name() == "dlib");
        cv::Mat blank(240, 320, CV_8UC1, cv::Scalar(128));
        check("dlib finds no face in a blank frame", hog->detect(blank).empty());
    }

    if (failures == 0) {
        std::cout << "\n✅ All frame analyzer tests passed" << std::endl;
        return 0;
    }
    std::cout << "\n❌ " << failures << " frame analyzer test(s) failed" << std::endl;
    return 1;
}

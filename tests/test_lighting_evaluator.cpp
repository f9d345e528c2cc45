#include "TestCommon.hpp"
#include "core/LightingEvaluator.hpp"

#include <cstdint>
#include <opencv2/core.hpp>

using core::LightingEvaluator;
using core::LightingStatus;

namespace {

std::vector<uint8_t> uniformRgba(int width, int height, uint8_t value) {
    std::vector<uint8_t> buffer(static_cast<size_t>(width) * height * 4, value);
    for (size_t i = 3; i < buffer.size(); i += 4) buffer[i] = 255;
    return buffer;
}

// Top half black, bottom half white
std::vector<uint8_t> splitRgba(int width, int height) {
    std::vector<uint8_t> buffer(static_cast<size_t>(width) * height * 4, 0);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            uint8_t* px = &buffer[(static_cast<size_t>(y) * width + x) * 4];
            const uint8_t v = y < height / 2 ? 0 : 255;
            px[0] = v;
            px[1] = v;
            px[2] = v;
            px[3] = 255;
        }
    }
    return buffer;
}

} // namespace

bool test_boundary_rule() {
    core::CalibrationProfile profile;   // min 45, max 210, contrast 22

    bool ok = LightingEvaluator::classify(45.0f, 30.0f, profile) == LightingStatus::Good;
    ok = ok && LightingEvaluator::classify(44.99f, 30.0f, profile) == LightingStatus::LowLight;
    ok = ok && LightingEvaluator::classify(210.0f, 30.0f, profile) == LightingStatus::Good;
    ok = ok && LightingEvaluator::classify(210.01f, 30.0f, profile) == LightingStatus::Overexposed;
    ok = ok && LightingEvaluator::classify(100.0f, 22.0f, profile) == LightingStatus::Good;
    ok = ok && LightingEvaluator::classify(100.0f, 21.9f, profile) == LightingStatus::LowContrast;

    // Brightness problems take precedence over contrast
    ok = ok && LightingEvaluator::classify(10.0f, 0.0f, profile) == LightingStatus::LowLight;
    ok = ok && LightingEvaluator::classify(250.0f, 0.0f, profile) == LightingStatus::Overexposed;
    print_test_result("thresholds are strict: values on the limit are good", ok);
    return ok;
}

bool test_uniform_buffers() {
    core::CalibrationProfile profile;

    auto gray = uniformRgba(64, 48, 100);
    auto stats = LightingEvaluator::evaluate(gray.data(), 64, 48, profile);
    bool ok = near(stats.mean, 100.0f, 0.05f) && near(stats.contrast, 0.0f, 0.05f);
    ok = ok && stats.status == LightingStatus::LowContrast;

    auto dark = uniformRgba(64, 48, 10);
    ok = ok && LightingEvaluator::evaluate(dark.data(), 64, 48, profile).status == LightingStatus::LowLight;

    auto bright = uniformRgba(64, 48, 250);
    ok = ok && LightingEvaluator::evaluate(bright.data(), 64, 48, profile).status == LightingStatus::Overexposed;

    print_test_result("uniform frames report mean luma and zero contrast", ok);
    return ok;
}

bool test_contrast_and_consistency() {
    core::CalibrationProfile profile;
    auto split = splitRgba(64, 64);

    auto first = LightingEvaluator::evaluate(split.data(), 64, 64, profile);
    bool ok = near(first.mean, 127.5f, 0.1f) && near(first.contrast, 127.5f, 0.1f);
    ok = ok && first.status == LightingStatus::Good;

    for (int i = 0; i < 5 && ok; ++i) {
        auto again = LightingEvaluator::evaluate(split.data(), 64, 64, profile);
        ok = again.mean == first.mean && again.contrast == first.contrast && again.status == first.status;
    }
    print_test_result("repeated evaluation of a buffer is identical", ok);
    return ok;
}

bool test_empty_input() {
    core::CalibrationProfile profile;
    auto a = LightingEvaluator::evaluate(nullptr, 64, 48, profile);
    auto buffer = uniformRgba(4, 4, 128);
    auto b = LightingEvaluator::evaluate(buffer.data(), 0, 4, profile);
    auto c = LightingEvaluator::evaluate(cv::Mat(), profile);

    bool ok = a.mean == 0.0f && a.status == LightingStatus::LowLight;
    ok = ok && b.mean == 0.0f && b.status == LightingStatus::LowLight;
    ok = ok && c.status == LightingStatus::LowLight;
    print_test_result("empty frames report low light", ok);
    return ok;
}

bool test_stride() {
    bool ok = LightingEvaluator::sampleStride(96, 72) == 4;
    ok = ok && LightingEvaluator::sampleStride(1280, 720) == 14;
    ok = ok && LightingEvaluator::sampleStride(1920, 1080) == 21;
    print_test_result("sample stride scales with the longer side", ok);
    return ok;
}

bool test_camera_frame_throttle() {
    core::CalibrationProfile profile;
    LightingEvaluator evaluator(core::LIGHTING_INTERVAL_MS);

    cv::Mat frame(480, 640, CV_8UC3, cv::Scalar(120, 120, 120));
    bool ok = !evaluator.hasStats();
    ok = ok && evaluator.update(frame, profile, 1000);
    ok = ok && near(evaluator.stats().mean, 120.0f, 0.5f);

    cv::Mat dark(480, 640, CV_8UC3, cv::Scalar(5, 5, 5));
    ok = ok && !evaluator.update(dark, profile, 1100);          // Within the interval: cached
    ok = ok && near(evaluator.stats().mean, 120.0f, 0.5f);
    ok = ok && evaluator.update(dark, profile, 1000 + core::LIGHTING_INTERVAL_MS);
    ok = ok && evaluator.stats().status == LightingStatus::LowLight;

    evaluator.reset();
    ok = ok && !evaluator.hasStats();
    print_test_result("camera frames are evaluated at most once per interval", ok);
    return ok;
}

bool test_camera_frame_formats() {
    core::CalibrationProfile profile;
    const cv::Mat bgr(120, 160, CV_8UC3, cv::Scalar(90, 90, 90));
    const cv::Mat bgra(120, 160, CV_8UC4, cv::Scalar(90, 90, 90, 255));
    const cv::Mat gray(120, 160, CV_8UC1, cv::Scalar(90));

    auto a = LightingEvaluator::evaluate(bgr, profile);
    auto b = LightingEvaluator::evaluate(bgra, profile);
    auto c = LightingEvaluator::evaluate(gray, profile);
    bool ok = near(a.mean, 90.0f, 0.5f) && near(b.mean, a.mean, 0.01f) && near(c.mean, a.mean, 0.01f);
    ok = ok && b.status == a.status && c.status == a.status;

    const cv::Mat floats(120, 160, CV_32FC3, cv::Scalar(0.5, 0.5, 0.5));
    ok = ok && LightingEvaluator::evaluate(floats, profile).mean == 0.0f;
    print_test_result("gray and BGRA camera frames are converted before evaluation", ok);
    return ok;
}

int main() {
    std::cout << "=== LightingEvaluator tests ===" << std::endl;

    std::vector<bool> results;
    results.push_back(test_boundary_rule());
    results.push_back(test_uniform_buffers());
    results.push_back(test_contrast_and_consistency());
    results.push_back(test_empty_input());
    results.push_back(test_stride());
    results.push_back(test_camera_frame_throttle());
    results.push_back(test_camera_frame_formats());

    return summarize("LightingEvaluator", results);
}

#include "core/LightingEvaluator.hpp"
#include "core/Logger.hpp"

#include <algorithm>
#include <opencv2/imgproc.hpp>

namespace core {

namespace {
constexpr int MIN_STRIDE = 4;
constexpr int STRIDE_TARGET = 90;   // ~90 samples along the longer side
}

LightingEvaluator::LightingEvaluator(int64_t intervalMs)
    : intervalMs_(std::max<int64_t>(0, intervalMs)) {
}

int LightingEvaluator::sampleStride(int width, int height) {
    return std::max(MIN_STRIDE, std::max(width, height) / STRIDE_TARGET);
}

LightingStatus LightingEvaluator::classify(float mean, float contrast, const CalibrationProfile& profile) {
    if (mean < profile.lightingMin) return LightingStatus::LowLight;
    if (mean > profile.lightingMax) return LightingStatus::Overexposed;
    if (contrast < profile.lightingMinContrast) return LightingStatus::LowContrast;
    return LightingStatus::Good;
}

LightingStats LightingEvaluator::evaluate(const uint8_t* rgba, int width, int height,
                                          const CalibrationProfile& profile) {
    LightingStats stats;
    if (rgba == nullptr || width <= 0 || height <= 0) {
        return stats;
    }

    // Wrap without copying; only read from it
    const cv::Mat frame(height, width, CV_8UC4, const_cast<uint8_t*>(rgba));

    const int stride = sampleStride(width, height);
    const int rows = (height + stride - 1) / stride;
    const int cols = (width + stride - 1) / stride;

    cv::Mat sampled(rows, cols, CV_8UC4);
    for (int r = 0; r < rows; ++r) {
        const auto* src = frame.ptr<cv::Vec4b>(r * stride);
        auto* dst = sampled.ptr<cv::Vec4b>(r);
        for (int c = 0; c < cols; ++c) {
            dst[c] = src[c * stride];
        }
    }

    cv::Mat sampledF;
    sampled.convertTo(sampledF, CV_32FC4);

    // Rec. 709 luma from RGBA
    const cv::Matx14f lumaWeights(0.2126f, 0.7152f, 0.0722f, 0.0f);
    cv::Mat luma;
    cv::transform(sampledF, luma, lumaWeights);

    cv::Scalar mean, stddev;
    cv::meanStdDev(luma, mean, stddev);

    stats.mean = static_cast<float>(mean[0]);
    stats.contrast = static_cast<float>(stddev[0]);
    stats.status = classify(stats.mean, stats.contrast, profile);
    return stats;
}

LightingStats LightingEvaluator::evaluate(const cv::Mat& bgrFrame, const CalibrationProfile& profile) {
    if (bgrFrame.empty()) {
        return LightingStats{};
    }

    int conversion = cv::COLOR_BGR2RGBA;
    switch (bgrFrame.type()) {
        case CV_8UC3: conversion = cv::COLOR_BGR2RGBA; break;
        case CV_8UC4: conversion = cv::COLOR_BGRA2RGBA; break;
        case CV_8UC1: conversion = cv::COLOR_GRAY2RGBA; break;
        default: {
            static bool warned = false;
            if (!warned) {
                Logger::warn("LightingEvaluator: unsupported frame type ", bgrFrame.type(),
                             " (expected 8-bit gray, BGR or BGRA)");
                warned = true;
            }
            return LightingStats{};
        }
    }

    cv::Mat small;
    cv::resize(bgrFrame, small, cv::Size(LIGHTING_SAMPLE_WIDTH, LIGHTING_SAMPLE_HEIGHT), 0, 0, cv::INTER_AREA);

    cv::Mat rgba;
    cv::cvtColor(small, rgba, conversion);
    if (!rgba.isContinuous()) {
        rgba = rgba.clone();
    }
    return evaluate(rgba.ptr<uint8_t>(0), rgba.cols, rgba.rows, profile);
}

bool LightingEvaluator::update(const cv::Mat& bgrFrame, const CalibrationProfile& profile, int64_t nowMs) {
    if (hasStats() && nowMs - lastEvalMs_ < intervalMs_) {
        return false;
    }
    LightingStatus previous = stats_.status;
    stats_ = evaluate(bgrFrame, profile);
    lastEvalMs_ = nowMs;

    if (stats_.status != previous) {
        Logger::info("LightingEvaluator: ", lightingStatusName(previous), " → ",
                     lightingStatusName(stats_.status), " (mean=", stats_.mean,
                     " contrast=", stats_.contrast, ")");
    }
    return true;
}

void LightingEvaluator::setStats(const LightingStats& stats, int64_t nowMs) {
    stats_ = stats;
    lastEvalMs_ = nowMs;
}

void LightingEvaluator::reset() {
    stats_ = LightingStats{};
    lastEvalMs_ = -1;
}

} // namespace core

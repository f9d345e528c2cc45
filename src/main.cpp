#include "core/DatasetCache.hpp"
#include "core/LandmarkReplay.hpp"
#include "core/Logger.hpp"
#include "core/ProfileStore.hpp"
#include "core/ServiceConfig.hpp"
#include "core/SignLabels.hpp"
#include "core/SignPipeline.hpp"
#include "core/Types.hpp"
#include "net/OscSender.hpp"

#include <opencv2/videoio.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <thread>

// Global flag for shutdown
std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    core::Logger::info("Interrupt signal (", signum, ") received. Shutting down...");
    g_running = false;
}

namespace {

void logProgress(const core::SignPipeline::TickResult& result, const std::string& sign) {
    switch (result.event) {
        case core::SignPipeline::TickEvent::StepAccepted:
            core::Logger::info("Sign landed: ", core::toDisplayLabel(sign), " (",
                               result.step, "/", result.sequenceLength, ")");
            break;
        case core::SignPipeline::TickEvent::SequenceCompleted:
            core::Logger::info("Sequence complete: ", result.landed, " signs landed");
            break;
        default:
            break;
    }
}

int run(const core::ServiceConfig& config) {
    // 1. Reference data
    core::DatasetCache dataset;
    dataset.loadFile(config.dataset.csvPath, config.dataset.version);

    std::vector<std::string> labels = config.sequence.empty()
        ? dataset.labels(config.dataset.version)
        : core::requiredLabels(config.sequence);
    auto missing = dataset.missingLabels(config.dataset.version, labels);
    if (!missing.empty()) {
        for (const auto& label : missing) {
            core::Logger::warn("Dataset has no samples for '", label, "'");
        }
    }

    // 2. Pipeline
    const auto pipelineConfig = config.pipelineConfig();
    auto profile = core::ProfileStore::load(config.profilePath, pipelineConfig.vote.params.windowSize);
    core::SignPipeline pipeline(pipelineConfig, profile);
    if (!pipeline.setReferenceSet(dataset.select(config.dataset.version, labels))) {
        throw std::runtime_error("No usable reference samples in " + config.dataset.csvPath);
    }

    // 3. Input
    core::LandmarkReplay replay;
    if (config.replayPath.empty()) {
        throw std::runtime_error("No landmark recording configured (replay)");
    }
    replay.loadFile(config.replayPath);
    replay.setLoop(config.loopReplay);
    if (replay.empty()) {
        throw std::runtime_error("Landmark recording " + config.replayPath + " has no frames");
    }

    std::unique_ptr<cv::VideoCapture> camera;
    if (config.camera.enabled) {
        camera = std::make_unique<cv::VideoCapture>(config.camera.index);
        if (!camera->isOpened()) {
            core::Logger::warn("Camera ", config.camera.index, " unavailable, lighting check disabled");
            camera.reset();
        }
    }

    // 4. Output
    std::unique_ptr<net::OscSender> oscSender;
    if (config.osc.enabled) {
        oscSender = std::make_unique<net::OscSender>(config.osc.host, config.osc.port);
        if (!oscSender->start()) {
            oscSender.reset();
        }
    }

    core::HandFrame frame;
    if (!replay.next(frame)) return 0;

    if (config.isCalibration()) {
        pipeline.startCalibration(frame.timestampMs);
        core::Logger::info("Calibration started (", static_cast<int>(core::CALIBRATION_DURATION_S),
                           " s). Hold your usual signing position.");
    } else {
        pipeline.startRun(config.sequence);
        if (!pipeline.ready()) {
            core::Logger::warn("Classifier is not ready for the full sequence; missing signs will never land");
        }
    }

    core::Logger::info("Service running. Press Ctrl+C to exit.");

    cv::Mat cameraFrame;
    size_t failedPublishes = 0;
    int exitCode = 0;
    const auto interval = std::chrono::milliseconds(config.detectionIntervalMs);
    auto nextTick = std::chrono::steady_clock::now();

    do {
        if (camera && camera->read(cameraFrame) && !cameraFrame.empty()) {
            pipeline.updateLighting(cameraFrame, frame.timestampMs);
        }

        const std::string expected = pipeline.matcher().expectedSign();
        auto result = pipeline.tick(frame);

        logProgress(result, expected);
        if (oscSender && !oscSender->publish(result, expected)) {
            ++failedPublishes;
        }

        if (result.event == core::SignPipeline::TickEvent::CalibrationCompleted) {
            if (!core::ProfileStore::save(config.profilePath, *pipeline.calibrationResult())) {
                exitCode = 1;
            }
            break;
        }
        if (result.event == core::SignPipeline::TickEvent::SequenceCompleted && !config.loopReplay) {
            break;
        }
        if (result.event == core::SignPipeline::TickEvent::SequenceCompleted) {
            pipeline.startRun(config.sequence);
        }

        if (config.realtime) {
            nextTick += interval;
            std::this_thread::sleep_until(nextTick);
        }
    } while (g_running && replay.next(frame));

    if (config.isCalibration() && !pipeline.calibrationResult()) {
        core::Logger::warn("Recording ended before calibration finished; profile not saved");
    }

    core::Logger::info("Stopping modules...");
    if (oscSender) {
        if (failedPublishes > 0) {
            core::Logger::warn("OSC: ", failedPublishes, " ticks incomplete, ", oscSender->failedSends(),
                               " messages failed");
        }
        oscSender->stop();
    }
    return exitCode;
}

} // namespace

int main(int argc, char** argv) {
    // Register signal handlers
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const std::string configPath = argc > 1 ? argv[1] : "config/service.yaml";
    auto config = core::ServiceConfig::fromYaml(configPath);
    core::Logger::setLevel(core::Logger::parseLevel(config.logLevel));

    core::Logger::info("Starting HandSignService (", config.mode, " mode)...");

    try {
        return run(config);
    } catch (const std::exception& e) {
        core::Logger::error("Fatal: ", e.what());
    }
    return 1;
}

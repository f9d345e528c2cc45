#include "net/OscSender.hpp"
#include "core/Logger.hpp"
#include "core/SequenceMatcher.hpp"

namespace net {

OscSender::OscSender(const std::string& host, const std::string& port)
    : _host(host), _port(port) {
}

OscSender::~OscSender() {
    stop();
}

bool OscSender::start() {
    if (_loAddress) return true;

    _loAddress = lo_address_new(_host.c_str(), _port.c_str());
    if (!_loAddress) {
        core::Logger::error("OscSender: Failed to create LO address for ", _host, ":", _port);
        return false;
    }
    core::Logger::info("OscSender started. Target: ", _host, ":", _port);
    return true;
}

void OscSender::stop() {
    if (!_loAddress) return;
    lo_address_free(_loAddress);
    _loAddress = nullptr;
    core::Logger::info("OscSender stopped.");
}

bool OscSender::send(const char* path, lo_message msg) {
    int ret = lo_send_message(_loAddress, path, msg);
    lo_message_free(msg);
    if (ret == -1) {
        // Log the first failure and then every 100th to avoid flooding
        if (_failedSends++ % 100 == 0) {
            core::Logger::error("OscSender: Failed to send ", path, ": ", lo_address_errstr(_loAddress));
        }
        return false;
    }
    return true;
}

bool OscSender::publish(const core::SignPipeline::TickResult& result, const std::string& eventSign) {
    if (!_loAddress) return false;
    bool ok = true;

    lo_message rawMsg = lo_message_new();
    lo_message_add_string(rawMsg, result.rawLabel.c_str());
    lo_message_add_float(rawMsg, result.rawConfidence);
    lo_message_add_float(rawMsg, result.rawDistance);
    lo_message_add_int32(rawMsg, result.handCount);
    ok &= send("/sign/raw", rawMsg);

    lo_message stableMsg = lo_message_new();
    lo_message_add_string(stableMsg, result.stableLabel.c_str());
    lo_message_add_float(stableMsg, result.stableConfidence);
    lo_message_add_int32(stableMsg, result.hits);
    lo_message_add_int32(stableMsg, result.needsBothHands ? 1 : 0);
    ok &= send("/sign/stable", stableMsg);

    if (result.lightingEvaluated) {
        lo_message lightMsg = lo_message_new();
        lo_message_add_string(lightMsg, core::lightingStatusName(result.lighting.status));
        lo_message_add_float(lightMsg, result.lighting.mean);
        lo_message_add_float(lightMsg, result.lighting.contrast);
        ok &= send("/sign/lighting", lightMsg);
    }

    lo_message progressMsg = lo_message_new();
    lo_message_add_int32(progressMsg, static_cast<int32_t>(result.step));
    lo_message_add_int32(progressMsg, static_cast<int32_t>(result.sequenceLength));
    lo_message_add_int32(progressMsg, result.landed);
    lo_message_add_string(progressMsg, core::SequenceMatcher::getPhaseName(result.phase));
    ok &= send("/sign/progress", progressMsg);

    if (result.event != core::SignPipeline::TickEvent::None) {
        lo_message eventMsg = lo_message_new();
        lo_message_add_string(eventMsg, core::SignPipeline::getEventName(result.event));
        lo_message_add_string(eventMsg, eventSign.c_str());
        lo_message_add_int32(eventMsg, static_cast<int32_t>(result.step));
        ok &= send("/sign/event", eventMsg);
    }

    if (result.face) {
        lo_message faceMsg = lo_message_new();
        lo_message_add_float(faceMsg, result.face->anchor.x);
        lo_message_add_float(faceMsg, result.face->anchor.y);
        lo_message_add_float(faceMsg, result.face->yaw);
        lo_message_add_float(faceMsg, result.face->pitch);
        ok &= send("/sign/face", faceMsg);
    }

    return ok;
}

} // namespace net

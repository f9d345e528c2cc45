#pragma once

#include <string>
#include <lo/lo.h>

#include "core/SignPipeline.hpp"

namespace net {

/**
 * Publishes pipeline ticks to an OSC receiver (game front-end, TouchDesigner, ...).
 *
 * Addresses:
 *   /sign/raw       s label, f confidence, f distance, i hands
 *   /sign/stable    s label, f confidence, i hits, i needsBothHands
 *   /sign/lighting  s status, f mean, f contrast   (only once lighting was evaluated)
 *   /sign/progress  i step, i length, i landed, s phase
 *   /sign/event     s event, s sign, i step       (only when an event fired)
 *   /sign/face      f anchorX, f anchorY, f yaw, f pitch   (only with a face mesh)
 */
class OscSender {
public:
    OscSender(const std::string& host, const std::string& port);
    ~OscSender();

    OscSender(const OscSender&) = delete;
    OscSender& operator=(const OscSender&) = delete;

    bool start();
    void stop();

    /**
     * Send one tick. @return false if not started or any send failed
     */
    bool publish(const core::SignPipeline::TickResult& result, const std::string& eventSign = "");

    [[nodiscard]] bool isRunning() const { return _loAddress != nullptr; }
    [[nodiscard]] size_t failedSends() const { return _failedSends; }

private:
    bool send(const char* path, lo_message msg);

    std::string _host;
    std::string _port;

    lo_address _loAddress = nullptr;
    size_t _failedSends = 0;
};

} // namespace net

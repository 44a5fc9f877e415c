#pragma once

#include <thread>
#include <atomic>
#include <memory>
#include <string>
#include <lo/lo.h>
#include "core/Types.hpp"

namespace net {

/**
 * Publishes posture updates to the game over OSC.
 *
 *   /posture/state ,iffffiif        phase, depth, depthNorm, velocity, dwell,
 *                                   inBottom, validForm, quality
 *   /posture/controllers ,fffi      left, right, combined, detected
 *   /posture/event ,isff            type, name, value, quality
 *
 * Events are sent even when their state message is too old to be useful.
 */
class OscSender {
public:
    OscSender(std::shared_ptr<core::OutputQueue> inputQueue, const std::string& host,
              const std::string& port, int maxLatencyMs = core::MAX_STATE_LATENCY_MS);
    ~OscSender();

    OscSender(const OscSender&) = delete;
    OscSender& operator=(const OscSender&) = delete;

    void start();
    void stop();

    bool hasError() const { return _hasError; }
    uint64_t sentCount() const { return _sent; }
    uint64_t staleCount() const { return _stale; }

private:
    void loop();
    void send(const core::PostureUpdate& update, bool sendState);
    void sendState(const core::PostureState& state);
    void sendEvent(const core::PostureEvent& event);
    void dispatch(const char* path, lo_message msg);

    std::shared_ptr<core::OutputQueue> _inputQueue;
    std::string _host;
    std::string _port;
    int _maxLatencyMs;

    lo_address _loAddress = nullptr;

    std::atomic<bool> _running;
    std::atomic<bool> _hasError{false};
    std::atomic<uint64_t> _sent{0};
    std::atomic<uint64_t> _stale{0};
    int _consecutiveFailures = 0;
    std::thread _thread;
};

} // namespace net

#include "net/OscSender.hpp"
#include "core/Logger.hpp"
#include "core/PostureClassifier.hpp"

namespace net {

namespace {
// Consecutive send failures before the pipeline is flagged for restart
constexpr int MAX_SEND_FAILURES = 50;
} // namespace

OscSender::OscSender(std::shared_ptr<core::OutputQueue> inputQueue, const std::string& host,
                     const std::string& port, int maxLatencyMs)
    : _inputQueue(std::move(inputQueue)), _host(host), _port(port),
      _maxLatencyMs(maxLatencyMs), _running(false) {
}

OscSender::~OscSender() {
    stop();
    if (_loAddress) {
        lo_address_free(_loAddress);
    }
}

void OscSender::start() {
    if (_running) return;

    if (!_loAddress) {
        _loAddress = lo_address_new(_host.c_str(), _port.c_str());
    }
    if (!_loAddress) {
        core::Logger::error("OscSender: Failed to create LO address for ", _host, ":", _port);
        _hasError = true;
        return;
    }

    _running = true;
    _thread = std::thread(&OscSender::loop, this);
    core::Logger::info("OscSender started. Target: ", _host, ":", _port);
}

void OscSender::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    core::Logger::info("OscSender stopped. sent=", _sent.load(), " stale=", _stale.load());
}

void OscSender::loop() {
    while (_running) {
        core::PostureUpdate update;
        if (_inputQueue->pop_front(update)) {
            auto now = std::chrono::steady_clock::now();
            auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(now - update.timestamp).count();

            // Stale state is superseded by the next tick; its events are not
            const bool fresh = latency <= _maxLatencyMs;
            if (!fresh) {
                _stale++;
                core::Logger::debug("OscSender: dropping stale state, latency: ", latency, "ms");
            }
            send(update, fresh);
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

void OscSender::send(const core::PostureUpdate& update, bool sendState) {
    if (!_loAddress) return;

    if (sendState) {
        this->sendState(update.state);
    }
    for (const auto& event : update.events) {
        sendEvent(event);
    }
}

void OscSender::sendState(const core::PostureState& state) {
    lo_message stateMsg = lo_message_new();
    lo_message_add_int32(stateMsg, static_cast<int32_t>(state.phase));
    lo_message_add_float(stateMsg, state.currentDepth);
    lo_message_add_float(stateMsg, state.currentDepthNorm);
    lo_message_add_float(stateMsg, state.velocity);
    lo_message_add_float(stateMsg, state.dwellTime);
    lo_message_add_int32(stateMsg, state.isInBottom ? 1 : 0);
    lo_message_add_int32(stateMsg, state.isValidSquatForm ? 1 : 0);
    lo_message_add_float(stateMsg, state.qualityScore);
    dispatch("/posture/state", stateMsg);

    const core::ControllerMetrics& controllers = state.controllers;
    lo_message ctrlMsg = lo_message_new();
    lo_message_add_float(ctrlMsg, controllers.leftForwardMovement);
    lo_message_add_float(ctrlMsg, controllers.rightForwardMovement);
    lo_message_add_float(ctrlMsg, controllers.combinedMovement);
    lo_message_add_int32(ctrlMsg, controllers.movementDetected ? 1 : 0);
    dispatch("/posture/controllers", ctrlMsg);
}

void OscSender::sendEvent(const core::PostureEvent& event) {
    lo_message eventMsg = lo_message_new();
    lo_message_add_int32(eventMsg, static_cast<int32_t>(event.type));
    lo_message_add_string(eventMsg, core::PostureClassifier::eventName(event.type));
    lo_message_add_float(eventMsg, event.value);
    lo_message_add_float(eventMsg, event.quality);
    dispatch("/posture/event", eventMsg);
}

void OscSender::dispatch(const char* path, lo_message msg) {
    int ret = lo_send_message(_loAddress, path, msg);
    lo_message_free(msg);

    if (ret == -1) {
        _consecutiveFailures++;
        if (_consecutiveFailures == 1) {
            core::Logger::error("OscSender: Failed to send ", path, ": ", lo_address_errstr(_loAddress));
        }
        if (_consecutiveFailures >= MAX_SEND_FAILURES && !_hasError) {
            core::Logger::error("OscSender: ", _consecutiveFailures, " consecutive send failures");
            _hasError = true;
        }
        return;
    }
    _consecutiveFailures = 0;
    _sent++;
}

} // namespace net

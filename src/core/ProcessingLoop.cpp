#include "core/ProcessingLoop.hpp"
#include "core/Logger.hpp"

namespace core {

namespace {
constexpr uint64_t DROP_LOG_INTERVAL = 100;
} // namespace

ProcessingLoop::ProcessingLoop(std::shared_ptr<InputQueue> inputQueue,
                               std::shared_ptr<OutputQueue> outputQueue,
                               const ClassifierConfig& classifierConfig,
                               const ServiceConfig& serviceConfig)
    : _inputQueue(std::move(inputQueue)),
      _outputQueue(std::move(outputQueue)),
      _serviceConfig(serviceConfig),
      _classifier(std::make_unique<PostureClassifier>(classifierConfig)),
      _running(false) {

    // Events of one tick travel together with that tick's state
    _classifier->addEventCallback([this](const PostureEvent& event) {
        _pendingEvents.push_back(event);
    });

    _lastStatsTime = std::chrono::steady_clock::now();
}

ProcessingLoop::~ProcessingLoop() {
    stop();
}

void ProcessingLoop::start() {
    if (_running) return;
    _running = true;
    _lastStatsTime = std::chrono::steady_clock::now();
    _thread = std::thread(&ProcessingLoop::loop, this);
    Logger::info("ProcessingLoop started.");
}

void ProcessingLoop::stop() {
    if (!_running) return;
    _running = false;
    if (_thread.joinable()) {
        _thread.join();
    }
    Logger::info("ProcessingLoop stopped.");
}

bool ProcessingLoop::isRunning() const {
    return _running;
}

void ProcessingLoop::loop() {
    while (_running) {
        if (drain() == 0) {
            // Headset rate is ~72-120 Hz; 1 ms polling keeps added latency negligible
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        updateStats();
    }
}

size_t ProcessingLoop::drain() {
    size_t handled = 0;
    InputMessage message;
    while (_inputQueue->pop_front(message)) {
        handleMessage(message);
        handled++;
    }
    return handled;
}

void ProcessingLoop::handleMessage(const InputMessage& message) {
    switch (message.kind) {
        case InputMessage::Kind::Sample:
            handleSample(message.sample);
            break;
        case InputMessage::Kind::Calibrate:
            handleCalibrate(message);
            break;
        case InputMessage::Kind::Recalibrate:
            if (_classifier->beginRecalibration(message.value) != PostureError::None) {
                Logger::warn("ProcessingLoop: recalibration request rejected");
            }
            break;
        case InputMessage::Kind::Reset:
            _classifier->reset();
            _hasLastTimestamp = false;
            Logger::info("ProcessingLoop: session reset");
            publish();
            break;
    }
}

void ProcessingLoop::handleSample(const PoseSample& sample) {
    float deltaTime = 1.0f / _serviceConfig.nominalRateHz;
    if (_hasLastTimestamp) {
        deltaTime = static_cast<float>(sample.timestamp - _lastTimestamp);
    }

    _classifier->tick(sample, deltaTime);
    _tickCount++;

    if (_classifier->lastError() == PostureError::InputError) {
        // Rejected sample: nothing changed, nothing to publish
        return;
    }

    // Out-of-order / duplicate samples are no-ops and must not move the clock back
    if (!_hasLastTimestamp || sample.timestamp > _lastTimestamp) {
        _lastTimestamp = sample.timestamp;
        _hasLastTimestamp = true;
    }
    _lastHeadHeight = sample.headHeight();
    _hasLastHeadHeight = true;

    publish();
}

void ProcessingLoop::handleCalibrate(const InputMessage& message) {
    float height = message.value;
    if (!message.hasValue) {
        if (!_hasLastHeadHeight) {
            Logger::warn("ProcessingLoop: calibrate requested before any pose sample");
            return;
        }
        height = _lastHeadHeight;
    }

    if (_classifier->calibrateStandingHeight(height) != PostureError::None) {
        Logger::warn("ProcessingLoop: calibration to ", height, "m rejected");
        return;
    }
    publish();
}

void ProcessingLoop::publish() {
    PostureUpdate update;
    update.state = _classifier->state();
    update.events.swap(_pendingEvents);
    update.timestamp = std::chrono::steady_clock::now();

    if (!_outputQueue->try_push(std::move(update))) {
        _publishDrops++;
        if (_publishDrops % DROP_LOG_INTERVAL == 1) {
            Logger::warn("ProcessingLoop: output queue full, dropped=", _publishDrops);
        }
    }
    _pendingEvents.clear();
}

void ProcessingLoop::updateStats() {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - _lastStatsTime).count();
    if (elapsed < static_cast<long long>(_serviceConfig.statsIntervalS * 1000.0f)) {
        return;
    }

    _currentRate = _tickCount * 1000.0f / elapsed;
    _tickCount = 0;
    _lastStatsTime = now;

    const PostureState& state = _classifier->state();
    Logger::info("ProcessingLoop: ", _currentRate, " ticks/s, phase=",
                 PostureClassifier::phaseName(state.phase),
                 " depth=", state.currentDepth, "m",
                 " rejected=", _classifier->rejectedSamples(),
                 " inDropped=", _inputQueue->droppedCount(),
                 " outDropped=", _publishDrops);
}

} // namespace core

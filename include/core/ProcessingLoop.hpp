#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "Types.hpp"
#include "PostureConfig.hpp"
#include "PostureClassifier.hpp"

namespace core {

/**
 * ProcessingLoop - owns the session's PostureClassifier
 *
 * Drains pose samples and calibration commands from the input queue,
 * ticks the classifier with the sample-to-sample time delta and hands
 * the resulting state plus that tick's events to the output queue.
 */
class ProcessingLoop {
public:
    ProcessingLoop(std::shared_ptr<InputQueue> inputQueue,
                   std::shared_ptr<OutputQueue> outputQueue,
                   const ClassifierConfig& classifierConfig,
                   const ServiceConfig& serviceConfig);
    ~ProcessingLoop();

    ProcessingLoop(const ProcessingLoop&) = delete;
    ProcessingLoop& operator=(const ProcessingLoop&) = delete;

    void start();
    void stop();
    bool isRunning() const;

    /**
     * Handle everything currently queued on the calling thread.
     * Only call while the loop thread is not running.
     * @return Number of messages handled
     */
    size_t drain();

    const PostureClassifier& classifier() const { return *_classifier; }

private:
    void loop();
    void handleMessage(const InputMessage& message);
    void handleSample(const PoseSample& sample);
    void handleCalibrate(const InputMessage& message);
    void publish();
    void updateStats();

    std::shared_ptr<InputQueue> _inputQueue;
    std::shared_ptr<OutputQueue> _outputQueue;
    ServiceConfig _serviceConfig;

    std::unique_ptr<PostureClassifier> _classifier;
    std::vector<PostureEvent> _pendingEvents;

    std::atomic<bool> _running;
    std::thread _thread;

    // Sample timing
    bool _hasLastTimestamp = false;
    double _lastTimestamp = 0.0;
    bool _hasLastHeadHeight = false;
    float _lastHeadHeight = 0.0f;

    // Tick rate statistics
    std::chrono::steady_clock::time_point _lastStatsTime;
    int _tickCount = 0;
    float _currentRate = 0.0f;
    uint64_t _publishDrops = 0;
};

} // namespace core

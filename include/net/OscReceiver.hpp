#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <vector>
#include <lo/lo.h>
#include "core/Types.hpp"

namespace net {

/**
 * Receives pose samples and calibration commands from the engine over OSC.
 *
 * Addresses:
 *   /pose ,fffffffffff          t, head xyz, left xyz, right xyz
 *   /pose ,ffff                 t, head xyz (no controllers)
 *   /posture/calibrate [,f]     explicit height, or last head height
 *   /posture/recalibrate ,f     averaging window in seconds
 *   /posture/reset
 *
 * 'd' and 'i' arguments are accepted wherever 'f' is listed.
 *
 * liblo runs the handlers on its own thread, which is the single producer
 * of the input queue.
 */
class OscReceiver {
public:
    OscReceiver(std::shared_ptr<core::InputQueue> outputQueue, const std::string& port);
    ~OscReceiver();

    OscReceiver(const OscReceiver&) = delete;
    OscReceiver& operator=(const OscReceiver&) = delete;

    void start();
    void stop();

    bool hasError() const { return _hasError; }
    uint64_t receivedCount() const { return _received; }

    /**
     * Decode one OSC message (address + numeric arguments).
     * @return false for unknown addresses or wrong argument counts
     */
    static bool decode(const std::string& path, const std::vector<double>& args, core::InputMessage& out);

private:
    static int handleMessage(const char* path, const char* types, lo_arg** argv,
                             int argc, lo_message msg, void* userData);
    static void handleError(int num, const char* msg, const char* path);

    void push(core::InputMessage message);

    std::shared_ptr<core::InputQueue> _outputQueue;
    std::string _port;

    lo_server_thread _server = nullptr;

    std::atomic<bool> _running{false};
    std::atomic<bool> _hasError{false};
    std::atomic<uint64_t> _received{0};
};

} // namespace net

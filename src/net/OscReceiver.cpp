#include "net/OscReceiver.hpp"
#include "core/Logger.hpp"

namespace net {

namespace {

constexpr uint64_t DROP_LOG_INTERVAL = 100;

core::Point3D pointAt(const std::vector<double>& args, size_t offset) {
    return {static_cast<float>(args[offset]),
            static_cast<float>(args[offset + 1]),
            static_cast<float>(args[offset + 2])};
}

} // namespace

OscReceiver::OscReceiver(std::shared_ptr<core::InputQueue> outputQueue, const std::string& port)
    : _outputQueue(std::move(outputQueue)), _port(port) {
}

OscReceiver::~OscReceiver() {
    stop();
}

void OscReceiver::start() {
    if (_running) return;

    _server = lo_server_thread_new(_port.c_str(), &OscReceiver::handleError);
    if (!_server) {
        core::Logger::error("OscReceiver: Failed to open UDP port ", _port);
        _hasError = true;
        return;
    }

    // NULL path/typespec: every message reaches handleMessage, which validates it
    lo_server_thread_add_method(_server, nullptr, nullptr, &OscReceiver::handleMessage, this);

    if (lo_server_thread_start(_server) < 0) {
        core::Logger::error("OscReceiver: Failed to start server thread on port ", _port);
        lo_server_thread_free(_server);
        _server = nullptr;
        _hasError = true;
        return;
    }

    _running = true;
    core::Logger::info("OscReceiver listening on UDP port ", _port);
}

void OscReceiver::stop() {
    if (!_server) return;
    _running = false;
    lo_server_thread_stop(_server);
    lo_server_thread_free(_server);
    _server = nullptr;
    core::Logger::info("OscReceiver stopped.");
}

bool OscReceiver::decode(const std::string& path, const std::vector<double>& args, core::InputMessage& out) {
    out = core::InputMessage{};

    if (path == "/pose") {
        if (args.size() != 11 && args.size() != 4) return false;
        out.kind = core::InputMessage::Kind::Sample;
        out.sample.timestamp = args[0];
        out.sample.head = pointAt(args, 1);
        out.sample.hasControllers = args.size() == 11;
        if (out.sample.hasControllers) {
            out.sample.leftController = pointAt(args, 4);
            out.sample.rightController = pointAt(args, 7);
        }
        return true;
    }

    if (path == "/posture/calibrate") {
        if (args.size() > 1) return false;
        out.kind = core::InputMessage::Kind::Calibrate;
        out.hasValue = args.size() == 1;
        out.value = out.hasValue ? static_cast<float>(args[0]) : 0.0f;
        return true;
    }

    if (path == "/posture/recalibrate") {
        if (args.size() != 1) return false;
        out.kind = core::InputMessage::Kind::Recalibrate;
        out.hasValue = true;
        out.value = static_cast<float>(args[0]);
        return true;
    }

    if (path == "/posture/reset") {
        if (!args.empty()) return false;
        out.kind = core::InputMessage::Kind::Reset;
        return true;
    }

    return false;
}

int OscReceiver::handleMessage(const char* path, const char* types, lo_arg** argv,
                               int argc, lo_message /*msg*/, void* userData) {
    auto* self = static_cast<OscReceiver*>(userData);

    std::vector<double> args;
    args.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i) {
        switch (types[i]) {
            case LO_FLOAT:  args.push_back(argv[i]->f); break;
            case LO_DOUBLE: args.push_back(argv[i]->d); break;
            case LO_INT32:  args.push_back(argv[i]->i); break;
            default:
                core::Logger::warn("OscReceiver: unsupported argument type '", types[i], "' on ", path);
                return 0;
        }
    }

    core::InputMessage message;
    if (!decode(path, args, message)) {
        core::Logger::warn("OscReceiver: ignoring ", path, " with ", argc, " args");
        return 0;
    }

    self->push(std::move(message));
    return 0;
}

void OscReceiver::handleError(int num, const char* msg, const char* path) {
    core::Logger::error("OscReceiver: liblo error ", num, " in ", (path ? path : "?"), ": ", (msg ? msg : ""));
}

void OscReceiver::push(core::InputMessage message) {
    _received++;
    if (!_outputQueue->try_push(std::move(message))) {
        const uint64_t dropped = _outputQueue->droppedCount();
        if (dropped % DROP_LOG_INTERVAL == 1) {
            core::Logger::warn("OscReceiver: input queue full, dropped=", dropped);
        }
    }
}

} // namespace net

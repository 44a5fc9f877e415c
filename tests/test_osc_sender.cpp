// Loopback tests for the OSC output encoding
#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <lo/lo.h>

#include "net/OscSender.hpp"

using Catch::Approx;

namespace {

constexpr const char* PORT = "19473";

struct Received {
    std::string path;
    std::string types;
    std::vector<float> floats;
    std::vector<int> ints;
    std::string text;
};

int record(const char* path, const char* types, lo_arg** argv, int argc, lo_message /*msg*/, void* userData) {
    auto* out = static_cast<std::vector<Received>*>(userData);
    Received r;
    r.path = path;
    r.types = types;
    for (int i = 0; i < argc; ++i) {
        switch (types[i]) {
            case LO_FLOAT:  r.floats.push_back(argv[i]->f); break;
            case LO_INT32:  r.ints.push_back(argv[i]->i); break;
            case LO_STRING: r.text = &argv[i]->s; break;
            default: break;
        }
    }
    out->push_back(r);
    return 0;
}

// Plain (non-threaded) liblo server standing in for the game
struct Listener {
    lo_server server = nullptr;
    std::vector<Received> received;

    Listener() {
        server = lo_server_new(PORT, nullptr);
        if (server) {
            lo_server_add_method(server, nullptr, nullptr, record, &received);
        }
    }
    ~Listener() {
        if (server) lo_server_free(server);
    }
    Listener(const Listener&) = delete;
    Listener& operator=(const Listener&) = delete;

    void waitFor(size_t count) {
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (received.size() < count && std::chrono::steady_clock::now() < deadline) {
            lo_server_recv_noblock(server, 10);
        }
    }

    const Received* find(const std::string& path) const {
        for (const auto& r : received) {
            if (r.path == path) return &r;
        }
        return nullptr;
    }
};

core::PostureUpdate dodgeUpdate(std::chrono::steady_clock::time_point timestamp) {
    core::PostureUpdate update;
    update.state.phase = core::PosturePhase::Dodging;
    update.state.isDodging = true;
    update.state.currentDepth = 0.35f;
    update.state.currentDepthNorm = 0.7f;
    update.state.velocity = -0.4f;
    update.state.dwellTime = 0.0f;
    update.state.isInBottom = true;
    update.state.isValidSquatForm = true;
    update.state.qualityScore = 0.72f;
    update.state.controllers.leftForwardMovement = 0.1f;
    update.state.controllers.rightForwardMovement = 0.3f;
    update.state.controllers.combinedMovement = 0.2f;
    update.state.controllers.movementDetected = true;

    core::PostureEvent event;
    event.type = core::PostureEventType::DodgeStarted;
    event.value = 0.35f;
    update.events.push_back(event);
    update.timestamp = timestamp;
    return update;
}

} // namespace

TEST_CASE("State, controllers and events are encoded", "[osc][network]") {
    Listener listener;
    REQUIRE(listener.server != nullptr);

    auto queue = std::make_shared<core::OutputQueue>();
    net::OscSender sender(queue, "127.0.0.1", PORT);
    sender.start();
    REQUIRE_FALSE(sender.hasError());

    queue->try_push(dodgeUpdate(std::chrono::steady_clock::now()));
    listener.waitFor(3);
    sender.stop();

    REQUIRE(listener.received.size() == 3);

    const Received* state = listener.find("/posture/state");
    REQUIRE(state != nullptr);
    CHECK(state->types == "iffffiif");
    REQUIRE(state->ints.size() == 3);
    CHECK(state->ints[0] == static_cast<int>(core::PosturePhase::Dodging));
    CHECK(state->ints[1] == 1);
    CHECK(state->ints[2] == 1);
    REQUIRE(state->floats.size() == 5);
    CHECK(state->floats[0] == Approx(0.35f));
    CHECK(state->floats[1] == Approx(0.7f));
    CHECK(state->floats[2] == Approx(-0.4f));
    CHECK(state->floats[3] == Approx(0.0f));
    CHECK(state->floats[4] == Approx(0.72f));

    const Received* controllers = listener.find("/posture/controllers");
    REQUIRE(controllers != nullptr);
    CHECK(controllers->types == "fffi");
    REQUIRE(controllers->floats.size() == 3);
    CHECK(controllers->floats[2] == Approx(0.2f));
    CHECK(controllers->ints.at(0) == 1);

    const Received* event = listener.find("/posture/event");
    REQUIRE(event != nullptr);
    CHECK(event->types == "isff");
    CHECK(event->ints.at(0) == static_cast<int>(core::PostureEventType::DodgeStarted));
    CHECK(event->text == "DODGE_STARTED");
    CHECK(event->floats.at(0) == Approx(0.35f));
}

TEST_CASE("Stale state is dropped but its events are sent", "[osc][network]") {
    Listener listener;
    REQUIRE(listener.server != nullptr);

    auto queue = std::make_shared<core::OutputQueue>();
    net::OscSender sender(queue, "127.0.0.1", PORT, 50);
    sender.start();

    queue->try_push(dodgeUpdate(std::chrono::steady_clock::now() - std::chrono::seconds(1)));
    listener.waitFor(1);

    // Give a wrongly sent state message time to arrive
    auto settle = std::chrono::steady_clock::now() + std::chrono::milliseconds(100);
    while (std::chrono::steady_clock::now() < settle) {
        lo_server_recv_noblock(listener.server, 10);
    }
    sender.stop();

    REQUIRE(listener.received.size() == 1);
    CHECK(listener.received[0].path == "/posture/event");
    CHECK(sender.staleCount() == 1);
}

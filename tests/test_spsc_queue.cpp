// Unit tests for the SPSC ring buffer
#include <catch2/catch_test_macros.hpp>

#include <thread>

#include "core/SpscQueue.hpp"

TEST_CASE("SpscQueue preserves FIFO order", "[queue]") {
    core::SpscQueue<int, 4> q;
    CHECK(q.empty());
    CHECK(q.capacity() == 4);

    CHECK(q.try_push(1));
    CHECK(q.try_push(2));
    CHECK(q.size() == 2);

    int v = 0;
    REQUIRE(q.pop_front(v));
    CHECK(v == 1);
    REQUIRE(q.pop_front(v));
    CHECK(v == 2);
    CHECK_FALSE(q.pop_front(v));
}

TEST_CASE("SpscQueue counts drops when full", "[queue]") {
    core::SpscQueue<int, 2> q;
    CHECK(q.try_push(1));
    CHECK(q.try_push(2));
    CHECK(q.full());

    CHECK_FALSE(q.try_push(3));
    CHECK(q.droppedCount() == 1);

    // The dropped item is the newest one
    auto a = q.try_pop();
    auto b = q.try_pop();
    REQUIRE(a);
    REQUIRE(b);
    CHECK(*a == 1);
    CHECK(*b == 2);
    CHECK_FALSE(q.try_pop());
}

TEST_CASE("SpscQueue wraps around", "[queue]") {
    core::SpscQueue<int, 4> q;
    int v = 0;
    for (int i = 0; i < 10; ++i) {
        REQUIRE(q.try_push(i));
        REQUIRE(q.pop_front(v));
        CHECK(v == i);
    }
    CHECK(q.empty());
}

TEST_CASE("SpscQueue across two threads", "[queue][thread]") {
    core::SpscQueue<int, 64> q;
    constexpr int COUNT = 10000;

    std::thread producer([&q] {
        for (int i = 0; i < COUNT; ++i) {
            while (!q.try_push(i)) {
                std::this_thread::yield();
            }
        }
    });

    int expected = 0;
    bool ordered = true;
    while (expected < COUNT) {
        int v;
        if (q.pop_front(v)) {
            if (v != expected) ordered = false;
            expected++;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();

    CHECK(ordered);
    CHECK(q.empty());
}

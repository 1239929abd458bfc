#include <catch2/catch_test_macros.hpp>
#include "core/bounded_queue.hpp"

#include <chrono>
#include <memory>
#include <thread>

using namespace sqlpool;
using namespace std::chrono_literals;

TEST_CASE("BoundedQueue: FIFO within capacity", "[bounded_queue]") {
    BoundedQueue<int> queue(2);
    CHECK(queue.capacity() == 2);

    int a = 1, b = 2, c = 3;
    CHECK(queue.try_push(a));
    CHECK(queue.try_push(b));
    CHECK_FALSE(queue.try_push(c));
    CHECK(queue.size() == 2);

    CHECK(queue.try_pop() == 1);
    CHECK(queue.try_pop() == 2);
    CHECK_FALSE(queue.try_pop().has_value());
}

TEST_CASE("BoundedQueue: rejected item is left untouched", "[bounded_queue]") {
    BoundedQueue<std::unique_ptr<int>> queue(1);
    auto first = std::make_unique<int>(1);
    auto second = std::make_unique<int>(2);

    REQUIRE(queue.try_push(first));
    CHECK(first == nullptr);
    CHECK_FALSE(queue.try_push(second));
    REQUIRE(second);
    CHECK(*second == 2);
}

TEST_CASE("BoundedQueue: pop_for waits for a producer", "[bounded_queue]") {
    BoundedQueue<int> queue(1);

    SECTION("times out when empty") {
        const auto start = std::chrono::steady_clock::now();
        CHECK_FALSE(queue.pop_for(50ms).has_value());
        CHECK(std::chrono::steady_clock::now() - start >= 45ms);
    }

    SECTION("wakes on push") {
        std::thread producer([&queue] {
            std::this_thread::sleep_for(20ms);
            int value = 7;
            (void)queue.try_push(value);
        });
        auto item = queue.pop_for(2s);
        producer.join();
        REQUIRE(item.has_value());
        CHECK(*item == 7);
    }
}

TEST_CASE("BoundedQueue: drain empties the queue", "[bounded_queue]") {
    BoundedQueue<int> queue(3);
    for (int i = 0; i < 3; ++i) {
        int v = i;
        REQUIRE(queue.try_push(v));
    }
    auto items = queue.drain();
    CHECK(items.size() == 3);
    CHECK(items.front() == 0);
    CHECK(queue.size() == 0);
}

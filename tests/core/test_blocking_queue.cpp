/**
 * test_blocking_queue.cpp - Unit test for the pipeline hand-off queue
 */

#include "llt/core/BlockingQueue.hpp"
#include "llt/Types.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <thread>
#include <vector>

using namespace llt;
using namespace llt::core;
using namespace std::chrono_literals;

void test_fifo_order() {
    BlockingQueue<int> queue;

    for (int i = 0; i < 5; ++i) {
        assert(queue.tryPush(i));
    }
    assert(queue.size() == 5);

    for (int i = 0; i < 5; ++i) {
        auto item = queue.popFor(10ms);
        assert(item && *item == i);
    }
    assert(queue.empty());

    std::cout << "[PASS] test_fifo_order" << std::endl;
}

void test_capacity() {
    BlockingQueue<int> queue(2);

    assert(queue.tryPush(1));
    assert(queue.tryPush(2));
    assert(!queue.tryPush(3));  // full
    assert(queue.droppedCount() == 1);
    assert(!queue.pushFor(3, 20ms));  // times out
    assert(queue.size() == 2);

    std::cout << "[PASS] test_capacity" << std::endl;
}

void test_pop_timeout() {
    BlockingQueue<int> queue;

    auto start = std::chrono::steady_clock::now();
    auto item = queue.popFor(50ms);
    auto waited = std::chrono::steady_clock::now() - start;

    assert(!item);
    assert(waited >= 40ms);

    std::cout << "[PASS] test_pop_timeout" << std::endl;
}

void test_close_drains() {
    BlockingQueue<int> queue;
    queue.tryPush(7);
    queue.tryPush(8);
    queue.close();

    assert(queue.isClosed());
    assert(!queue.isFinished());
    assert(!queue.tryPush(9));

    assert(*queue.popFor(10ms) == 7);
    assert(*queue.popFor(10ms) == 8);
    assert(!queue.popFor(10ms));
    assert(queue.isFinished());

    std::cout << "[PASS] test_close_drains" << std::endl;
}

void test_close_wakes_waiter() {
    BlockingQueue<int> queue;
    std::atomic<bool> returned{false};

    std::thread waiter([&]() {
        auto item = queue.popFor(5s);
        assert(!item);
        returned = true;
    });

    std::this_thread::sleep_for(20ms);
    queue.close();
    waiter.join();

    assert(returned);
    std::cout << "[PASS] test_close_wakes_waiter" << std::endl;
}

void test_concurrent_order() {
    BlockingQueue<AudioChunk> queue(8);
    const int total = 500;
    std::vector<float> received;

    // Producer pushes chunks tagged with their sequence number
    std::thread producer([&]() {
        for (int i = 0; i < total; ++i) {
            AudioChunk chunk;
            chunk.samples = {static_cast<float>(i)};
            while (!queue.pushFor(chunk, 10ms)) {
            }
        }
        queue.close();
    });

    // Consumer
    std::thread consumer([&]() {
        while (!queue.isFinished()) {
            auto chunk = queue.popFor(10ms);
            if (chunk) {
                received.push_back(chunk->samples[0]);
            }
        }
    });

    producer.join();
    consumer.join();

    assert(received.size() == static_cast<size_t>(total));
    for (int i = 0; i < total; ++i) {
        assert(received[i] == static_cast<float>(i));
    }

    std::cout << "[PASS] test_concurrent_order (received=" << received.size() << ")" << std::endl;
}

int main() {
    std::cout << "=== BlockingQueue Tests ===" << std::endl;

    test_fifo_order();
    test_capacity();
    test_pop_timeout();
    test_close_drains();
    test_close_wakes_waiter();
    test_concurrent_order();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}

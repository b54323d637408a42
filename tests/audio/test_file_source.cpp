/**
 * test_file_source.cpp - File replay as a finite chunk stream
 */

#include "llt/audio/FileSource.hpp"
#include "../support/TestFakes.hpp"
#include <cassert>
#include <chrono>
#include <iostream>

using namespace llt;
using namespace llt::audio;
using namespace std::chrono_literals;

void test_chunks_and_end_of_stream() {
    std::string path = llt::test::tempPath("replay.wav");
    llt::test::writeWav16(path, std::vector<float>(40000, 0.1f), 16000, 1);

    ChunkQueue queue(16);
    core::CancellationToken token;
    FileSource source(path, 16000, 1.0);

    assert(source.isFinite());
    assert(source.start(queue, token));

    std::vector<size_t> sizes;
    while (!queue.isFinished()) {
        auto chunk = queue.popFor(100ms);
        if (chunk) {
            assert(chunk->sample_rate == 16000);
            sizes.push_back(chunk->samples.size());
        }
    }

    // 40000 samples in 16000-sample chunks; the last one is shorter
    assert(sizes.size() == 3);
    assert(sizes[0] == 16000);
    assert(sizes[1] == 16000);
    assert(sizes[2] == 8000);
    assert(source.chunksDelivered() == 3);

    assert(llt::test::waitUntil([&]() { return !source.isRunning(); }));
    source.stop();
    source.stop();

    std::remove(path.c_str());
    std::cout << "[PASS] test_chunks_and_end_of_stream" << std::endl;
}

void test_backpressure_keeps_everything() {
    std::string path = llt::test::tempPath("replay_small_queue.wav");
    llt::test::writeWav16(path, std::vector<float>(16000 * 3, 0.1f), 16000, 1);

    // Queue holds a single chunk: replay must wait, not drop
    ChunkQueue queue(1);
    core::CancellationToken token;
    FileSource source(path, 16000, 0.25);
    assert(source.start(queue, token));

    size_t total = 0;
    while (!queue.isFinished()) {
        auto chunk = queue.popFor(100ms);
        if (chunk) {
            total += chunk->samples.size();
            std::this_thread::sleep_for(2ms);
        }
    }
    assert(total == 48000);
    assert(queue.droppedCount() == 0);

    source.stop();
    std::remove(path.c_str());
    std::cout << "[PASS] test_backpressure_keeps_everything" << std::endl;
}

void test_cancel_stops_replay() {
    std::string path = llt::test::tempPath("replay_cancel.wav");
    llt::test::writeWav16(path, std::vector<float>(16000 * 10, 0.1f), 16000, 1);

    ChunkQueue queue(1);
    core::CancellationToken token;
    FileSource source(path, 16000, 0.1);
    assert(source.start(queue, token));

    // Nobody drains: replay blocks on the full queue until cancelled
    std::this_thread::sleep_for(50ms);
    token.cancel();
    source.stop();

    assert(!source.isRunning());
    assert(source.chunksDelivered() < 100);
    assert(queue.isClosed());

    std::remove(path.c_str());
    std::cout << "[PASS] test_cancel_stops_replay" << std::endl;
}

void test_setup_errors() {
    ChunkQueue queue;
    core::CancellationToken token;

    FileSource missing("/nonexistent/song.wav", 16000, 1.0);
    assert(!missing.start(queue, token));
    assert(!missing.lastError().empty());
    assert(queue.empty());
    assert(!queue.isClosed());

    FileSource bad_duration("/nonexistent/song.wav", 16000, 0.0);
    assert(!bad_duration.start(queue, token));

    FileSource bad_rate("/nonexistent/song.wav", 0, 1.0);
    assert(!bad_rate.start(queue, token));

    std::cout << "[PASS] test_setup_errors" << std::endl;
}

int main() {
    std::cout << "=== FileSource Tests ===" << std::endl;

    test_chunks_and_end_of_stream();
    test_backpressure_keeps_everything();
    test_cancel_stops_replay();
    test_setup_errors();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}

/**
 * FileSource.cpp - Decoded file replay on a dedicated thread
 */

#include "llt/audio/FileSource.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <mutex>
#include <thread>
#include <vector>

namespace llt::audio {

// How long one push may wait for queue space before re-checking the token
constexpr auto PUSH_TIMEOUT = std::chrono::milliseconds(100);

struct FileSource::Impl {
    std::vector<float> samples;
    AudioFileInfo info;

    std::thread replay_thread;
    std::atomic<bool> running{false};
    std::atomic<bool> stop_requested{false};
    std::atomic<size_t> delivered{0};

    mutable std::mutex error_mutex;
    std::string last_error;

    void setError(const std::string& message) {
        std::lock_guard<std::mutex> lock(error_mutex);
        last_error = message;
        std::cerr << "[FileSource] " << message << std::endl;
    }

    void replay(ChunkQueue& sink, core::CancellationToken token, size_t chunk_size, int sample_rate) {
        size_t index = 0;
        while (index < samples.size() && !stop_requested && !token.isCancelled()) {
            size_t end = std::min(index + chunk_size, samples.size());

            AudioChunk chunk;
            chunk.sample_rate = sample_rate;
            chunk.samples.assign(samples.begin() + index, samples.begin() + end);

            // No real-time pacing: wait only for queue space
            bool pushed = false;
            while (!pushed && !stop_requested && !token.isCancelled() && !sink.isClosed()) {
                pushed = sink.pushFor(std::move(chunk), PUSH_TIMEOUT);
                if (!pushed) {
                    chunk.samples.assign(samples.begin() + index, samples.begin() + end);
                }
            }
            if (!pushed) {
                break;
            }

            delivered++;
            index = end;
        }

        if (index >= samples.size()) {
            std::cout << "[FileSource] End of file after " << delivered << " chunks" << std::endl;
        }

        // End of stream for the consumer
        sink.close();
        running = false;
    }
};

FileSource::FileSource(std::string path, int sample_rate, double chunk_duration)
    : impl_(std::make_unique<Impl>())
    , path_(std::move(path))
    , sample_rate_(sample_rate)
    , chunk_duration_(chunk_duration)
{
}

FileSource::~FileSource() {
    stop();
}

bool FileSource::start(ChunkQueue& sink, core::CancellationToken token) {
    if (impl_->running) {
        return true;
    }

    if (sample_rate_ <= 0 || !(chunk_duration_ > 0.0)) {
        impl_->setError("Invalid replay config (sample_rate=" + std::to_string(sample_rate_)
                        + ", chunk_duration=" + std::to_string(chunk_duration_) + ")");
        return false;
    }

    // Previous replay thread (if any) has finished by itself
    if (impl_->replay_thread.joinable()) {
        impl_->replay_thread.join();
    }

    std::string error;
    if (!decodeAudioFile(path_, sample_rate_, impl_->samples, error, &impl_->info)) {
        impl_->setError("Decode failed: " + error);
        return false;
    }

    const size_t chunk_size = std::max<size_t>(
        1, static_cast<size_t>(std::round(sample_rate_ * chunk_duration_)));

    std::cout << "[FileSource] Loaded " << path_ << " (" << impl_->info.codec << ", "
              << impl_->info.channels << " ch, " << impl_->info.sample_rate << "Hz) -> "
              << impl_->samples.size() << " samples at " << sample_rate_ << "Hz" << std::endl;

    impl_->stop_requested = false;
    impl_->delivered = 0;
    impl_->running = true;
    impl_->replay_thread = std::thread([this, &sink, token, chunk_size]() {
        impl_->replay(sink, token, chunk_size, sample_rate_);
    });

    return true;
}

void FileSource::stop() {
    impl_->stop_requested = true;
    if (impl_->replay_thread.joinable()) {
        impl_->replay_thread.join();
    }
}

bool FileSource::isRunning() const {
    return impl_->running;
}

std::string FileSource::lastError() const {
    std::lock_guard<std::mutex> lock(impl_->error_mutex);
    return impl_->last_error;
}

std::string FileSource::describe() const {
    return "file " + path_;
}

AudioFileInfo FileSource::info() const {
    return impl_->info;
}

size_t FileSource::chunksDelivered() const {
    return impl_->delivered;
}

} // namespace llt::audio

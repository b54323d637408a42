/**
 * AudioEngine.hpp - Live microphone capture via PortAudio
 */

#pragma once

#include "llt/audio/AudioSource.hpp"

#include <memory>
#include <string>
#include <vector>

namespace llt::audio {

struct AudioConfig {
    int sample_rate = 16000;
    int channels = 1;
    int frames_per_buffer = 1024;
    int input_device = -1;  // -1 = system default
};

/**
 * Captures mono float audio from an input device.
 *
 * The PortAudio callback copies each buffer into an AudioChunk and hands it
 * to the sink with a non-blocking push. When the sink is full the buffer is
 * dropped and counted rather than stalling the driver thread.
 */
class AudioEngine : public AudioSource {
public:
    explicit AudioEngine(const AudioConfig& config = AudioConfig{});
    ~AudioEngine() override;

    AudioEngine(const AudioEngine&) = delete;
    AudioEngine& operator=(const AudioEngine&) = delete;

    /// Initialize PortAudio. Called by start() if needed.
    bool initialize();

    bool start(ChunkQueue& sink, core::CancellationToken token) override;
    void stop() override;
    bool isRunning() const override;
    bool isFinite() const override { return false; }
    int sampleRate() const override { return config_.sample_rate; }
    std::string lastError() const override;
    std::string describe() const override;

    /// Buffers dropped because the sink was full.
    size_t droppedChunks() const;

    /// Buffers flagged by the driver as overflowed.
    size_t inputOverflows() const;

    static std::vector<std::string> listInputDevices();

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl_;
    AudioConfig config_;
};

} // namespace llt::audio

/**
 * AudioEngine.cpp - PortAudio capture feeding the chunk queue
 *
 * Input-only stream at the session sample rate. The callback runs on the
 * driver thread and must never block, so chunks go in with tryPush().
 */

#include "llt/audio/AudioEngine.hpp"

#include <portaudio.h>
#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>

namespace llt::audio {

struct AudioEngineImpl {
    PaStream* inputStream = nullptr;

    ChunkQueue* sink = nullptr;
    core::CancellationToken token;
    int sampleRate = 16000;
    int channels = 1;

    std::atomic<bool> running{false};
    std::atomic<bool> initialized{false};
    std::atomic<size_t> dropped{0};
    std::atomic<size_t> overflows{0};

    mutable std::mutex errorMutex;
    std::string lastError;

    void setError(const std::string& message) {
        std::lock_guard<std::mutex> lock(errorMutex);
        lastError = message;
        std::cerr << "[AudioEngine] " << message << std::endl;
    }
};

/**
 * PortAudio callback for input stream
 */
static int inputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
);

struct AudioEngine::Impl : public AudioEngineImpl {};

AudioEngine::AudioEngine(const AudioConfig& config)
    : pImpl_(std::make_unique<Impl>())
    , config_(config)
{
    pImpl_->sampleRate = config.sample_rate;
    pImpl_->channels = config.channels;
}

AudioEngine::~AudioEngine() {
    stop();

    if (pImpl_->initialized) {
        Pa_Terminate();
    }
}

bool AudioEngine::initialize() {
    if (pImpl_->initialized) {
        return true;
    }

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_Initialize failed: ") + Pa_GetErrorText(err));
        return false;
    }

    pImpl_->initialized = true;

    int numDevices = Pa_GetDeviceCount();
    std::cout << "[AudioEngine] Found " << numDevices << " audio devices" << std::endl;

    int defaultInput = Pa_GetDefaultInputDevice();
    if (defaultInput >= 0) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(defaultInput);
        std::cout << "[AudioEngine] Default input: " << info->name << std::endl;
    }

    return true;
}

bool AudioEngine::start(ChunkQueue& sink, core::CancellationToken token) {
    if (pImpl_->running) {
        return true;
    }

    if (config_.sample_rate <= 0 || config_.channels <= 0 || config_.frames_per_buffer <= 0) {
        pImpl_->setError("Invalid audio config (sample_rate="
                         + std::to_string(config_.sample_rate) + ", channels="
                         + std::to_string(config_.channels) + ")");
        return false;
    }

    if (!pImpl_->initialized && !initialize()) {
        return false;
    }

    PaStreamParameters inputParams;
    inputParams.device = (config_.input_device >= 0)
        ? config_.input_device
        : Pa_GetDefaultInputDevice();

    if (inputParams.device == paNoDevice || inputParams.device >= Pa_GetDeviceCount()) {
        pImpl_->setError("No input device available");
        return false;
    }

    const PaDeviceInfo* deviceInfo = Pa_GetDeviceInfo(inputParams.device);
    if (!deviceInfo || deviceInfo->maxInputChannels < config_.channels) {
        pImpl_->setError("Device " + std::to_string(inputParams.device) + " has no input channels");
        return false;
    }

    inputParams.channelCount = config_.channels;
    inputParams.sampleFormat = paFloat32;
    inputParams.suggestedLatency = deviceInfo->defaultLowInputLatency;
    inputParams.hostApiSpecificStreamInfo = nullptr;

    pImpl_->sink = &sink;
    pImpl_->token = token;
    pImpl_->dropped = 0;
    pImpl_->overflows = 0;

    PaError err = Pa_OpenStream(
        &pImpl_->inputStream,
        &inputParams,
        nullptr,  // capture only
        config_.sample_rate,
        config_.frames_per_buffer,
        paClipOff,
        inputCallback,
        pImpl_.get()
    );

    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_OpenStream (input) failed: ") + Pa_GetErrorText(err));
        pImpl_->inputStream = nullptr;
        pImpl_->sink = nullptr;
        return false;
    }

    err = Pa_StartStream(pImpl_->inputStream);
    if (err != paNoError) {
        pImpl_->setError(std::string("Pa_StartStream (input) failed: ") + Pa_GetErrorText(err));
        Pa_CloseStream(pImpl_->inputStream);
        pImpl_->inputStream = nullptr;
        pImpl_->sink = nullptr;
        return false;
    }

    pImpl_->running = true;
    std::cout << "[AudioEngine] Capturing from \"" << deviceInfo->name << "\" (sample_rate="
              << config_.sample_rate << "Hz, buffer=" << config_.frames_per_buffer
              << " frames)" << std::endl;

    return true;
}

void AudioEngine::stop() {
    if (!pImpl_->running) {
        return;
    }

    pImpl_->running = false;

    if (pImpl_->inputStream) {
        // Pa_StopStream waits for the callback to return, so the sink is
        // no longer touched after this point
        Pa_StopStream(pImpl_->inputStream);
        Pa_CloseStream(pImpl_->inputStream);
        pImpl_->inputStream = nullptr;
    }
    pImpl_->sink = nullptr;

    if (pImpl_->dropped > 0) {
        std::cerr << "[AudioEngine] Dropped " << pImpl_->dropped
                  << " buffers (transcription fell behind)" << std::endl;
    }
    if (pImpl_->overflows > 0) {
        std::cerr << "[AudioEngine] Input overflowed " << pImpl_->overflows << " times" << std::endl;
    }

    std::cout << "[AudioEngine] Stopped" << std::endl;
}

bool AudioEngine::isRunning() const {
    return pImpl_->running;
}

std::string AudioEngine::lastError() const {
    std::lock_guard<std::mutex> lock(pImpl_->errorMutex);
    return pImpl_->lastError;
}

std::string AudioEngine::describe() const {
    if (config_.input_device >= 0) {
        return "microphone (device " + std::to_string(config_.input_device) + ")";
    }
    return "microphone (default device)";
}

size_t AudioEngine::droppedChunks() const {
    return pImpl_->dropped;
}

size_t AudioEngine::inputOverflows() const {
    return pImpl_->overflows;
}

std::vector<std::string> AudioEngine::listInputDevices() {
    std::vector<std::string> devices;

    PaError err = Pa_Initialize();
    if (err != paNoError) {
        std::cerr << "[AudioEngine] Pa_Initialize failed: " << Pa_GetErrorText(err) << std::endl;
        return devices;
    }

    int numDevices = Pa_GetDeviceCount();
    for (int i = 0; i < numDevices; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (info && info->maxInputChannels > 0) {
            devices.push_back(std::to_string(i) + ": " + info->name);
        }
    }

    Pa_Terminate();
    return devices;
}

// ============================================================================
// PortAudio Callbacks
// ============================================================================

static int inputCallback(
    const void* input,
    void* output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo* timeInfo,
    PaStreamCallbackFlags statusFlags,
    void* userData
) {
    (void)output;
    (void)timeInfo;

    auto* impl = static_cast<AudioEngineImpl*>(userData);
    const float* samples = static_cast<const float*>(input);

    if (impl->token.isCancelled()) {
        return paComplete;
    }

    if (statusFlags & paInputOverflow) {
        impl->overflows++;
    }

    if (!samples || !impl->sink) {
        return paContinue;
    }

    AudioChunk chunk;
    chunk.sample_rate = impl->sampleRate;
    chunk.samples.resize(frameCount);

    if (impl->channels == 1) {
        std::copy(samples, samples + frameCount, chunk.samples.begin());
    } else {
        // Downmix interleaved frames
        for (unsigned long f = 0; f < frameCount; ++f) {
            float sum = 0.0f;
            for (int c = 0; c < impl->channels; ++c) {
                sum += samples[f * impl->channels + c];
            }
            chunk.samples[f] = sum / static_cast<float>(impl->channels);
        }
    }

    if (!impl->sink->tryPush(std::move(chunk))) {
        impl->dropped++;
    }

    return paContinue;
}

} // namespace llt::audio

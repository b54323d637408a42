/**
 * STTEngine.cpp - Speech-to-Text Engine using whisper.cpp
 *
 * Uses whisper.cpp for local, offline speech recognition.
 * Model is preloaded at startup and stays resident in RAM.
 */

#include "llt/stt/STTEngine.hpp"
#include "llt/Errors.hpp"

#include <iostream>
#include <string>
#include <vector>

#include "whisper.h"

namespace llt::stt {

struct STTEngine::Impl {
    std::string model_path;
    std::string language;
    int n_threads;

    whisper_context* ctx = nullptr;
    whisper_full_params params;

    Impl(const std::string& path, const std::string& lang, int threads, bool use_gpu)
        : model_path(path), language(lang), n_threads(threads) {

        // Initialize whisper context from model file
        struct whisper_context_params cparams = whisper_context_default_params();
        cparams.use_gpu = use_gpu;
        ctx = whisper_init_from_file_with_params(model_path.c_str(), cparams);

        if (!ctx) {
            std::cerr << "[STTEngine] Failed to load model: " << model_path << std::endl;
            return;
        }

        // Greedy decoding, temperature 0, no context carried between calls
        params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
        params.language = language.c_str();
        params.n_threads = n_threads;
        params.print_progress = false;
        params.print_timestamps = false;
        params.print_realtime = false;
        params.print_special = false;
        params.translate = false;
        params.single_segment = false;
        params.no_context = true;
        params.temperature = 0.0f;
        params.greedy.best_of = 1;

        std::cout << "[STTEngine] Model loaded: " << model_path << std::endl;
        std::cout << "[STTEngine] Language: " << language << ", Threads: " << n_threads
                  << ", GPU: " << (use_gpu ? "yes" : "no") << std::endl;
    }

    ~Impl() {
        if (ctx) {
            whisper_free(ctx);
            ctx = nullptr;
        }
    }
};

STTEngine::STTEngine(const std::string& model_path, const std::string& language, int n_threads, bool use_gpu)
    : impl_(std::make_unique<Impl>(model_path, language, n_threads, use_gpu)) {
}

STTEngine::~STTEngine() = default;

std::vector<TranscriptSegment> STTEngine::transcribe(const std::vector<float>& audio, int sample_rate) {
    if (!isReady()) {
        throw TranscriptionError("model not loaded: " + (impl_ ? impl_->model_path : std::string()));
    }
    if (sample_rate != getSampleRate()) {
        throw TranscriptionError("whisper needs " + std::to_string(getSampleRate())
                                 + "Hz audio, got " + std::to_string(sample_rate) + "Hz");
    }
    if (audio.empty()) {
        return {};
    }

    int result = whisper_full(impl_->ctx, impl_->params, audio.data(), static_cast<int>(audio.size()));

    if (result != 0) {
        throw TranscriptionError("whisper_full failed with code " + std::to_string(result));
    }

    std::vector<TranscriptSegment> segments;
    const int n_segments = whisper_full_n_segments(impl_->ctx);
    segments.reserve(n_segments);

    for (int i = 0; i < n_segments; ++i) {
        const char* segment_text = whisper_full_get_segment_text(impl_->ctx, i);
        if (segment_text) {
            segments.push_back(TranscriptSegment{segment_text});
        }
    }

    return segments;
}

bool STTEngine::isReady() const {
    return impl_ && impl_->ctx != nullptr;
}

int STTEngine::getSampleRate() {
    return WHISPER_SAMPLE_RATE;
}

} // namespace llt::stt

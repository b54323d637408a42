/**
 * STTEngine.hpp - whisper.cpp speech recognition
 */

#pragma once

#include "llt/stt/Transcriber.hpp"

#include <memory>
#include <string>

namespace llt::stt {

/**
 * Loads a ggml whisper model once and keeps it resident.
 * Not thread safe: one transcribe() call at a time.
 */
class STTEngine : public Transcriber {
public:
    explicit STTEngine(const std::string& model_path,
                       const std::string& language = "auto",
                       int n_threads = 4,
                       bool use_gpu = true);
    ~STTEngine() override;

    STTEngine(const STTEngine&) = delete;
    STTEngine& operator=(const STTEngine&) = delete;

    std::vector<TranscriptSegment> transcribe(const std::vector<float>& audio,
                                              int sample_rate) override;

    bool isReady() const override;

    /// Sample rate whisper expects.
    static int getSampleRate();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace llt::stt

/**
 * TranscriptionWorker.hpp - Accumulate audio chunks and transcribe in batches
 */

#pragma once

#include "llt/Types.hpp"
#include "llt/audio/AudioSource.hpp"
#include "llt/core/CancellationToken.hpp"
#include "llt/stt/Transcriber.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace llt::stt {

enum class WorkerExit {
    Cancelled,        // token cancelled (explicit stop)
    EndOfStream,      // finite source drained
    TooManyFailures   // gave up after consecutive engine failures
};

using TranscriptCallback = std::function<void(const std::string&)>;
using WorkerExitCallback = std::function<void(WorkerExit)>;

struct WorkerConfig {
    int sample_rate = 16000;
    double chunk_duration = 5.0;
    int max_consecutive_failures = 5;  // 0 = never give up
    std::chrono::milliseconds pop_timeout{500};
};

/**
 * Drains the audio queue on its own thread, concatenating chunks until
 * sample_rate * chunk_duration samples are buffered, then makes one blocking
 * transcribe() call on the whole buffer. Chunks that arrive during the call
 * wait in the queue.
 *
 * Non-empty text goes to the transcript callback, on the worker thread.
 * On cancellation a partial buffer is discarded; on end-of-stream it is
 * transcribed once before the worker exits.
 */
class TranscriptionWorker {
public:
    TranscriptionWorker(Transcriber& engine, const WorkerConfig& config);
    ~TranscriptionWorker();

    TranscriptionWorker(const TranscriptionWorker&) = delete;
    TranscriptionWorker& operator=(const TranscriptionWorker&) = delete;

    void setTranscriptCallback(TranscriptCallback callback);
    void setExitCallback(WorkerExitCallback callback);

    /// Spawn the consumption loop.
    void start(audio::ChunkQueue& queue, core::CancellationToken token);

    /// Wait for the loop to exit. The token decides when that happens.
    void join();

    bool isRunning() const { return running_; }

    /**
     * Append one chunk and flush if the threshold is reached.
     * The loop calls this; tests may drive it directly.
     */
    void accept(const AudioChunk& chunk);

    /// Transcribe whatever is buffered, even below the threshold.
    void flushRemainder();

    /// Drop the buffered samples without transcribing.
    void discard();

    size_t thresholdSamples() const { return threshold_; }
    size_t bufferedSamples() const { return buffer_.size(); }
    size_t flushCount() const { return flushes_; }
    size_t failureCount() const { return failures_; }
    size_t transcriptCount() const { return transcripts_; }
    bool gaveUp() const { return gave_up_; }

private:
    void run(audio::ChunkQueue& queue);
    void flush();

    Transcriber& engine_;
    WorkerConfig config_;
    size_t threshold_;

    TranscriptCallback on_transcript_;
    WorkerExitCallback on_exit_;

    core::CancellationToken token_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    std::vector<float> buffer_;
    int consecutive_failures_ = 0;
    std::atomic<size_t> flushes_{0};
    std::atomic<size_t> failures_{0};
    std::atomic<size_t> transcripts_{0};
    std::atomic<bool> gave_up_{false};
};

} // namespace llt::stt

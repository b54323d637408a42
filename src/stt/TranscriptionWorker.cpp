/**
 * TranscriptionWorker.cpp - Accumulate-and-flush loop around the STT engine
 *
 * The transcribe() call is the pipeline's bottleneck: while it runs, the
 * audio queue absorbs whatever the source keeps producing.
 */

#include "llt/stt/TranscriptionWorker.hpp"

#include <cmath>
#include <exception>
#include <iostream>

namespace llt::stt {

TranscriptionWorker::TranscriptionWorker(Transcriber& engine, const WorkerConfig& config)
    : engine_(engine)
    , config_(config)
{
    double samples = std::round(static_cast<double>(config.sample_rate) * config.chunk_duration);
    threshold_ = samples < 1.0 ? 1 : static_cast<size_t>(samples);
    buffer_.reserve(threshold_);
}

TranscriptionWorker::~TranscriptionWorker() {
    token_.cancel();
    join();
}

void TranscriptionWorker::setTranscriptCallback(TranscriptCallback callback) {
    on_transcript_ = std::move(callback);
}

void TranscriptionWorker::setExitCallback(WorkerExitCallback callback) {
    on_exit_ = std::move(callback);
}

void TranscriptionWorker::start(audio::ChunkQueue& queue, core::CancellationToken token) {
    if (running_) {
        return;
    }
    join();

    token_ = token;
    buffer_.clear();
    consecutive_failures_ = 0;
    gave_up_ = false;
    running_ = true;

    thread_ = std::thread([this, &queue]() { run(queue); });
}

void TranscriptionWorker::join() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

void TranscriptionWorker::run(audio::ChunkQueue& queue) {
    std::cout << "[TranscriptionWorker] Started (threshold=" << threshold_ << " samples)" << std::endl;

    WorkerExit reason = WorkerExit::Cancelled;

    while (!token_.isCancelled()) {
        auto chunk = queue.popFor(config_.pop_timeout);
        if (!chunk) {
            if (queue.isFinished()) {
                reason = WorkerExit::EndOfStream;
                break;
            }
            continue;
        }

        accept(*chunk);

        if (gave_up_) {
            reason = WorkerExit::TooManyFailures;
            break;
        }
    }

    if (reason == WorkerExit::EndOfStream && !token_.isCancelled()) {
        // Last, shorter slice of a finite source
        flushRemainder();
    } else {
        if (!buffer_.empty()) {
            std::cout << "[TranscriptionWorker] Discarding " << buffer_.size()
                      << " buffered samples" << std::endl;
        }
        discard();
    }

    std::cout << "[TranscriptionWorker] Stopped (" << flushes_ << " calls, "
              << transcripts_ << " transcripts, " << failures_ << " failures)" << std::endl;

    running_ = false;

    if (on_exit_) {
        on_exit_(reason);
    }
}

void TranscriptionWorker::accept(const AudioChunk& chunk) {
    if (chunk.sample_rate != config_.sample_rate) {
        std::cerr << "[TranscriptionWorker] Warning: chunk at " << chunk.sample_rate
                  << "Hz, expected " << config_.sample_rate << "Hz" << std::endl;
    }

    buffer_.insert(buffer_.end(), chunk.samples.begin(), chunk.samples.end());

    if (buffer_.size() >= threshold_) {
        flush();
    }
}

void TranscriptionWorker::flushRemainder() {
    if (!buffer_.empty()) {
        flush();
    }
}

void TranscriptionWorker::discard() {
    buffer_.clear();
}

void TranscriptionWorker::flush() {
    std::vector<float> audio;
    audio.swap(buffer_);
    buffer_.reserve(threshold_);

    flushes_++;

    std::string text;
    try {
        text = joinSegments(engine_.transcribe(audio, config_.sample_rate));
        consecutive_failures_ = 0;
    } catch (const std::exception& e) {
        failures_++;
        consecutive_failures_++;
        std::cerr << "[TranscriptionWorker] Transcription failed (" << consecutive_failures_
                  << " in a row), dropping " << audio.size() << " samples: " << e.what() << std::endl;

        if (config_.max_consecutive_failures > 0
            && consecutive_failures_ >= config_.max_consecutive_failures) {
            std::cerr << "[TranscriptionWorker] Giving up after " << consecutive_failures_
                      << " consecutive failures" << std::endl;
            gave_up_ = true;
        }
        return;
    }

    // Stop arrived while the engine was busy: nobody downstream wants this
    if (token_.isCancelled()) {
        return;
    }

    if (text.empty()) {
        return;
    }

    transcripts_++;
    if (on_transcript_) {
        on_transcript_(text);
    }
}

} // namespace llt::stt

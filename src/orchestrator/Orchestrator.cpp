/**
 * Orchestrator.cpp - Session lifecycle and stage wiring
 *
 * Connects: AudioSource → ChunkQueue → TranscriptionWorker → LyricsAligner → match queue
 */

#include "llt/Orchestrator.hpp"
#include "llt/Errors.hpp"
#include "llt/core/BlockingQueue.hpp"
#include "llt/core/CancellationToken.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace llt {

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Running: return "running";
        case SessionState::Stopping: return "stopping";
        case SessionState::Stopped: return "stopped";
    }
    return "unknown";
}

struct Orchestrator::Impl {
    // Stages
    std::unique_ptr<audio::AudioSource> source;
    std::shared_ptr<stt::Transcriber> engine;
    std::unique_ptr<stt::TranscriptionWorker> worker;
    align::LyricsAligner aligner;  // touched only from the worker thread while running

    // Channels
    audio::ChunkQueue audio_queue;
    core::BlockingQueue<MatchResult> matches;  // unbounded

    // State
    core::CancellationToken token;
    std::atomic<SessionState> state{SessionState::Idle};
    std::mutex lifecycle_mutex;  // serializes start()/stop() callers
    std::atomic<size_t> match_count{0};

    OrchestratorConfig config;
    OrchestratorCallbacks callbacks;

    Impl(std::unique_ptr<audio::AudioSource> src,
         std::shared_ptr<stt::Transcriber> eng,
         align::LyricsAligner lyrics,
         const OrchestratorConfig& cfg)
        : source(std::move(src))
        , engine(std::move(eng))
        , aligner(std::move(lyrics))
        , audio_queue(cfg.audio_queue_capacity)
        , config(cfg)
    {
        aligner.setVerbose(cfg.verbose);
    }

    void setState(SessionState new_state) {
        state = new_state;
        if (callbacks.onStateChange) {
            callbacks.onStateChange(new_state);
        }
    }

    void reportError(const std::string& message) {
        std::cerr << "[Orchestrator] " << message << std::endl;
        if (callbacks.onError) {
            callbacks.onError(message);
        }
    }

    void validate() {
        if (!source) {
            throw SetupError("no audio source");
        }
        if (!engine || !engine->isReady()) {
            throw SetupError("speech recognition engine is not ready");
        }
        if (aligner.empty()) {
            throw SetupError("no lyric lines to follow");
        }
        if (config.min_ratio < 0.0 || config.min_ratio > 1.0) {
            throw SetupError("min ratio must be within [0, 1]");
        }
        if (config.worker.sample_rate <= 0 || !(config.worker.chunk_duration > 0.0)) {
            throw SetupError("sample rate and chunk duration must be positive");
        }
        if (source->sampleRate() != config.worker.sample_rate) {
            throw SetupError("audio source delivers " + std::to_string(source->sampleRate())
                             + "Hz but transcription expects "
                             + std::to_string(config.worker.sample_rate) + "Hz");
        }
    }

    // Worker thread
    void handleTranscript(const std::string& text) {
        if (token.isCancelled()) {
            return;
        }

        if (config.verbose) {
            std::cout << "[Orchestrator] Heard: " << text << std::endl;
        }
        if (callbacks.onTranscript) {
            callbacks.onTranscript(text);
        }

        auto match = aligner.align(text, config.min_ratio);
        if (!match || token.isCancelled()) {
            return;
        }

        if (config.verbose) {
            std::cout << "[Orchestrator] Matched line " << match->line_index << std::endl;
        }

        match_count++;
        if (callbacks.onMatch) {
            callbacks.onMatch(*match);
        }
        matches.tryPush(std::move(*match));
    }

    // Worker thread, right before it exits
    void handleWorkerExit(stt::WorkerExit reason) {
        if (reason == stt::WorkerExit::TooManyFailures) {
            reportError("Transcription keeps failing, ending session");
        } else if (reason == stt::WorkerExit::EndOfStream) {
            std::cout << "[Orchestrator] Audio exhausted" << std::endl;
        }

        // Only one of stop() and this path gets to tear the session down
        SessionState expected = SessionState::Running;
        if (!state.compare_exchange_strong(expected, SessionState::Stopping)) {
            return;
        }
        if (callbacks.onStateChange) {
            callbacks.onStateChange(SessionState::Stopping);
        }

        releaseStages();
        setState(SessionState::Stopped);
        std::cout << "[Orchestrator] Session ended" << std::endl;
    }

    void releaseStages() {
        token.cancel();
        audio_queue.close();
        source->stop();
    }

    void start() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex);

        if (state != SessionState::Idle) {
            throw SetupError(std::string("session can't start from state ") + toString(state));
        }

        validate();

        worker = std::make_unique<stt::TranscriptionWorker>(*engine, config.worker);
        worker->setTranscriptCallback([this](const std::string& text) {
            handleTranscript(text);
        });
        worker->setExitCallback([this](stt::WorkerExit reason) {
            handleWorkerExit(reason);
        });

        std::cout << "[Orchestrator] Starting " << source->describe() << " with "
                  << aligner.size() << " lyric lines" << std::endl;

        if (!source->start(audio_queue, token)) {
            worker.reset();
            throw SetupError("audio source failed to start: " + source->lastError());
        }

        setState(SessionState::Running);
        worker->start(audio_queue, token);
    }

    void stop() {
        std::lock_guard<std::mutex> lock(lifecycle_mutex);

        SessionState expected = SessionState::Running;
        if (state.compare_exchange_strong(expected, SessionState::Stopping)) {
            if (callbacks.onStateChange) {
                callbacks.onStateChange(SessionState::Stopping);
            }
            std::cout << "[Orchestrator] Stopping..." << std::endl;

            releaseStages();
            if (worker) {
                worker->join();
            }

            setState(SessionState::Stopped);
            std::cout << "[Orchestrator] Session ended" << std::endl;
            return;
        }

        // Idle: nothing to do. Ended by itself: make sure the worker is gone.
        if (worker) {
            worker->join();
        }
    }
};

Orchestrator::Orchestrator(std::unique_ptr<audio::AudioSource> source,
                           std::shared_ptr<stt::Transcriber> engine,
                           align::LyricsAligner aligner,
                           const OrchestratorConfig& config)
    : impl_(std::make_unique<Impl>(std::move(source), std::move(engine), std::move(aligner), config)) {
}

Orchestrator::~Orchestrator() { stop(); }

void Orchestrator::setCallbacks(OrchestratorCallbacks callbacks) {
    impl_->callbacks = std::move(callbacks);
}

void Orchestrator::start() { impl_->start(); }

void Orchestrator::stop() { impl_->stop(); }

bool Orchestrator::isRunning() const { return impl_->state == SessionState::Running; }

SessionState Orchestrator::state() const { return impl_->state; }

std::optional<MatchResult> Orchestrator::nextMatch(std::chrono::milliseconds timeout) {
    return impl_->matches.popFor(timeout);
}

size_t Orchestrator::pendingMatches() const { return impl_->matches.size(); }

size_t Orchestrator::matchCount() const { return impl_->match_count; }

} // namespace llt

/**
 * Orchestrator.hpp - One lyrics-following session
 *
 * AudioSource -> ChunkQueue -> TranscriptionWorker -> LyricsAligner -> match queue
 */

#pragma once

#include "llt/Types.hpp"
#include "llt/align/LyricsAligner.hpp"
#include "llt/audio/AudioSource.hpp"
#include "llt/stt/Transcriber.hpp"
#include "llt/stt/TranscriptionWorker.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace llt {

enum class SessionState {
    Idle,
    Running,
    Stopping,
    Stopped
};

const char* toString(SessionState state);

struct OrchestratorConfig {
    double min_ratio = align::LyricsAligner::DEFAULT_MIN_RATIO;
    size_t audio_queue_capacity = 256;
    stt::WorkerConfig worker;
    bool verbose = false;
};

struct OrchestratorCallbacks {
    std::function<void(SessionState)> onStateChange;
    std::function<void(const std::string&)> onTranscript;
    std::function<void(const MatchResult&)> onMatch;
    std::function<void(const std::string&)> onError;
};

class Orchestrator {
public:
    Orchestrator(std::unique_ptr<audio::AudioSource> source,
                 std::shared_ptr<stt::Transcriber> engine,
                 align::LyricsAligner aligner,
                 const OrchestratorConfig& config = OrchestratorConfig{});
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    /// Set before start().
    void setCallbacks(OrchestratorCallbacks callbacks);

    /**
     * Start the audio source and the transcription worker.
     * @throws SetupError if the session can't start (nothing is left running)
     */
    void start();

    /**
     * Signal every stage to halt and wait until they released their resources.
     * Matches already queued stay available to nextMatch().
     * No-op when idle or already stopped.
     */
    void stop();

    /// True while audio is still being captured or processed.
    bool isRunning() const;

    SessionState state() const;

    /// Next accepted match, waiting up to timeout.
    std::optional<MatchResult> nextMatch(std::chrono::milliseconds timeout);

    size_t pendingMatches() const;

    /// Number of matches emitted so far.
    size_t matchCount() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace llt

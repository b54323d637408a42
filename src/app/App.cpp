/**
 * App.cpp - Console lyrics follower
 *
 * lyrics (file or lyrics.ovh) → translation → Orchestrator → stdout
 */

#include "llt/App.hpp"
#include "llt/Errors.hpp"
#include "llt/Orchestrator.hpp"
#include "llt/align/LyricsAligner.hpp"
#include "llt/audio/AudioEngine.hpp"
#include "llt/audio/FileSource.hpp"
#include "llt/lyrics/LyricsProvider.hpp"
#include "llt/stt/STTEngine.hpp"

#include <chrono>

namespace llt {

App::App(TranscriberConfig transcriber_config, std::ostream& out)
    : transcriber_config_(std::move(transcriber_config))
    , out_(out) {
}

App::~App() = default;

void App::setTranscriber(std::shared_ptr<stt::Transcriber> transcriber) {
    transcriber_ = std::move(transcriber);
}

void App::setTranslationEngine(std::unique_ptr<translate::TranslationEngine> engine) {
    translator_ = std::move(engine);
}

int App::run(const AppConfig& config, const std::atomic<bool>& interrupted) {
    std::unique_ptr<Orchestrator> session;

    try {
        config.validate();
        transcriber_config_.validate();

        // Lyrics
        lyrics::LyricsProvider provider;
        std::vector<std::string> lyrics = config.lyrics_file.empty()
            ? provider.fetch(config.artist, config.title)
            : provider.loadFromFile(config.lyrics_file);

        // Translation
        if (!translator_) {
            translator_ = std::make_unique<translate::TranslationClient>();
        }
        std::vector<std::string> translations = translator_->translateLines(lyrics, config.target_language);

        align::LyricsAligner aligner(align::buildReferenceLines(lyrics, translations));

        // Speech recognition, loaded once per App
        if (!transcriber_) {
            auto engine = std::make_shared<stt::STTEngine>(transcriber_config_.model_path,
                                                           transcriber_config_.language,
                                                           transcriber_config_.n_threads,
                                                           transcriber_config_.use_gpu);
            if (!engine->isReady()) {
                throw SetupError("could not load whisper model " + transcriber_config_.model_path);
            }
            transcriber_ = std::move(engine);
        }

        // Audio
        std::unique_ptr<audio::AudioSource> source;
        if (!config.audio_file.empty()) {
            source = std::make_unique<audio::FileSource>(config.audio_file,
                                                         transcriber_config_.sample_rate,
                                                         transcriber_config_.chunk_duration);
        } else {
            audio::AudioConfig audio_config;
            audio_config.sample_rate = transcriber_config_.sample_rate;
            audio_config.frames_per_buffer = transcriber_config_.frames_per_buffer;
            audio_config.input_device = transcriber_config_.input_device;
            source = std::make_unique<audio::AudioEngine>(audio_config);
        }

        OrchestratorConfig session_config;
        session_config.min_ratio = config.min_ratio;
        session_config.audio_queue_capacity = transcriber_config_.audio_queue_capacity;
        session_config.verbose = config.verbose;
        session_config.worker.sample_rate = transcriber_config_.sample_rate;
        session_config.worker.chunk_duration = transcriber_config_.chunk_duration;
        session_config.worker.max_consecutive_failures = transcriber_config_.max_consecutive_failures;

        session = std::make_unique<Orchestrator>(std::move(source), transcriber_, std::move(aligner), session_config);
        session->start();

    } catch (const SetupError& e) {
        std::cerr << "[App] Setup failed: " << e.what() << std::endl;
        return 1;
    }

    if (!config.artist.empty() || !config.title.empty()) {
        out_ << "🎵 " << config.artist << " – " << config.title << "\n";
    }
    out_ << "Listening... Press Ctrl+C to stop.\n" << std::endl;

    const auto poll = std::chrono::milliseconds(config.poll_interval_ms);
    bool stop_announced = false;

    while (true) {
        if (interrupted && !stop_announced) {
            out_ << "\nStopping..." << std::endl;
            stop_announced = true;
            session->stop();
        }

        auto match = session->nextMatch(poll);
        if (!match) {
            if (!session->isRunning() && session->pendingMatches() == 0) {
                break;
            }
            continue;
        }

        out_ << "[ORIGINAL] " << match->original << "\n"
             << "[TRANSLATED] " << match->translation << std::endl;
    }

    session->stop();
    out_ << "Session ended" << std::endl;
    out_ << "Goodbye!" << std::endl;
    return 0;
}

} // namespace llt

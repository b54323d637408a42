/**
 * App.hpp - Console front end: lyrics + translation + live session
 */

#pragma once

#include "llt/Config.hpp"
#include "llt/stt/Transcriber.hpp"
#include "llt/translate/TranslationClient.hpp"

#include <atomic>
#include <iostream>
#include <memory>

namespace llt {

class App {
public:
    explicit App(TranscriberConfig transcriber_config, std::ostream& out = std::cout);
    ~App();

    /// Replace the whisper engine (loaded lazily otherwise).
    void setTranscriber(std::shared_ptr<stt::Transcriber> transcriber);

    /// Replace the Google Translate client.
    void setTranslationEngine(std::unique_ptr<translate::TranslationEngine> engine);

    /**
     * Resolve lyrics, translate them, then follow the audio until it ends or
     * interrupted becomes true.
     * @return process exit code (0 on success, 1 on setup error)
     */
    int run(const AppConfig& config, const std::atomic<bool>& interrupted);

private:
    TranscriberConfig transcriber_config_;
    std::ostream& out_;
    std::shared_ptr<stt::Transcriber> transcriber_;
    std::unique_ptr<translate::TranslationEngine> translator_;
};

} // namespace llt

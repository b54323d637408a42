/**
 * Config.hpp - Session configuration
 */

#pragma once

#include <string>

namespace llt {

/**
 * Audio capture and transcription settings.
 * Fixed for the lifetime of a session.
 */
struct TranscriberConfig {
    std::string model_path = "models/ggml-small.bin";
    std::string language = "auto";
    int n_threads = 4;
    bool use_gpu = true;

    int sample_rate = 16000;        // Hz, mono
    double chunk_duration = 5.0;    // seconds of audio per transcription call

    int max_consecutive_failures = 5;   // 0 = never give up
    size_t audio_queue_capacity = 256;  // chunks
    int frames_per_buffer = 1024;       // live capture buffer size
    int input_device = -1;              // -1 = default device

    /// Throws SetupError on invalid values.
    void validate() const;
};

/**
 * Console application settings.
 */
struct AppConfig {
    std::string artist;
    std::string title;
    std::string target_language = "en";
    std::string lyrics_file;   // empty = fetch from the lyrics service
    std::string audio_file;    // empty = live microphone

    double min_ratio = 0.45;
    int poll_interval_ms = 1000;
    bool verbose = false;

    void validate() const;
};

/// Default lyrics service, overridable with LYRICS_OVH_BASE_URL.
std::string lyricsBaseUrlFromEnv();

/// Translation hosts from GOOGLETRANS_SERVICE_URLS (comma separated).
std::string translationHostsFromEnv();

} // namespace llt

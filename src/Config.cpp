/**
 * Config.cpp - Validation and environment overrides for session settings
 */

#include "llt/Config.hpp"
#include "llt/Errors.hpp"

#include <cstdlib>

namespace llt {

constexpr const char* DEFAULT_LYRICS_BASE_URL = "https://api.lyrics.ovh/v1";
constexpr const char* DEFAULT_TRANSLATION_HOSTS = "translate.googleapis.com";

void TranscriberConfig::validate() const {
    if (sample_rate <= 0) {
        throw SetupError("sample rate must be positive (got " + std::to_string(sample_rate) + ")");
    }
    if (!(chunk_duration > 0.0)) {
        throw SetupError("chunk duration must be positive (got " + std::to_string(chunk_duration) + ")");
    }
    if (n_threads <= 0) {
        throw SetupError("thread count must be positive");
    }
    if (max_consecutive_failures < 0) {
        throw SetupError("max consecutive failures can't be negative");
    }
    if (audio_queue_capacity == 0) {
        throw SetupError("audio queue capacity must be positive");
    }
    if (frames_per_buffer <= 0) {
        throw SetupError("frames per buffer must be positive");
    }
}

void AppConfig::validate() const {
    if (lyrics_file.empty() && (artist.empty() || title.empty())) {
        throw SetupError("artist and title are required unless a lyrics file is given");
    }
    if (target_language.empty()) {
        throw SetupError("target language is empty");
    }
    if (min_ratio < 0.0 || min_ratio > 1.0) {
        throw SetupError("min ratio must be within [0, 1]");
    }
    if (poll_interval_ms <= 0) {
        throw SetupError("poll interval must be positive");
    }
}

std::string lyricsBaseUrlFromEnv() {
    const char* value = std::getenv("LYRICS_OVH_BASE_URL");
    if (value && *value) {
        return value;
    }
    return DEFAULT_LYRICS_BASE_URL;
}

std::string translationHostsFromEnv() {
    const char* value = std::getenv("GOOGLETRANS_SERVICE_URLS");
    if (value && *value) {
        return value;
    }
    return DEFAULT_TRANSLATION_HOSTS;
}

} // namespace llt

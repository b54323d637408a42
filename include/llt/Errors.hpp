/**
 * Errors.hpp - Exception types raised by the pipeline
 */

#pragma once

#include <stdexcept>
#include <string>

namespace llt {

/**
 * Fatal error raised while assembling a session, before any audio flows
 * (device unavailable, undecodable file, empty lyrics, bad config).
 */
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Raised by a speech-recognition engine when a single transcription call fails.
 * The transcription worker drops the affected buffer and keeps going.
 */
class TranscriptionError : public std::runtime_error {
public:
    explicit TranscriptionError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace llt

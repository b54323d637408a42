/**
 * Types.hpp - Value types shared across the pipeline stages
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace llt {

/**
 * One lyric line paired with its translation.
 * Position in the session's line list is fixed once built.
 */
struct ReferenceLine {
    size_t index = 0;
    std::string original;
    std::string translation;
};

/**
 * Mono float samples handed from an audio source to the transcription worker.
 */
struct AudioChunk {
    std::vector<float> samples;
    int sample_rate = 16000;
};

/**
 * Emitted when a transcript moves the alignment cursor forward.
 */
struct MatchResult {
    size_t line_index = 0;
    std::string original;
    std::string translation;
};

/**
 * One text segment returned by the speech-recognition engine.
 */
struct TranscriptSegment {
    std::string text;
};

} // namespace llt

/**
 * Transcriber.hpp - Contract for a blocking speech-recognition engine
 */

#pragma once

#include "llt/Types.hpp"

#include <string>
#include <vector>

namespace llt::stt {

class Transcriber {
public:
    virtual ~Transcriber() = default;

    /**
     * Recognize speech in one buffer of mono float samples.
     * Blocks until the engine is done.
     * @throws TranscriptionError if the engine fails
     */
    virtual std::vector<TranscriptSegment> transcribe(const std::vector<float>& audio,
                                                      int sample_rate) = 0;

    virtual bool isReady() const = 0;
};

/// Segment texts trimmed, joined with single spaces, empty segments skipped.
std::string joinSegments(const std::vector<TranscriptSegment>& segments);

} // namespace llt::stt

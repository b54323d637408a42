/**
 * AudioSource.hpp - Common interface for live and file audio input
 *
 * A source pushes AudioChunk values into a queue owned by the caller.
 * Finite sources close the queue once they run out of samples, which is
 * how end-of-stream reaches the transcription worker.
 */

#pragma once

#include "llt/Types.hpp"
#include "llt/core/BlockingQueue.hpp"
#include "llt/core/CancellationToken.hpp"

#include <string>

namespace llt::audio {

using ChunkQueue = core::BlockingQueue<AudioChunk>;

class AudioSource {
public:
    virtual ~AudioSource() = default;

    /**
     * Open the underlying resource and start delivering chunks into sink.
     * Setup failures are reported here, before any chunk is produced.
     * @return false on failure (see lastError())
     */
    virtual bool start(ChunkQueue& sink, core::CancellationToken token) = 0;

    /// Stop delivering and release the resource. Safe to call repeatedly.
    virtual void stop() = 0;

    virtual bool isRunning() const = 0;

    /// True when the source ends by itself (and closes its sink).
    virtual bool isFinite() const = 0;

    virtual int sampleRate() const = 0;

    virtual std::string lastError() const = 0;

    /// Short human readable description for logs.
    virtual std::string describe() const = 0;
};

} // namespace llt::audio

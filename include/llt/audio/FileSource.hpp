/**
 * FileSource.hpp - Replays a decoded audio file as a finite chunk stream
 */

#pragma once

#include "llt/audio/AudioSource.hpp"
#include "llt/audio/AudioFileDecoder.hpp"

#include <memory>
#include <string>

namespace llt::audio {

/**
 * Decodes the whole file on start() (WAV, MP3, Ogg, FLAC, ...), then a replay thread pushes
 * sample_rate * chunk_duration sized chunks (the last one may be shorter)
 * as fast as the sink accepts them. The sink is closed when the samples
 * run out.
 */
class FileSource : public AudioSource {
public:
    FileSource(std::string path, int sample_rate, double chunk_duration);
    ~FileSource() override;

    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    bool start(ChunkQueue& sink, core::CancellationToken token) override;
    void stop() override;
    bool isRunning() const override;
    bool isFinite() const override { return true; }
    int sampleRate() const override { return sample_rate_; }
    std::string lastError() const override;
    std::string describe() const override;

    /// Header of the decoded file (valid after a successful start()).
    AudioFileInfo info() const;

    /// Chunks handed to the sink so far.
    size_t chunksDelivered() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::string path_;
    int sample_rate_;
    double chunk_duration_;
};

} // namespace llt::audio

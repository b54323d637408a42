/**
 * AudioFileDecoder.hpp - Any audio file to mono float at the session rate
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace llt::audio {

struct AudioFileInfo {
    std::string codec;      // "wav" for the built-in reader, else the FFmpeg decoder name
    int channels = 0;
    int sample_rate = 0;
    size_t frames = 0;      // source frames before resampling
};

/**
 * Decode an audio file into mono float samples at target_rate.
 *
 * RIFF/WAVE PCM and float files go through the WAV reader. Everything
 * else (MP3, Ogg, FLAC, AAC, WAV codecs the reader doesn't handle) is
 * demuxed and decoded with FFmpeg and converted by libswresample.
 *
 * @return false with a message in error if the file can't be decoded
 */
bool decodeAudioFile(const std::string& path,
                     int target_rate,
                     std::vector<float>& out,
                     std::string& error,
                     AudioFileInfo* info = nullptr);

/// FFmpeg path only, regardless of the container.
bool decodeWithFFmpeg(const std::string& path,
                      int target_rate,
                      std::vector<float>& out,
                      std::string& error,
                      AudioFileInfo* info = nullptr);

} // namespace llt::audio

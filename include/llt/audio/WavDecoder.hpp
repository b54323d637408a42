/**
 * WavDecoder.hpp - WAV decoding, downmix and resampling to mono float
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace llt::audio {

struct WavInfo {
    uint16_t format = 0;        // 1 = PCM, 3 = IEEE float
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    size_t frames = 0;
};

/**
 * Decode a RIFF/WAVE file into mono float samples at target_rate.
 *
 * Supports 8/16/24/32-bit integer PCM and 32-bit float, including
 * WAVE_FORMAT_EXTENSIBLE headers. Channels are averaged, the result is
 * linearly resampled when the file rate differs from target_rate.
 *
 * @return false with a message in error if the file can't be decoded
 */
bool decodeWavFile(const std::string& path,
                   int target_rate,
                   std::vector<float>& out,
                   std::string& error,
                   WavInfo* info = nullptr);

/// Same as decodeWavFile() on an in-memory file image.
bool decodeWav(const std::vector<uint8_t>& data,
               int target_rate,
               std::vector<float>& out,
               std::string& error,
               WavInfo* info = nullptr);

/// Average interleaved frames down to one channel.
std::vector<float> downmixToMono(const std::vector<float>& interleaved, int channels);

/// Linear interpolation resampler.
std::vector<float> resampleLinear(const std::vector<float>& samples, int from_rate, int to_rate);

} // namespace llt::audio

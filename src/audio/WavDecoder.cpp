/**
 * WavDecoder.cpp - RIFF/WAVE parsing to mono float at the session rate
 */

#include "llt/audio/WavDecoder.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>

namespace llt::audio {

constexpr uint16_t WAVE_FORMAT_PCM = 0x0001;
constexpr uint16_t WAVE_FORMAT_IEEE_FLOAT = 0x0003;
constexpr uint16_t WAVE_FORMAT_EXTENSIBLE = 0xFFFE;

namespace {

uint16_t readU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t readU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool tagIs(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

float decodeSample(const uint8_t* p, uint16_t format, uint16_t bits) {
    if (format == WAVE_FORMAT_IEEE_FLOAT) {
        float value;
        std::memcpy(&value, p, sizeof(float));
        return value;
    }
    switch (bits) {
        case 8:
            // 8-bit PCM is unsigned
            return (static_cast<float>(p[0]) - 128.0f) / 128.0f;
        case 16:
            return static_cast<float>(static_cast<int16_t>(readU16(p))) / 32768.0f;
        case 24: {
            int32_t val = (p[0] << 8) | (p[1] << 16) | (p[2] << 24);
            val >>= 8;  // Sign-extend
            return static_cast<float>(val) / 8388608.0f;
        }
        case 32:
            return static_cast<float>(static_cast<int32_t>(readU32(p))) / 2147483648.0f;
        default:
            return 0.0f;
    }
}

} // namespace

std::vector<float> downmixToMono(const std::vector<float>& interleaved, int channels) {
    if (channels <= 1) {
        return interleaved;
    }
    const size_t frames = interleaved.size() / static_cast<size_t>(channels);
    std::vector<float> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        float sum = 0.0f;
        for (int c = 0; c < channels; ++c) {
            sum += interleaved[f * channels + c];
        }
        mono[f] = sum / static_cast<float>(channels);
    }
    return mono;
}

std::vector<float> resampleLinear(const std::vector<float>& samples, int from_rate, int to_rate) {
    if (samples.empty() || from_rate == to_rate || from_rate <= 0 || to_rate <= 0) {
        return samples;
    }

    double ratio = static_cast<double>(to_rate) / from_rate;
    size_t new_size = static_cast<size_t>(samples.size() * ratio);
    std::vector<float> resampled(new_size);

    for (size_t i = 0; i < new_size; i++) {
        double src_pos = i / ratio;
        size_t idx = static_cast<size_t>(src_pos);
        double frac = src_pos - idx;

        if (idx + 1 < samples.size()) {
            // Linear interpolation
            resampled[i] = static_cast<float>(samples[idx] * (1.0 - frac) + samples[idx + 1] * frac);
        } else if (idx < samples.size()) {
            resampled[i] = samples[idx];
        }
    }

    return resampled;
}

bool decodeWav(const std::vector<uint8_t>& data,
               int target_rate,
               std::vector<float>& out,
               std::string& error,
               WavInfo* info)
{
    out.clear();

    if (target_rate <= 0) {
        error = "target sample rate must be positive";
        return false;
    }
    if (data.size() < 12 || !tagIs(&data[0], "RIFF") || !tagIs(&data[8], "WAVE")) {
        error = "not a RIFF/WAVE file";
        return false;
    }

    WavInfo header;
    bool have_fmt = false;
    const uint8_t* pcm = nullptr;
    size_t pcm_size = 0;

    // Walk the chunk list; chunks are word aligned
    size_t pos = 12;
    while (pos + 8 <= data.size()) {
        const uint8_t* chunk = &data[pos];
        uint32_t chunk_size = readU32(chunk + 4);
        size_t body = pos + 8;
        size_t available = std::min<size_t>(chunk_size, data.size() - body);

        if (tagIs(chunk, "fmt ")) {
            if (available < 16) {
                error = "truncated fmt chunk";
                return false;
            }
            header.format = readU16(&data[body]);
            header.channels = readU16(&data[body + 2]);
            header.sample_rate = readU32(&data[body + 4]);
            header.bits_per_sample = readU16(&data[body + 14]);
            if (header.format == WAVE_FORMAT_EXTENSIBLE && available >= 26) {
                // First two bytes of the SubFormat GUID carry the real format tag
                header.format = readU16(&data[body + 24]);
            }
            have_fmt = true;
        } else if (tagIs(chunk, "data")) {
            pcm = &data[body];
            pcm_size = available;
            break;
        }

        pos = body + chunk_size + (chunk_size & 1);
    }

    if (!have_fmt) {
        error = "missing fmt chunk";
        return false;
    }
    if (!pcm) {
        error = "missing data chunk";
        return false;
    }
    if (header.channels == 0 || header.sample_rate == 0) {
        error = "invalid channel count or sample rate";
        return false;
    }

    bool supported =
        (header.format == WAVE_FORMAT_PCM &&
         (header.bits_per_sample == 8 || header.bits_per_sample == 16 ||
          header.bits_per_sample == 24 || header.bits_per_sample == 32)) ||
        (header.format == WAVE_FORMAT_IEEE_FLOAT && header.bits_per_sample == 32);

    if (!supported) {
        error = "unsupported encoding (format " + std::to_string(header.format)
              + ", " + std::to_string(header.bits_per_sample) + " bits)";
        return false;
    }

    const size_t bytes_per_sample = header.bits_per_sample / 8;
    const size_t frame_bytes = bytes_per_sample * header.channels;
    header.frames = pcm_size / frame_bytes;

    std::vector<float> interleaved(header.frames * header.channels);
    for (size_t i = 0; i < interleaved.size(); ++i) {
        interleaved[i] = decodeSample(pcm + i * bytes_per_sample, header.format, header.bits_per_sample);
    }

    out = resampleLinear(downmixToMono(interleaved, header.channels),
                         static_cast<int>(header.sample_rate), target_rate);

    if (info) {
        *info = header;
    }
    return true;
}

bool decodeWavFile(const std::string& path,
                   int target_rate,
                   std::vector<float>& out,
                   std::string& error,
                   WavInfo* info)
{
    std::ifstream wav_file(path, std::ios::binary);
    if (!wav_file.good()) {
        error = "can't open " + path;
        return false;
    }

    wav_file.seekg(0, std::ios::end);
    std::streamoff file_size = wav_file.tellg();
    wav_file.seekg(0, std::ios::beg);

    if (file_size <= 0) {
        error = "empty file: " + path;
        return false;
    }

    std::vector<uint8_t> data(static_cast<size_t>(file_size));
    wav_file.read(reinterpret_cast<char*>(data.data()), file_size);
    if (!wav_file) {
        error = "read failed: " + path;
        return false;
    }

    if (!decodeWav(data, target_rate, out, error, info)) {
        error = path + ": " + error;
        return false;
    }
    return true;
}

} // namespace llt::audio

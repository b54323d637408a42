/**
 * test_audio_file_decoder.cpp - Non-WAV containers and codecs through FFmpeg
 */

#include "llt/audio/AudioFileDecoder.hpp"
#include "llt/audio/FileSource.hpp"
#include "../support/TestFakes.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
}

using namespace llt;
using namespace llt::audio;
using namespace std::chrono_literals;

static void putBE32(std::ofstream& f, uint32_t v) {
    for (int i = 3; i >= 0; --i) {
        f.put(static_cast<char>((v >> (8 * i)) & 0xFF));
    }
}

// Sun/NeXT .au, 16-bit big-endian linear PCM
static void writeAu16(const std::string& path, const std::vector<float>& interleaved,
                      int sample_rate, int channels) {
    std::ofstream f(path, std::ios::binary);
    f.write(".snd", 4);
    putBE32(f, 24);
    putBE32(f, static_cast<uint32_t>(interleaved.size() * 2));
    putBE32(f, 3);
    putBE32(f, static_cast<uint32_t>(sample_rate));
    putBE32(f, static_cast<uint32_t>(channels));
    for (float s : interleaved) {
        uint16_t v = static_cast<uint16_t>(static_cast<int16_t>(s * 32767.0f));
        f.put(static_cast<char>(v >> 8));
        f.put(static_cast<char>(v & 0xFF));
    }
}

// WAV with an A-law payload (format tag 6), which the built-in reader refuses
static void writeWavAlaw(const std::string& path, size_t samples, int sample_rate) {
    auto put16 = [](std::ofstream& f, uint16_t v) {
        f.put(static_cast<char>(v & 0xFF));
        f.put(static_cast<char>(v >> 8));
    };
    auto put32 = [](std::ofstream& f, uint32_t v) {
        for (int i = 0; i < 4; ++i) {
            f.put(static_cast<char>((v >> (8 * i)) & 0xFF));
        }
    };
    std::ofstream f(path, std::ios::binary);
    f.write("RIFF", 4);
    put32(f, static_cast<uint32_t>(36 + samples));
    f.write("WAVE", 4);
    f.write("fmt ", 4);
    put32(f, 16);
    put16(f, 6);
    put16(f, 1);
    put32(f, static_cast<uint32_t>(sample_rate));
    put32(f, static_cast<uint32_t>(sample_rate));
    put16(f, 1);
    put16(f, 8);
    f.write("data", 4);
    put32(f, static_cast<uint32_t>(samples));
    for (size_t i = 0; i < samples; ++i) {
        f.put(static_cast<char>(0xD5));  // A-law for (nearly) zero
    }
}

// Mono 16-bit FLAC written with FFmpeg's own encoder
static bool writeFlac(const std::string& path, const std::vector<int16_t>& samples, int sample_rate) {
    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_FLAC);
    if (!codec) {
        return false;
    }

    AVFormatContext* oc = nullptr;
    if (avformat_alloc_output_context2(&oc, nullptr, "flac", path.c_str()) < 0 || !oc) {
        return false;
    }

    bool ok = false;
    AVCodecContext* enc = avcodec_alloc_context3(codec);
    AVStream* stream = avformat_new_stream(oc, nullptr);
    AVFrame* frame = av_frame_alloc();
    AVPacket* packet = av_packet_alloc();

    auto drain = [&]() {
        while (avcodec_receive_packet(enc, packet) >= 0) {
            av_packet_rescale_ts(packet, enc->time_base, stream->time_base);
            packet->stream_index = stream->index;
            av_interleaved_write_frame(oc, packet);
        }
    };

    do {
        if (!enc || !stream || !frame || !packet) {
            break;
        }
        enc->sample_fmt = AV_SAMPLE_FMT_S16;
        enc->sample_rate = sample_rate;
        av_channel_layout_default(&enc->ch_layout, 1);
        enc->time_base = AVRational{1, sample_rate};
        if (avcodec_open2(enc, codec, nullptr) < 0) {
            break;
        }
        if (avcodec_parameters_from_context(stream->codecpar, enc) < 0) {
            break;
        }
        stream->time_base = enc->time_base;
        if (avio_open(&oc->pb, path.c_str(), AVIO_FLAG_WRITE) < 0) {
            break;
        }
        if (avformat_write_header(oc, nullptr) < 0) {
            break;
        }

        const size_t frame_size = enc->frame_size > 0 ? static_cast<size_t>(enc->frame_size) : 1024;
        int64_t pts = 0;
        bool failed = false;
        for (size_t pos = 0; pos < samples.size() && !failed; pos += frame_size) {
            size_t n = std::min(frame_size, samples.size() - pos);
            frame->nb_samples = static_cast<int>(n);
            frame->format = enc->sample_fmt;
            frame->sample_rate = sample_rate;
            av_channel_layout_copy(&frame->ch_layout, &enc->ch_layout);
            if (av_frame_get_buffer(frame, 0) < 0) {
                failed = true;
                break;
            }
            std::memcpy(frame->data[0], &samples[pos], n * sizeof(int16_t));
            frame->pts = pts;
            pts += static_cast<int64_t>(n);

            failed = avcodec_send_frame(enc, frame) < 0;
            av_frame_unref(frame);
            drain();
        }
        if (failed) {
            break;
        }
        avcodec_send_frame(enc, nullptr);
        drain();
        ok = av_write_trailer(oc) >= 0;
    } while (false);

    av_packet_free(&packet);
    av_frame_free(&frame);
    avcodec_free_context(&enc);
    if (oc->pb) {
        avio_closep(&oc->pb);
    }
    avformat_free_context(oc);
    return ok;
}

void test_au_stereo_48k() {
    std::string path = llt::test::tempPath("stereo_48k.au");

    // 0.1s at 48kHz: left 0.5, right 0.25
    std::vector<float> interleaved;
    for (int i = 0; i < 4800; ++i) {
        interleaved.push_back(0.5f);
        interleaved.push_back(0.25f);
    }
    writeAu16(path, interleaved, 48000, 2);

    std::vector<float> mono;
    std::string error;
    AudioFileInfo info;
    bool ok = decodeAudioFile(path, 16000, mono, error, &info);

    assert(ok);
    assert(info.codec == "pcm_s16be");
    assert(info.channels == 2);
    assert(info.sample_rate == 48000);
    assert(info.frames == 4800);
    assert(mono.size() >= 1584 && mono.size() <= 1616);
    // Channels averaged, away from the resampler's edges
    assert(std::fabs(mono[800] - 0.375f) < 2e-3f);

    std::remove(path.c_str());
    std::cout << "[PASS] test_au_stereo_48k" << std::endl;
}

void test_flac_is_lossless() {
    std::string path = llt::test::tempPath("tone.flac");

    std::vector<int16_t> pcm(16000);
    for (size_t i = 0; i < pcm.size(); ++i) {
        pcm[i] = static_cast<int16_t>(std::lround(16000.0 * std::sin(2.0 * 3.14159265358979323846 * 440.0 * i / 16000.0)));
    }
    if (!writeFlac(path, pcm, 16000)) {
        std::cout << "[SKIP] test_flac_is_lossless (no FLAC encoder)" << std::endl;
        return;
    }

    std::vector<float> mono;
    std::string error;
    AudioFileInfo info;
    assert(decodeAudioFile(path, 16000, mono, error, &info));
    assert(info.codec == "flac");
    assert(mono.size() == pcm.size());
    for (size_t i = 0; i < pcm.size(); i += 97) {
        assert(std::fabs(mono[i] - pcm[i] / 32768.0f) < 1e-6f);
    }

    std::remove(path.c_str());
    std::cout << "[PASS] test_flac_is_lossless" << std::endl;
}

void test_compressed_wav_falls_back() {
    std::string path = llt::test::tempPath("alaw.wav");
    writeWavAlaw(path, 800, 8000);

    std::vector<float> mono;
    std::string error;
    AudioFileInfo info;
    assert(decodeAudioFile(path, 16000, mono, error, &info));
    assert(info.codec == "pcm_alaw");
    assert(info.frames == 800);
    assert(mono.size() >= 1584 && mono.size() <= 1616);
    assert(std::fabs(mono[800]) < 0.01f);

    std::remove(path.c_str());
    std::cout << "[PASS] test_compressed_wav_falls_back" << std::endl;
}

void test_pcm_wav_uses_builtin_reader() {
    std::string path = llt::test::tempPath("plain.wav");
    llt::test::writeWav16(path, std::vector<float>(1600, 0.25f), 16000, 1);

    std::vector<float> mono;
    std::string error;
    AudioFileInfo info;
    assert(decodeAudioFile(path, 16000, mono, error, &info));
    assert(info.codec == "wav");
    assert(mono.size() == 1600);

    std::remove(path.c_str());
    std::cout << "[PASS] test_pcm_wav_uses_builtin_reader" << std::endl;
}

void test_file_source_replays_flac() {
    std::string path = llt::test::tempPath("replay.flac");
    std::vector<int16_t> pcm(40000, 1000);
    if (!writeFlac(path, pcm, 16000)) {
        std::cout << "[SKIP] test_file_source_replays_flac (no FLAC encoder)" << std::endl;
        return;
    }

    ChunkQueue queue(16);
    core::CancellationToken token;
    FileSource source(path, 16000, 1.0);
    assert(source.start(queue, token));

    std::vector<size_t> sizes;
    while (!queue.isFinished()) {
        auto chunk = queue.popFor(100ms);
        if (chunk) {
            sizes.push_back(chunk->samples.size());
        }
    }
    assert(sizes.size() == 3);
    assert(sizes[2] == 8000);
    assert(source.info().codec == "flac");

    source.stop();
    std::remove(path.c_str());
    std::cout << "[PASS] test_file_source_replays_flac" << std::endl;
}

void test_undecodable_input() {
    std::string path = llt::test::tempPath("notes.txt");
    {
        std::ofstream f(path);
        f << "these are not audio samples\n";
    }

    std::vector<float> mono;
    std::string error;
    assert(!decodeAudioFile(path, 16000, mono, error));
    assert(!error.empty());
    assert(mono.empty());

    error.clear();
    assert(!decodeAudioFile("/nonexistent/song.mp3", 16000, mono, error));
    assert(error.find("/nonexistent/song.mp3") != std::string::npos);

    std::remove(path.c_str());
    std::cout << "[PASS] test_undecodable_input" << std::endl;
}

int main() {
    std::cout << "=== AudioFileDecoder Tests ===" << std::endl;

    test_au_stereo_48k();
    test_flac_is_lossless();
    test_compressed_wav_falls_back();
    test_pcm_wav_uses_builtin_reader();
    test_file_source_replays_flac();
    test_undecodable_input();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}

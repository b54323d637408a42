/**
 * AudioFileDecoder.cpp - WAV reader first, FFmpeg for everything else
 */

#include "llt/audio/AudioFileDecoder.hpp"
#include "llt/audio/WavDecoder.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>

extern "C" {
#include <libavformat/avformat.h>
#include <libavcodec/avcodec.h>
#include <libavutil/opt.h>
#include <libavutil/channel_layout.h>
#include <libswresample/swresample.h>
}

namespace llt::audio {

namespace {

std::string avError(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return buf;
}

bool looksLikeWav(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    char header[12] = {0};
    if (!file.read(header, sizeof(header))) {
        return false;
    }
    return std::memcmp(header, "RIFF", 4) == 0 && std::memcmp(header + 8, "WAVE", 4) == 0;
}

/// Demuxer, decoder and resampler for one file; released together.
struct FFmpegDecoder {
    AVFormatContext* format_ctx = nullptr;
    AVCodecContext* codec_ctx = nullptr;
    AVFrame* frame = nullptr;
    AVPacket* packet = nullptr;
    SwrContext* swr_ctx = nullptr;
    int stream_index = -1;
    size_t source_frames = 0;

    ~FFmpegDecoder() {
        if (swr_ctx) {
            swr_free(&swr_ctx);
        }
        if (packet) {
            av_packet_free(&packet);
        }
        if (frame) {
            av_frame_free(&frame);
        }
        if (codec_ctx) {
            avcodec_free_context(&codec_ctx);
        }
        if (format_ctx) {
            avformat_close_input(&format_ctx);
        }
    }

    bool open(const std::string& path, int target_rate, std::string& error) {
        int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
        if (ret < 0) {
            error = "can't open " + path + ": " + avError(ret);
            return false;
        }

        ret = avformat_find_stream_info(format_ctx, nullptr);
        if (ret < 0) {
            error = "no stream info: " + avError(ret);
            return false;
        }

        for (unsigned int i = 0; i < format_ctx->nb_streams; i++) {
            if (format_ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_AUDIO) {
                stream_index = static_cast<int>(i);
                break;
            }
        }
        if (stream_index < 0) {
            error = "no audio stream in " + path;
            return false;
        }

        AVCodecParameters* codec_params = format_ctx->streams[stream_index]->codecpar;
        const AVCodec* codec = avcodec_find_decoder(codec_params->codec_id);
        if (!codec) {
            error = std::string("no decoder for codec ") + avcodec_get_name(codec_params->codec_id);
            return false;
        }

        codec_ctx = avcodec_alloc_context3(codec);
        if (!codec_ctx) {
            error = "can't allocate codec context";
            return false;
        }
        ret = avcodec_parameters_to_context(codec_ctx, codec_params);
        if (ret < 0) {
            error = "can't copy codec parameters: " + avError(ret);
            return false;
        }
        ret = avcodec_open2(codec_ctx, codec, nullptr);
        if (ret < 0) {
            error = std::string("can't open decoder ") + codec->name + ": " + avError(ret);
            return false;
        }

        frame = av_frame_alloc();
        packet = av_packet_alloc();
        if (!frame || !packet) {
            error = "can't allocate frame/packet";
            return false;
        }

        // Mono float at the session rate
        AVChannelLayout in_layout;
        if (codec_ctx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
            av_channel_layout_default(&in_layout, codec_ctx->ch_layout.nb_channels);
        } else {
            av_channel_layout_copy(&in_layout, &codec_ctx->ch_layout);
        }
        AVChannelLayout out_layout = AV_CHANNEL_LAYOUT_MONO;

        ret = swr_alloc_set_opts2(&swr_ctx,
            &out_layout, AV_SAMPLE_FMT_FLT, target_rate,
            &in_layout, codec_ctx->sample_fmt, codec_ctx->sample_rate,
            0, nullptr);
        av_channel_layout_uninit(&in_layout);

        if (ret < 0 || !swr_ctx) {
            error = "can't configure resampler: " + avError(ret);
            return false;
        }

        // Normalized downmix: stereo becomes (L + R) / 2
        av_opt_set_double(swr_ctx, "rematrix_maxval", 1.0, 0);

        ret = swr_init(swr_ctx);
        if (ret < 0) {
            error = "can't initialize resampler: " + avError(ret);
            return false;
        }
        return true;
    }

    /// Convert one decoded frame, or drain the resampler when src is null.
    bool convert(const AVFrame* src, std::vector<float>& out, std::string& error) {
        const int in_samples = src ? src->nb_samples : 0;
        const int capacity = swr_get_out_samples(swr_ctx, in_samples);
        if (capacity <= 0) {
            return true;
        }

        const size_t offset = out.size();
        out.resize(offset + static_cast<size_t>(capacity));
        uint8_t* dst = reinterpret_cast<uint8_t*>(out.data() + offset);

        int converted = swr_convert(swr_ctx, &dst, capacity,
                                    src ? (const uint8_t**)src->extended_data : nullptr,
                                    in_samples);
        if (converted < 0) {
            out.resize(offset);
            error = "resampling failed: " + avError(converted);
            return false;
        }
        out.resize(offset + static_cast<size_t>(converted));
        return true;
    }

    bool receiveFrames(std::vector<float>& out, std::string& error) {
        while (true) {
            int ret = avcodec_receive_frame(codec_ctx, frame);
            if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
                return true;
            }
            if (ret < 0) {
                error = "decoding failed: " + avError(ret);
                return false;
            }

            source_frames += static_cast<size_t>(frame->nb_samples);
            bool ok = convert(frame, out, error);
            av_frame_unref(frame);
            if (!ok) {
                return false;
            }
        }
    }

    bool decode(std::vector<float>& out, std::string& error) {
        int ret = 0;
        while ((ret = av_read_frame(format_ctx, packet)) >= 0) {
            if (packet->stream_index == stream_index) {
                int sent = avcodec_send_packet(codec_ctx, packet);
                // A corrupt packet costs its own samples, not the file
                if (sent >= 0 && !receiveFrames(out, error)) {
                    av_packet_unref(packet);
                    return false;
                }
            }
            av_packet_unref(packet);
        }
        if (ret != AVERROR_EOF) {
            error = "read failed: " + avError(ret);
            return false;
        }

        // Decoder delay, then resampler delay
        avcodec_send_packet(codec_ctx, nullptr);
        if (!receiveFrames(out, error)) {
            return false;
        }

        size_t before = 0;
        do {
            before = out.size();
            if (!convert(nullptr, out, error)) {
                return false;
            }
        } while (out.size() > before);

        return true;
    }
};

} // namespace

bool decodeWithFFmpeg(const std::string& path,
                      int target_rate,
                      std::vector<float>& out,
                      std::string& error,
                      AudioFileInfo* info)
{
    out.clear();
    if (target_rate <= 0) {
        error = "target sample rate must be positive";
        return false;
    }

    FFmpegDecoder decoder;
    if (!decoder.open(path, target_rate, error) || !decoder.decode(out, error)) {
        out.clear();
        return false;
    }

    if (info) {
        info->codec = decoder.codec_ctx->codec->name;
        info->channels = decoder.codec_ctx->ch_layout.nb_channels;
        info->sample_rate = decoder.codec_ctx->sample_rate;
        info->frames = decoder.source_frames;
    }
    return true;
}

bool decodeAudioFile(const std::string& path,
                     int target_rate,
                     std::vector<float>& out,
                     std::string& error,
                     AudioFileInfo* info)
{
    if (looksLikeWav(path)) {
        WavInfo wav;
        std::string wav_error;
        if (decodeWavFile(path, target_rate, out, wav_error, &wav)) {
            if (info) {
                info->codec = "wav";
                info->channels = wav.channels;
                info->sample_rate = static_cast<int>(wav.sample_rate);
                info->frames = wav.frames;
            }
            return true;
        }

        // Compressed WAV payloads (A-law, ADPCM, ...) are FFmpeg's job
        if (decodeWithFFmpeg(path, target_rate, out, error, info)) {
            return true;
        }
        error = wav_error + "; " + error;
        return false;
    }

    return decodeWithFFmpeg(path, target_rate, out, error, info);
}

} // namespace llt::audio

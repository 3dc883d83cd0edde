/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/normalizer.hpp"
#include "sonavec/logger.hpp"
#include <algorithm>
#include <cctype>
#include <memory>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
#include <libswresample/swresample.h>
}

namespace sonavec {

namespace {
struct FormatCloser {
    void operator()(AVFormatContext* ctx) const noexcept { avformat_close_input(&ctx); }
};
struct CodecFreer {
    void operator()(AVCodecContext* ctx) const noexcept { avcodec_free_context(&ctx); }
};
struct SwrFreer {
    void operator()(SwrContext* ctx) const noexcept { swr_free(&ctx); }
};
struct PacketFreer {
    void operator()(AVPacket* pkt) const noexcept { av_packet_free(&pkt); }
};
struct FrameFreer {
    void operator()(AVFrame* frame) const noexcept { av_frame_free(&frame); }
};

std::string averr(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return buf;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Appends resampled output until limit samples have been collected.
void appendResampled(SwrContext* swr, const uint8_t** in, int inSamples,
                     std::vector<float>& out, std::size_t limit) {
    int capacity = swr_get_out_samples(swr, inSamples);
    if (capacity <= 0) {
        return;
    }
    std::vector<float> buffer(static_cast<std::size_t>(capacity));
    auto* outData = reinterpret_cast<uint8_t*>(buffer.data());
    int produced = swr_convert(swr, &outData, capacity, in, inSamples);
    if (produced < 0) {
        throw DecodeError("swr_convert failed: " + averr(produced));
    }
    std::size_t room = limit - std::min(limit, out.size());
    std::size_t take = std::min(room, static_cast<std::size_t>(produced));
    out.insert(out.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(take));
}
}

AudioNormalizer::AudioNormalizer(int sampleRate, int maxSeconds)
    : sampleRate_(sampleRate), maxSeconds_(maxSeconds) {
    if (sampleRate_ <= 0 || maxSeconds_ <= 0) {
        throw std::invalid_argument("sample rate and clip length must be positive");
    }
}

std::size_t AudioNormalizer::maxSamples() const noexcept {
    return static_cast<std::size_t>(sampleRate_) * static_cast<std::size_t>(maxSeconds_);
}

bool AudioNormalizer::isSupported(const std::filesystem::path& path) {
    static const std::vector<std::string> kExtensions = {".mp3", ".wav", ".flac", ".ogg", ".m4a"};
    std::string ext = lower(path.extension().string());
    return std::find(kExtensions.begin(), kExtensions.end(), ext) != kExtensions.end();
}

PcmAudio AudioNormalizer::decode(const std::filesystem::path& input) const {
    AVFormatContext* rawFormat = nullptr;
    int rc = avformat_open_input(&rawFormat, input.c_str(), nullptr, nullptr);
    if (rc < 0) {
        throw DecodeError("cannot open " + input.string() + ": " + averr(rc));
    }
    std::unique_ptr<AVFormatContext, FormatCloser> format(rawFormat);

    rc = avformat_find_stream_info(format.get(), nullptr);
    if (rc < 0) {
        throw DecodeError("no stream info in " + input.string() + ": " + averr(rc));
    }

    const AVCodec* codec = nullptr;
    int streamIndex = av_find_best_stream(format.get(), AVMEDIA_TYPE_AUDIO, -1, -1, &codec, 0);
    if (streamIndex < 0 || !codec) {
        throw DecodeError("no audio stream in " + input.string());
    }

    std::unique_ptr<AVCodecContext, CodecFreer> codecCtx(avcodec_alloc_context3(codec));
    if (!codecCtx) {
        throw DecodeError("cannot allocate decoder for " + input.string());
    }
    rc = avcodec_parameters_to_context(codecCtx.get(), format->streams[streamIndex]->codecpar);
    if (rc < 0) {
        throw DecodeError("cannot copy codec parameters: " + averr(rc));
    }
    rc = avcodec_open2(codecCtx.get(), codec, nullptr);
    if (rc < 0) {
        throw DecodeError("cannot open decoder for " + input.string() + ": " + averr(rc));
    }

    AVChannelLayout inLayout{};
    if (codecCtx->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC && codecCtx->ch_layout.nb_channels > 0) {
        av_channel_layout_copy(&inLayout, &codecCtx->ch_layout);
    } else {
        av_channel_layout_default(&inLayout, codecCtx->ch_layout.nb_channels > 0 ? codecCtx->ch_layout.nb_channels : 2);
    }
    AVChannelLayout outLayout{};
    av_channel_layout_default(&outLayout, 1);

    SwrContext* rawSwr = nullptr;
    rc = swr_alloc_set_opts2(&rawSwr, &outLayout, AV_SAMPLE_FMT_FLT, sampleRate_,
                             &inLayout, codecCtx->sample_fmt, codecCtx->sample_rate, 0, nullptr);
    av_channel_layout_uninit(&inLayout);
    av_channel_layout_uninit(&outLayout);
    std::unique_ptr<SwrContext, SwrFreer> swr(rawSwr);
    if (rc < 0 || !swr || swr_init(swr.get()) < 0) {
        throw DecodeError("cannot initialize resampler for " + input.string());
    }

    std::unique_ptr<AVPacket, PacketFreer> packet(av_packet_alloc());
    std::unique_ptr<AVFrame, FrameFreer> frame(av_frame_alloc());
    if (!packet || !frame) {
        throw DecodeError("out of memory decoding " + input.string());
    }

    const std::size_t limit = maxSamples();
    PcmAudio audio;
    audio.sampleRate = sampleRate_;
    audio.channels = 1;
    audio.samples.reserve(limit);

    auto drainFrames = [&]() {
        while (avcodec_receive_frame(codecCtx.get(), frame.get()) == 0) {
            appendResampled(swr.get(), const_cast<const uint8_t**>(frame->extended_data),
                            frame->nb_samples, audio.samples, limit);
            av_frame_unref(frame.get());
        }
    };

    while (audio.samples.size() < limit && av_read_frame(format.get(), packet.get()) >= 0) {
        if (packet->stream_index == streamIndex) {
            rc = avcodec_send_packet(codecCtx.get(), packet.get());
            if (rc < 0 && rc != AVERROR(EAGAIN)) {
                av_packet_unref(packet.get());
                throw DecodeError("decode error in " + input.string() + ": " + averr(rc));
            }
            drainFrames();
        }
        av_packet_unref(packet.get());
    }

    if (audio.samples.size() < limit) {
        rc = avcodec_send_packet(codecCtx.get(), nullptr);
        if (rc >= 0) {
            drainFrames();
        } else {
            LOG_DEBUG("Decoder flush failed for " + input.string() + ": " + averr(rc));
        }
        appendResampled(swr.get(), nullptr, 0, audio.samples, limit);
    }

    if (audio.samples.empty()) {
        throw DecodeError("no audio decoded from " + input.string());
    }
    return audio;
}

bool AudioNormalizer::normalizeFile(const std::filesystem::path& input,
                                    const std::filesystem::path& output) const noexcept {
    return convert(input, output).has_value();
}

std::optional<double> AudioNormalizer::convert(const std::filesystem::path& input,
                                               const std::filesystem::path& output) const noexcept {
    try {
        PcmAudio audio = decode(input);
        if (!writeWav16(output, audio)) {
            LOG_WARN("Failed to write " + output.string());
            return std::nullopt;
        }
        LOG_DEBUG("Normalized " + input.filename().string() + " -> " + output.filename().string() +
                  " (" + std::to_string(audio.seconds()) + "s)");
        return audio.seconds();
    } catch (const std::exception& e) {
        LOG_WARN("Skipping " + input.filename().string() + ": " + e.what());
        return std::nullopt;
    }
}

std::vector<NormalizedFile> AudioNormalizer::normalizeFiles(const std::vector<std::filesystem::path>& inputs,
                                                            const std::filesystem::path& outputDir) const {
    std::vector<NormalizedFile> results;
    std::error_code ec;
    std::filesystem::create_directories(outputDir, ec);
    if (ec) {
        LOG_ERROR("Cannot create " + outputDir.string() + ": " + ec.message());
        return results;
    }

    for (const auto& input : inputs) {
        if (!isSupported(input)) {
            LOG_DEBUG("Ignoring unsupported file " + input.string());
            continue;
        }
        auto output = outputDir / input.stem();
        output += ".wav";
        if (auto seconds = convert(input, output)) {
            results.push_back({input, output, *seconds});
        }
    }

    LOG_INFO("Converted " + std::to_string(results.size()) + "/" + std::to_string(inputs.size()) +
             " files to WAV");
    return results;
}

std::vector<NormalizedFile> AudioNormalizer::normalizeDirectory(const std::filesystem::path& inputDir,
                                                                const std::filesystem::path& outputDir) const {
    std::vector<std::filesystem::path> inputs;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(inputDir, ec)) {
        if (entry.is_regular_file() && isSupported(entry.path())) {
            inputs.push_back(entry.path());
        }
    }
    if (ec) {
        LOG_ERROR("Cannot list " + inputDir.string() + ": " + ec.message());
    }
    std::sort(inputs.begin(), inputs.end());
    return normalizeFiles(inputs, outputDir);
}

}

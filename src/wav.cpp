/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/wav.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <type_traits>

namespace sonavec {

namespace {
template <typename T>
void writeLe(std::ofstream& out, T value) {
    using U = std::make_unsigned_t<T>;
    U v = static_cast<U>(value);
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        out.put(static_cast<char>((v >> (8u * i)) & 0xFFu));
    }
}

std::uint32_t readU32(const unsigned char* p) {
    return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
}

std::uint16_t readU16(const unsigned char* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}
}

bool writeWav16(const std::filesystem::path& path, const PcmAudio& audio) {
    if (audio.channels <= 0 || audio.sampleRate <= 0 ||
        audio.samples.size() % static_cast<std::size_t>(audio.channels) != 0) {
        return false;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return false;
    }

    const std::uint16_t bits = 16;
    const std::uint16_t channels = static_cast<std::uint16_t>(audio.channels);
    const std::uint32_t rate = static_cast<std::uint32_t>(audio.sampleRate);
    const std::uint32_t dataBytes = static_cast<std::uint32_t>(audio.samples.size() * sizeof(std::int16_t));
    const std::uint16_t blockAlign = static_cast<std::uint16_t>(channels * (bits / 8));

    out.write("RIFF", 4);
    writeLe<std::uint32_t>(out, 36u + dataBytes);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    writeLe<std::uint32_t>(out, 16u);
    writeLe<std::uint16_t>(out, 1u);   // PCM
    writeLe<std::uint16_t>(out, channels);
    writeLe<std::uint32_t>(out, rate);
    writeLe<std::uint32_t>(out, rate * blockAlign);
    writeLe<std::uint16_t>(out, blockAlign);
    writeLe<std::uint16_t>(out, bits);
    out.write("data", 4);
    writeLe<std::uint32_t>(out, dataBytes);

    for (float s : audio.samples) {
        float clipped = std::max(-1.0f, std::min(1.0f, s));
        writeLe<std::int16_t>(out, static_cast<std::int16_t>(std::lround(clipped * 32767.0f)));
    }
    return out.good();
}

std::optional<PcmAudio> readWav(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }
    std::vector<unsigned char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        return std::nullopt;
    }

    std::uint16_t format = 0;
    std::uint16_t bits = 0;
    PcmAudio audio;
    bool haveFmt = false;

    std::size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const unsigned char* chunk = bytes.data() + pos;
        std::uint32_t size = readU32(chunk + 4);
        std::size_t body = pos + 8;
        if (body + size > bytes.size()) {
            size = static_cast<std::uint32_t>(bytes.size() - body);
        }

        if (std::memcmp(chunk, "fmt ", 4) == 0 && size >= 16) {
            format = readU16(bytes.data() + body);
            audio.channels = readU16(bytes.data() + body + 2);
            audio.sampleRate = static_cast<int>(readU32(bytes.data() + body + 4));
            bits = readU16(bytes.data() + body + 14);
            haveFmt = true;
        } else if (std::memcmp(chunk, "data", 4) == 0 && haveFmt) {
            const unsigned char* data = bytes.data() + body;
            if (format == 1 && bits == 16) {
                audio.samples.reserve(size / 2);
                for (std::size_t i = 0; i + 1 < size; i += 2) {
                    auto v = static_cast<std::int16_t>(readU16(data + i));
                    audio.samples.push_back(static_cast<float>(v) / 32768.0f);
                }
            } else if (format == 3 && bits == 32) {
                audio.samples.reserve(size / 4);
                for (std::size_t i = 0; i + 3 < size; i += 4) {
                    std::uint32_t raw = readU32(data + i);
                    float f;
                    std::memcpy(&f, &raw, sizeof(f));
                    audio.samples.push_back(f);
                }
            } else {
                return std::nullopt;
            }
            return audio.channels > 0 ? std::optional<PcmAudio>(std::move(audio)) : std::nullopt;
        }
        pos = body + size + (size & 1u);
    }
    return std::nullopt;
}

}

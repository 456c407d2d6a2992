#pragma once

#include <cstdint>
#include <cstring>
#include <expected>
#include <fstream>
#include <iterator>
#include <span>
#include <string>
#include <vector>

// Decodes a RIFF/WAVE file held in memory into mono float samples in [-1, 1].
// Supports 16-bit PCM and 32-bit IEEE float; channels are averaged.
namespace wav {

struct Audio {
    std::vector<float> samples;
    uint32_t sample_rate = 0;
    uint16_t channels = 0;
};

inline std::expected<Audio, std::string> decode(std::span<const uint8_t> bytes) {
    auto r16 = [&bytes](size_t pos) {
        uint16_t v;
        std::memcpy(&v, bytes.data() + pos, 2);
        return v;
    };
    auto r32 = [&bytes](size_t pos) {
        uint32_t v;
        std::memcpy(&v, bytes.data() + pos, 4);
        return v;
    };
    auto tag = [&bytes](size_t pos, const char* expect) {
        return std::memcmp(bytes.data() + pos, expect, 4) == 0;
    };

    if (bytes.size() < 12 || !tag(0, "RIFF") || !tag(8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits_per_sample = 0;
    bool have_fmt = false;
    std::span<const uint8_t> data;

    // Walk chunks; each is 8 bytes of header plus a payload padded to even length.
    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        uint32_t size = r32(pos + 4);
        size_t body = pos + 8;
        if (size > bytes.size() - body) {
            return std::unexpected("truncated chunk");
        }

        if (tag(pos, "fmt ")) {
            if (size < 16) return std::unexpected("fmt chunk too small");
            format = r16(body);
            channels = r16(body + 2);
            sample_rate = r32(body + 4);
            bits_per_sample = r16(body + 14);
            // WAVE_FORMAT_EXTENSIBLE: the real format tag leads the subformat GUID
            if (format == 0xFFFE && size >= 26) format = r16(body + 24);
            have_fmt = true;
        } else if (tag(pos, "data")) {
            data = bytes.subspan(body, size);
            break;
        }

        pos = body + size + (size & 1);
    }

    if (!have_fmt) return std::unexpected("missing fmt chunk");
    if (data.data() == nullptr) return std::unexpected("missing data chunk");
    if (channels == 0) return std::unexpected("zero channels");

    Audio out;
    out.sample_rate = sample_rate;
    out.channels = channels;

    if (format == 1 && bits_per_sample == 16) {
        size_t frames = data.size() / (2 * channels);
        out.samples.resize(frames);
        for (size_t i = 0; i < frames; ++i) {
            float sum = 0.0f;
            for (uint16_t c = 0; c < channels; ++c) {
                int16_t s;
                std::memcpy(&s, data.data() + (i * channels + c) * 2, 2);
                sum += static_cast<float>(s) / 32768.0f;
            }
            out.samples[i] = sum / channels;
        }
    } else if (format == 3 && bits_per_sample == 32) {
        size_t frames = data.size() / (4 * channels);
        out.samples.resize(frames);
        for (size_t i = 0; i < frames; ++i) {
            float sum = 0.0f;
            for (uint16_t c = 0; c < channels; ++c) {
                float s;
                std::memcpy(&s, data.data() + (i * channels + c) * 4, 4);
                sum += s;
            }
            out.samples[i] = sum / channels;
        }
    } else {
        return std::unexpected("unsupported sample format (need 16-bit PCM or 32-bit float)");
    }

    return out;
}

inline std::expected<Audio, std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("could not open " + path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return decode(bytes);
}

} // namespace wav

// SPDX-License-Identifier: Apache-2.0
#include "WavCodec.hpp"

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstring>
#include <format>
#include <string_view>
#include <vector>

namespace chatvox::wav
{

namespace
{

    constexpr auto RiffHeaderSize = std::size_t { 12 };
    constexpr auto ChunkHeaderSize = std::size_t { 8 };

    auto readU16(std::span<const std::uint8_t> data, std::size_t offset) -> std::uint16_t
    {
        return static_cast<std::uint16_t>(data[offset] | (data[offset + 1] << 8));
    }

    auto readU32(std::span<const std::uint8_t> data, std::size_t offset) -> std::uint32_t
    {
        return static_cast<std::uint32_t>(data[offset]) | (static_cast<std::uint32_t>(data[offset + 1]) << 8)
               | (static_cast<std::uint32_t>(data[offset + 2]) << 16)
               | (static_cast<std::uint32_t>(data[offset + 3]) << 24);
    }

    auto tagIs(std::span<const std::uint8_t> data, std::size_t offset, std::string_view tag) -> bool
    {
        return std::memcmp(data.data() + offset, tag.data(), 4) == 0;
    }

    void appendTag(AudioBlob& out, std::string_view tag)
    {
        out.insert(out.end(), tag.begin(), tag.end());
    }

    void appendU16(AudioBlob& out, std::uint16_t value)
    {
        out.push_back(static_cast<std::uint8_t>(value & 0xFF));
        out.push_back(static_cast<std::uint8_t>(value >> 8));
    }

    void appendU32(AudioBlob& out, std::uint32_t value)
    {
        for (auto shift = 0; shift < 32; shift += 8)
            out.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFF));
    }

    auto makeHeader(std::uint16_t format,
                    std::uint16_t channels,
                    std::uint32_t sampleRate,
                    std::uint16_t bitsPerSample,
                    std::uint32_t dataBytes) -> AudioBlob
    {
        auto const blockAlign = static_cast<std::uint16_t>(channels * bitsPerSample / 8);

        auto out = AudioBlob {};
        out.reserve(44 + dataBytes);
        appendTag(out, "RIFF");
        appendU32(out, 36 + dataBytes);
        appendTag(out, "WAVE");
        appendTag(out, "fmt ");
        appendU32(out, 16);
        appendU16(out, format);
        appendU16(out, channels);
        appendU32(out, sampleRate);
        appendU32(out, sampleRate * blockAlign);
        appendU16(out, blockAlign);
        appendU16(out, bitsPerSample);
        appendTag(out, "data");
        appendU32(out, dataBytes);
        return out;
    }

    auto clampToPcm16(double sample) -> std::int16_t
    {
        auto const scaled = std::lround(std::clamp(sample, -1.0, 1.0) * 32767.0);
        return static_cast<std::int16_t>(scaled);
    }

} // namespace

auto parse(std::span<const std::uint8_t> blob) -> Result<WavInfo>
{
    if (blob.size() < RiffHeaderSize || !tagIs(blob, 0, "RIFF") || !tagIs(blob, 8, "WAVE"))
        return makeError(ErrorCode::InvalidArgument, "Not a RIFF/WAVE file");

    auto info = WavInfo {};
    auto haveFormat = false;
    auto offset = RiffHeaderSize;

    while (offset + ChunkHeaderSize <= blob.size())
    {
        auto const chunkSize = static_cast<std::size_t>(readU32(blob, offset + 4));
        auto const body = offset + ChunkHeaderSize;

        if (tagIs(blob, offset, "fmt "))
        {
            if (chunkSize < 16 || body + chunkSize > blob.size())
                return makeError(ErrorCode::InvalidArgument, "Truncated fmt chunk");

            info.format = readU16(blob, body);
            info.channels = readU16(blob, body + 2);
            info.sampleRate = readU32(blob, body + 4);
            info.bitsPerSample = readU16(blob, body + 14);

            // WAVE_FORMAT_EXTENSIBLE carries the real format in the first two bytes of its sub-format GUID.
            if (info.format == FormatExtensible && chunkSize >= 26)
                info.format = readU16(blob, body + 24);
            haveFormat = true;
        }
        else if (tagIs(blob, offset, "data"))
        {
            if (!haveFormat)
                return makeError(ErrorCode::InvalidArgument, "data chunk precedes fmt chunk");

            info.dataOffset = body;
            info.dataSize = std::min(chunkSize, blob.size() - body);
            return info;
        }

        offset = body + chunkSize + (chunkSize & 1);
    }

    return makeError(ErrorCode::InvalidArgument, "WAV file has no data chunk");
}

auto encodeFloat32(std::span<const float> samples, std::uint32_t sampleRate, std::uint16_t channels) -> AudioBlob
{
    auto const dataBytes = static_cast<std::uint32_t>(samples.size() * sizeof(float));
    auto out = makeHeader(FormatIeeeFloat, channels, sampleRate, 32, dataBytes);
    for (auto const sample: samples)
        appendU32(out, std::bit_cast<std::uint32_t>(sample));
    return out;
}

auto encodePcm16(std::span<const std::int16_t> samples, std::uint32_t sampleRate, std::uint16_t channels)
    -> AudioBlob
{
    auto const dataBytes = static_cast<std::uint32_t>(samples.size() * sizeof(std::int16_t));
    auto out = makeHeader(FormatPcm, channels, sampleRate, 16, dataBytes);
    for (auto const sample: samples)
        appendU16(out, static_cast<std::uint16_t>(sample));
    return out;
}

auto reencodeToPcm16(std::span<const std::uint8_t> blob) -> Result<std::optional<AudioBlob>>
{
    auto info = parse(blob);
    if (!info)
        return std::unexpected(info.error());

    if (info->channels == 0)
        return makeError(ErrorCode::InvalidArgument, "WAV file declares zero channels");

    if (info->bitsPerSample <= 16)
        return std::optional<AudioBlob> {};

    auto const data = blob.subspan(info->dataOffset, info->dataSize);
    auto samples = std::vector<std::int16_t> {};

    if (info->format == FormatIeeeFloat && info->bitsPerSample == 32)
    {
        samples.reserve(data.size() / 4);
        for (auto i = std::size_t { 0 }; i + 4 <= data.size(); i += 4)
            samples.push_back(clampToPcm16(std::bit_cast<float>(readU32(data, i))));
    }
    else if (info->format == FormatPcm && info->bitsPerSample == 24)
    {
        samples.reserve(data.size() / 3);
        for (auto i = std::size_t { 0 }; i + 3 <= data.size(); i += 3)
            samples.push_back(static_cast<std::int16_t>(data[i + 1] | (data[i + 2] << 8)));
    }
    else if (info->format == FormatPcm && info->bitsPerSample == 32)
    {
        samples.reserve(data.size() / 4);
        for (auto i = std::size_t { 0 }; i + 4 <= data.size(); i += 4)
            samples.push_back(static_cast<std::int16_t>(data[i + 2] | (data[i + 3] << 8)));
    }
    else
    {
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Unsupported WAV encoding (format {}, {} bits)",
                                     info->format,
                                     info->bitsPerSample));
    }

    return std::optional<AudioBlob> { encodePcm16(samples, info->sampleRate, info->channels) };
}

} // namespace chatvox::wav

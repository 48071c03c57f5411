// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <optional>
#include <span>

namespace chatvox::wav
{

constexpr auto FormatPcm = std::uint16_t { 1 };
constexpr auto FormatIeeeFloat = std::uint16_t { 3 };
constexpr auto FormatExtensible = std::uint16_t { 0xFFFE };

/// @brief The parts of a RIFF/WAVE header the cache cares about.
struct WavInfo
{
    std::uint16_t format = 0; ///< Resolved format tag (extensible is resolved to its sub-format).
    std::uint16_t channels = 0;
    std::uint32_t sampleRate = 0;
    std::uint16_t bitsPerSample = 0;
    std::size_t dataOffset = 0;
    std::size_t dataSize = 0;
};

/// @brief Parses the RIFF chunk list of a WAV file held in memory.
[[nodiscard]] auto parse(std::span<const std::uint8_t> blob) -> Result<WavInfo>;

/// @brief Encodes interleaved float samples as a 32-bit IEEE float WAV file.
[[nodiscard]] auto encodeFloat32(std::span<const float> samples, std::uint32_t sampleRate, std::uint16_t channels)
    -> AudioBlob;

/// @brief Encodes interleaved 16-bit samples as a PCM WAV file.
[[nodiscard]] auto encodePcm16(std::span<const std::int16_t> samples,
                               std::uint32_t sampleRate,
                               std::uint16_t channels) -> AudioBlob;

/// @brief Re-encodes a float32 / 24-bit / 32-bit WAV as 16-bit PCM.
///
/// @return The smaller blob, std::nullopt when the blob is already 16-bit (or
///         narrower), or an error when it is not a WAV file this codec understands.
[[nodiscard]] auto reencodeToPcm16(std::span<const std::uint8_t> blob) -> Result<std::optional<AudioBlob>>;

} // namespace chatvox::wav

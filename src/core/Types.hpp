// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace chatvox
{

/// @brief Encoded audio artifact as produced by the synthesis service (usually a WAV file).
using AudioBlob = std::vector<std::uint8_t>;

/// @brief Identifies a message. Ids are handed out in arrival order.
using MessageId = std::uint64_t;

/// @brief Wall clock used for every persisted and observed timestamp.
using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

/// @brief Converts a time point to milliseconds since the Unix epoch.
[[nodiscard]] inline auto toUnixMillis(TimePoint tp) -> std::int64_t
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

/// @brief Converts milliseconds since the Unix epoch to a time point.
[[nodiscard]] inline auto fromUnixMillis(std::int64_t ms) -> TimePoint
{
    return TimePoint { std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds { ms }) };
}

/// @brief Parameters that influence the synthesized audio. Every field is part of the cache key.
struct SynthesisParams
{
    std::string model = "1.7B";
    std::string language = "Auto";
    double speed = 1.0;
    double temperature = 0.7;
    double repetitionPenalty = 1.05;
    int maxTokens = 2000;

    auto operator==(const SynthesisParams&) const -> bool = default;
};

/// @brief A single text to synthesize, as sent to the synthesis service.
struct SynthesisRequest
{
    std::string text;
    std::string voice;
    SynthesisParams params;
};

} // namespace chatvox

// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace chatvox
{

/// @brief Lifecycle of a chat message on its way to the speaker.
///
/// Queued -> Synthesizing -> (WaitingForCache) -> Ready -> Playing -> Done.
/// Failed and Skipped are terminal and reachable from every non-terminal state.
enum class MessageState : std::uint8_t
{
    Queued,
    Synthesizing,
    WaitingForCache,
    Ready,
    Playing,
    Done,
    Failed,
    Skipped,
};

/// @brief Inputs of the message state machine.
enum class MessageEvent : std::uint8_t
{
    StartSynthesis, ///< Message was submitted in a synthesis batch.
    AwaitDuplicate, ///< An identical cache key is already being produced.
    AudioReady,     ///< Audio for the cache key is available.
    StartPlayback,
    Finish,
    Fail,
    Skip,
};

[[nodiscard]] constexpr auto stateName(MessageState state) -> std::string_view
{
    switch (state)
    {
        case MessageState::Queued: return "queued";
        case MessageState::Synthesizing: return "synthesizing";
        case MessageState::WaitingForCache: return "waiting-for-cache";
        case MessageState::Ready: return "ready";
        case MessageState::Playing: return "playing";
        case MessageState::Done: return "done";
        case MessageState::Failed: return "failed";
        case MessageState::Skipped: return "skipped";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto eventName(MessageEvent event) -> std::string_view
{
    switch (event)
    {
        case MessageEvent::StartSynthesis: return "start-synthesis";
        case MessageEvent::AwaitDuplicate: return "await-duplicate";
        case MessageEvent::AudioReady: return "audio-ready";
        case MessageEvent::StartPlayback: return "start-playback";
        case MessageEvent::Finish: return "finish";
        case MessageEvent::Fail: return "fail";
        case MessageEvent::Skip: return "skip";
    }
    return "unknown";
}

[[nodiscard]] constexpr auto isTerminal(MessageState state) -> bool
{
    return state == MessageState::Done || state == MessageState::Failed || state == MessageState::Skipped;
}

/// @brief The message state machine.
///
/// Accepts only the valid (state, event) pairs; every other pair, and every
/// event on a terminal state, is reported as ErrorCode::InvalidTransition.
[[nodiscard]] auto transition(MessageState current, MessageEvent event) -> Result<MessageState>;

/// @brief Trims @p text and collapses internal whitespace runs into a single space.
[[nodiscard]] auto normalizeText(std::string_view text) -> std::string;

/// @brief Computes the content address of the audio for (text, voice, params).
///
/// Any change of the normalized text, the voice (case-insensitive) or any
/// synthesis parameter yields a different key.
[[nodiscard]] auto computeCacheKey(std::string_view text, std::string_view voice, const SynthesisParams& params)
    -> Result<std::string>;

/// @brief Length of @p text as the synthesizer perceives it: every digit counts five.
[[nodiscard]] auto ttsLength(std::string_view text) -> std::size_t;

/// @brief One chat message in flight.
struct QueuedMessage
{
    MessageId id = 0;
    std::string username;
    std::string platform;
    std::string originalText;
    std::string text; ///< Text to synthesize, voice prefix removed.
    std::string voice;
    bool explicitVoice = false;
    SynthesisParams params;
    std::string cacheKey;

    MessageState state = MessageState::Queued;
    std::map<MessageState, TimePoint> timestamps;
    std::optional<std::string> error;
    bool wasCacheHit = false;

    /// @brief Audio kept in memory when it could not be written to the cache.
    std::shared_ptr<const AudioBlob> audioFallback;

    /// @brief Applies @p event through transition() and records the timestamp of the new state.
    [[nodiscard]] auto apply(MessageEvent event, TimePoint now = Clock::now()) -> VoidResult;

    /// @brief Time the message entered @p state, if it ever did.
    [[nodiscard]] auto enteredAt(MessageState state) const -> std::optional<TimePoint>;

    /// @brief Single-line text shortened to @p maxLength characters for log output and UIs.
    [[nodiscard]] auto displayText(std::size_t maxLength = 30) const -> std::string;
};

} // namespace chatvox

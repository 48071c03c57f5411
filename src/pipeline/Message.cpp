// SPDX-License-Identifier: Apache-2.0
#include "Message.hpp"

#include <core/Hash.hpp>
#include <core/StringUtils.hpp>

#include <algorithm>
#include <cctype>
#include <format>

namespace chatvox
{

auto transition(MessageState current, MessageEvent event) -> Result<MessageState>
{
    auto const reject = [&]() -> Result<MessageState> {
        return makeError(ErrorCode::InvalidTransition,
                         std::format("Invalid transition: {} on {}", eventName(event), stateName(current)));
    };

    if (isTerminal(current))
        return reject();

    switch (event)
    {
        case MessageEvent::Fail: return MessageState::Failed;
        case MessageEvent::Skip: return MessageState::Skipped;
        case MessageEvent::StartSynthesis:
            if (current == MessageState::Queued)
                return MessageState::Synthesizing;
            break;
        case MessageEvent::AwaitDuplicate:
            if (current == MessageState::Queued)
                return MessageState::WaitingForCache;
            break;
        case MessageEvent::AudioReady:
            if (current == MessageState::Queued || current == MessageState::Synthesizing
                || current == MessageState::WaitingForCache)
                return MessageState::Ready;
            break;
        case MessageEvent::StartPlayback:
            if (current == MessageState::Ready)
                return MessageState::Playing;
            break;
        case MessageEvent::Finish:
            if (current == MessageState::Playing)
                return MessageState::Done;
            break;
    }
    return reject();
}

auto normalizeText(std::string_view text) -> std::string
{
    auto result = std::string {};
    result.reserve(text.size());

    auto pendingSpace = false;
    for (auto const c: text)
    {
        if (std::isspace(static_cast<unsigned char>(c)))
        {
            pendingSpace = !result.empty();
            continue;
        }
        if (pendingSpace)
        {
            result += ' ';
            pendingSpace = false;
        }
        result += c;
    }
    return result;
}

auto computeCacheKey(std::string_view text, std::string_view voice, const SynthesisParams& params)
    -> Result<std::string>
{
    // Numbers use the shortest round-trip form so any parameter change yields a new key.
    // Unit separators keep fields from bleeding into each other ("ab"+"c" vs "a"+"bc").
    auto const material = std::format("{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}\x1f{}",
                                      params.model,
                                      toLower(voice),
                                      params.language,
                                      params.speed,
                                      params.temperature,
                                      params.repetitionPenalty,
                                      params.maxTokens,
                                      normalizeText(text));
    return sha256Hex(material);
}

auto ttsLength(std::string_view text) -> std::size_t
{
    auto length = std::size_t { 0 };
    for (auto const c: text)
        length += std::isdigit(static_cast<unsigned char>(c)) ? 5 : 1;
    return length;
}

auto QueuedMessage::apply(MessageEvent event, TimePoint now) -> VoidResult
{
    auto next = transition(state, event);
    if (!next)
        return makeError(next.error().code, std::format("Message #{}: {}", id, next.error().message));

    state = *next;
    timestamps[state] = now;
    return {};
}

auto QueuedMessage::enteredAt(MessageState s) const -> std::optional<TimePoint>
{
    if (auto const it = timestamps.find(s); it != timestamps.end())
        return it->second;
    return std::nullopt;
}

auto QueuedMessage::displayText(std::size_t maxLength) const -> std::string
{
    auto shortened = text.size() > maxLength && maxLength > 3 ? text.substr(0, maxLength - 3) + "..." : text;
    std::ranges::replace(shortened, '\n', ' ');
    std::ranges::replace(shortened, '\r', ' ');
    return shortened;
}

} // namespace chatvox

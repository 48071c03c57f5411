// SPDX-License-Identifier: Apache-2.0
#include "VoiceQueueManager.hpp"

#include <core/Log.hpp>
#include <core/StringUtils.hpp>

#include <algorithm>
#include <format>
#include <regex>

namespace chatvox
{

namespace
{

    struct VoicePrefix
    {
        std::string voice;
        std::string rest;
    };

    /// @brief Splits a leading voice token off @p text, without validating it.
    auto splitVoicePrefix(std::string_view text, VoiceExtractionMode mode) -> std::optional<VoicePrefix>
    {
        static auto const bracketPattern = std::regex(R"(^\s*\[([^\]]+)\]\s*([\s\S]*)$)");
        static auto const firstWordPattern = std::regex(R"(^\s*(\S+)\s+([\s\S]+)$)");

        auto const& pattern = mode == VoiceExtractionMode::Bracket ? bracketPattern : firstWordPattern;
        auto match = std::match_results<std::string_view::const_iterator> {};
        if (!std::regex_match(text.begin(), text.end(), match, pattern))
            return std::nullopt;

        auto voice = std::string(trim(match[1].str()));
        if (voice.empty())
            return std::nullopt;
        return VoicePrefix { .voice = std::move(voice), .rest = match[2].str() };
    }

} // namespace

auto parseExtractionMode(std::string_view name) -> std::optional<VoiceExtractionMode>
{
    if (equalsIgnoreCase(name, "bracket"))
        return VoiceExtractionMode::Bracket;
    if (equalsIgnoreCase(name, "firstword"))
        return VoiceExtractionMode::FirstWord;
    return std::nullopt;
}

auto extractionModeName(VoiceExtractionMode mode) -> std::string_view
{
    switch (mode)
    {
        case VoiceExtractionMode::Bracket: return "bracket";
        case VoiceExtractionMode::FirstWord: return "firstword";
    }
    return "bracket";
}

VoiceQueueManager::VoiceQueueManager(QueueSettings settings): _settings(std::move(settings))
{
}

auto VoiceQueueManager::enqueue(std::string_view username,
                                std::string_view platform,
                                std::string_view text,
                                bool requireVoice) -> QueuedMessage
{
    return create(username, platform, text, std::nullopt, requireVoice);
}

auto VoiceQueueManager::enqueueWithBinding(std::string_view username,
                                           std::string_view platform,
                                           std::string_view text,
                                           std::string_view boundVoice) -> QueuedMessage
{
    return create(username, platform, text, boundVoice, false);
}

auto VoiceQueueManager::enqueueManual(std::string_view text, std::string_view voice, const SynthesisParams& params)
    -> QueuedMessage
{
    auto notes = Notifications {};
    auto result = QueuedMessage {};
    {
        auto lock = std::lock_guard(_mutex);
        auto message = QueuedMessage {
            .username = "Manual",
            .platform = "Manual",
            .originalText = std::string(text),
            .text = std::string(text),
            .voice = std::string(voice),
            .explicitVoice = true,
            .params = params,
        };
        result = admit(std::move(message), notes);
    }
    notify(std::move(notes));
    return result;
}

auto VoiceQueueManager::create(std::string_view username,
                               std::string_view platform,
                               std::string_view text,
                               std::optional<std::string_view> boundVoice,
                               bool requireVoice) -> QueuedMessage
{
    auto notes = Notifications {};
    auto result = QueuedMessage {};
    {
        auto lock = std::lock_guard(_mutex);
        auto message = QueuedMessage {
            .username = std::string(username),
            .platform = std::string(platform),
            .originalText = std::string(text),
            .text = std::string(text),
            .params = _settings.params,
        };

        // In first-word mode every message starts with a word, so only known voices count there.
        auto const prefix = splitVoicePrefix(text, _settings.extractionMode);
        auto const acceptsAny = _settings.extractionMode == VoiceExtractionMode::Bracket;
        if (prefix && (acceptsAny || !_knownVoices.empty()))
        {
            if (auto canonical = resolveVoiceLocked(prefix->voice))
            {
                message.voice = std::move(*canonical);
                message.text = prefix->rest;
                message.explicitVoice = true;
            }
        }

        if (requireVoice && !message.explicitVoice)
        {
            message.state = MessageState::Skipped;
            message.timestamps[MessageState::Skipped] = Clock::now();
            message.error = "Message does not name a voice";
            log::debug("Skipping message from {}: no voice given", message.username);
            return message;
        }

        if (!message.explicitVoice)
            message.voice = boundVoice ? std::string(*boundVoice) : _settings.defaultVoice;

        result = admit(std::move(message), notes);
    }
    notify(std::move(notes));
    return result;
}

auto VoiceQueueManager::admit(QueuedMessage message, Notifications& notes) -> QueuedMessage
{
    auto const now = Clock::now();
    auto const skip = [&](std::string reason) {
        log::debug("Skipping message from {}: {}", message.username, reason);
        message.state = MessageState::Skipped;
        message.timestamps[MessageState::Skipped] = now;
        message.error = std::move(reason);
        return message;
    };

    if (normalizeText(message.text).empty())
        return skip("Empty text");

    auto canonical = message.voice.empty() ? std::nullopt : resolveVoiceLocked(message.voice);
    if (!canonical)
    {
        log::warning("Message from {} uses unknown voice '{}'", message.username, message.voice);
        notes.invalidVoice = std::pair { message.username, message.voice };
        return skip(std::format("Unknown voice '{}'", message.voice));
    }
    message.voice = std::move(*canonical);

    auto key = computeCacheKey(message.text, message.voice, message.params);
    if (!key)
    {
        log::error("Cannot compute cache key for message from {}: {}", message.username, key.error());
        return skip(key.error().message);
    }
    message.cacheKey = std::move(*key);

    message.id = _nextId++;
    message.state = MessageState::Queued;
    message.timestamps[MessageState::Queued] = now;
    _queues[message.voice].push_back(message.id);
    _active.emplace(message.id, message);
    notes.queueChanged = true;

    log::debug("Queued message #{} for voice {}: \"{}\"", message.id, message.voice, message.displayText());
    return message;
}

auto VoiceQueueManager::requeue(MessageId id) -> Result<MessageId>
{
    auto notes = Notifications {};
    auto newId = MessageId { 0 };
    {
        auto lock = std::lock_guard(_mutex);
        if (_active.contains(id))
            return makeError(ErrorCode::InvalidArgument, std::format("Message #{} is still active", id));

        auto const it = std::ranges::find(_history, id, &QueuedMessage::id);
        if (it == _history.end())
            return makeError(ErrorCode::InvalidArgument, std::format("Unknown message #{}", id));
        if (it->state != MessageState::Failed && it->state != MessageState::Skipped)
            return makeError(ErrorCode::InvalidArgument,
                             std::format("Message #{} is {}, only failed or skipped messages can be requeued",
                                         id,
                                         stateName(it->state)));

        auto message = QueuedMessage {
            .id = _nextId++,
            .username = it->username,
            .platform = it->platform,
            .originalText = it->originalText,
            .text = it->text,
            .voice = it->voice,
            .explicitVoice = it->explicitVoice,
            .params = it->params,
            .cacheKey = it->cacheKey,
        };
        message.timestamps[MessageState::Queued] = Clock::now();
        newId = message.id;
        _queues[message.voice].push_back(newId);
        _active.emplace(newId, std::move(message));
        notes.queueChanged = true;
    }

    log::info("Requeued message #{} as #{}", id, newId);
    notify(std::move(notes));
    return newId;
}

auto VoiceQueueManager::takeBatch(std::size_t maxCount,
                                  std::size_t maxTextLength,
                                  const std::set<std::string, std::less<>>& busyVoices) -> std::vector<QueuedMessage>
{
    auto lock = std::lock_guard(_mutex);

    auto* chosen = static_cast<std::deque<MessageId>*>(nullptr);
    for (auto& [voice, queue]: _queues)
    {
        // Drop ids that left the Queued state while waiting.
        while (!queue.empty())
        {
            auto const it = _active.find(queue.front());
            if (it != _active.end() && it->second.state == MessageState::Queued)
                break;
            queue.pop_front();
        }

        if (queue.empty() || busyVoices.contains(voice))
            continue;
        if (!chosen || queue.front() < chosen->front())
            chosen = &queue;
    }

    auto batch = std::vector<QueuedMessage> {};
    if (!chosen)
        return batch;

    auto length = std::size_t { 0 };
    while (!chosen->empty() && batch.size() < maxCount)
    {
        auto const it = _active.find(chosen->front());
        if (it == _active.end() || it->second.state != MessageState::Queued)
        {
            chosen->pop_front();
            continue;
        }

        auto const messageLength = ttsLength(it->second.text);
        if (!batch.empty() && length + messageLength > maxTextLength)
            break;

        length += messageLength;
        batch.push_back(it->second);
        chosen->pop_front();
    }
    return batch;
}

auto VoiceQueueManager::update(MessageId id, MessageEvent event, const std::function<void(QueuedMessage&)>& edit)
    -> Result<QueuedMessage>
{
    auto notes = Notifications {};
    auto updated = QueuedMessage {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const it = _active.find(id);
        if (it == _active.end())
        {
            if (std::ranges::find(_history, id, &QueuedMessage::id) != _history.end())
                return makeError(ErrorCode::InvalidTransition,
                                 std::format("Message #{} already finished, ignoring {}", id, eventName(event)));
            return makeError(ErrorCode::InvalidArgument, std::format("Unknown message #{}", id));
        }

        auto const previous = it->second.state;
        if (auto applied = it->second.apply(event); !applied)
            return std::unexpected(applied.error());
        if (edit)
            edit(it->second);

        updated = it->second;
        notes.stateChanges.emplace_back(updated, previous);
        notes.queueChanged = previous == MessageState::Queued || isTerminal(updated.state);

        if (isTerminal(updated.state))
            retire(it);
    }

    log::trace("Message #{}: {} -> {}", id, stateName(notes.stateChanges.front().second), stateName(updated.state));
    notify(std::move(notes));
    return updated;
}

auto VoiceQueueManager::nextPlayable() const -> std::optional<QueuedMessage>
{
    auto lock = std::lock_guard(_mutex);
    // Only terminal messages leave _active, so the oldest active message is the gate.
    if (_active.empty() || _active.begin()->second.state != MessageState::Ready)
        return std::nullopt;
    return _active.begin()->second;
}

auto VoiceQueueManager::skipAll() -> std::vector<MessageId>
{
    auto notes = Notifications {};
    auto skipped = std::vector<MessageId> {};
    {
        auto lock = std::lock_guard(_mutex);
        auto const now = Clock::now();
        for (auto it = _active.begin(); it != _active.end();)
        {
            auto const next = std::next(it);
            auto const previous = it->second.state;
            if (previous != MessageState::Playing && it->second.apply(MessageEvent::Skip, now))
            {
                skipped.push_back(it->first);
                notes.stateChanges.emplace_back(it->second, previous);
                retire(it);
            }
            it = next;
        }
        _queues.clear();
        notes.queueChanged = true;
    }

    log::info("Skipped {} queued message(s)", skipped.size());
    notify(std::move(notes));
    return skipped;
}

auto VoiceQueueManager::find(MessageId id) const -> std::optional<QueuedMessage>
{
    auto lock = std::lock_guard(_mutex);
    if (auto const it = _active.find(id); it != _active.end())
        return it->second;
    if (auto const it = std::ranges::find(_history, id, &QueuedMessage::id); it != _history.end())
        return *it;
    return std::nullopt;
}

auto VoiceQueueManager::snapshot() const -> std::vector<QueuedMessage>
{
    auto lock = std::lock_guard(_mutex);
    auto result = std::vector<QueuedMessage> {};
    result.reserve(_active.size());
    for (auto const& [id, message]: _active)
        result.push_back(message);
    return result;
}

auto VoiceQueueManager::history() const -> std::vector<QueuedMessage>
{
    auto lock = std::lock_guard(_mutex);
    return { _history.begin(), _history.end() };
}

auto VoiceQueueManager::counts() const -> QueueCounts
{
    auto lock = std::lock_guard(_mutex);
    auto result = QueueCounts { .total = _active.size() };
    for (auto const& [id, message]: _active)
    {
        switch (message.state)
        {
            case MessageState::Queued: ++result.pending; break;
            case MessageState::Synthesizing:
            case MessageState::WaitingForCache: ++result.synthesizing; break;
            case MessageState::Ready: ++result.ready; break;
            default: break;
        }
    }
    return result;
}

auto VoiceQueueManager::queueLength(std::string_view voice) const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    auto const it = _queues.find(voice);
    if (it == _queues.end())
        return 0;
    return static_cast<std::size_t>(std::ranges::count_if(it->second, [this](MessageId id) {
        auto const message = _active.find(id);
        return message != _active.end() && message->second.state == MessageState::Queued;
    }));
}

void VoiceQueueManager::setKnownVoices(std::vector<std::string> voices)
{
    auto lock = std::lock_guard(_mutex);
    _knownVoices = std::move(voices);
}

auto VoiceQueueManager::knownVoices() const -> std::vector<std::string>
{
    auto lock = std::lock_guard(_mutex);
    return _knownVoices;
}

auto VoiceQueueManager::resolveVoice(std::string_view voice) const -> std::optional<std::string>
{
    auto lock = std::lock_guard(_mutex);
    return resolveVoiceLocked(voice);
}

auto VoiceQueueManager::resolveVoiceLocked(std::string_view voice) const -> std::optional<std::string>
{
    if (_knownVoices.empty())
        return std::string(voice);
    for (auto const& known: _knownVoices)
        if (equalsIgnoreCase(known, voice))
            return known;
    return std::nullopt;
}

void VoiceQueueManager::setDefaultVoice(std::string voice)
{
    auto lock = std::lock_guard(_mutex);
    _settings.defaultVoice = std::move(voice);
}

void VoiceQueueManager::setExtractionMode(VoiceExtractionMode mode)
{
    auto lock = std::lock_guard(_mutex);
    _settings.extractionMode = mode;
}

void VoiceQueueManager::setParams(SynthesisParams params)
{
    auto lock = std::lock_guard(_mutex);
    _settings.params = std::move(params);
}

auto VoiceQueueManager::params() const -> SynthesisParams
{
    auto lock = std::lock_guard(_mutex);
    return _settings.params;
}

void VoiceQueueManager::setQueueChangedCallback(QueueChangedCallback callback)
{
    auto lock = std::lock_guard(_callbackMutex);
    _queueChanged = std::move(callback);
}

void VoiceQueueManager::setStateChangedCallback(StateChangedCallback callback)
{
    auto lock = std::lock_guard(_callbackMutex);
    _stateChanged = std::move(callback);
}

void VoiceQueueManager::setInvalidVoiceCallback(InvalidVoiceCallback callback)
{
    auto lock = std::lock_guard(_callbackMutex);
    _invalidVoice = std::move(callback);
}

void VoiceQueueManager::retire(std::map<MessageId, QueuedMessage>::iterator it)
{
    if (auto const queue = _queues.find(it->second.voice); queue != _queues.end())
        std::erase(queue->second, it->first);

    _history.push_back(std::move(it->second));
    _active.erase(it);
    while (_history.size() > _settings.historyLimit)
        _history.pop_front();
}

void VoiceQueueManager::notify(Notifications notes)
{
    auto queueChanged = QueueChangedCallback {};
    auto stateChanged = StateChangedCallback {};
    auto invalidVoice = InvalidVoiceCallback {};
    {
        auto lock = std::lock_guard(_callbackMutex);
        queueChanged = _queueChanged;
        stateChanged = _stateChanged;
        invalidVoice = _invalidVoice;
    }

    if (stateChanged)
        for (auto const& [message, previous]: notes.stateChanges)
            stateChanged(message, previous);
    if (invalidVoice && notes.invalidVoice)
        invalidVoice(notes.invalidVoice->first, notes.invalidVoice->second);
    if (queueChanged && notes.queueChanged)
        queueChanged();
}

} // namespace chatvox

// SPDX-License-Identifier: Apache-2.0
#include "MessageFilter.hpp"

#include <core/Log.hpp>
#include <core/StringUtils.hpp>
#include <pipeline/VoiceQueueManager.hpp>

namespace chatvox
{

namespace
{

    auto platformMatches(std::string_view rule, std::string_view platform) -> bool
    {
        return equalsIgnoreCase(rule, AnyPlatform) || equalsIgnoreCase(rule, platform);
    }

} // namespace

MessageFilter::MessageFilter(VoiceQueueManager& queue, FilterRules rules): _queue(queue), _rules(std::move(rules))
{
}

auto MessageFilter::onMessage(std::string_view username,
                              std::string_view platform,
                              std::string_view text,
                              std::optional<std::string_view> rewardId) -> std::optional<QueuedMessage>
{
    if (rewardId && !rewardId->empty())
        return onReward(username, platform, text, *rewardId);

    if (isBlacklisted(username, platform))
    {
        log::trace("Ignoring blacklisted user {} on {}", username, platform);
        return std::nullopt;
    }

    if (auto const binding = bindingFor(username, platform))
        return _queue.enqueueWithBinding(username, platform, text, binding->voice);

    auto const settings = platformSettings(platform);
    if (!settings.readAllMessages || !settings.rewardId.empty())
        return std::nullopt;

    return _queue.enqueue(username, platform, text, settings.requireVoice);
}

auto MessageFilter::onReward(std::string_view username,
                             std::string_view platform,
                             std::string_view text,
                             std::string_view rewardId) -> std::optional<QueuedMessage>
{
    if (isBlacklisted(username, platform))
    {
        log::trace("Ignoring reward of blacklisted user {} on {}", username, platform);
        return std::nullopt;
    }

    if (auto const binding = bindingFor(username, platform))
        return _queue.enqueueWithBinding(username, platform, text, binding->voice);

    auto const settings = platformSettings(platform);
    if (!settings.rewardId.empty() && settings.rewardId != rewardId)
    {
        log::trace("Ignoring reward {} on {}", rewardId, platform);
        return std::nullopt;
    }

    return _queue.enqueue(username, platform, text);
}

void MessageFilter::setRules(FilterRules rules)
{
    auto lock = std::lock_guard(_mutex);
    _rules = std::move(rules);
}

auto MessageFilter::rules() const -> FilterRules
{
    auto lock = std::lock_guard(_mutex);
    return _rules;
}

auto MessageFilter::isBlacklisted(std::string_view username, std::string_view platform) const -> bool
{
    auto lock = std::lock_guard(_mutex);
    for (auto const& entry: _rules.blacklist)
        if (entry.enabled && equalsIgnoreCase(entry.username, username) && platformMatches(entry.platform, platform))
            return true;
    return false;
}

auto MessageFilter::bindingFor(std::string_view username, std::string_view platform) const
    -> std::optional<VoiceBinding>
{
    auto lock = std::lock_guard(_mutex);
    for (auto const& binding: _rules.bindings)
        if (binding.enabled && !binding.voice.empty() && equalsIgnoreCase(binding.username, username)
            && platformMatches(binding.platform, platform))
            return binding;
    return std::nullopt;
}

auto MessageFilter::platformSettings(std::string_view platform) const -> PlatformSettings
{
    auto lock = std::lock_guard(_mutex);
    for (auto const& [name, settings]: _rules.platforms)
        if (equalsIgnoreCase(name, platform))
            return settings;
    return PlatformSettings {};
}

} // namespace chatvox

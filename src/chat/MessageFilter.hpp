// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <pipeline/Message.hpp>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chatvox
{

class VoiceQueueManager;

/// @brief Platform name that matches every platform in bindings and blacklist entries.
constexpr auto AnyPlatform = std::string_view { "Any" };

/// @brief Routes every message of a user to a fixed voice.
struct VoiceBinding
{
    std::string username;
    std::string voice;
    std::string platform { AnyPlatform };
    bool enabled = true;
};

struct BlacklistEntry
{
    std::string username;
    std::string platform { AnyPlatform };
    bool enabled = true;
};

/// @brief Intake rules of one chat platform.
struct PlatformSettings
{
    /// @brief Read plain chat messages, not only rewards.
    bool readAllMessages = true;

    /// @brief Plain messages must name a voice to be read.
    bool requireVoice = false;

    /// @brief Only rewards with this id are read. Empty reads every reward.
    std::string rewardId;
};

struct FilterRules
{
    std::vector<VoiceBinding> bindings;
    std::vector<BlacklistEntry> blacklist;
    std::map<std::string, PlatformSettings, std::less<>> platforms;
};

/// @brief Decides which chat events become queued messages.
///
/// Blacklisted users are dropped silently. Users with a voice binding are
/// always read, with their bound voice. Everybody else is subject to the rules
/// of the platform the event came from.
class MessageFilter
{
  public:
    MessageFilter(VoiceQueueManager& queue, FilterRules rules);

    /// @brief Handles a plain chat message.
    /// @return The enqueued (or skipped) message, or std::nullopt if the filter dropped it.
    auto onMessage(std::string_view username,
                   std::string_view platform,
                   std::string_view text,
                   std::optional<std::string_view> rewardId = std::nullopt) -> std::optional<QueuedMessage>;

    /// @brief Handles a reward redemption.
    auto onReward(std::string_view username, std::string_view platform, std::string_view text, std::string_view rewardId)
        -> std::optional<QueuedMessage>;

    void setRules(FilterRules rules);
    [[nodiscard]] auto rules() const -> FilterRules;

    [[nodiscard]] auto isBlacklisted(std::string_view username, std::string_view platform) const -> bool;
    [[nodiscard]] auto bindingFor(std::string_view username, std::string_view platform) const
        -> std::optional<VoiceBinding>;
    [[nodiscard]] auto platformSettings(std::string_view platform) const -> PlatformSettings;

  private:
    VoiceQueueManager& _queue;

    mutable std::mutex _mutex;
    FilterRules _rules;
};

} // namespace chatvox

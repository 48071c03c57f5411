// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <functional>
#include <istream>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

namespace chatvox
{

class MessageFilter;

/// @brief Platform tag of messages typed into the console.
constexpr auto ConsolePlatform = std::string_view { "console" };

/// @brief Username used for console lines without a "name:" prefix.
constexpr auto ConsoleUser = std::string_view { "console" };

struct ChatLine
{
    std::string username;
    std::string text;
};

/// @brief Splits "username: text". Returns std::nullopt for blank lines.
[[nodiscard]] auto parseChatLine(std::string_view line) -> std::optional<ChatLine>;

/// @brief Called for lines starting with '/', without the slash.
using CommandHandler = std::function<void(std::string_view command)>;

/// @brief Feeds chat lines read from a stream into a MessageFilter.
class ConsoleChatSource
{
  public:
    ConsoleChatSource(std::istream& input, MessageFilter& filter, CommandHandler commands = {});

    /// @brief Reads lines until end of input or until @p stopToken is triggered.
    /// @return The number of chat lines handed to the filter.
    auto run(const std::stop_token& stopToken = {}) -> std::size_t;

  private:
    std::istream& _input;
    MessageFilter& _filter;
    CommandHandler _commands;
};

} // namespace chatvox

// SPDX-License-Identifier: Apache-2.0
#include "ConsoleChatSource.hpp"

#include <chat/MessageFilter.hpp>
#include <core/Log.hpp>
#include <core/StringUtils.hpp>

#include <algorithm>
#include <cctype>

namespace chatvox
{

auto parseChatLine(std::string_view line) -> std::optional<ChatLine>
{
    line = trim(line);
    if (line.empty())
        return std::nullopt;

    // "name: text" where name is a single token; "[voice] text" lines have no such prefix.
    if (auto const colon = line.find(':'); colon != std::string_view::npos && colon > 0)
    {
        auto const name = trim(line.substr(0, colon));
        auto const hasSpace =
            std::ranges::any_of(name, [](char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; });
        if (!name.empty() && !hasSpace && name.front() != '[')
            return ChatLine { .username = std::string(name), .text = std::string(trim(line.substr(colon + 1))) };
    }

    return ChatLine { .username = std::string(ConsoleUser), .text = std::string(line) };
}

ConsoleChatSource::ConsoleChatSource(std::istream& input, MessageFilter& filter, CommandHandler commands):
    _input(input), _filter(filter), _commands(std::move(commands))
{
}

auto ConsoleChatSource::run(const std::stop_token& stopToken) -> std::size_t
{
    auto count = std::size_t { 0 };
    auto line = std::string {};
    while (!stopToken.stop_requested() && std::getline(_input, line))
    {
        auto const trimmed = trim(line);
        if (trimmed.starts_with('/'))
        {
            if (_commands)
                _commands(trimmed.substr(1));
            continue;
        }

        auto const chat = parseChatLine(trimmed);
        if (!chat)
            continue;

        ++count;
        auto const message = _filter.onMessage(chat->username, ConsolePlatform, chat->text);
        if (message && message->state == MessageState::Skipped)
            log::info("Not reading message from {}: {}", chat->username, message->error.value_or("skipped"));
    }
    log::debug("Console chat source finished after {} line(s)", count);
    return count;
}

} // namespace chatvox

/*
 * Request helpers
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "LanguageModelRequest.hpp"

const char* to_string(Role role)
{
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

std::optional<Role> parse_role(const std::string& value)
{
    if (value == "system") {
        return Role::System;
    }
    if (value == "user") {
        return Role::User;
    }
    if (value == "assistant") {
        return Role::Assistant;
    }
    return std::nullopt;
}

std::size_t count_characters(const std::string& utf8)
{
    std::size_t count = 0;
    for (unsigned char c : utf8) {
        // Continuation bytes (10xxxxxx) don't start a code point
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

std::size_t estimate_token_count(const LanguageModelRequest& request)
{
    std::size_t characters = 0;
    for (const auto& message : request.messages) {
        characters += count_characters(message.content);
    }
    return characters / 4;
}

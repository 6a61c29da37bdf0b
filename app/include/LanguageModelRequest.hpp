/*
 * Backend-independent chat request
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef LANGUAGE_MODEL_REQUEST_HPP
#define LANGUAGE_MODEL_REQUEST_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * Chat message role
 */
enum class Role {
    System,
    User,
    Assistant,
};

const char* to_string(Role role);
std::optional<Role> parse_role(const std::string& value);

/**
 * A single message in a chat conversation
 */
struct RequestMessage {
    Role role{Role::User};
    std::string content;
};

/**
 * Request to a language model
 */
struct LanguageModelRequest {
    std::vector<RequestMessage> messages;
    std::vector<std::string> stop;
    float temperature{1.0f};
};

/**
 * Number of Unicode code points in UTF-8 text
 */
std::size_t count_characters(const std::string& utf8);

/**
 * Token estimate for backends without a counting endpoint:
 * total characters across all messages divided by 4
 */
std::size_t estimate_token_count(const LanguageModelRequest& request);

#endif // LANGUAGE_MODEL_REQUEST_HPP

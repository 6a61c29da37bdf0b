/*
 * Minimal JSON Schema checks for tool results
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef JSON_SCHEMA_HPP
#define JSON_SCHEMA_HPP

#ifdef _WIN32
    #include <json/json.h>
#elif __APPLE__
    #include <json/json.h>
#else
    #include <jsoncpp/json/json.h>
#endif

#include <optional>
#include <string>

/**
 * Check a value against the subset of JSON Schema used for tool calls:
 * type (single or list), properties, required, additionalProperties: false,
 * items, enum.
 *
 * @return Description of the first violation (with its JSON path), or
 *         nullopt when the value conforms
 */
std::optional<std::string> validate_json_schema(const Json::Value& value, const Json::Value& schema);

/**
 * Parse a JSON document
 * @return Parsed value, or nullopt with the parser message in errors
 */
std::optional<Json::Value> parse_json(const std::string& text, std::string* errors = nullptr);

/**
 * Serialize compactly (no indentation, no trailing newline)
 */
std::string write_json(const Json::Value& value);

#endif // JSON_SCHEMA_HPP

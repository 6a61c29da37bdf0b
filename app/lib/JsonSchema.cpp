/*
 * JSON Schema subset implementation
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "JsonSchema.hpp"

#include <cmath>
#include <memory>

namespace {

bool matches_type(const Json::Value& value, const std::string& type)
{
    if (type == "object") return value.isObject();
    if (type == "array") return value.isArray();
    if (type == "string") return value.isString();
    if (type == "boolean") return value.isBool();
    if (type == "null") return value.isNull();
    if (type == "number") return value.isNumeric() && !value.isBool();
    if (type == "integer") {
        if (value.isInt64() || value.isUInt64()) {
            return !value.isBool();
        }
        if (value.isDouble()) {
            const double d = value.asDouble();
            return std::isfinite(d) && std::floor(d) == d;
        }
        return false;
    }
    return false;
}

std::string type_list(const Json::Value& type)
{
    if (type.isString()) {
        return type.asString();
    }
    std::string out;
    for (const auto& t : type) {
        if (!out.empty()) {
            out += " or ";
        }
        out += t.asString();
    }
    return out;
}

std::optional<std::string> validate_at(const Json::Value& value,
                                       const Json::Value& schema,
                                       const std::string& path)
{
    if (!schema.isObject()) {
        return std::nullopt;
    }

    if (schema.isMember("type")) {
        const Json::Value& type = schema["type"];
        bool ok = false;
        if (type.isString()) {
            ok = matches_type(value, type.asString());
        } else if (type.isArray()) {
            for (const auto& t : type) {
                if (t.isString() && matches_type(value, t.asString())) {
                    ok = true;
                    break;
                }
            }
        }
        if (!ok) {
            return path + ": expected " + type_list(type);
        }
    }

    if (schema.isMember("enum") && schema["enum"].isArray()) {
        bool found = false;
        for (const auto& candidate : schema["enum"]) {
            if (candidate == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return path + ": value is not one of the allowed values";
        }
    }

    if (value.isObject()) {
        const Json::Value& properties = schema["properties"];
        if (schema.isMember("required") && schema["required"].isArray()) {
            for (const auto& name : schema["required"]) {
                if (name.isString() && !value.isMember(name.asString())) {
                    return path + ": missing required property '" + name.asString() + "'";
                }
            }
        }
        for (const auto& name : value.getMemberNames()) {
            if (properties.isObject() && properties.isMember(name)) {
                if (auto violation = validate_at(value[name], properties[name], path + "." + name)) {
                    return violation;
                }
            } else if (schema.isMember("additionalProperties") &&
                       schema["additionalProperties"].isBool() &&
                       !schema["additionalProperties"].asBool()) {
                return path + ": unexpected property '" + name + "'";
            }
        }
    }

    if (value.isArray() && schema.isMember("items") && schema["items"].isObject()) {
        for (Json::ArrayIndex i = 0; i < value.size(); ++i) {
            if (auto violation = validate_at(value[i], schema["items"], path + "[" + std::to_string(i) + "]")) {
                return violation;
            }
        }
    }

    return std::nullopt;
}

} // namespace

std::optional<std::string> validate_json_schema(const Json::Value& value, const Json::Value& schema)
{
    return validate_at(value, schema, "$");
}

std::optional<Json::Value> parse_json(const std::string& text, std::string* errors)
{
    Json::CharReaderBuilder reader_builder;
    std::unique_ptr<Json::CharReader> reader(reader_builder.newCharReader());
    Json::Value root;
    std::string parse_errors;

    if (!reader->parse(text.data(), text.data() + text.size(), &root, &parse_errors)) {
        if (errors) {
            *errors = parse_errors;
        }
        return std::nullopt;
    }
    return root;
}

std::string write_json(const Json::Value& value)
{
    Json::StreamWriterBuilder writer_builder;
    writer_builder["indentation"] = "";
    return Json::writeString(writer_builder, value);
}

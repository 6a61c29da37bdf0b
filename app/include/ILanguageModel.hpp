/*
 * Language model abstraction
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef I_LANGUAGE_MODEL_HPP
#define I_LANGUAGE_MODEL_HPP

#include "CompletionStream.hpp"
#include "Identifiers.hpp"
#include "JsonSchema.hpp"
#include "LanguageModelRequest.hpp"
#include "LlmErrors.hpp"

#include <cstddef>
#include <future>
#include <memory>
#include <string>

/**
 * One usable model of one backend
 *
 * Instances are immutable after construction and shared between any number
 * of concurrent callers through LanguageModelPtr.
 */
class ILanguageModel {
public:
    virtual ~ILanguageModel() = default;

    virtual ModelId id() const = 0;
    virtual ModelName name() const = 0;
    virtual ProviderId provider_id() const = 0;
    virtual ProviderName provider_name() const = 0;

    /**
     * Identifier reported in usage telemetry, e.g. "ollama/llama3:latest"
     */
    virtual std::string telemetry_id() const = 0;

    /**
     * Context window size declared by the backend
     */
    virtual std::size_t max_token_count() const = 0;

    /**
     * Estimate the tokens a request uses. Backends without a counting
     * endpoint fall back to estimate_token_count().
     */
    virtual std::future<std::size_t> count_tokens(const LanguageModelRequest& request) const = 0;

    /**
     * Start a streaming completion
     *
     * The pending call resolves once the backend has accepted the request;
     * the stream then yields text deltas in arrival order. Errors before the
     * backend responds fail the call; later errors end the stream. Dropping
     * the pending call unresolved abandons the request without blocking.
     *
     * @throws LlmError synchronously when the call can't be set up at all
     *         (provider gone, not authenticated)
     */
    virtual PendingCompletion stream_completion(LanguageModelRequest request) const = 0;

    /**
     * Ask the backend for one JSON value conforming to schema
     *
     * Backends without tool calling fail promptly with
     * LlmErrorCode::UnsupportedOperation.
     */
    virtual std::future<Json::Value> use_any_tool(LanguageModelRequest request,
                                                  std::string tool_name,
                                                  std::string tool_description,
                                                  Json::Value schema) const = 0;
};

using LanguageModelPtr = std::shared_ptr<ILanguageModel>;

/**
 * Validate a tool result against its schema and convert it
 * @throws LlmError(SchemaViolation) when the value doesn't fit
 */
template <typename Tool>
Tool parse_tool_result(const Json::Value& value, const Json::Value& schema)
{
    if (auto violation = validate_json_schema(value, schema)) {
        throw LlmError(LlmErrorCode::SchemaViolation,
                       "Tool '" + Tool::name() + "' returned invalid output: " + *violation);
    }
    try {
        return Tool::from_json(value);
    } catch (const Json::Exception& ex) {
        throw LlmError(LlmErrorCode::SchemaViolation,
                       "Tool '" + Tool::name() + "' output could not be converted: " + ex.what());
    }
}

/**
 * Typed tool call
 *
 * Tool must provide:
 *   static std::string name();
 *   static std::string description();
 *   static Json::Value schema();
 *   static Tool from_json(const Json::Value& value);
 *
 * The returned future is deferred: conversion happens in get().
 */
template <typename Tool>
std::future<Tool> use_tool(const ILanguageModel& model, LanguageModelRequest request)
{
    Json::Value schema = Tool::schema();
    std::future<Json::Value> pending =
        model.use_any_tool(std::move(request), Tool::name(), Tool::description(), schema);

    return std::async(std::launch::deferred,
        [pending = std::move(pending), schema = std::move(schema)]() mutable {
            return parse_tool_result<Tool>(pending.get(), schema);
        });
}

#endif // I_LANGUAGE_MODEL_HPP

/*
 * Error types surfaced by language models and providers
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef LLM_ERRORS_HPP
#define LLM_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * Error categories reported to callers
 */
enum class LlmErrorCode {
    AuthenticationRequired,   // No reachable backend or empty model set
    BackendUnreachable,       // Transport failure, caller may retry
    Timeout,                  // No data within the low-activity window, caller may retry
    UnsupportedOperation,     // Backend lacks the capability (e.g. tool calling)
    SchemaViolation,          // Tool output doesn't match the requested schema
    InvalidResponse,          // Malformed backend payload
    BackendError,             // Error message reported by the backend itself
    Cancelled,                // Consumer cancelled, or the provider shut down
};

/**
 * Stable lowercase name for logs and diagnostics
 */
const char* to_string(LlmErrorCode code);

/**
 * Whether retrying the same call later may succeed
 */
bool is_retryable(LlmErrorCode code);

/**
 * Exception carrying an error category
 *
 * Raised synchronously for setup failures, set on futures for async
 * failures, and rethrown by CompletionStream::next() as a stream's
 * terminal error.
 */
class LlmError : public std::runtime_error {
public:
    LlmError(LlmErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    LlmErrorCode code() const noexcept { return code_; }
    bool retryable() const { return is_retryable(code_); }

private:
    LlmErrorCode code_;
};

#endif // LLM_ERRORS_HPP

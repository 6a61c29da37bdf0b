/*
 * Error category helpers
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "LlmErrors.hpp"

const char* to_string(LlmErrorCode code)
{
    switch (code) {
        case LlmErrorCode::AuthenticationRequired: return "authentication_required";
        case LlmErrorCode::BackendUnreachable: return "backend_unreachable";
        case LlmErrorCode::Timeout: return "timeout";
        case LlmErrorCode::UnsupportedOperation: return "unsupported_operation";
        case LlmErrorCode::SchemaViolation: return "schema_violation";
        case LlmErrorCode::InvalidResponse: return "invalid_response";
        case LlmErrorCode::BackendError: return "backend_error";
        case LlmErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool is_retryable(LlmErrorCode code)
{
    return code == LlmErrorCode::BackendUnreachable || code == LlmErrorCode::Timeout;
}

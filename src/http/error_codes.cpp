#include "subscout/http/error_codes.hpp"
#include "subscout/core/error_codes.hpp"

namespace subscout {
namespace http {

static const std::unordered_map<ErrorCode, ErrorInfo> ERROR_INFO_MAP = {
    {ErrorCode::REQUEST_INVALID_ENDPOINT, {
        ErrorCode::REQUEST_INVALID_ENDPOINT,
        "REQUEST_INVALID_ENDPOINT",
        404,
        "The requested endpoint does not exist"
    }},
    {ErrorCode::REQUEST_METHOD_NOT_ALLOWED, {
        ErrorCode::REQUEST_METHOD_NOT_ALLOWED,
        "REQUEST_METHOD_NOT_ALLOWED",
        405,
        "HTTP method not allowed for this endpoint"
    }},
    {ErrorCode::REQUEST_MISSING_PARAMETER, {
        ErrorCode::REQUEST_MISSING_PARAMETER,
        "REQUEST_MISSING_PARAMETER",
        400,
        "Required parameter is missing"
    }},
    {ErrorCode::REQUEST_INVALID_PARAMETER, {
        ErrorCode::REQUEST_INVALID_PARAMETER,
        "REQUEST_INVALID_PARAMETER",
        400,
        "Invalid parameter value"
    }},
    {ErrorCode::REQUEST_INVALID_DOMAIN, {
        ErrorCode::REQUEST_INVALID_DOMAIN,
        "REQUEST_INVALID_DOMAIN",
        400,
        "Invalid domain"
    }},
    {ErrorCode::RATE_LIMIT_EXCEEDED, {
        ErrorCode::RATE_LIMIT_EXCEEDED,
        "RATE_LIMIT_EXCEEDED",
        429,
        "Too many requests"
    }},
    {ErrorCode::HISTORY_UNAVAILABLE, {
        ErrorCode::HISTORY_UNAVAILABLE,
        "HISTORY_UNAVAILABLE",
        503,
        "Scan history is unavailable"
    }},
    {ErrorCode::PROBE_FAILED, {
        ErrorCode::PROBE_FAILED,
        "PROBE_FAILED",
        502,
        "Host probe failed"
    }},
    {ErrorCode::SYSTEM_INTERNAL_ERROR, {
        ErrorCode::SYSTEM_INTERNAL_ERROR,
        "SYSTEM_INTERNAL_ERROR",
        500,
        "Internal server error"
    }},
    {ErrorCode::SYSTEM_SERVICE_UNAVAILABLE, {
        ErrorCode::SYSTEM_SERVICE_UNAVAILABLE,
        "SYSTEM_SERVICE_UNAVAILABLE",
        503,
        "Service temporarily unavailable"
    }}
};

const ErrorInfo& ErrorCodeHelper::getInfo(ErrorCode code) {
    auto it = ERROR_INFO_MAP.find(code);
    if (it != ERROR_INFO_MAP.end()) {
        return it->second;
    }
    static const ErrorInfo fallback = {
        ErrorCode::SYSTEM_INTERNAL_ERROR,
        "SYSTEM_INTERNAL_ERROR",
        500,
        "Unknown error"
    };
    return fallback;
}

const char* ErrorCodeHelper::toString(ErrorCode code) {
    return getInfo(code).code_str;
}

int ErrorCodeHelper::getHttpStatus(ErrorCode code) {
    return getInfo(code).http_status;
}

const char* ErrorCodeHelper::getDefaultMessage(ErrorCode code) {
    return getInfo(code).default_message;
}

ErrorCode ErrorCodeHelper::mapCoreErrorCode(core::CoreErrorCode core_code) {
    using C = core::CoreErrorCode;

    switch (core_code) {
        case C::HOSTNAME_INVALID:
            return ErrorCode::REQUEST_INVALID_DOMAIN;

        case C::STORAGE_READ_FAILED:
        case C::STORAGE_WRITE_FAILED:
            return ErrorCode::HISTORY_UNAVAILABLE;

        case C::HTTP_CONNECTION_FAILED:
        case C::HTTP_TIMEOUT:
        case C::TLS_HANDSHAKE_FAILED:
        case C::DNS_NO_ANSWER:
        case C::DNS_QUERY_FAILED:
        case C::DNS_TIMEOUT:
            return ErrorCode::PROBE_FAILED;

        default:
            return ErrorCode::SYSTEM_INTERNAL_ERROR;
    }
}

}}

#pragma once

#include <string>
#include <unordered_map>

namespace subscout {

namespace core {
enum class CoreErrorCode;
}

namespace http {

enum class ErrorCode {
    REQUEST_INVALID_ENDPOINT,
    REQUEST_METHOD_NOT_ALLOWED,
    REQUEST_MISSING_PARAMETER,
    REQUEST_INVALID_PARAMETER,
    REQUEST_INVALID_DOMAIN,

    RATE_LIMIT_EXCEEDED,

    HISTORY_UNAVAILABLE,
    PROBE_FAILED,

    SYSTEM_INTERNAL_ERROR,
    SYSTEM_SERVICE_UNAVAILABLE
};

struct ErrorInfo {
    ErrorCode code;
    const char* code_str;
    int http_status;
    const char* default_message;
};

class ErrorCodeHelper {
public:
    static const ErrorInfo& getInfo(ErrorCode code);
    static const char* toString(ErrorCode code);
    static int getHttpStatus(ErrorCode code);
    static const char* getDefaultMessage(ErrorCode code);

    static ErrorCode mapCoreErrorCode(core::CoreErrorCode core_code);
};

}}

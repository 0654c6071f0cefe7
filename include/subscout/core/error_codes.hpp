#pragma once

#include "../common/error_framework.hpp"
#include <unordered_map>

namespace subscout {
namespace core {

enum class CoreErrorCode {
    HOSTNAME_INVALID = 100,

    DNS_NO_ANSWER = 200,
    DNS_QUERY_FAILED = 201,
    DNS_TIMEOUT = 202,

    HTTP_CONNECTION_FAILED = 300,
    HTTP_TIMEOUT = 301,
    TLS_HANDSHAKE_FAILED = 302,

    CT_FETCH_FAILED = 400,
    CT_BAD_STATUS = 401,
    CT_MALFORMED_PAYLOAD = 402,

    RESOLVER_BINARY_MISSING = 500,
    RESOLVER_SPAWN_FAILED = 501,
    RESOLVER_BATCH_FAILED = 502,

    STORAGE_READ_FAILED = 600,
    STORAGE_WRITE_FAILED = 601
};

using CoreErrorCodeHelper = common::ErrorRegistry<CoreErrorCode>;

}
}

namespace subscout {
namespace common {

template<>
inline const std::unordered_map<core::CoreErrorCode, ErrorInfo<core::CoreErrorCode>>&
ErrorRegistry<core::CoreErrorCode>::getInfoMap() {
    static const std::unordered_map<core::CoreErrorCode, ErrorInfo<core::CoreErrorCode>> map = {
        {core::CoreErrorCode::HOSTNAME_INVALID, {
            core::CoreErrorCode::HOSTNAME_INVALID,
            "HOSTNAME_INVALID",
            "Invalid hostname"
        }},
        {core::CoreErrorCode::DNS_NO_ANSWER, {
            core::CoreErrorCode::DNS_NO_ANSWER,
            "DNS_NO_ANSWER",
            "No records of the requested type"
        }},
        {core::CoreErrorCode::DNS_QUERY_FAILED, {
            core::CoreErrorCode::DNS_QUERY_FAILED,
            "DNS_QUERY_FAILED",
            "DNS query failed"
        }},
        {core::CoreErrorCode::DNS_TIMEOUT, {
            core::CoreErrorCode::DNS_TIMEOUT,
            "DNS_TIMEOUT",
            "DNS query timed out"
        }},
        {core::CoreErrorCode::HTTP_CONNECTION_FAILED, {
            core::CoreErrorCode::HTTP_CONNECTION_FAILED,
            "HTTP_CONNECTION_FAILED",
            "HTTP connection failed"
        }},
        {core::CoreErrorCode::HTTP_TIMEOUT, {
            core::CoreErrorCode::HTTP_TIMEOUT,
            "HTTP_TIMEOUT",
            "HTTP request timed out"
        }},
        {core::CoreErrorCode::TLS_HANDSHAKE_FAILED, {
            core::CoreErrorCode::TLS_HANDSHAKE_FAILED,
            "TLS_HANDSHAKE_FAILED",
            "TLS handshake failed"
        }},
        {core::CoreErrorCode::CT_FETCH_FAILED, {
            core::CoreErrorCode::CT_FETCH_FAILED,
            "CT_FETCH_FAILED",
            "Certificate transparency fetch failed"
        }},
        {core::CoreErrorCode::CT_BAD_STATUS, {
            core::CoreErrorCode::CT_BAD_STATUS,
            "CT_BAD_STATUS",
            "Certificate transparency source returned non-200 status"
        }},
        {core::CoreErrorCode::CT_MALFORMED_PAYLOAD, {
            core::CoreErrorCode::CT_MALFORMED_PAYLOAD,
            "CT_MALFORMED_PAYLOAD",
            "Certificate transparency payload is malformed"
        }},
        {core::CoreErrorCode::RESOLVER_BINARY_MISSING, {
            core::CoreErrorCode::RESOLVER_BINARY_MISSING,
            "RESOLVER_BINARY_MISSING",
            "Batch resolver binary not found"
        }},
        {core::CoreErrorCode::RESOLVER_SPAWN_FAILED, {
            core::CoreErrorCode::RESOLVER_SPAWN_FAILED,
            "RESOLVER_SPAWN_FAILED",
            "Failed to start batch resolver process"
        }},
        {core::CoreErrorCode::RESOLVER_BATCH_FAILED, {
            core::CoreErrorCode::RESOLVER_BATCH_FAILED,
            "RESOLVER_BATCH_FAILED",
            "Batch resolver exited with non-zero status"
        }},
        {core::CoreErrorCode::STORAGE_READ_FAILED, {
            core::CoreErrorCode::STORAGE_READ_FAILED,
            "STORAGE_READ_FAILED",
            "Failed to read scan history"
        }},
        {core::CoreErrorCode::STORAGE_WRITE_FAILED, {
            core::CoreErrorCode::STORAGE_WRITE_FAILED,
            "STORAGE_WRITE_FAILED",
            "Failed to write scan history"
        }}
    };
    return map;
}

}
}

// src/common/rpc/src/RpcStatus.cpp
#include "common/rpc/include/RpcStatus.hpp"
#include <unordered_map>

namespace secret_env::rpc
{
    const char* StatusCodeToString(StatusCode code)
    {
        switch (code) {
            case StatusCode::OK: return "OK";
            case StatusCode::CANCELLED: return "CANCELLED";
            case StatusCode::UNKNOWN: return "UNKNOWN";
            case StatusCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case StatusCode::DEADLINE_EXCEEDED: return "DEADLINE_EXCEEDED";
            case StatusCode::NOT_FOUND: return "NOT_FOUND";
            case StatusCode::ALREADY_EXISTS: return "ALREADY_EXISTS";
            case StatusCode::PERMISSION_DENIED: return "PERMISSION_DENIED";
            case StatusCode::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
            case StatusCode::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
            case StatusCode::ABORTED: return "ABORTED";
            case StatusCode::OUT_OF_RANGE: return "OUT_OF_RANGE";
            case StatusCode::UNIMPLEMENTED: return "UNIMPLEMENTED";
            case StatusCode::INTERNAL: return "INTERNAL";
            case StatusCode::UNAVAILABLE: return "UNAVAILABLE";
            case StatusCode::DATA_LOSS: return "DATA_LOSS";
            case StatusCode::UNAUTHENTICATED: return "UNAUTHENTICATED";
            default: return "UNKNOWN";
        }
    }

    StatusCode StatusCodeFromString(const std::string& str)
    {
        static const std::unordered_map<std::string, StatusCode> codes = {
            {"OK", StatusCode::OK},
            {"CANCELLED", StatusCode::CANCELLED},
            {"UNKNOWN", StatusCode::UNKNOWN},
            {"INVALID_ARGUMENT", StatusCode::INVALID_ARGUMENT},
            {"DEADLINE_EXCEEDED", StatusCode::DEADLINE_EXCEEDED},
            {"NOT_FOUND", StatusCode::NOT_FOUND},
            {"ALREADY_EXISTS", StatusCode::ALREADY_EXISTS},
            {"PERMISSION_DENIED", StatusCode::PERMISSION_DENIED},
            {"RESOURCE_EXHAUSTED", StatusCode::RESOURCE_EXHAUSTED},
            {"FAILED_PRECONDITION", StatusCode::FAILED_PRECONDITION},
            {"ABORTED", StatusCode::ABORTED},
            {"OUT_OF_RANGE", StatusCode::OUT_OF_RANGE},
            {"UNIMPLEMENTED", StatusCode::UNIMPLEMENTED},
            {"INTERNAL", StatusCode::INTERNAL},
            {"UNAVAILABLE", StatusCode::UNAVAILABLE},
            {"DATA_LOSS", StatusCode::DATA_LOSS},
            {"UNAUTHENTICATED", StatusCode::UNAUTHENTICATED}
        };

        auto it = codes.find(str);
        return it != codes.end() ? it->second : StatusCode::UNKNOWN;
    }

    StatusCode StatusCodeFromHttp(int http_status)
    {
        if (http_status >= 200 && http_status < 300) {
            return StatusCode::OK;
        }

        switch (http_status) {
            case 400: return StatusCode::INVALID_ARGUMENT;
            case 401: return StatusCode::UNAUTHENTICATED;
            case 403: return StatusCode::PERMISSION_DENIED;
            case 404: return StatusCode::NOT_FOUND;
            case 409: return StatusCode::ABORTED;
            case 412: return StatusCode::FAILED_PRECONDITION;
            case 429: return StatusCode::RESOURCE_EXHAUSTED;
            case 499: return StatusCode::CANCELLED;
            case 501: return StatusCode::UNIMPLEMENTED;
            case 503: return StatusCode::UNAVAILABLE;
            case 504: return StatusCode::DEADLINE_EXCEEDED;
            default: break;
        }

        if (http_status >= 500) {
            return StatusCode::INTERNAL;
        }
        return StatusCode::UNKNOWN;
    }

    std::string RpcStatus::ToString() const
    {
        std::string result = StatusCodeToString(code);
        if (!message.empty()) {
            result += ": " + message;
        }
        return result;
    }

} // namespace secret_env::rpc

// src/common/rpc/include/RpcStatus.hpp
#pragma once
#include <string>
#include <utility>

namespace secret_env::rpc
{
    /**
     * @brief Google API 표준 상태 코드 (google.rpc.Code)
     */
    enum class StatusCode
    {
        OK = 0,
        CANCELLED = 1,
        UNKNOWN = 2,
        INVALID_ARGUMENT = 3,
        DEADLINE_EXCEEDED = 4,
        NOT_FOUND = 5,
        ALREADY_EXISTS = 6,
        PERMISSION_DENIED = 7,
        RESOURCE_EXHAUSTED = 8,
        FAILED_PRECONDITION = 9,
        ABORTED = 10,
        OUT_OF_RANGE = 11,
        UNIMPLEMENTED = 12,
        INTERNAL = 13,
        UNAVAILABLE = 14,
        DATA_LOSS = 15,
        UNAUTHENTICATED = 16
    };

    const char* StatusCodeToString(StatusCode code);

    /**
     * @brief "NOT_FOUND" 같은 문자열을 코드로 변환
     * @return 알 수 없는 문자열이면 UNKNOWN
     */
    StatusCode StatusCodeFromString(const std::string& str);

    /**
     * @brief HTTP 상태 코드를 표준 상태 코드로 매핑
     *
     * 에러 응답 본문에 status 필드가 없을 때만 사용
     */
    StatusCode StatusCodeFromHttp(int http_status);

    /**
     * @brief RPC 결과 상태
     */
    struct RpcStatus
    {
        StatusCode code = StatusCode::OK;
        std::string message;

        RpcStatus() = default;
        RpcStatus(StatusCode c, std::string msg)
            : code(c), message(std::move(msg)) {}

        static RpcStatus Ok() { return RpcStatus(); }
        static RpcStatus Unknown(const std::string& msg) { return RpcStatus(StatusCode::UNKNOWN, msg); }

        bool IsOk() const { return code == StatusCode::OK; }
        std::string ToString() const;
    };

} // namespace secret_env::rpc

// src/common/vault/include/VaultException.hpp
#pragma once
#include "common/rpc/include/RpcStatus.hpp"
#include <stdexcept>
#include <string>

namespace secret_env::vault
{
    /**
     * @brief 에러 분류
     *
     * 설정 문제 / 네트워크 문제 / 데이터 문제를 호출자가 구분할 수 있도록
     * 모든 Vault 예외는 하나의 Kind를 가짐
     */
    enum class VaultErrorKind
    {
        TRANSPORT = 0,
        CONFIGURATION = 1,
        REMOTE_CALL = 2,
        EMPTY_SECRET = 3,
        DECODE = 4,
        UNIMPLEMENTED = 5,
        PAYLOAD_CORRUPTED = 6
    };

    inline const char* VaultErrorKindToString(VaultErrorKind kind)
    {
        switch (kind) {
            case VaultErrorKind::TRANSPORT: return "TRANSPORT";
            case VaultErrorKind::CONFIGURATION: return "CONFIGURATION";
            case VaultErrorKind::REMOTE_CALL: return "REMOTE_CALL";
            case VaultErrorKind::EMPTY_SECRET: return "EMPTY_SECRET";
            case VaultErrorKind::DECODE: return "DECODE";
            case VaultErrorKind::UNIMPLEMENTED: return "UNIMPLEMENTED";
            case VaultErrorKind::PAYLOAD_CORRUPTED: return "PAYLOAD_CORRUPTED";
            default: return "UNKNOWN";
        }
    }

    /**
     * @brief Vault 기본 예외 클래스
     */
    class VaultException : public std::runtime_error
    {
    private:
        VaultErrorKind kind_;

    public:
        VaultException(VaultErrorKind kind, const std::string& msg)
            : std::runtime_error(msg), kind_(kind) {}

        VaultErrorKind Kind() const { return kind_; }
    };

    /**
     * @brief 채널 생성, TLS 협상, 연결/송수신 실패
     */
    class TransportException : public VaultException
    {
    public:
        explicit TransportException(const std::string& msg)
            : VaultException(VaultErrorKind::TRANSPORT, "Transport error: " + msg) {}
    };

    /**
     * @brief 자격 증명 또는 설정이 잘못되었을 때 발생
     */
    class ConfigurationException : public VaultException
    {
    public:
        explicit ConfigurationException(const std::string& msg)
            : VaultException(VaultErrorKind::CONFIGURATION, "Configuration error: " + msg) {}
    };

    /**
     * @brief 원격 서비스가 실패 상태를 반환했을 때 발생
     *
     * 진단을 위해 상태 코드와 메시지를 그대로 보존
     */
    class RemoteCallException : public VaultException
    {
    private:
        rpc::RpcStatus status_;

    public:
        explicit RemoteCallException(const rpc::RpcStatus& status)
            : VaultException(VaultErrorKind::REMOTE_CALL, "Remote call failed: " + status.ToString())
            , status_(status) {}

        const rpc::RpcStatus& GetStatus() const { return status_; }
        rpc::StatusCode Code() const { return status_.code; }
    };

    /**
     * @brief 호출은 성공했지만 payload가 없음 (빈 값으로 대체하지 않음)
     */
    class EmptySecretException : public VaultException
    {
    public:
        explicit EmptySecretException(const std::string& secret_name)
            : VaultException(VaultErrorKind::EMPTY_SECRET, "The secret is empty: " + secret_name) {}
    };

    /**
     * @brief payload가 JSON이 아니거나 환경 변수로 변환할 수 없음
     */
    class DecodeException : public VaultException
    {
    public:
        explicit DecodeException(const std::string& msg)
            : VaultException(VaultErrorKind::DECODE, "Decode error: " + msg) {}
    };

    /**
     * @brief 구현되지 않은 기능 호출
     */
    class UnimplementedException : public VaultException
    {
    public:
        explicit UnimplementedException(const std::string& operation)
            : VaultException(VaultErrorKind::UNIMPLEMENTED, "Not implemented: " + operation) {}
    };

    /**
     * @brief payload CRC32C 불일치
     */
    class PayloadCorruptedException : public VaultException
    {
    public:
        explicit PayloadCorruptedException(const std::string& msg)
            : VaultException(VaultErrorKind::PAYLOAD_CORRUPTED, "Payload corrupted: " + msg) {}
    };

} // namespace secret_env::vault

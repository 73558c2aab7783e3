// src/common/network/tls/include/TlsContext.hpp
#pragma once

#include <boost/asio/ssl/context.hpp>
#include <openssl/ssl.h>
#include <string>
#include <memory>

namespace secret_env::network::tls
{
    /**
     * @brief TLS 버전
     */
    enum class TlsVersion
    {
        TLS_1_2 = 0,
        TLS_1_3 = 1
    };

    /**
     * @brief TLS 설정 구조체 (클라이언트 전용)
     */
    struct TlsConfig
    {
        TlsVersion min_version = TlsVersion::TLS_1_2;

        // 암호화 스위트 (비어있으면 기본값 사용)
        std::string cipher_list;
        std::string cipher_suites;

        int verify_depth = 10;

        static TlsConfig CreateSecureClientConfig();
    };

    /**
     * @brief TLS Context 래퍼 클래스
     *
     * boost::asio::ssl::context를 소유하며 신뢰 루트는 메모리(PEM)에서만 로드
     * 호스트의 시스템 인증서 저장소는 사용하지 않음
     */
    class TlsContext
    {
    private:
        boost::asio::ssl::context ctx;
        TlsConfig config;
        int ca_count = 0;

    public:
        explicit TlsContext(const TlsConfig& cfg = TlsConfig::CreateSecureClientConfig());
        ~TlsContext() = default;

        TlsContext(const TlsContext&) = delete;
        TlsContext& operator=(const TlsContext&) = delete;

        /**
         * @brief CA 인증서 로드 (메모리에서, 여러 개 연결된 PEM 허용)
         *
         * @param ca_pem CA 인증서 PEM 데이터
         * @return 로드된 인증서 개수 (0이면 실패)
         */
        int LoadCA(const std::string& ca_pem);

        bool HasCA() const { return ca_count > 0; }
        int GetCACount() const { return ca_count; }
        boost::asio::ssl::context& Native() { return ctx; }
        const TlsConfig& GetConfig() const { return config; }

        /**
         * @brief 컴파일 시 포함된 Google 루트 인증서로 초기화된 Context 생성
         * @throws TransportException 루트 번들 로드 실패 시
         */
        static std::unique_ptr<TlsContext> CreateWithEmbeddedRoots();

        static std::string GetLastError();

    private:
        bool SetCipherList();
        bool SetTlsVersion();
        void ConfigureVerification();

        static int VerifyCallback(int preverify_ok, X509_STORE_CTX* ctx);
    };

    namespace CipherSuites
    {
        constexpr const char* STRONG_TLS_1_2 =
            "ECDHE-ECDSA-AES256-GCM-SHA384:"
            "ECDHE-RSA-AES256-GCM-SHA384:"
            "ECDHE-ECDSA-AES128-GCM-SHA256:"
            "ECDHE-RSA-AES128-GCM-SHA256:"
            "ECDHE-ECDSA-CHACHA20-POLY1305:"
            "ECDHE-RSA-CHACHA20-POLY1305";

        constexpr const char* STRONG_TLS_1_3 =
            "TLS_AES_256_GCM_SHA384:"
            "TLS_AES_128_GCM_SHA256:"
            "TLS_CHACHA20_POLY1305_SHA256";
    }

} // namespace secret_env::network::tls

// src/common/network/tls/src/TlsContext.cpp
#include "common/network/tls/include/TlsContext.hpp"
#include "common/network/tls/include/RootCertificates.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <openssl/x509v3.h>

namespace secret_env::network::tls
{
    // ========================================
    // TlsConfig 구현
    // ========================================

    TlsConfig TlsConfig::CreateSecureClientConfig()
    {
        TlsConfig config;
        config.min_version = TlsVersion::TLS_1_2;
        config.cipher_list = CipherSuites::STRONG_TLS_1_2;
        config.cipher_suites = CipherSuites::STRONG_TLS_1_3;
        return config;
    }

    // ========================================
    // TlsContext 구현
    // ========================================

    TlsContext::TlsContext(const TlsConfig& cfg)
        : ctx(boost::asio::ssl::context::tls_client)
        , config(cfg)
    {
        ctx.set_options(
            boost::asio::ssl::context::default_workarounds |
            boost::asio::ssl::context::no_sslv2 |
            boost::asio::ssl::context::no_sslv3 |
            boost::asio::ssl::context::no_compression);

        if (!SetTlsVersion() || !SetCipherList()) {
            throw vault::TransportException("failed to configure TLS context: " + GetLastError());
        }

        ConfigureVerification();
    }

    int TlsContext::LoadCA(const std::string& ca_pem)
    {
        if (ca_pem.empty()) {
            LOG_ERROR("TLS", "Empty CA data");
            return 0;
        }

        BIO* bio = BIO_new_mem_buf(ca_pem.data(), static_cast<int>(ca_pem.size()));
        if (!bio) {
            LOG_ERROR("TLS", "Failed to create BIO for CA");
            return 0;
        }

        X509_STORE* store = SSL_CTX_get_cert_store(ctx.native_handle());
        if (!store) {
            BIO_free(bio);
            LOG_ERROR("TLS", "Failed to get certificate store");
            return 0;
        }

        X509* ca_cert = nullptr;
        int count = 0;

        while ((ca_cert = PEM_read_bio_X509(bio, nullptr, nullptr, nullptr)) != nullptr) {
            if (X509_STORE_add_cert(store, ca_cert) == 1) {
                count++;
            }
            X509_free(ca_cert);
        }

        BIO_free(bio);
        // 마지막 PEM 뒤의 "no start line" 에러 제거
        ERR_clear_error();

        if (count == 0) {
            LOG_ERROR("TLS", "No CA certificates loaded");
            return 0;
        }

        ca_count += count;
        LOG_DEBUGF("TLS", "Loaded %d CA certificates", count);
        return count;
    }

    std::unique_ptr<TlsContext> TlsContext::CreateWithEmbeddedRoots()
    {
        auto context = std::make_unique<TlsContext>();
        if (context->LoadCA(EMBEDDED_ROOT_CERTIFICATES) == 0) {
            throw vault::TransportException("failed to load embedded root certificates");
        }
        return context;
    }

    std::string TlsContext::GetLastError()
    {
        char buf[256];
        ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
        return std::string(buf);
    }

    bool TlsContext::SetCipherList()
    {
        SSL_CTX* native = ctx.native_handle();

        if (!config.cipher_list.empty()) {
            if (SSL_CTX_set_cipher_list(native, config.cipher_list.c_str()) != 1) {
                LOG_ERRORF("TLS", "Failed to set cipher list: %s", GetLastError().c_str());
                return false;
            }
        }

        if (!config.cipher_suites.empty()) {
            if (SSL_CTX_set_ciphersuites(native, config.cipher_suites.c_str()) != 1) {
                LOG_ERRORF("TLS", "Failed to set cipher suites: %s", GetLastError().c_str());
                return false;
            }
        }

        return true;
    }

    bool TlsContext::SetTlsVersion()
    {
        int min_version = (config.min_version == TlsVersion::TLS_1_3)
                          ? TLS1_3_VERSION : TLS1_2_VERSION;

        if (SSL_CTX_set_min_proto_version(ctx.native_handle(), min_version) != 1) {
            LOG_ERRORF("TLS", "Failed to set min TLS version: %s", GetLastError().c_str());
            return false;
        }
        return true;
    }

    void TlsContext::ConfigureVerification()
    {
        // 호스트명 검증은 채널에서 연결 대상마다 별도로 설정
        SSL_CTX_set_verify(ctx.native_handle(), SSL_VERIFY_PEER, VerifyCallback);
        SSL_CTX_set_verify_depth(ctx.native_handle(), config.verify_depth);
    }

    int TlsContext::VerifyCallback(int preverify_ok, X509_STORE_CTX* store_ctx)
    {
        if (!preverify_ok) {
            char buf[256] = {0};
            X509* err_cert = X509_STORE_CTX_get_current_cert(store_ctx);
            int err = X509_STORE_CTX_get_error(store_ctx);
            int depth = X509_STORE_CTX_get_error_depth(store_ctx);

            if (err_cert) {
                X509_NAME_oneline(X509_get_subject_name(err_cert), buf, sizeof(buf));
            }

            LOG_ERRORF("TLS", "Certificate verification failed: subject=%s error=%s depth=%d",
                       buf, X509_verify_cert_error_string(err), depth);
        }

        return preverify_ok;
    }

} // namespace secret_env::network::tls

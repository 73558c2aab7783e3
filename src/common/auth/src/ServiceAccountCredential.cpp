// src/common/auth/src/ServiceAccountCredential.cpp
#include "common/auth/include/ServiceAccountCredential.hpp"
#include "common/auth/include/CredentialFile.hpp"
#include "common/auth/include/Jwt.hpp"
#include "common/network/https/include/Url.hpp"
#include "common/vault/include/VaultException.hpp"
#include "common/utils/logger/Logger.hpp"
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <chrono>

namespace secret_env::auth
{
    constexpr int64_t ASSERTION_LIFETIME_SEC = 3600;
    constexpr const char* JWT_BEARER_GRANT = "urn:ietf:params:oauth:grant-type:jwt-bearer";

    ServiceAccountCredential::ServiceAccountCredential(const nlohmann::json& info,
                                                       network::https::ChannelFactory channel_factory)
        : OAuthCredential(std::move(channel_factory))
    {
        client_email_ = RequireString(info, "client_email");
        std::string private_key_pem = RequireString(info, "private_key");
        private_key_id_ = OptionalString(info, "private_key_id", "");
        token_uri_ = HttpsUrlField(info, "token_uri", DEFAULT_TOKEN_URI);

        BIO* bio = BIO_new_mem_buf(private_key_pem.data(), static_cast<int>(private_key_pem.size()));
        if (!bio) {
            throw vault::ConfigurationException("failed to allocate BIO for private_key");
        }

        private_key_ = PEM_read_bio_PrivateKey(bio, nullptr, nullptr, nullptr);
        BIO_free(bio);

        if (!private_key_) {
            ERR_clear_error();
            throw vault::ConfigurationException("private_key of " + client_email_ + " is not a valid PEM key");
        }

        LOG_DEBUGF("ServiceAccountCredential", "Loaded service account %s", client_email_.c_str());
    }

    ServiceAccountCredential::~ServiceAccountCredential()
    {
        if (private_key_) {
            EVP_PKEY_free(private_key_);
        }
    }

    std::string ServiceAccountCredential::BuildAssertion(int64_t issued_at) const
    {
        nlohmann::json header = {
            {"alg", "RS256"},
            {"typ", "JWT"}
        };
        if (!private_key_id_.empty()) {
            header["kid"] = private_key_id_;
        }

        nlohmann::json claims = {
            {"iss", client_email_},
            {"scope", CLOUD_PLATFORM_SCOPE},
            {"aud", token_uri_},
            {"iat", issued_at},
            {"exp", issued_at + ASSERTION_LIFETIME_SEC}
        };

        return jwt::EncodeRs256(private_key_, header.dump(), claims.dump());
    }

    AccessToken ServiceAccountCredential::FetchToken()
    {
        int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();

        std::string form = "grant_type=" + network::https::FormUrlEncode(JWT_BEARER_GRANT) +
                           "&assertion=" + network::https::FormUrlEncode(BuildAssertion(now));

        return PostForm(token_uri_, form);
    }

} // namespace secret_env::auth

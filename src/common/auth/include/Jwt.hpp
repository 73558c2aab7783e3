// src/common/auth/include/Jwt.hpp
#pragma once
#include <openssl/evp.h>
#include <string>
#include <string_view>

namespace secret_env::auth::jwt
{
    // RFC 4648 section 5, padding 없음
    std::string Base64UrlEncode(std::string_view data);

    /**
     * @brief RSASSA-PKCS1-v1_5 SHA-256 서명 (JWS "RS256")
     * @throws ConfigurationException 서명 실패
     */
    std::string SignRs256(EVP_PKEY* key, std::string_view signing_input);

    /**
     * @brief header.claims를 서명해 compact JWS 생성
     */
    std::string EncodeRs256(EVP_PKEY* key, const std::string& header_json,
                            const std::string& claims_json);

} // namespace secret_env::auth::jwt

// src/common/auth/src/Jwt.cpp
#include "common/auth/include/Jwt.hpp"
#include "common/vault/include/VaultException.hpp"
#include <openssl/err.h>
#include <vector>

namespace secret_env::auth::jwt
{
    namespace
    {
        std::string OpenSslError()
        {
            unsigned long err = ERR_get_error();
            if (err == 0) {
                return "unknown OpenSSL error";
            }
            char buf[256];
            ERR_error_string_n(err, buf, sizeof(buf));
            ERR_clear_error();
            return buf;
        }
    }

    std::string Base64UrlEncode(std::string_view data)
    {
        if (data.empty()) {
            return "";
        }

        std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
        int len = EVP_EncodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(data.data()),
                                  static_cast<int>(data.size()));

        std::string encoded(reinterpret_cast<const char*>(out.data()), static_cast<size_t>(len));
        for (char& c : encoded) {
            if (c == '+') c = '-';
            else if (c == '/') c = '_';
        }
        while (!encoded.empty() && encoded.back() == '=') {
            encoded.pop_back();
        }
        return encoded;
    }

    std::string SignRs256(EVP_PKEY* key, std::string_view signing_input)
    {
        if (!key) {
            throw vault::ConfigurationException("no signing key");
        }

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (!ctx) {
            throw vault::ConfigurationException("EVP_MD_CTX_new failed: " + OpenSslError());
        }

        const auto* input = reinterpret_cast<const unsigned char*>(signing_input.data());
        size_t sig_len = 0;

        if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, key) != 1 ||
            EVP_DigestSign(ctx, nullptr, &sig_len, input, signing_input.size()) != 1) {
            EVP_MD_CTX_free(ctx);
            throw vault::ConfigurationException("RS256 sign init failed: " + OpenSslError());
        }

        std::string signature(sig_len, '\0');
        if (EVP_DigestSign(ctx, reinterpret_cast<unsigned char*>(&signature[0]), &sig_len,
                           input, signing_input.size()) != 1) {
            EVP_MD_CTX_free(ctx);
            throw vault::ConfigurationException("RS256 sign failed: " + OpenSslError());
        }

        EVP_MD_CTX_free(ctx);
        signature.resize(sig_len);
        return signature;
    }

    std::string EncodeRs256(EVP_PKEY* key, const std::string& header_json,
                            const std::string& claims_json)
    {
        std::string signing_input = Base64UrlEncode(header_json) + "." + Base64UrlEncode(claims_json);
        return signing_input + "." + Base64UrlEncode(SignRs256(key, signing_input));
    }

} // namespace secret_env::auth::jwt

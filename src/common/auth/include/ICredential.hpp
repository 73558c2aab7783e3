// src/common/auth/include/ICredential.hpp
#pragma once
#include <string>

namespace secret_env::auth
{
    /**
     * @brief 시간 제한이 있는 bearer 자격 증명
     *
     * 토큰 발급은 HeaderValue() 호출 시점에 지연 수행
     */
    class ICredential
    {
    public:
        virtual ~ICredential() = default;

        /**
         * @brief "Bearer <token>" 형태의 authorization 헤더 값
         * @throws std::exception 토큰 발급 실패
         */
        virtual std::string HeaderValue() = 0;

        /**
         * @brief 자격 증명 종류 (로그용)
         */
        virtual const char* Type() const = 0;
    };

} // namespace secret_env::auth

// src/common/env/include/EnvDecoder.hpp
#pragma once
#include "common/types/BasicTypes.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace secret_env::env
{
    /**
     * @brief 시크릿 payload(JSON) -> 환경 변수 변환기
     *
     * 규칙:
     *   - 최상위는 반드시 객체
     *   - 멤버는 payload 순서 그대로 출력
     *   - string은 그대로, number/boolean은 JSON 표기 그대로 ("42", "true")
     *   - null, 객체, 배열 값은 거부
     *   - 빈 키, '=' 또는 NUL을 포함한 키는 거부
     */
    class EnvDecoder
    {
    public:
        /**
         * @brief payload 바이트를 JSON으로 파싱 (키 순서 유지)
         * @throws DecodeException 유효한 JSON이 아닐 때
         */
        static nlohmann::ordered_json ParsePayload(const std::string& secret_name,
                                                   std::string_view payload);

        /**
         * @brief 파싱된 JSON을 (KEY, VALUE) 목록으로 변환
         * @throws DecodeException 규칙 위반 시 (시크릿 이름과 키 포함)
         */
        static EnvEntries DecodeEnvFromJson(const std::string& secret_name,
                                            const nlohmann::ordered_json& value);

        static bool IsValidKey(const std::string& key);

    private:
        EnvDecoder() = delete;
    };

} // namespace secret_env::env

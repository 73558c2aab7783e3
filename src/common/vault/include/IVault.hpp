// src/common/vault/include/IVault.hpp
#pragma once
#include "common/types/BasicTypes.hpp"
#include <string>

namespace secret_env::vault
{
    /**
     * @brief Vault 공통 인터페이스
     *
     * 모든 시크릿 저장소 구현체(Google, Local)가 상속받아야 하는 순수 가상 인터페이스
     * 호출자는 이 인터페이스에만 의존하므로 백엔드를 추가해도 호출 코드는 바뀌지 않음
     *
     * 두 메서드 모두 호출 스레드를 결과가 나올 때까지 블로킹
     * (내부 비동기 I/O는 구현체가 감춤)
     */
    class IVault
    {
    public:
        virtual ~IVault() = default;

        /**
         * @brief 이름이 prefix로 시작하는 시크릿 전체 조회
         * @param prefix 시크릿 이름 prefix
         * @return (KEY, VALUE) 목록
         * @throws UnimplementedException 지원하지 않는 백엔드 (현재 모든 백엔드)
         */
        virtual EnvEntries DownloadPrefixed(const std::string& prefix) const = 0;

        /**
         * @brief 시크릿 하나를 읽어 JSON으로 해석한 뒤 환경 변수 목록으로 변환
         * @param secret_name 시크릿 이름
         * @return (KEY, VALUE) 목록 (payload 순서 유지)
         * @throws VaultException 하위 예외 (Kind()로 구분)
         */
        virtual EnvEntries DownloadJson(const std::string& secret_name) const = 0;

        /**
         * @brief 로그 출력용 백엔드 이름
         */
        virtual const char* Name() const = 0;
    };

} // namespace secret_env::vault

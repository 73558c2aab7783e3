// src/common/rpc/include/RequestInterceptor.hpp
#pragma once
#include "common/rpc/include/RpcStatus.hpp"
#include "common/auth/include/ICredential.hpp"
#include "common/network/https/include/IHttpChannel.hpp"
#include <functional>
#include <memory>

namespace secret_env::rpc
{
    /**
     * @brief 나가는 요청마다 한 번씩 호출되는 훅
     *
     * OK가 아닌 상태를 반환하면 해당 요청은 전송되지 않고 그 상태로 실패
     */
    using RequestInterceptor = std::function<RpcStatus(network::https::HttpRequest&)>;

    /**
     * @brief authorization: <HeaderValue()> 헤더를 붙이는 인터셉터
     *
     * 자격 증명은 shared_ptr로 캡처되어 클라이언트 수명 동안 유지
     * HeaderValue() 실패 시 UNKNOWN 상태에 실패 메시지를 담아 반환
     */
    RequestInterceptor MakeBearerTokenInterceptor(std::shared_ptr<auth::ICredential> credential);

} // namespace secret_env::rpc

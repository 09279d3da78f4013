#pragma once

// ---------------------------------------------------------------------------
// model_client.hpp
//
// 생성 모델 백엔드 추상 인터페이스.
// 백엔드는 불투명한 텍스트 완성 서비스로 취급한다.
//
// [계약]
// - complete() 는 동기 호출이다. 재시도/취소는 호출자 (ModelInvoker) 가
//   담당한다.
// - timeout 은 호출마다 전달되는 기한이다. 구현체는 이 값을 자체 I/O 기한으로
//   쓰고, 기한 초과는 GateErrorCode::kUpstreamTimeout 으로 반환한다.
// - 그 밖의 전송/백엔드 오류는 GateErrorCode::kUpstreamUnavailable 로 반환한다.
// - 구현체는 여러 스레드에서 동시에 호출될 수 있어야 한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <expected>
#include <string>

#include "common/types.hpp"

class ModelClient {
public:
    virtual ~ModelClient() = default;

    [[nodiscard]] virtual std::expected<std::string, GateError> complete(
        const std::string&        prompt,
        const ModelParams&        params,
        std::chrono::milliseconds timeout) = 0;
};

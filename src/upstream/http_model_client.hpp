#pragma once

// ---------------------------------------------------------------------------
// http_model_client.hpp
//
// Boost.Beast 기반 HTTP/1.1 모델 백엔드 클라이언트.
//
// [요청]
//   POST <target>  Content-Type: application/json
//   {"model":"...","prompt":"...","max_tokens":N,"temperature":T}
//
// [응답]
//   2xx 응답 본문에서 첫 "text" 문자열 필드, 없으면 첫 "content" 필드를
//   모델 응답으로 사용한다 (completions / chat 스타일 모두 수용).
//
// [기한]
//   complete() 의 timeout 을 연결+송수신 전체 기한으로 쓴다. 호출마다
//   전달되므로 reload 로 바뀐 upstream.timeout_ms 가 다음 요청부터 적용된다.
//
// [오류 매핑]
//   기한 초과 → GateErrorCode::kUpstreamTimeout
//   연결 실패, 송수신 실패, 2xx 외 상태, 응답 본문이 max_response_bytes 초과,
//   응답 필드 없음 → GateErrorCode::kUpstreamUnavailable
//
// [스레드 안전성]
//   호출마다 독립된 io_context 와 소켓을 사용하므로 동시 호출 안전.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "upstream/model_client.hpp"

struct HttpModelClientConfig {
    std::string               host{"127.0.0.1"};
    std::uint16_t             port{8000};
    std::string               target{"/v1/completions"};
    std::size_t               max_response_bytes{1024 * 1024};
};

class HttpModelClient final : public ModelClient {
public:
    explicit HttpModelClient(HttpModelClientConfig config);

    [[nodiscard]] std::expected<std::string, GateError> complete(
        const std::string&        prompt,
        const ModelParams&        params,
        std::chrono::milliseconds timeout) override;

    // build_request_body
    //   백엔드로 보낼 JSON 본문 (테스트에서 형식 검증용으로 공개).
    [[nodiscard]] static std::string build_request_body(const std::string& prompt,
                                                        const ModelParams& params);

    // extract_completion
    //   응답 본문에서 완성 텍스트를 꺼낸다. 없으면 빈 optional.
    [[nodiscard]] static std::optional<std::string> extract_completion(const std::string& body);

private:
    HttpModelClientConfig config_;
};

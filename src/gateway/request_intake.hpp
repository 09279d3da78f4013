#pragma once

// ---------------------------------------------------------------------------
// request_intake.hpp
//
// 원시 요청을 검증/정규화하여 불변 Request 로 만든다.
//
// [정규화]
// - ASCII 제어 문자 제거 (탭, CR, LF 제외)
// - 보이지 않는 유니코드 서식 문자 제거
//   U+200B–U+200F (zero-width, LRM/RLM), U+202A–U+202E (bidi embedding/override),
//   U+2060–U+2064 (word joiner, invisible operators), U+FEFF (BOM)
//   → "ig​nore previous instructions" 같은 탐지 우회 차단
// - caller 가 비어 있으면 role 을 caller 로 사용 (앞뒤 공백 제거)
// - model_params 기본값 적용, 요청 id 가 없으면 "req-<n>" 부여
//
// [거부 (kInvalidRequest)]
// - 정규화 후 빈 프롬프트, max_prompt_bytes 초과
// - 빈 역할
// - max_tokens == 0 또는 max_tokens_limit 초과
// - temperature 가 [0, 2] 밖
// ---------------------------------------------------------------------------

#include <atomic>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "common/types.hpp"
#include "policy/rule.hpp"  // IntakeConfig

// ---------------------------------------------------------------------------
// RawRequest
//   외부 표면(제어 소켓, HTTP 프런트)에서 받은 그대로의 요청.
// ---------------------------------------------------------------------------
struct RawRequest {
    std::string                  id{};          // 비어 있으면 자동 부여
    std::string                  prompt{};
    std::string                  role{};
    std::string                  caller{};      // 비어 있으면 role 로 대체
    std::optional<std::string>   model{};
    std::optional<std::uint32_t> max_tokens{};
    std::optional<double>        temperature{};
};

class RequestIntake {
public:
    // normalize
    //   default_model: model 이 비어 있을 때 쓸 업스트림 모델 이름
    [[nodiscard]] std::expected<Request, GateError> normalize(const RawRequest&   raw,
                                                              const IntakeConfig& cfg,
                                                              std::string_view    default_model);

    // strip_hidden_characters
    //   제어 문자와 보이지 않는 유니코드 서식 문자를 제거한다.
    //   잘못된 UTF-8 바이트는 그대로 둔다.
    [[nodiscard]] static std::string strip_hidden_characters(std::string_view text);

    // next_id
    //   "req-<n>" 형식의 새 요청 id. 오류 경로(정규화 실패)에서도 사용.
    [[nodiscard]] std::string next_id();

private:
    std::atomic<std::uint64_t> counter_{0};
};

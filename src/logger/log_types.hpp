#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - SecurityVerdict, RiskScorer 등 파이프라인 헤더를 include 하지 않는다.
// - enum 값은 호출자가 to_string() 으로 변환한 문자열로 넘긴다.
//
// [민감정보 취급 주의]
// - 프롬프트/응답 원문과 변환본은 어떤 로그 구조체에도 넣지 않는다.
//   길이, 개수, 카테고리 이름만 기록한다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// parse_log_level
//   "debug"|"info"|"warn"|"warning"|"error" (대소문자 무시). 모르는 값은 kInfo.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ---------------------------------------------------------------------------
// VerdictLog
//   요청 한 건의 최종 판정 로그.
//   audit_sequence_no: 감사 체인에 기록된 경우에만 값이 있다.
// ---------------------------------------------------------------------------
struct VerdictLog {
    std::string                           request_id{};
    std::string                           role{};
    std::string                           decision{};    // "allow" | "block"
    std::string                           reason{};      // DecisionReason 문자열
    std::uint32_t                         risk_score{0};
    std::string                           risk_band{};
    std::string                           intent{};
    std::string                           policy{};      // PolicyAction 문자열
    std::size_t                           pii_count{0};
    std::vector<std::string>              pii_types{};
    bool                                  is_injection{false};
    double                                injection_confidence{0.0};
    bool                                  response_filtered{false};
    bool                                  audited{false};
    std::optional<std::uint64_t>          audit_sequence_no{};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};   // handle() 소요 시간
};

// ---------------------------------------------------------------------------
// BlockLog
//   차단 이벤트 로그.
//   matched_rule: 매칭된 규칙 식별자 ("default-deny", "injection-override" 포함)
//   detail: 사람이 읽을 수 있는 차단 사유 (클라이언트에 직접 노출 금지)
// ---------------------------------------------------------------------------
struct BlockLog {
    std::string                           request_id{};
    std::string                           role{};
    std::string                           reason{};
    std::string                           matched_rule{};
    std::string                           detail{};
    std::chrono::system_clock::time_point timestamp{};
};

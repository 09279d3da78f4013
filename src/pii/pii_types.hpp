#pragma once

// ---------------------------------------------------------------------------
// pii_types.hpp
//
// PII / 비밀값 카테고리와 탐지 결과 타입.
//
// [카테고리 메타데이터]
// 카테고리마다 고정 이름, 심각도, redact placeholder, 비밀값 여부를 가진다.
// placeholder 는 카테고리별 상수이므로 redact 결과 길이는 원래 값 길이와
// 무관하다.
//
// [스팬 불변식]
// - 한 텍스트 안의 PiiMatch 는 서로 겹치지 않는다.
// - 항상 start 오름차순으로 정렬되어 있다.
// - start/end 는 원본 텍스트 기준 바이트 오프셋 [start, end).
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// PiiCategory
//   열거 순서는 의미 없음. 탐지 우선순위는 규칙 테이블 순서가 결정한다.
// ---------------------------------------------------------------------------
enum class PiiCategory : std::uint8_t {
    kEmail       = 0,
    kCreditCard  = 1,
    kPhone       = 2,
    kSsn         = 3,
    kAadhaar     = 4,
    kIban        = 5,
    kIpAddress   = 6,
    kPassword    = 7,
    kApiKey      = 8,
    kAccessToken = 9,
    kJwt         = 10,
    kPrivateKey  = 11,
    kDbUrl       = 12,
    kCloudKey    = 13,  // 응답 전용 비밀값 규칙 (AWS access key 등)
    kCredential  = 14,  // 응답 전용 비밀값 규칙 ("the password is ..." 류 문장)
};

// ---------------------------------------------------------------------------
// PiiSeverity
//   RiskScorer 가 최고 심각도를 가중치로 사용한다.
// ---------------------------------------------------------------------------
enum class PiiSeverity : std::uint8_t {
    kLow      = 0,
    kMedium   = 1,
    kHigh     = 2,
    kCritical = 3,
};

struct PiiMatch {
    PiiCategory category{PiiCategory::kEmail};
    std::size_t start{0};
    std::size_t end{0};
    double      confidence{0.0};
};

inline bool operator==(const PiiMatch& a, const PiiMatch& b) {
    return a.category == b.category && a.start == b.start && a.end == b.end &&
           a.confidence == b.confidence;
}

// ---------------------------------------------------------------------------
// SanitizedText
//   PIISanitizer / ResponseGuard 공통 결과.
//   original_text 는 점수 계산 동안만 보관한다. 로그/감사/응답에 싣지 말 것.
// ---------------------------------------------------------------------------
struct SanitizedText {
    std::string           original_text{};
    std::string           transformed_text{};
    std::vector<PiiMatch> spans{};
    SanitizeMode          mode{SanitizeMode::kDetect};
};

// ---------------------------------------------------------------------------
// PiiSummary
//   verdict 의 pii 필드. 원문 없이 개수/카테고리/길이만 담는다.
//   types 는 중복 없이 원문 첫 등장 순서.
// ---------------------------------------------------------------------------
struct PiiSummary {
    bool                     detected{false};
    std::size_t              count{0};
    std::vector<PiiCategory> types{};
    std::size_t              original_length{0};
    std::size_t              sanitized_length{0};
    PiiSeverity              max_severity{PiiSeverity::kLow};
};

// 카테고리 메타데이터 조회 (pii_types.cpp)
[[nodiscard]] std::string_view to_string(PiiCategory category) noexcept;
[[nodiscard]] std::string_view to_string(PiiSeverity severity) noexcept;
[[nodiscard]] PiiSeverity      severity_of(PiiCategory category) noexcept;
[[nodiscard]] std::string_view placeholder_of(PiiCategory category) noexcept;
[[nodiscard]] bool             is_secret(PiiCategory category) noexcept;

// summarize
//   SanitizedText 에서 verdict 용 요약을 만든다.
[[nodiscard]] PiiSummary summarize(const SanitizedText& text);

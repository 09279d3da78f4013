#pragma once

// ---------------------------------------------------------------------------
// risk_scorer.hpp
//
// 단계별 신호를 0..100 정수 점수와 구간(low/medium/high)으로 합산한다.
//
// [가중치 (항목별 상한이 있는 합)]
//   인젝션   : is_injection 이면 30 + round(confidence * 40), 아니면 round(confidence * 40)
//              상한 70
//   탐지 저하: degraded 이면 25
//   정책     : allow 0 / allow_with_sanitize 10 / block 20
//   PII      : min(5 * count, 20) + 최고 심각도 (low 0, medium 5, high 10, critical 15)
//   응답 필터: response_filtered 이면 20
//   합계는 [0, 100] 으로 clamp.
//
// [단조성]
// 각 항목은 자기 입력에 대해 비감소이고 항목끼리 더하기만 하므로,
// 어느 신호 하나가 나빠져도 총점은 줄지 않는다.
// PII 만으로는 최대 35 이므로 PII 단독으로 차단 임계값(기본 70)에 닿지 않는다.
//
// [구간]
//   low < 30 <= medium < 70 <= high
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "detector/injection_detector.hpp"
#include "pii/pii_types.hpp"

#include <cstdint>
#include <string_view>

enum class RiskBand : std::uint8_t {
    kLow    = 0,
    kMedium = 1,
    kHigh   = 2,
};

[[nodiscard]] std::string_view to_string(RiskBand band) noexcept;

struct RiskScore {
    std::uint32_t value{0};
    RiskBand      band{RiskBand::kLow};
};

class RiskScorer {
public:
    static constexpr std::uint32_t kInjectionBase       = 30;
    static constexpr std::uint32_t kInjectionConfidence = 40;
    static constexpr std::uint32_t kInjectionCap        = 70;
    static constexpr std::uint32_t kDegraded            = 25;
    static constexpr std::uint32_t kPolicySanitize      = 10;
    static constexpr std::uint32_t kPolicyBlock         = 20;
    static constexpr std::uint32_t kPiiPerMatch         = 5;
    static constexpr std::uint32_t kPiiCountCap         = 20;
    static constexpr std::uint32_t kResponseFiltered    = 20;

    // score
    //   결정적 순수 함수. 같은 입력이면 항상 같은 점수.
    [[nodiscard]] RiskScore score(const InjectionVerdict& injection,
                                  PolicyAction            policy_action,
                                  const PiiSummary&       pii,
                                  bool                    response_filtered) const noexcept;

    [[nodiscard]] static RiskBand band_for(std::uint32_t value) noexcept;
};

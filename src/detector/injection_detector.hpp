#pragma once

// ---------------------------------------------------------------------------
// injection_detector.hpp
//
// 가중치 정규식 규칙 기반 프롬프트 인젝션 / 탈옥 탐지기.
// 독립적 모듈: 프롬프트를 변경하지 않고 판정만 돌려준다.
//
// [탐지 대상 (기본 규칙, config 에서 교체 가능)]
// - 이전 지시 무시/덮어쓰기 ("ignore previous instructions")
// - 시스템 프롬프트 / 개발자 지시 공개 요구
// - 탈옥 페르소나 (DAN, developer mode, jailbreak)
// - 권한 상승 역할극 ("you are now an unrestricted ...")
// - 자격증명 / API 키 공개 요구
// - 가짜 시스템 태그 ([system], <|im_start|>)
// - 제한 해제 요구, 동사/대상 동시 출현, 인코딩 우회 (낮은 가중치)
//
// [집계 방식]
// 규칙은 id 오름차순으로 평가한다. 매칭된 규칙 가중치 w_i 의 noisy-OR
//   confidence = 1 - Π(1 - w_i)
// 를 집계 신뢰도로 쓰고, confidence > threshold 이면 is_injection=true.
// 가중치가 short_circuit_confidence 이상인 규칙이 매칭되면 나머지 규칙은
// 평가하지 않는다. matched_rule_id 는 매칭 규칙 중 가중치가 가장 큰 것이며
// 동률이면 id 가 작은 규칙이 이긴다.
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 동의어/의역: 패턴에 없는 표현은 탐지 불가 (false negative).
// 2. 분할 입력: 여러 요청에 걸쳐 나눈 지시는 요청 단위 탐지로 잡지 못함.
// 3. 비영어 프롬프트: 기본 규칙은 영어만 다룬다.
// 4. 인코딩 우회: base64 본문 자체는 디코딩하지 않는다.
//
// [fail-safe]
// 유효한 규칙이 하나도 없으면 is_injection=false, confidence=0 에
// degraded=true 를 붙여 반환한다. 파이프라인은 degraded 를 보고 차단한다
// (탐지 불가 상태를 허용으로 흘려보내지 않음).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// InjectionRule
//   id          : 우선순위 (작을수록 먼저 평가, 동률 시 승리)
//   pattern     : ECMAScript 정규식 (icase 로 컴파일)
//   weight      : 개별 신뢰도 가중치 (0, 1]
//   description : 감사/로그용 설명. 클라이언트에 노출하지 않는다.
// ---------------------------------------------------------------------------
struct InjectionRule {
    std::uint32_t id{0};
    std::string   pattern{};
    double        weight{0.0};
    std::string   description{};
};

// ---------------------------------------------------------------------------
// InjectionVerdict
//   matched_rule_id 는 감사 로그 용도. 공격자 피드백 최소화를 위해
//   클라이언트 응답에는 규칙 설명을 싣지 않는다.
// ---------------------------------------------------------------------------
struct InjectionVerdict {
    bool                         is_injection{false};
    double                       confidence{0.0};
    std::optional<std::uint32_t> matched_rule_id{};
    bool                         degraded{false};  // 규칙 테이블 없음 → 평가 불가
};

struct InjectionSettings {
    double threshold{0.5};                 // 집계 신뢰도가 이 값을 넘으면 인젝션
    double short_circuit_confidence{0.9};  // 개별 가중치가 이 이상이면 즉시 종료
};

class InjectionDetector {
public:
    // 생성자: 규칙을 id 순으로 정렬 후 컴파일한다.
    //   잘못된 정규식, 상한 없는 반복이 있는 정규식, 가중치가 (0, 1] 밖인
    //   규칙은 경고 후 건너뛴다.
    InjectionDetector(std::vector<InjectionRule> rules, InjectionSettings settings);

    ~InjectionDetector();

    InjectionDetector(const InjectionDetector&)            = delete;
    InjectionDetector& operator=(const InjectionDetector&) = delete;
    InjectionDetector(InjectionDetector&&) noexcept;
    InjectionDetector& operator=(InjectionDetector&&) noexcept;

    // default_rules
    //   config 에 injection.rules 가 없을 때 쓰는 기본 규칙 테이블.
    [[nodiscard]] static std::vector<InjectionRule> default_rules();

    // evaluate
    //   prompt_text: intake 에서 숨김 문자가 제거된 프롬프트
    //   반환: InjectionVerdict (degraded 상태면 degraded=true)
    [[nodiscard]] InjectionVerdict evaluate(std::string_view prompt_text) const;

    [[nodiscard]] bool degraded() const noexcept { return degraded_; }
    [[nodiscard]] std::size_t rule_count() const noexcept;

    // description_of
    //   감사/로그용 규칙 설명. 없는 id 면 빈 문자열.
    [[nodiscard]] std::string description_of(std::uint32_t rule_id) const;

private:
    struct CompiledRule;
    std::vector<CompiledRule> rules_;
    InjectionSettings         settings_;
    bool                      degraded_{false};
};

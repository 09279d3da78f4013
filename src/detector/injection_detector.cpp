// ---------------------------------------------------------------------------
// injection_detector.cpp
//
// 가중치 정규식 규칙 기반 프롬프트 인젝션 탐지기 구현.
//
// [기본 규칙, id 순]
//  1. 이전 지시 무시/덮어쓰기                0.95
//  2. 시스템 프롬프트 공개 요구               0.95
//  3. 탈옥 페르소나 (DAN, developer mode)      0.95
//  4. 권한 상승 역할극                         0.90
//  5. 자격증명/API 키 공개 요구                0.90
//  6. 가짜 시스템/역할 태그                    0.85
//  7. "new instructions:" 류 서두              0.70
//  8. 제한/필터 해제 요구                      0.60
//  9. 동사 + 대상 동시 출현 (약한 신호)        0.45
// 10. 인코딩 우회 암시 (약한 신호)             0.40
//
// [오탐/미탐 트레이드오프]
// - 규칙 9, 10 은 단독으로 threshold(0.5) 를 넘지 못한다. 다른 규칙과
//   함께 매칭될 때만 판정을 뒤집는다 ("reset the system" 같은 정상 요청 보호).
// - 규칙 5 는 "show me your password" 는 잡지만 "show me all user passwords"
//   (대상 앞에 다른 명사) 는 잡지 않는다. 그런 요청은 intent=admin 으로
//   분류되어 정책 단계에서 처리된다.
//
// [반복 상한]
// 모든 반복은 {m,n} 으로 상한을 둔다. 상한 없는 반복이 있는 규칙은
// 로드하지 않는다 (common/regex_bounds.hpp).
//
// [CompiledRule 구현 주의사항]
// std::regex 는 shared_ptr 로 보관하고, 소멸자/이동 연산은 CompiledRule 의
// 완전한 정의 이후인 이 파일에서 정의한다.
// ---------------------------------------------------------------------------

#include "detector/injection_detector.hpp"

#include "common/regex_bounds.hpp"

#include <algorithm>
#include <memory>
#include <regex>

#include <spdlog/spdlog.h>

struct InjectionDetector::CompiledRule {
    InjectionRule                     rule;
    std::shared_ptr<const std::regex> compiled;
};

InjectionDetector::InjectionDetector(std::vector<InjectionRule> rules, InjectionSettings settings)
    : settings_{settings}
{
    std::stable_sort(rules.begin(), rules.end(),
                     [](const InjectionRule& a, const InjectionRule& b) { return a.id < b.id; });

    rules_.reserve(rules.size());
    for (auto& r : rules) {
        if (!(r.weight > 0.0 && r.weight <= 1.0)) {
            spdlog::warn("injection_detector: rule {} has weight {} outside (0, 1], skipping",
                         r.id, r.weight);
            continue;
        }
        if (has_unbounded_repetition(r.pattern)) {
            spdlog::warn("injection_detector: rule {} has unbounded repetition, skipping", r.id);
            continue;
        }
        try {
            auto re = std::make_shared<const std::regex>(
                r.pattern,
                std::regex_constants::icase | std::regex_constants::ECMAScript
            );
            rules_.push_back(CompiledRule{std::move(r), std::move(re)});
        } catch (const std::regex_error& e) {
            // 잘못된 규칙을 건너뛰면 탐지 범위가 줄어든다 (false negative 증가).
            spdlog::warn("injection_detector: rule {} has invalid regex, skipping: {}",
                         r.id, e.what());
        }
    }

    if (rules_.empty()) {
        degraded_ = true;
        spdlog::error(
            "injection_detector: no valid injection rules loaded, detection degraded; "
            "requests will be blocked by the pipeline"
        );
    }
}

InjectionDetector::~InjectionDetector()                                       = default;
InjectionDetector::InjectionDetector(InjectionDetector&&) noexcept            = default;
InjectionDetector& InjectionDetector::operator=(InjectionDetector&&) noexcept = default;

std::size_t InjectionDetector::rule_count() const noexcept {
    return rules_.size();
}

std::string InjectionDetector::description_of(std::uint32_t rule_id) const {
    for (const auto& cr : rules_) {
        if (cr.rule.id == rule_id) {
            return cr.rule.description;
        }
    }
    return {};
}

InjectionVerdict InjectionDetector::evaluate(std::string_view prompt_text) const {
    InjectionVerdict verdict{};
    if (degraded_) {
        verdict.degraded = true;
        return verdict;
    }

    const char* first = prompt_text.data();
    const char* last  = prompt_text.data() + prompt_text.size();

    double miss_probability = 1.0;
    double best_weight      = 0.0;

    for (const auto& cr : rules_) {
        if (!std::regex_search(first, last, *cr.compiled)) {
            continue;
        }
        miss_probability *= (1.0 - cr.rule.weight);

        // 같은 가중치면 먼저 본(id 가 작은) 규칙 유지
        if (cr.rule.weight > best_weight) {
            best_weight             = cr.rule.weight;
            verdict.matched_rule_id = cr.rule.id;
        }
        if (cr.rule.weight >= settings_.short_circuit_confidence) {
            break;
        }
    }

    verdict.confidence   = 1.0 - miss_probability;
    verdict.is_injection = verdict.confidence > settings_.threshold;
    return verdict;
}

std::vector<InjectionRule> InjectionDetector::default_rules() {
    return {
        {1,
         R"re(\b(ignore|disregard|forget|bypass|override)\s{1,8}(all\s{1,8}|any\s{1,8}|the\s{1,8}|your\s{1,8}|my\s{1,8})?(previous|prior|above|earlier|preceding|original)\s{1,8}(instructions?|prompts?|rules?|directions?|context|guidelines))re",
         0.95, "override of prior instructions"},
        {2,
         R"re(\b(reveal|show|print|display|output|repeat|leak|tell\s{1,8}me)\s{1,8}(me\s{1,8})?(your|the)\s{1,8}(system\s{1,8}prompt|hidden\s{1,8}prompt|initial\s{1,8}prompt|original\s{1,8}prompt|instructions|developer\s{1,8}message))re",
         0.95, "system prompt disclosure request"},
        {3,
         R"re(\b(jailbreak|DAN\s{1,8}mode|developer\s{1,8}mode|god\s{1,8}mode|do\s{1,8}anything\s{1,8}now)\b)re",
         0.95, "jailbreak persona"},
        {4,
         R"re(\b(you\s{1,8}are\s{1,8}now|act\s{1,8}as|pretend\s{1,8}(to\s{1,8}be|you\s{1,8}are)|roleplay\s{1,8}as)\s{1,8}(an?\s{1,8})?(unrestricted|unfiltered|uncensored|evil|admin|administrator|root|system))re",
         0.90, "role escalation phrasing"},
        {5,
         R"re(\b(reveal|show|give|tell|print|leak|expose|dump)\s{1,8}(me\s{1,8})?(the\s{1,8}|your\s{1,8}|all\s{1,8})?(api\s{0,8}keys?|secrets?|passwords?|tokens?|credentials?|private\s{1,8}keys?)\b)re",
         0.90, "credential disclosure request"},
        {6,
         R"re(\[(system|admin|developer)\]|<\|?(system|im_start)\|?>|###\s{0,8}(system|instruction))re",
         0.85, "fake system or role tag"},
        {7,
         R"re(\b(new|updated|real|actual)\s{1,8}(instructions?|rules?)\s{0,8}:)re",
         0.70, "replacement instruction preamble"},
        {8,
         R"re(\b(without|no|ignore|remove|disable)\s{1,8}(any\s{1,8}|all\s{1,8}|your\s{1,8})?(restrictions|filters|safety|guidelines|limitations|guardrails)\b)re",
         0.60, "restriction removal request"},
        {9,
         R"re(\b(ignore|forget|override|bypass|disable|reset)\b.{0,40}\b(instructions?|rules?|guidelines|safety|restrictions|system)\b)re",
         0.45, "override verb near control target"},
        {10,
         R"re(\b(base64|rot13|hex)[\s\-]{0,4}(decode|decoded|encoded)\b.{0,40}\b(instructions?|prompt|command))re",
         0.40, "encoding evasion hint"},
    };
}

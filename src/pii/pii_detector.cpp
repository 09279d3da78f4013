// ---------------------------------------------------------------------------
// pii_detector.cpp
//
// [CompiledRule 구현 주의사항]
// 헤더에서는 전방 선언만 하므로 소멸자/이동 연산은 여기서 정의한다.
// std::regex 는 shared_ptr 로 보관한다 (규칙 복사 시 재컴파일 없음).
// ---------------------------------------------------------------------------

#include "pii/pii_detector.hpp"

#include "common/regex_bounds.hpp"

#include <algorithm>
#include <memory>
#include <regex>

#include <spdlog/spdlog.h>

struct PiiDetector::CompiledRule {
    PiiRule                           rule;
    std::shared_ptr<const std::regex> compiled;
};

namespace {

bool overlaps_any(const std::vector<PiiMatch>& accepted, std::size_t start, std::size_t end) {
    return std::any_of(accepted.begin(), accepted.end(), [&](const PiiMatch& m) {
        return start < m.end && m.start < end;
    });
}

void sort_by_start(std::vector<PiiMatch>& spans) {
    std::sort(spans.begin(), spans.end(), [](const PiiMatch& a, const PiiMatch& b) {
        return a.start < b.start;
    });
}

}  // namespace

PiiDetector::PiiDetector(std::vector<PiiRule> rules) {
    rules_.reserve(rules.size());

    for (auto& r : rules) {
        if (has_unbounded_repetition(r.pattern)) {
            spdlog::warn("pii_detector: unbounded repetition in rule for category '{}', skipping",
                         to_string(r.category));
            continue;
        }
        auto flags = std::regex_constants::ECMAScript;
        if (!r.case_sensitive) {
            flags |= std::regex_constants::icase;
        }
        try {
            auto re = std::make_shared<const std::regex>(r.pattern, flags);
            rules_.push_back(CompiledRule{std::move(r), std::move(re)});
        } catch (const std::regex_error& e) {
            spdlog::warn("pii_detector: invalid regex for category '{}', skipping: {}",
                         to_string(r.category), e.what());
        }
    }

    if (rules_.empty()) {
        spdlog::warn("pii_detector: no valid rules loaded, nothing will be detected");
    }
}

PiiDetector::~PiiDetector()                                 = default;
PiiDetector::PiiDetector(PiiDetector&&) noexcept            = default;
PiiDetector& PiiDetector::operator=(PiiDetector&&) noexcept = default;

std::size_t PiiDetector::rule_count() const noexcept {
    return rules_.size();
}

std::vector<PiiMatch> PiiDetector::detect(std::string_view text) const {
    std::vector<PiiMatch> accepted;
    if (text.empty()) {
        return accepted;
    }

    const char* base = text.data();
    const char* last = text.data() + text.size();

    for (const auto& cr : rules_) {
        const std::cregex_iterator end_it;
        for (std::cregex_iterator it(base, last, *cr.compiled); it != end_it; ++it) {
            const std::cmatch& m = *it;
            const std::size_t group = (m.size() > 1 && m[1].matched) ? 1 : 0;

            const auto start = static_cast<std::size_t>(m[group].first - base);
            const auto end   = static_cast<std::size_t>(m[group].second - base);
            if (start == end) {
                continue;
            }
            if (!validate(cr.rule.validator, text.substr(start, end - start))) {
                continue;
            }
            if (overlaps_any(accepted, start, end)) {
                continue;
            }
            accepted.push_back(PiiMatch{
                .category   = cr.rule.category,
                .start      = start,
                .end        = end,
                .confidence = cr.rule.confidence,
            });
        }
    }

    sort_by_start(accepted);
    return accepted;
}

std::vector<PiiMatch> PiiDetector::merge(std::vector<PiiMatch>        primary,
                                         const std::vector<PiiMatch>& secondary) {
    for (const auto& m : secondary) {
        if (!overlaps_any(primary, m.start, m.end)) {
            primary.push_back(m);
        }
    }
    sort_by_start(primary);
    return primary;
}

// ---------------------------------------------------------------------------
// default_rules
//   순서 = 우선순위. 비밀값 → 금융 → 신원 → 연락처 → 네트워크.
// ---------------------------------------------------------------------------
std::vector<PiiRule> PiiDetector::default_rules() {
    return {
        {PiiCategory::kPrivateKey,
         R"re(-----BEGIN (?:RSA |EC |DSA |OPENSSH |ENCRYPTED )?PRIVATE KEY-----[\s\S]{0,4096}?-----END (?:RSA |EC |DSA |OPENSSH |ENCRYPTED )?PRIVATE KEY-----)re",
         0.97, ValidatorKind::kNone, true},
        {PiiCategory::kJwt,
         R"re(\beyJ[A-Za-z0-9_\-]{5,2048}\.eyJ[A-Za-z0-9_\-]{5,2048}\.[A-Za-z0-9_\-]{5,1024})re",
         0.95, ValidatorKind::kNone, true},
        {PiiCategory::kApiKey,
         R"re(\b(?:api[_\- ]?key|secret[_\- ]?key|access[_\- ]?key)\s{0,8}[:=]\s{0,8}['"]?([A-Za-z0-9_\-]{16,512}))re",
         0.90, ValidatorKind::kNone, false},
        {PiiCategory::kAccessToken,
         R"re(\b(?:bearer|access_token|auth_token|token)\b\s{0,8}[:=]?\s{0,8}['"]?([A-Za-z0-9_\-\.]{20,1024}))re",
         0.88, ValidatorKind::kNone, false},
        // 값에 '[' ']' 를 허용하지 않는다: redact 결과를 다시 탐지하지 않도록.
        {PiiCategory::kPassword,
         R"re(\b(?:password|passwd|pwd)\s{0,8}[:=]\s{0,8}['"]?([^\s'"\[\]]{4,256}))re",
         0.80, ValidatorKind::kNone, false},
        {PiiCategory::kDbUrl,
         R"re(\b(?:postgres(?:ql)?|mysql|mongodb(?:\+srv)?|redis|mssql|amqp)://[^\s'"<>]{1,2048})re",
         0.92, ValidatorKind::kNone, false},
        {PiiCategory::kCreditCard,
         R"re(\b(?:4[0-9]{3}|5[1-5][0-9]{2}|2[2-7][0-9]{2}|3[47][0-9]{2}|6(?:011|5[0-9]{2}))[ \-]?[0-9]{4}[ \-]?[0-9]{4}[ \-]?[0-9]{1,4}\b)re",
         0.98, ValidatorKind::kCreditCard, true},
        {PiiCategory::kIban,
         R"re(\b[A-Z]{2}[0-9]{2}(?: ?[A-Z0-9]{4}){2,7}(?: ?[A-Z0-9]{1,3})?\b)re",
         0.90, ValidatorKind::kIban, true},
        {PiiCategory::kEmail,
         R"re(\b[A-Za-z0-9._%+\-]{1,64}@[A-Za-z0-9.\-]{1,253}\.[A-Za-z]{2,24}\b)re",
         0.95, ValidatorKind::kNone, true},
        {PiiCategory::kSsn,
         R"re(\b[0-9]{3}-[0-9]{2}-[0-9]{4}\b)re",
         0.92, ValidatorKind::kSsn, true},
        {PiiCategory::kAadhaar,
         R"re(\b[2-9][0-9]{3} ?[0-9]{4} ?[0-9]{4}\b)re",
         0.90, ValidatorKind::kAadhaar, true},
        {PiiCategory::kPhone,
         R"re((?:\+[0-9]{1,3}[ \-.]?)?(?:\([0-9]{2,4}\)|\b[0-9]{2,4})[ \-.]?[0-9]{3,4}[ \-.]?[0-9]{3,4}\b)re",
         0.85, ValidatorKind::kPhone, true},
        {PiiCategory::kIpAddress,
         R"re(\b(?:[0-9]{1,3}\.){3}[0-9]{1,3}\b)re",
         0.85, ValidatorKind::kIpv4, true},
    };
}

std::vector<PiiRule> PiiDetector::default_secret_rules() {
    return {
        // 잘린 개인키 (END 라인 없이 헤더만 유출된 경우)
        {PiiCategory::kPrivateKey,
         R"re(-----BEGIN [A-Z ]{0,32}PRIVATE KEY-----)re",
         0.95, ValidatorKind::kNone, true},
        {PiiCategory::kCloudKey,
         R"re(\b(?:AKIA|ASIA)[0-9A-Z]{16}\b)re",
         0.95, ValidatorKind::kNone, true},
        {PiiCategory::kApiKey,
         R"re(\bsk-(?:proj-|live-|test-)?[A-Za-z0-9_\-]{20,256})re",
         0.92, ValidatorKind::kNone, true},
        {PiiCategory::kApiKey,
         R"re(\bAIza[0-9A-Za-z_\-]{35})re",
         0.92, ValidatorKind::kNone, true},
        {PiiCategory::kAccessToken,
         R"re(\bgh[pousr]_[A-Za-z0-9]{36,255})re",
         0.95, ValidatorKind::kNone, true},
        {PiiCategory::kAccessToken,
         R"re(\bxox[abprs]-[A-Za-z0-9\-]{10,255})re",
         0.92, ValidatorKind::kNone, true},
        // "the api key is abc-123..." 류. 값에 숫자/'_'/'-' 가 하나는 있어야 한다.
        {PiiCategory::kCredential,
         R"re(\b(?:api[ _]?key|secret|password|passphrase|credential|token)s?\s{1,8}(?:is|are|was|=|:)\s{0,8}['"]?((?=[^\s'"\[\]]{0,255}[0-9_\-])[^\s'"\[\]]{6,256}))re",
         0.80, ValidatorKind::kNone, false},
    };
}

// ---------------------------------------------------------------------------
// test_regex_bounds.cpp
//
// has_unbounded_repetition 단위 테스트.
//
// [테스트 범위]
// - '*', '+', '{n,}' → unbounded
// - 이스케이프된 기호, 문자 클래스 안의 기호 → 무시
// - {n}, {n,m} → bounded, 상한이 kMaxRepetitionBound 초과면 unbounded
// - 기본 PII / 비밀값 / 인젝션 규칙은 전부 bounded
// ---------------------------------------------------------------------------

#include "common/regex_bounds.hpp"
#include "detector/injection_detector.hpp"
#include "pii/pii_detector.hpp"

#include <gtest/gtest.h>

#include <string>

TEST(RegexBounds, StarPlusAndOpenBrace_Unbounded) {
    EXPECT_TRUE(has_unbounded_repetition(R"(a*)"));
    EXPECT_TRUE(has_unbounded_repetition(R"(\s+x)"));
    EXPECT_TRUE(has_unbounded_repetition(R"([A-Z]{16,})"));
    EXPECT_TRUE(has_unbounded_repetition(R"([\s\S]*?END)"));
    EXPECT_TRUE(has_unbounded_repetition(R"((?:ab)+)"));
}

TEST(RegexBounds, EscapedAndClassMembers_Ignored) {
    EXPECT_FALSE(has_unbounded_repetition(R"(\+[0-9]{1,3})"));
    EXPECT_FALSE(has_unbounded_repetition(R"([._%+\-]{1,64})"));
    EXPECT_FALSE(has_unbounded_repetition(R"([*+]{2})"));
    EXPECT_FALSE(has_unbounded_repetition(R"([]*]{1,4})"));
    EXPECT_FALSE(has_unbounded_repetition(R"(\*\*bold\*\*)"));
    EXPECT_FALSE(has_unbounded_repetition(R"(\{literal\})"));
}

TEST(RegexBounds, BoundedBraces) {
    EXPECT_FALSE(has_unbounded_repetition(R"(x{4})"));
    EXPECT_FALSE(has_unbounded_repetition(R"(x{0,4096})"));
    EXPECT_FALSE(has_unbounded_repetition(R"(a?b?)"));
    EXPECT_TRUE(has_unbounded_repetition(R"(x{0,4097})"));
    EXPECT_TRUE(has_unbounded_repetition(R"(x{99999})"));
}

TEST(RegexBounds, DefaultRuleTables_AllBounded) {
    for (const auto& r : PiiDetector::default_rules()) {
        EXPECT_FALSE(has_unbounded_repetition(r.pattern)) << r.pattern;
    }
    for (const auto& r : PiiDetector::default_secret_rules()) {
        EXPECT_FALSE(has_unbounded_repetition(r.pattern)) << r.pattern;
    }
    for (const auto& r : InjectionDetector::default_rules()) {
        EXPECT_FALSE(has_unbounded_repetition(r.pattern)) << r.pattern;
    }
}

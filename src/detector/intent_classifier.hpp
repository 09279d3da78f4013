#pragma once

// ---------------------------------------------------------------------------
// intent_classifier.hpp
//
// 프롬프트를 의도 레이블(chat/summarize/tool/admin/unknown) 하나로 분류한다.
// 어휘 기반 결정적 분류기. 같은 입력이면 항상 같은 레이블.
//
// [점수 계산]
// 레이블별 어휘 구(phrase)를 소문자로 비교하고, 단어 경계에서 등장하는
// 구의 가중치를 합산한다 (같은 구는 여러 번 나와도 한 번만 센다).
//
// [동률 처리]
// 최고 점수 레이블이 여럿이면 admin > tool > summarize > chat 순으로
// 더 민감한 레이블을 고른다. 오분류가 권한 상승으로 이어지지 않도록
// 정책상 더 제한적인 쪽으로 기운다.
//
// [unknown]
// 최고 점수가 min_score 미만이면 unknown. unknown 은 정책 테이블에서
// 명시적으로 허용된 역할만 통과한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <string>
#include <string_view>
#include <vector>

struct IntentPhrase {
    std::string phrase{};
    double      weight{1.0};
};

struct IntentVocabulary {
    IntentLabel               label{IntentLabel::kUnknown};
    std::vector<IntentPhrase> phrases{};
};

class IntentClassifier {
public:
    static constexpr double kDefaultMinScore = 1.0;

    // vocabularies 의 구는 생성 시 소문자로 정규화된다.
    //   빈 구, unknown 레이블 어휘는 무시한다.
    explicit IntentClassifier(std::vector<IntentVocabulary> vocabularies,
                              double                        min_score = kDefaultMinScore);

    [[nodiscard]] static std::vector<IntentVocabulary> default_vocabularies();

    // classify
    //   결정적. 예외를 던지지 않는다.
    [[nodiscard]] IntentLabel classify(std::string_view prompt_text) const;

private:
    [[nodiscard]] double score_lowered(const std::string& lowered, IntentLabel label) const;

    std::vector<IntentVocabulary> vocabularies_;
    double                        min_score_;
};

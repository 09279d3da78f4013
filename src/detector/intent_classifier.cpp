#include "detector/intent_classifier.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace {

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool is_word_char(char c) noexcept {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// 단어 경계에서 phrase 가 등장하는지 검사.
// "hi" 가 "this" 안에서 매칭되지 않도록 앞뒤 문자를 확인한다.
bool contains_phrase(const std::string& haystack, const std::string& phrase) {
    std::size_t pos = haystack.find(phrase);
    while (pos != std::string::npos) {
        const bool left_ok  = pos == 0 || !is_word_char(haystack[pos - 1]) ||
                              !is_word_char(phrase.front());
        const std::size_t after = pos + phrase.size();
        const bool right_ok = after >= haystack.size() || !is_word_char(haystack[after]) ||
                              !is_word_char(phrase.back());
        if (left_ok && right_ok) {
            return true;
        }
        pos = haystack.find(phrase, pos + 1);
    }
    return false;
}

// 동률 시 우선 순서 (더 민감한 레이블 먼저)
constexpr std::array<IntentLabel, 4> kTieBreakOrder{
    IntentLabel::kAdmin,
    IntentLabel::kTool,
    IntentLabel::kSummarize,
    IntentLabel::kChat,
};

}  // namespace

IntentClassifier::IntentClassifier(std::vector<IntentVocabulary> vocabularies, double min_score)
    : min_score_{min_score}
{
    for (auto& vocab : vocabularies) {
        if (vocab.label == IntentLabel::kUnknown) {
            continue;
        }
        IntentVocabulary normalized{vocab.label, {}};
        for (auto& p : vocab.phrases) {
            if (p.phrase.empty()) {
                continue;
            }
            normalized.phrases.push_back(IntentPhrase{to_lower(p.phrase), p.weight});
        }
        vocabularies_.push_back(std::move(normalized));
    }
}

double IntentClassifier::score_lowered(const std::string& lowered, IntentLabel label) const {
    double total = 0.0;
    for (const auto& vocab : vocabularies_) {
        if (vocab.label != label) {
            continue;
        }
        for (const auto& p : vocab.phrases) {
            if (contains_phrase(lowered, p.phrase)) {
                total += p.weight;
            }
        }
    }
    return total;
}

IntentLabel IntentClassifier::classify(std::string_view prompt_text) const {
    const std::string lowered = to_lower(prompt_text);

    IntentLabel best       = IntentLabel::kUnknown;
    double      best_score = 0.0;
    for (const auto label : kTieBreakOrder) {
        const double s = score_lowered(lowered, label);
        if (s > best_score) {
            best       = label;
            best_score = s;
        }
    }

    if (best_score < min_score_) {
        return IntentLabel::kUnknown;
    }
    return best;
}

std::vector<IntentVocabulary> IntentClassifier::default_vocabularies() {
    return {
        {IntentLabel::kChat,
         {{"hello", 1.0},        {"hi", 1.0},          {"hey", 1.0},
          {"how are you", 1.0},  {"thanks", 1.0},      {"thank you", 1.0},
          {"my email", 1.0},     {"my card", 1.0},     {"my name", 1.0},
          {"my phone", 1.0},     {"my address", 1.0},  {"tell me about", 1.0},
          {"what is", 1.0},      {"can you help", 1.0}, {"explain", 1.0}}},
        {IntentLabel::kSummarize,
         {{"summarize", 2.0},    {"summarise", 2.0},   {"summary", 1.5},
          {"tl;dr", 2.0},        {"tldr", 2.0},        {"key points", 1.5},
          {"condense", 1.0},     {"shorten", 1.0},     {"recap", 1.0}}},
        {IntentLabel::kTool,
         {{"execute", 1.5},      {"invoke", 1.5},      {"run the", 1.0},
          {"call the api", 1.5}, {"search the web", 1.5}, {"fetch", 1.0},
          {"send an email", 1.5}, {"download", 1.0},   {"use the tool", 1.5}}},
        {IntentLabel::kAdmin,
         {{"admin", 1.5},        {"administrator", 1.5}, {"passwords", 1.5},
          {"user passwords", 1.0}, {"all users", 1.5}, {"show me all", 0.5},
          {"credentials", 1.5},  {"permissions", 1.0}, {"root access", 2.0},
          {"delete user", 2.0},  {"grant access", 1.5}, {"reset password", 1.5},
          {"system configuration", 1.5}}},
    };
}

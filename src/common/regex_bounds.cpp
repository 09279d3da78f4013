// ---------------------------------------------------------------------------
// regex_bounds.cpp
// ---------------------------------------------------------------------------

#include "common/regex_bounds.hpp"

#include <cctype>

namespace {

// skip_class
//   pattern[i] == '[' 에서 시작해 짝이 되는 ']' 다음 위치를 반환한다.
//   "[]...]", "[^]...]" 의 맨 앞 ']' 는 리터럴이다.
std::size_t skip_class(std::string_view pattern, std::size_t i) {
    ++i;
    if (i < pattern.size() && pattern[i] == '^') {
        ++i;
    }
    if (i < pattern.size() && pattern[i] == ']') {
        ++i;
    }
    while (i < pattern.size() && pattern[i] != ']') {
        i += (pattern[i] == '\\') ? 2 : 1;
    }
    return i + 1;
}

bool parse_number(std::string_view pattern, std::size_t& i, std::size_t& value) {
    const std::size_t begin = i;
    value = 0;
    while (i < pattern.size() && std::isdigit(static_cast<unsigned char>(pattern[i]))) {
        if (value <= kMaxRepetitionBound) {
            value = value * 10 + static_cast<std::size_t>(pattern[i] - '0');
        }
        ++i;
    }
    return i > begin;
}

// brace_unbounded
//   pattern[i] == '{'. "{n}" / "{n,m}" 형태가 아니면 리터럴 '{' 로 보고 false.
bool brace_unbounded(std::string_view pattern, std::size_t i) {
    ++i;
    std::size_t lower = 0;
    if (!parse_number(pattern, i, lower)) {
        return false;
    }
    if (i < pattern.size() && pattern[i] == '}') {
        return lower > kMaxRepetitionBound;
    }
    if (i >= pattern.size() || pattern[i] != ',') {
        return false;
    }
    ++i;
    std::size_t upper = 0;
    if (!parse_number(pattern, i, upper)) {
        return i < pattern.size() && pattern[i] == '}';
    }
    return i < pattern.size() && pattern[i] == '}' && upper > kMaxRepetitionBound;
}

}  // namespace

bool has_unbounded_repetition(std::string_view pattern) {
    std::size_t i = 0;
    while (i < pattern.size()) {
        switch (pattern[i]) {
        case '\\':
            i += 2;
            break;
        case '[':
            i = skip_class(pattern, i);
            break;
        case '*':
        case '+':
            return true;
        case '{':
            if (brace_unbounded(pattern, i)) {
                return true;
            }
            ++i;
            break;
        default:
            ++i;
            break;
        }
    }
    return false;
}

#pragma once

// ---------------------------------------------------------------------------
// regex_bounds.hpp
//
// 탐지 규칙 정규식의 반복 상한 검사.
//
// libstdc++ 의 std::regex 실행기는 반복 한 번마다 재귀하므로 '*', '+',
// '{n,}' 처럼 상한이 없는 반복이 긴 토큰을 만나면 스레드 스택을 넘칠 수
// 있다. 탐지기는 상한이 없거나 kMaxRepetitionBound 를 넘는 규칙을 로드하지
// 않는다.
//
// [알려진 한계]
// - 문법 검사기가 아니다. 이스케이프와 문자 클래스만 건너뛰고 수량자 기호를
//   찾는다. 잘못된 정규식은 std::regex 컴파일 단계에서 걸러진다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string_view>

inline constexpr std::size_t kMaxRepetitionBound = 4096;

// has_unbounded_repetition
//   pattern 에 '*', '+', '{n,}' 또는 상한이 kMaxRepetitionBound 를 넘는
//   '{n,m}' 이 있으면 true.
[[nodiscard]] bool has_unbounded_repetition(std::string_view pattern);

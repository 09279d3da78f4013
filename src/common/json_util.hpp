#pragma once

// ---------------------------------------------------------------------------
// json_util.hpp
//
// 최소 JSON 헬퍼. 외부 JSON 라이브러리 없이 로그/verdict/제어 소켓
// 메시지를 직접 직렬화하고, 평탄한 요청 객체에서 필드 하나를 꺼낸다.
//
// [알려진 한계]
// - find_* 는 키 문자열 첫 등장 위치만 본다. 중첩 객체 안의 같은 이름 키를
//   구분하지 못하므로 최상위 필드 이름이 유일한 메시지에만 사용할 것.
// - \uXXXX 는 BMP 코드포인트만 UTF-8 로 복원한다 (서로게이트 쌍 미지원).
// ---------------------------------------------------------------------------

#include <optional>
#include <string>
#include <string_view>

// json_escape
//   JSON 문자열 값 이스케이프 (따옴표 없이 내용만 반환).
[[nodiscard]] std::string json_escape(std::string_view sv);

// json_quote
//   "<escaped>" 형태로 감싼 문자열.
[[nodiscard]] std::string json_quote(std::string_view sv);

// find_string_field
//   "key": "value" 를 찾아 이스케이프를 풀어 반환한다.
//   키가 없거나 값이 문자열이 아니면 std::nullopt.
[[nodiscard]] std::optional<std::string> find_string_field(std::string_view json,
                                                           std::string_view key);

// find_number_field
//   "key": 123.4 를 찾아 double 로 반환한다.
[[nodiscard]] std::optional<double> find_number_field(std::string_view json,
                                                      std::string_view key);

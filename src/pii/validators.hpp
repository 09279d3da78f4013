#pragma once

// ---------------------------------------------------------------------------
// validators.hpp
//
// PII 후보 스팬의 체크섬/구조 검증기.
// 정규식은 모양만 보므로 자릿수가 맞는 임의 숫자열을 걸러내는 데 사용한다
// (오탐 감소). 입력은 구분자(공백, '-')가 섞인 원문 스팬 그대로 받는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ValidatorKind
//   PiiRule 에 붙는 검증기 선택자.
// ---------------------------------------------------------------------------
enum class ValidatorKind : std::uint8_t {
    kNone       = 0,
    kCreditCard = 1,  // Luhn + 발급사 prefix
    kSsn        = 2,  // area/group/serial 규칙
    kAadhaar    = 3,  // Verhoeff
    kIban       = 4,  // ISO 13616 mod-97
    kIpv4       = 5,  // 옥텟 0..255
    kPhone      = 6,  // 숫자 10..15 자리
};

[[nodiscard]] std::string digits_only(std::string_view text);

// luhn_check: 13..19 자리 숫자열의 Luhn 체크섬
[[nodiscard]] bool luhn_check(std::string_view digits);

// card_prefix_check: Visa/Mastercard/Amex/Discover/Diners 발급사 prefix
[[nodiscard]] bool card_prefix_check(std::string_view digits);

// ssn_check: 000/666/9xx area, 00 group, 0000 serial 거부
[[nodiscard]] bool ssn_check(std::string_view text);

// verhoeff_check: 12 자리 Aadhaar 체크섬
[[nodiscard]] bool verhoeff_check(std::string_view text);

// iban_check: 국가코드 + 체크숫자 mod-97 == 1
[[nodiscard]] bool iban_check(std::string_view text);

// ipv4_check: 점 4개 옥텟이 모두 0..255
[[nodiscard]] bool ipv4_check(std::string_view text);

// validate: kind 에 맞는 검증기 실행 (kNone 은 항상 true)
[[nodiscard]] bool validate(ValidatorKind kind, std::string_view span_text);

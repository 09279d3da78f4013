#include "pii/validators.hpp"

#include <array>
#include <cctype>
#include <charconv>

std::string digits_only(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            out += c;
        }
    }
    return out;
}

bool luhn_check(std::string_view digits) {
    if (digits.size() < 13 || digits.size() > 19) {
        return false;
    }
    int  sum    = 0;
    bool double_it = false;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (!std::isdigit(static_cast<unsigned char>(*it))) {
            return false;
        }
        int d = *it - '0';
        if (double_it) {
            d *= 2;
            if (d > 9) {
                d -= 9;
            }
        }
        sum += d;
        double_it = !double_it;
    }
    return sum % 10 == 0;
}

bool card_prefix_check(std::string_view digits) {
    if (digits.size() < 4) {
        return false;
    }
    // digits 는 숫자만 담긴 문자열이라고 가정한다 (digits_only 결과).
    const auto prefix = [&](std::size_t n) {
        int v = 0;
        for (std::size_t i = 0; i < n; ++i) {
            v = v * 10 + (digits[i] - '0');
        }
        return v;
    };

    if (digits[0] == '4') {
        return true;                                   // Visa
    }
    const int p2 = prefix(2);
    const int p3 = prefix(3);
    const int p4 = prefix(4);
    if (p2 == 34 || p2 == 37) { return true; }         // Amex
    if (p2 >= 51 && p2 <= 55) { return true; }         // Mastercard
    if (p4 >= 2221 && p4 <= 2720) { return true; }     // Mastercard 2-series
    if (p4 == 6011 || p2 == 65) { return true; }       // Discover
    if (p2 == 36 || p2 == 38) { return true; }         // Diners
    if (p3 >= 300 && p3 <= 305) { return true; }       // Diners Carte Blanche
    return false;
}

bool ssn_check(std::string_view text) {
    const std::string d = digits_only(text);
    if (d.size() != 9) {
        return false;
    }
    const std::string_view area{d.data(), 3};
    const std::string_view group{d.data() + 3, 2};
    const std::string_view serial{d.data() + 5, 4};
    if (area == "000" || area == "666" || area[0] == '9') {
        return false;
    }
    if (group == "00" || serial == "0000") {
        return false;
    }
    return true;
}

bool verhoeff_check(std::string_view text) {
    static constexpr std::array<std::array<int, 10>, 10> kD{{
        {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
        {1, 2, 3, 4, 0, 6, 7, 8, 9, 5},
        {2, 3, 4, 0, 1, 7, 8, 9, 5, 6},
        {3, 4, 0, 1, 2, 8, 9, 5, 6, 7},
        {4, 0, 1, 2, 3, 9, 5, 6, 7, 8},
        {5, 9, 8, 7, 6, 0, 4, 3, 2, 1},
        {6, 5, 9, 8, 7, 1, 0, 4, 3, 2},
        {7, 6, 5, 9, 8, 2, 1, 0, 4, 3},
        {8, 7, 6, 5, 9, 3, 2, 1, 0, 4},
        {9, 8, 7, 6, 5, 4, 3, 2, 1, 0},
    }};
    static constexpr std::array<std::array<int, 10>, 8> kP{{
        {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
        {1, 5, 7, 6, 2, 8, 3, 0, 9, 4},
        {5, 8, 0, 3, 7, 9, 6, 1, 4, 2},
        {8, 9, 1, 6, 0, 4, 3, 5, 2, 7},
        {9, 4, 5, 3, 1, 2, 6, 8, 7, 0},
        {4, 2, 8, 6, 5, 7, 3, 9, 0, 1},
        {2, 7, 9, 3, 8, 0, 6, 4, 1, 5},
        {7, 0, 4, 6, 9, 1, 3, 2, 5, 8},
    }};

    const std::string d = digits_only(text);
    if (d.size() != 12) {
        return false;
    }
    int c = 0;
    std::size_t i = 0;
    for (auto it = d.rbegin(); it != d.rend(); ++it, ++i) {
        c = kD[c][kP[i % 8][*it - '0']];
    }
    return c == 0;
}

bool iban_check(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());
    for (char c : text) {
        if (c != ' ') {
            compact += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    if (compact.size() < 15 || compact.size() > 34) {
        return false;
    }
    // 앞 4글자를 뒤로 보내고 문자는 10..35 로 치환한 뒤 mod 97
    const std::string rearranged = compact.substr(4) + compact.substr(0, 4);
    int remainder = 0;
    for (char c : rearranged) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            remainder = (remainder * 10 + (c - '0')) % 97;
        } else if (c >= 'A' && c <= 'Z') {
            const int v = c - 'A' + 10;
            remainder = (remainder * 100 + v) % 97;
        } else {
            return false;
        }
    }
    return remainder == 1;
}

bool ipv4_check(std::string_view text) {
    int octets = 0;
    std::size_t pos = 0;
    while (pos <= text.size()) {
        const std::size_t dot = text.find('.', pos);
        const std::size_t end = dot == std::string_view::npos ? text.size() : dot;
        if (end == pos || end - pos > 3) {
            return false;
        }
        int value = -1;
        const auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + end, value);
        if (ec != std::errc{} || ptr != text.data() + end || value < 0 || value > 255) {
            return false;
        }
        ++octets;
        if (dot == std::string_view::npos) {
            break;
        }
        pos = dot + 1;
    }
    return octets == 4;
}

bool validate(ValidatorKind kind, std::string_view span_text) {
    switch (kind) {
        case ValidatorKind::kNone:
            return true;
        case ValidatorKind::kCreditCard: {
            const std::string d = digits_only(span_text);
            return card_prefix_check(d) && luhn_check(d);
        }
        case ValidatorKind::kSsn:
            return ssn_check(span_text);
        case ValidatorKind::kAadhaar:
            return verhoeff_check(span_text);
        case ValidatorKind::kIban:
            return iban_check(span_text);
        case ValidatorKind::kIpv4:
            return ipv4_check(span_text);
        case ValidatorKind::kPhone: {
            const std::size_t n = digits_only(span_text).size();
            return n >= 10 && n <= 15;
        }
    }
    return false;
}

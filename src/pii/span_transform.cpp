#include "pii/span_transform.hpp"

#include "pii/validators.hpp"

namespace {

std::string last_n(std::string_view s, std::size_t n) {
    return std::string(s.size() > n ? s.substr(s.size() - n) : s);
}

// 첫 글자 + '*' + 마지막 글자. 짧으면 전부 가린다.
std::string mask_generic(std::string_view value) {
    if (value.size() <= 2) {
        return std::string(value.size(), '*');
    }
    std::string out;
    out += value.front();
    out.append(value.size() - 2, '*');
    out += value.back();
    return out;
}

std::string mask_email(std::string_view value) {
    const std::size_t at = value.find('@');
    if (at == std::string_view::npos || at == 0) {
        return mask_generic(value);
    }
    if (at == 1) {
        return "*" + std::string(value.substr(at));
    }
    return std::string(1, value.front()) + "***" + std::string(value.substr(at));
}

std::string mask_token(std::string_view value) {
    if (value.size() <= 12) {
        return std::string(value.size(), '*');
    }
    return std::string(value.substr(0, 4)) + "..." + last_n(value, 4);
}

std::string mask_ip(std::string_view value) {
    const std::size_t first = value.find('.');
    const std::size_t second =
        first == std::string_view::npos ? first : value.find('.', first + 1);
    if (second == std::string_view::npos) {
        return mask_generic(value);
    }
    return std::string(value.substr(0, second)) + ".*.*";
}

std::string mask_iban(std::string_view value) {
    std::string compact;
    for (char c : value) {
        if (c != ' ') {
            compact += c;
        }
    }
    if (compact.size() <= 6) {
        return std::string(compact.size(), '*');
    }
    return compact.substr(0, 2) + std::string(compact.size() - 6, '*') + last_n(compact, 4);
}

std::string mask_db_url(std::string_view value) {
    const std::size_t scheme_end = value.find("://");
    if (scheme_end == std::string_view::npos) {
        return mask_generic(value);
    }
    return std::string(value.substr(0, scheme_end)) + "://***";
}

}  // namespace

std::string mask_value(PiiCategory category, std::string_view value) {
    switch (category) {
        case PiiCategory::kEmail:
            return mask_email(value);
        case PiiCategory::kCreditCard:
            return "**** **** **** " + last_n(digits_only(value), 4);
        case PiiCategory::kPhone: {
            const std::string d = digits_only(value);
            if (d.size() <= 4) {
                return std::string(d.size(), '*');
            }
            return std::string(d.size() - 4, '*') + last_n(d, 4);
        }
        case PiiCategory::kSsn:
            return "***-**-" + last_n(digits_only(value), 4);
        case PiiCategory::kAadhaar:
            return "**** **** " + last_n(digits_only(value), 4);
        case PiiCategory::kIban:
            return mask_iban(value);
        case PiiCategory::kIpAddress:
            return mask_ip(value);
        case PiiCategory::kApiKey:
        case PiiCategory::kAccessToken:
        case PiiCategory::kJwt:
        case PiiCategory::kCloudKey:
            return mask_token(value);
        case PiiCategory::kPassword:
        case PiiCategory::kCredential:
            return "********";
        case PiiCategory::kPrivateKey:
            return "[MASKED_PRIVATE_KEY]";
        case PiiCategory::kDbUrl:
            return mask_db_url(value);
    }
    return mask_generic(value);
}

std::string apply_transform(std::string_view             text,
                            const std::vector<PiiMatch>& spans,
                            SanitizeMode                 mode) {
    if (mode == SanitizeMode::kDetect || spans.empty()) {
        return std::string(text);
    }

    std::string out;
    out.reserve(text.size());

    std::size_t cursor = 0;
    for (const auto& span : spans) {
        if (span.start < cursor || span.end > text.size()) {
            // 정렬/비겹침 전제가 깨진 스팬은 건너뛴다
            continue;
        }
        out.append(text.substr(cursor, span.start - cursor));

        const std::string_view value = text.substr(span.start, span.end - span.start);
        if (mode == SanitizeMode::kMask) {
            out += mask_value(span.category, value);
        } else {
            out += placeholder_of(span.category);
        }
        cursor = span.end;
    }
    out.append(text.substr(cursor));
    return out;
}

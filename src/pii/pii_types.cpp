#include "pii/pii_types.hpp"

#include <algorithm>

namespace {

struct CategoryInfo {
    std::string_view name;
    PiiSeverity      severity;
    std::string_view placeholder;
    bool             secret;
};

// PiiCategory 열거 순서와 같은 순서로 유지할 것.
constexpr CategoryInfo kCategoryTable[] = {
    {"email",        PiiSeverity::kHigh,     "[REDACTED_EMAIL]",        false},
    {"credit_card",  PiiSeverity::kCritical, "[REDACTED_CREDIT_CARD]",  false},
    {"phone",        PiiSeverity::kMedium,   "[REDACTED_PHONE]",        false},
    {"ssn",          PiiSeverity::kCritical, "[REDACTED_SSN]",          false},
    {"aadhaar",      PiiSeverity::kCritical, "[REDACTED_AADHAAR]",      false},
    {"iban",         PiiSeverity::kCritical, "[REDACTED_IBAN]",         false},
    {"ip_address",   PiiSeverity::kLow,      "[REDACTED_IP]",           false},
    {"password",     PiiSeverity::kCritical, "[REDACTED_PASSWORD]",     true},
    {"api_key",      PiiSeverity::kCritical, "[REDACTED_API_KEY]",      true},
    {"access_token", PiiSeverity::kCritical, "[REDACTED_TOKEN]",        true},
    {"jwt",          PiiSeverity::kHigh,     "[REDACTED_JWT]",          true},
    {"private_key",  PiiSeverity::kCritical, "[REDACTED_PRIVATE_KEY]",  true},
    {"db_url",       PiiSeverity::kCritical, "[REDACTED_DB_URL]",       true},
    {"cloud_key",    PiiSeverity::kCritical, "[REDACTED_CLOUD_KEY]",    true},
    {"credential",   PiiSeverity::kHigh,     "[REDACTED_CREDENTIAL]",   true},
};

const CategoryInfo& info(PiiCategory category) noexcept {
    return kCategoryTable[static_cast<std::size_t>(category)];
}

}  // namespace

std::string_view to_string(PiiCategory category) noexcept {
    return info(category).name;
}

std::string_view to_string(PiiSeverity severity) noexcept {
    switch (severity) {
        case PiiSeverity::kLow:      return "low";
        case PiiSeverity::kMedium:   return "medium";
        case PiiSeverity::kHigh:     return "high";
        case PiiSeverity::kCritical: return "critical";
    }
    return "low";
}

PiiSeverity severity_of(PiiCategory category) noexcept {
    return info(category).severity;
}

std::string_view placeholder_of(PiiCategory category) noexcept {
    return info(category).placeholder;
}

bool is_secret(PiiCategory category) noexcept {
    return info(category).secret;
}

PiiSummary summarize(const SanitizedText& text) {
    PiiSummary summary{};
    summary.count            = text.spans.size();
    summary.detected         = !text.spans.empty();
    summary.original_length  = text.original_text.size();
    summary.sanitized_length = text.transformed_text.size();

    for (const auto& span : text.spans) {
        if (std::find(summary.types.begin(), summary.types.end(), span.category) ==
            summary.types.end()) {
            summary.types.push_back(span.category);
        }
        summary.max_severity = std::max(summary.max_severity, severity_of(span.category));
    }
    return summary;
}

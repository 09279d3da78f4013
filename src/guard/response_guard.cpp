#include "guard/response_guard.hpp"

#include "pii/span_transform.hpp"

#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>

std::string_view to_string(GuardDecision decision) noexcept {
    switch (decision) {
        case GuardDecision::kAllow:    return "allow";
        case GuardDecision::kSanitize: return "sanitize";
        case GuardDecision::kBlock:    return "block";
        case GuardDecision::kSkipped:  return "skipped";
    }
    return "block";
}

ResponseGuard::ResponseGuard(std::shared_ptr<const PiiDetector> pii_detector,
                             std::shared_ptr<const PiiDetector> secret_detector)
    : pii_detector_{std::move(pii_detector)}
    , secret_detector_{std::move(secret_detector)}
{
    if (!pii_detector_ || !secret_detector_) {
        throw std::invalid_argument("ResponseGuard: detectors must not be null");
    }
}

GuardResult ResponseGuard::guard(std::string_view response_text, SanitizeMode mode) const {
    GuardResult result{};
    result.text.original_text = std::string(response_text);

    auto spans = PiiDetector::merge(secret_detector_->detect(response_text),
                                    pii_detector_->detect(response_text));

    for (const auto& span : spans) {
        if (!is_secret(span.category)) {
            continue;
        }
        result.leaked = true;
        if (std::find(result.secret_categories.begin(), result.secret_categories.end(),
                      span.category) == result.secret_categories.end()) {
            result.secret_categories.push_back(span.category);
        }
    }

    const SanitizeMode effective = result.leaked ? SanitizeMode::kRedact : mode;

    result.text.mode             = effective;
    result.text.transformed_text = apply_transform(response_text, spans, effective);
    result.text.spans            = std::move(spans);

    if (result.leaked) {
        result.decision = GuardDecision::kBlock;
        spdlog::warn("response_guard: secret leak detected in model response ({} secret categories)",
                     result.secret_categories.size());
    } else if (!result.text.spans.empty() && effective != SanitizeMode::kDetect) {
        result.decision = GuardDecision::kSanitize;
    } else {
        result.decision = GuardDecision::kAllow;
    }
    return result;
}

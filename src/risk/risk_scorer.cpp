#include "risk/risk_scorer.hpp"

#include <algorithm>
#include <cmath>

namespace {

std::uint32_t injection_term(const InjectionVerdict& v) noexcept {
    const double conf = std::clamp(v.confidence, 0.0, 1.0);
    std::uint32_t term = static_cast<std::uint32_t>(
        std::lround(conf * RiskScorer::kInjectionConfidence));
    if (v.is_injection) {
        term += RiskScorer::kInjectionBase;
    }
    return std::min(term, RiskScorer::kInjectionCap);
}

std::uint32_t policy_term(PolicyAction action) noexcept {
    switch (action) {
        case PolicyAction::kAllow:             return 0;
        case PolicyAction::kAllowWithSanitize: return RiskScorer::kPolicySanitize;
        case PolicyAction::kBlock:             return RiskScorer::kPolicyBlock;
    }
    return RiskScorer::kPolicyBlock;
}

std::uint32_t severity_term(PiiSeverity severity) noexcept {
    switch (severity) {
        case PiiSeverity::kLow:      return 0;
        case PiiSeverity::kMedium:   return 5;
        case PiiSeverity::kHigh:     return 10;
        case PiiSeverity::kCritical: return 15;
    }
    return 15;
}

std::uint32_t pii_term(const PiiSummary& pii) noexcept {
    if (pii.count == 0) {
        return 0;
    }
    const auto count_term = static_cast<std::uint32_t>(
        std::min<std::size_t>(pii.count * RiskScorer::kPiiPerMatch, RiskScorer::kPiiCountCap));
    return count_term + severity_term(pii.max_severity);
}

}  // namespace

std::string_view to_string(RiskBand band) noexcept {
    switch (band) {
        case RiskBand::kLow:    return "low";
        case RiskBand::kMedium: return "medium";
        case RiskBand::kHigh:   return "high";
    }
    return "high";
}

RiskBand RiskScorer::band_for(std::uint32_t value) noexcept {
    if (value < 30) {
        return RiskBand::kLow;
    }
    if (value < 70) {
        return RiskBand::kMedium;
    }
    return RiskBand::kHigh;
}

RiskScore RiskScorer::score(const InjectionVerdict& injection,
                            PolicyAction            policy_action,
                            const PiiSummary&       pii,
                            bool                    response_filtered) const noexcept {
    std::uint32_t total = injection_term(injection);
    if (injection.degraded) {
        total += kDegraded;
    }
    total += policy_term(policy_action);
    total += pii_term(pii);
    if (response_filtered) {
        total += kResponseFiltered;
    }

    const std::uint32_t clamped = std::min<std::uint32_t>(total, 100);
    return RiskScore{.value = clamped, .band = band_for(clamped)};
}

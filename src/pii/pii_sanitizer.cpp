#include "pii/pii_sanitizer.hpp"

#include "pii/span_transform.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

PiiSanitizer::PiiSanitizer(std::shared_ptr<const PiiDetector> detector)
    : detector_{std::move(detector)}
{
    if (!detector_) {
        throw std::invalid_argument("PiiSanitizer: detector must not be null");
    }
}

SanitizedText PiiSanitizer::sanitize(std::string_view text, SanitizeMode mode) const {
    SanitizedText result{};
    result.original_text = std::string(text);
    result.mode          = mode;

    const bool blank = std::all_of(text.begin(), text.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
    if (blank) {
        result.transformed_text = result.original_text;
        return result;
    }

    result.spans            = detector_->detect(text);
    result.transformed_text = apply_transform(text, result.spans, mode);
    return result;
}

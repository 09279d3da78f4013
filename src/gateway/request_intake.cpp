#include "gateway/request_intake.hpp"

#include <chrono>

#include <fmt/format.h>

namespace {

GateError invalid(std::string message) {
    return GateError{GateErrorCode::kInvalidRequest, std::move(message), "request_intake"};
}

bool is_blank(std::string_view s) {
    for (const char c : s) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') {
            return false;
        }
    }
    return true;
}

std::string trim(std::string_view s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    const auto last  = s.find_last_not_of(" \t\r\n");
    return std::string(s.substr(first, last - first + 1));
}

// U+200B–U+200F, U+202A–U+202E, U+2060–U+2064, U+FEFF
bool is_hidden_codepoint(std::uint32_t cp) noexcept {
    return (cp >= 0x200B && cp <= 0x200F) ||
           (cp >= 0x202A && cp <= 0x202E) ||
           (cp >= 0x2060 && cp <= 0x2064) ||
           cp == 0xFEFF;
}

}  // namespace

std::string RequestIntake::strip_hidden_characters(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        const auto c = static_cast<unsigned char>(text[i]);

        if (c < 0x20 || c == 0x7F) {
            if (c == '\t' || c == '\r' || c == '\n') {
                out += static_cast<char>(c);
            }
            ++i;
            continue;
        }

        // 대상 문자는 모두 3바이트 UTF-8 (E2 80..81 xx, EF BB BF)
        if ((c == 0xE2 || c == 0xEF) && i + 2 < text.size()) {
            const auto b1 = static_cast<unsigned char>(text[i + 1]);
            const auto b2 = static_cast<unsigned char>(text[i + 2]);
            if ((b1 & 0xC0) == 0x80 && (b2 & 0xC0) == 0x80) {
                const std::uint32_t cp = ((c & 0x0Fu) << 12) | ((b1 & 0x3Fu) << 6) | (b2 & 0x3Fu);
                if (is_hidden_codepoint(cp)) {
                    i += 3;
                    continue;
                }
            }
        }

        out += static_cast<char>(c);
        ++i;
    }
    return out;
}

std::string RequestIntake::next_id() {
    return fmt::format("req-{}", counter_.fetch_add(1, std::memory_order_relaxed) + 1);
}

std::expected<Request, GateError> RequestIntake::normalize(const RawRequest&   raw,
                                                           const IntakeConfig& cfg,
                                                           std::string_view    default_model) {
    Request req{};
    req.id          = raw.id.empty() ? next_id() : raw.id;
    req.received_at = std::chrono::system_clock::now();

    if (raw.prompt.size() > cfg.max_prompt_bytes) {
        return std::unexpected(invalid(fmt::format(
            "prompt of {} bytes exceeds limit of {} bytes", raw.prompt.size(), cfg.max_prompt_bytes)));
    }

    req.prompt_text = strip_hidden_characters(raw.prompt);
    if (is_blank(req.prompt_text)) {
        return std::unexpected(invalid("prompt is empty"));
    }

    if (is_blank(raw.role)) {
        return std::unexpected(invalid("role is empty"));
    }
    req.role   = raw.role;
    req.caller = is_blank(raw.caller) ? raw.role : trim(raw.caller);

    req.model_params.model = raw.model && !raw.model->empty() ? *raw.model
                                                               : std::string(default_model);

    req.model_params.max_tokens = raw.max_tokens.value_or(cfg.default_max_tokens);
    if (req.model_params.max_tokens == 0 || req.model_params.max_tokens > cfg.max_tokens_limit) {
        return std::unexpected(invalid(fmt::format(
            "max_tokens {} outside 1..{}", req.model_params.max_tokens, cfg.max_tokens_limit)));
    }

    req.model_params.temperature = raw.temperature.value_or(cfg.default_temperature);
    if (!(req.model_params.temperature >= 0.0 && req.model_params.temperature <= 2.0)) {
        return std::unexpected(invalid("temperature outside [0, 2]"));
    }

    return req;
}

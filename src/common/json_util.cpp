// ---------------------------------------------------------------------------
// json_util.cpp
// ---------------------------------------------------------------------------

#include "common/json_util.hpp"

#include <charconv>
#include <cstdio>
#include <cstdint>

namespace {

// locate_value
//   "key" 다음의 ':' 와 공백을 건너뛴 값 시작 위치. 없으면 npos.
std::size_t locate_value(std::string_view json, std::string_view key) {
    const std::string quoted = "\"" + std::string(key) + "\"";
    std::size_t pos = 0;
    while ((pos = json.find(quoted, pos)) != std::string_view::npos) {
        std::size_t i = pos + quoted.size();
        while (i < json.size() && (json[i] == ' ' || json[i] == '\t')) { ++i; }
        if (i < json.size() && json[i] == ':') {
            ++i;
            while (i < json.size() && (json[i] == ' ' || json[i] == '\t')) { ++i; }
            return i;
        }
        pos += quoted.size();
    }
    return std::string_view::npos;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

}  // namespace

std::string json_escape(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]{};
                    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string json_quote(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 2);
    out += '"';
    out += json_escape(sv);
    out += '"';
    return out;
}

std::optional<std::string> find_string_field(std::string_view json, std::string_view key) {
    std::size_t i = locate_value(json, key);
    if (i == std::string_view::npos || i >= json.size() || json[i] != '"') {
        return std::nullopt;
    }
    ++i;

    std::string value;
    while (i < json.size()) {
        const char c = json[i++];
        if (c == '"') {
            return value;
        }
        if (c != '\\') {
            value += c;
            continue;
        }
        if (i >= json.size()) {
            break;
        }
        const char esc = json[i++];
        switch (esc) {
            case 'n': value += '\n'; break;
            case 't': value += '\t'; break;
            case 'r': value += '\r'; break;
            case 'b': value += '\b'; break;
            case 'f': value += '\f'; break;
            case 'u': {
                if (i + 4 > json.size()) {
                    return std::nullopt;
                }
                std::uint32_t cp = 0;
                const auto [ptr, ec] = std::from_chars(json.data() + i, json.data() + i + 4, cp, 16);
                if (ec != std::errc{} || ptr != json.data() + i + 4) {
                    return std::nullopt;
                }
                append_utf8(value, cp);
                i += 4;
                break;
            }
            default:
                value += esc;  // \" \\ \/
                break;
        }
    }
    // 닫는 따옴표 없음
    return std::nullopt;
}

std::optional<double> find_number_field(std::string_view json, std::string_view key) {
    const std::size_t i = locate_value(json, key);
    if (i == std::string_view::npos || i >= json.size()) {
        return std::nullopt;
    }
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(json.data() + i, json.data() + json.size(), value);
    if (ec != std::errc{} || ptr == json.data() + i) {
        return std::nullopt;
    }
    return value;
}

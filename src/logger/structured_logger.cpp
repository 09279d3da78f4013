// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include "common/json_util.hpp"

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC)
// ---------------------------------------------------------------------------
std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    const auto is = [name](std::string_view candidate) {
        return name.size() == candidate.size() &&
               std::equal(name.begin(), name.end(), candidate.begin(),
                          [](unsigned char a, unsigned char b) { return std::tolower(a) == b; });
    };
    if (is("debug") || is("trace")) {
        return LogLevel::kDebug;
    }
    if (is("warn") || is("warning")) {
        return LogLevel::kWarn;
    }
    if (is("error") || is("critical")) {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        // 로그 디렉터리 생성
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        // 싱크 생성: stdout + rotating file
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        logger_ = std::make_shared<spdlog::logger>("promptgate", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 기본 패턴: 타임스탬프만 (구조화 로그는 각 메서드에서 JSON으로 생성)
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");

        // 매 로그마다 파일을 플러시하도록 설정
        logger_->flush_on(spdlog::level::trace);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(min_level_) <= static_cast<int>(level);
}

// ---------------------------------------------------------------------------
// log_verdict: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_verdict(const VerdictLog& entry) {
    if (!enabled(LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"verdict","request_id":")" << json_escape(entry.request_id)
         << R"(","role":")" << json_escape(entry.role)
         << R"(","decision":")" << json_escape(entry.decision)
         << R"(","reason":")" << json_escape(entry.reason)
         << R"(","risk_score":)" << entry.risk_score
         << R"(,"risk_band":")" << json_escape(entry.risk_band)
         << R"(","intent":")" << json_escape(entry.intent)
         << R"(","policy":")" << json_escape(entry.policy)
         << R"(","pii_count":)" << entry.pii_count
         << R"(,"pii_types":[)";

    for (std::size_t i = 0; i < entry.pii_types.size(); ++i) {
        if (i > 0) {
            json << ',';
        }
        json << '"' << json_escape(entry.pii_types[i]) << '"';
    }

    json << R"(],"is_injection":)" << (entry.is_injection ? "true" : "false")
         << R"(,"injection_confidence":)" << std::fixed << std::setprecision(4)
         << entry.injection_confidence
         << R"(,"response_filtered":)" << (entry.response_filtered ? "true" : "false")
         << R"(,"audited":)" << (entry.audited ? "true" : "false")
         << R"(,"audit_sequence_no":)";
    if (entry.audit_sequence_no) {
        json << *entry.audit_sequence_no;
    } else {
        json << "null";
    }
    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << R"(})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_block: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_block(const BlockLog& entry) {
    if (!enabled(LogLevel::kWarn)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"request_blocked","request_id":")" << json_escape(entry.request_id)
         << R"(","role":")" << json_escape(entry.role)
         << R"(","reason":")" << json_escape(entry.reason)
         << R"(","matched_rule":")" << json_escape(entry.matched_rule)
         << R"(","detail":")" << json_escape(entry.detail)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->warn(json.str());
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

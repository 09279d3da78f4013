#pragma once

// ---------------------------------------------------------------------------
// audit_logger.hpp
//
// 요청마다 verdict 스냅샷을 해시 체인으로 엮어 추가 전용(append-only)으로
// 기록하는 감사 로거.
//
// [해시 체인]
//   entry_hash = SHA-256( sequence_no | timestamp_ms | request_id |
//                         verdict_snapshot | prev_hash )   (소문자 hex)
//   prev_hash  = 직전 항목의 entry_hash, 첫 항목은 kGenesisHash ("0" x 64)
// 과거 항목 하나를 고치면 그 항목부터 체인 끝까지 검증이 깨진다.
//
// [설계 원칙]
// - append 가 유일한 변경 연산이다. 수정/삭제 API 는 존재하지 않는다.
// - append 는 mutex 로 직렬화된다 (단일 writer). sequence_no 와 prev_hash
//   연결은 동시 요청 사이에서도 엄격히 순서가 보장된다.
// - 파일 기록(flush 포함)이 성공한 뒤에만 메모리 체인에 반영한다.
//   기록 실패 시 체인은 변하지 않고 kAuditWriteFailure 를 반환한다.
//   감사 누락은 조용히 삼키지 않는다.
//
// [저장 형식]
// audit_path 에 한 줄당 JSON 객체 하나 (JSONL).
//   {"sequence_no":1,"timestamp_ms":...,"request_id":"...",
//    "prev_hash":"...","entry_hash":"...","verdict":"<escaped verdict json>"}
// audit_path 가 비어 있으면 메모리에만 유지한다 (테스트/개발용).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "common/types.hpp"

struct AuditEntry {
    std::uint64_t sequence_no{0};
    std::int64_t  timestamp_ms{0};
    std::string   request_id{};
    std::string   verdict_snapshot{};
    std::string   prev_hash{};
    std::string   entry_hash{};
};

// ---------------------------------------------------------------------------
// ChainVerification
//   first_broken : 처음으로 검증에 실패한 항목의 인덱스 (0-based)
//   broken_count : 검증에 실패한 항목 수
// ---------------------------------------------------------------------------
struct ChainVerification {
    bool                       intact{true};
    std::optional<std::size_t> first_broken{};
    std::size_t                broken_count{0};
    std::size_t                entries_checked{0};
};

class AuditLogger {
public:
    static constexpr std::string_view kGenesisHash =
        "0000000000000000000000000000000000000000000000000000000000000000";

    // audit_path 가 비어 있으면 메모리 전용.
    // 파일을 열 수 없으면 에러 로그를 남기고, 이후 append 는 모두 실패한다.
    explicit AuditLogger(std::filesystem::path audit_path);

    ~AuditLogger() = default;

    AuditLogger(const AuditLogger&)            = delete;
    AuditLogger& operator=(const AuditLogger&) = delete;
    AuditLogger(AuditLogger&&)                 = delete;
    AuditLogger& operator=(AuditLogger&&)      = delete;

    // append
    //   verdict_snapshot 을 체인 끝에 추가한다.
    //   실패: GateErrorCode::kAuditWriteFailure (체인 불변)
    [[nodiscard]] std::expected<AuditEntry, GateError> append(std::string_view verdict_snapshot,
                                                              std::string_view request_id);

    // restore
    //   기동 시 기존 감사 파일을 읽어 체인을 복원하고 검증한다.
    //   반환: 복원한 항목 수
    //   실패: 파싱 불가 줄, 끊어진 체인, 이미 항목이 있는 상태에서 호출
    //         → GateErrorCode::kConfigurationError
    [[nodiscard]] std::expected<std::size_t, GateError> restore();

    // verify
    //   파일 모드: 감사 파일을 다시 읽어 체인을 재계산하고 메모리 체인과
    //   항목별로 대조한다 (변조, 삭제, 잘림, 끼워 넣기 모두 깨짐으로 보고).
    //   메모리 전용: 메모리 체인만 재계산한다.
    [[nodiscard]] ChainVerification verify() const;

    // verify_entries
    //   재계산한 해시를 다음 항목의 기대 prev_hash 로 사용한다.
    //   따라서 k 번째 항목이 변조되면 k..N-1 이 모두 깨진 것으로 보고된다.
    [[nodiscard]] static ChainVerification verify_entries(const std::vector<AuditEntry>& entries);

    [[nodiscard]] static std::string compute_hash(std::uint64_t    sequence_no,
                                                  std::int64_t     timestamp_ms,
                                                  std::string_view request_id,
                                                  std::string_view verdict_snapshot,
                                                  std::string_view prev_hash);

    [[nodiscard]] std::vector<AuditEntry> entries() const;

    // export_json
    //   메모리 체인 전체를 파일과 같은 레코드 형식의 JSON 배열로 직렬화한다.
    [[nodiscard]] std::string export_json() const;
    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] static std::string serialize(const AuditEntry& entry);

    std::filesystem::path   path_;
    std::ofstream           out_;
    mutable std::mutex      mutex_;
    std::vector<AuditEntry> entries_;
};

#include "audit/audit_logger.hpp"

#include <algorithm>
#include <chrono>
#include <memory>

#include <fmt/format.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

#include "common/json_util.hpp"

namespace {

std::int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

GateError audit_error(GateErrorCode code, std::string message) {
    return GateError{code, std::move(message), "audit_logger"};
}

// 감사 파일 한 줄을 AuditEntry 로 복원. 필수 필드가 없으면 nullopt.
std::optional<AuditEntry> parse_line(std::string_view line) {
    const auto seq        = find_number_field(line, "sequence_no");
    const auto ts         = find_number_field(line, "timestamp_ms");
    auto       request_id = find_string_field(line, "request_id");
    auto       prev_hash  = find_string_field(line, "prev_hash");
    auto       entry_hash = find_string_field(line, "entry_hash");
    auto       verdict    = find_string_field(line, "verdict");
    if (!seq || !ts || !request_id || !prev_hash || !entry_hash || !verdict) {
        return std::nullopt;
    }
    return AuditEntry{
        .sequence_no      = static_cast<std::uint64_t>(*seq),
        .timestamp_ms     = static_cast<std::int64_t>(*ts),
        .request_id       = std::move(*request_id),
        .verdict_snapshot = std::move(*verdict),
        .prev_hash        = std::move(*prev_hash),
        .entry_hash       = std::move(*entry_hash),
    };
}

// 감사 파일의 비어 있지 않은 줄을 순서대로 읽는다.
std::expected<std::vector<std::string>, GateError> read_records(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(audit_error(
            GateErrorCode::kConfigurationError,
            fmt::format("cannot read audit file '{}'", path.string())));
    }

    std::vector<std::string> records;
    std::string              line;
    while (std::getline(in, line)) {
        if (!line.empty()) {
            records.push_back(std::move(line));
        }
    }
    return records;
}

// 항목별 검증 결과. 재계산한 해시를 다음 항목의 기대 prev_hash 로 쓴다.
std::vector<bool> broken_links(const std::vector<AuditEntry>& entries) {
    std::vector<bool> broken(entries.size(), false);
    std::string       expected_prev(AuditLogger::kGenesisHash);

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& e          = entries[i];
        const auto  recomputed = AuditLogger::compute_hash(
            e.sequence_no, e.timestamp_ms, e.request_id, e.verdict_snapshot, expected_prev);

        broken[i] = e.sequence_no != i + 1 ||
                    e.prev_hash != expected_prev ||
                    e.entry_hash != recomputed;
        expected_prev = recomputed;
    }
    return broken;
}

ChainVerification summarize(const std::vector<bool>& broken) {
    ChainVerification result{};
    result.entries_checked = broken.size();
    for (std::size_t i = 0; i < broken.size(); ++i) {
        if (!broken[i]) {
            continue;
        }
        result.intact = false;
        ++result.broken_count;
        if (!result.first_broken) {
            result.first_broken = i;
        }
    }
    return result;
}

}  // namespace

AuditLogger::AuditLogger(std::filesystem::path audit_path)
    : path_{std::move(audit_path)}
{
    if (path_.empty()) {
        spdlog::warn("audit_logger: no audit path configured, chain kept in memory only");
        return;
    }
    out_.open(path_, std::ios::out | std::ios::app | std::ios::binary);
    if (!out_.is_open()) {
        spdlog::error("audit_logger: cannot open audit file '{}'; "
                      "every verdict will be reported as unaudited", path_.string());
    }
}

std::string AuditLogger::compute_hash(std::uint64_t    sequence_no,
                                      std::int64_t     timestamp_ms,
                                      std::string_view request_id,
                                      std::string_view verdict_snapshot,
                                      std::string_view prev_hash) {
    std::string input;
    input.reserve(verdict_snapshot.size() + request_id.size() + prev_hash.size() + 48);
    input += fmt::format("{}", sequence_no);
    input += '|';
    input += fmt::format("{}", timestamp_ms);
    input += '|';
    input += request_id;
    input += '|';
    input += verdict_snapshot;
    input += '|';
    input += prev_hash;

    // SHA-256 via OpenSSL EVP
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx{EVP_MD_CTX_new(), &EVP_MD_CTX_free};
    if (!ctx) {
        return {};
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int  hash_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        return {};
    }

    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(hash_len * 2);
    for (unsigned int i = 0; i < hash_len; ++i) {
        hex += hex_chars[(hash[i] >> 4) & 0x0F];
        hex += hex_chars[hash[i] & 0x0F];
    }
    return hex;
}

std::string AuditLogger::serialize(const AuditEntry& entry) {
    return fmt::format(
        R"({{"sequence_no":{},"timestamp_ms":{},"request_id":{},"prev_hash":"{}","entry_hash":"{}","verdict":{}}})",
        entry.sequence_no,
        entry.timestamp_ms,
        json_quote(entry.request_id),
        entry.prev_hash,
        entry.entry_hash,
        json_quote(entry.verdict_snapshot)
    );
}

std::expected<AuditEntry, GateError> AuditLogger::append(std::string_view verdict_snapshot,
                                                         std::string_view request_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    AuditEntry entry{};
    entry.sequence_no      = entries_.size() + 1;
    entry.timestamp_ms     = now_ms();
    entry.request_id       = std::string(request_id);
    entry.verdict_snapshot = std::string(verdict_snapshot);
    entry.prev_hash        = entries_.empty() ? std::string(kGenesisHash) : entries_.back().entry_hash;
    entry.entry_hash       = compute_hash(entry.sequence_no, entry.timestamp_ms, entry.request_id,
                                          entry.verdict_snapshot, entry.prev_hash);

    if (entry.entry_hash.empty()) {
        spdlog::error("audit_logger: SHA-256 computation failed for request '{}'", request_id);
        return std::unexpected(audit_error(GateErrorCode::kAuditWriteFailure,
                                           "hash computation failed"));
    }

    if (!path_.empty()) {
        if (!out_.is_open() || !out_.good()) {
            spdlog::error("audit_logger: audit file '{}' unavailable, request '{}' unaudited",
                          path_.string(), request_id);
            return std::unexpected(audit_error(GateErrorCode::kAuditWriteFailure,
                                               "audit file unavailable"));
        }
        out_ << serialize(entry) << '\n';
        out_.flush();
        if (!out_.good()) {
            spdlog::error("audit_logger: write to '{}' failed, request '{}' unaudited",
                          path_.string(), request_id);
            return std::unexpected(audit_error(GateErrorCode::kAuditWriteFailure,
                                               "audit write failed"));
        }
    }

    entries_.push_back(entry);
    return entry;
}

std::expected<std::size_t, GateError> AuditLogger::restore() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (path_.empty()) {
        return 0;
    }
    if (!entries_.empty()) {
        return std::unexpected(audit_error(GateErrorCode::kConfigurationError,
                                           "restore called on a non-empty chain"));
    }

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return 0;
    }

    auto records = read_records(path_);
    if (!records) {
        return std::unexpected(records.error());
    }

    std::vector<AuditEntry> restored;
    restored.reserve(records->size());
    for (std::size_t i = 0; i < records->size(); ++i) {
        auto entry = parse_line((*records)[i]);
        if (!entry) {
            return std::unexpected(audit_error(
                GateErrorCode::kConfigurationError,
                fmt::format("malformed audit record at line {}", i + 1)));
        }
        restored.push_back(std::move(*entry));
    }

    const auto check = verify_entries(restored);
    if (!check.intact) {
        return std::unexpected(audit_error(
            GateErrorCode::kConfigurationError,
            fmt::format("audit chain broken at entry {} ({} entries fail verification)",
                        *check.first_broken, check.broken_count)));
    }

    entries_ = std::move(restored);
    spdlog::info("audit_logger: restored {} audit entries from '{}'",
                 entries_.size(), path_.string());
    return entries_.size();
}

ChainVerification AuditLogger::verify_entries(const std::vector<AuditEntry>& entries) {
    return summarize(broken_links(entries));
}

// ---------------------------------------------------------------------------
// verify
//   파일 모드에서는 디스크의 감사 파일을 다시 읽어 검증한다.
//   1. 파일 자체의 체인 재계산 (파싱 불가 줄은 깨진 항목)
//   2. i 번째 항목의 entry_hash 가 메모리 체인과 같은지
//   3. 메모리에는 있는데 파일에서 사라진 항목, 파일에만 있는 항목
//   파일 전체를 일관되게 다시 계산해 쓴 경우도 2 에서 걸린다.
// ---------------------------------------------------------------------------
ChainVerification AuditLogger::verify() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (path_.empty()) {
        return verify_entries(entries_);
    }

    std::vector<AuditEntry> on_disk;
    if (auto records = read_records(path_)) {
        on_disk.reserve(records->size());
        for (const auto& record : *records) {
            on_disk.push_back(parse_line(record).value_or(AuditEntry{}));
        }
    } else {
        spdlog::error("audit_logger: verify: {}", records.error().message);
    }

    auto broken = broken_links(on_disk);
    broken.resize(std::max(on_disk.size(), entries_.size()), true);
    for (std::size_t i = 0; i < std::min(on_disk.size(), entries_.size()); ++i) {
        if (on_disk[i].entry_hash != entries_[i].entry_hash) {
            broken[i] = true;
        }
    }

    const auto result = summarize(broken);
    if (!result.intact) {
        spdlog::error("audit_logger: audit file '{}' diverges from the chain at entry {} "
                      "({} entries fail verification)",
                      path_.string(), *result.first_broken, result.broken_count);
    }
    return result;
}

std::vector<AuditEntry> AuditLogger::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::string AuditLogger::export_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out = "[";
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (i > 0) {
            out += ',';
        }
        out += serialize(entries_[i]);
    }
    out += ']';
    return out;
}

std::size_t AuditLogger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

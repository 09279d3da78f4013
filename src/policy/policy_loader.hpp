#pragma once

// ---------------------------------------------------------------------------
// policy_loader.hpp
//
// YAML 설정 파일(config/gateway.yaml)을 로드하여 GatewayConfig 로 파싱한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 기동 시 실패는
//   ConfigurationError 로 데몬을 종료시키고, reload 시 실패는 기존 설정을
//   유지한다.
// - 부분적으로 파싱된 설정을 반환하지 않는다 (all-or-nothing).
//
// [순환 의존성]
// policy_loader.hpp → rule.hpp (단방향만)
// ❌ rule.hpp → policy_loader.hpp 금지
//
// [보안 고려사항]
// - YAML 파일 경로는 환경 변수/명령행에서만 지정하고 요청 입력을 사용 금지.
// - path traversal 방지를 위해 절대 경로로 정규화한 뒤 연다.
// - 파싱 실패 원인은 로깅하되, YAML 파일 전체를 로그에 출력하지 말 것
//   (정규식/역할 테이블 노출 방지).
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>

#include "rule.hpp"  // GatewayConfig

class PolicyLoader {
public:
    // load
    //   지정된 경로의 YAML 파일을 읽어 GatewayConfig 로 파싱한다.
    //
    //   [실패로 처리하는 경우]
    //   - 파일 없음 / YAML 문법 오류 (line, col 포함)
    //   - 알 수 없는 pii_mode, action, intent 이름
    //   - 범위를 벗어난 수치 (risk_threshold_block > 100, threshold 가 [0, 1) 밖,
    //     worker_threads == 0, max_attempts == 0)
    //   - role, intent, priority 가 같고 action 이 다른 policy_rules
    //
    //   [오탐 주의]
    //   injection.rules 의 regex 가 잘못 작성되면 InjectionDetector 가 그 규칙을
    //   건너뛴다 (false negative). 로드 시 경고를 남긴다.
    [[nodiscard]] static std::expected<GatewayConfig, std::string>
    load(const std::filesystem::path& config_path);
};

#pragma once

// ---------------------------------------------------------------------------
// span_transform.hpp
//
// detect / mask / redact 변환의 단일 구현.
// PIISanitizer 와 ResponseGuard 모두 이 함수만 호출하므로 두 경로의
// 변환 의미가 어긋나지 않는다.
//
// [조립 방식]
// 스팬 오프셋은 항상 원본 텍스트 기준이다. 원본을 왼쪽부터 한 번 훑으며
// (스팬 앞 구간 복사 → 치환 문자열 추가) 를 반복해 출력을 한 번에 만든다.
// 앞선 치환이 뒤 스팬의 오프셋을 밀어내는 일이 없다.
//
// [전제]
// spans 는 겹치지 않고 start 오름차순이어야 한다 (PiiDetector::detect 결과).
// ---------------------------------------------------------------------------

#include "pii/pii_types.hpp"

#include <string>
#include <string_view>
#include <vector>

// mask_value
//   카테고리별 부분 가림. 항상 일부 문맥은 남기고 민감 부분은 숨긴다.
//   예) 4111111111111111 → "**** **** **** 1111"
//       john.doe@email.com → "j***@email.com"
[[nodiscard]] std::string mask_value(PiiCategory category, std::string_view value);

// apply_transform
//   kDetect : text 그대로
//   kMask   : 각 스팬을 mask_value 로 치환
//   kRedact : 각 스팬을 placeholder_of(category) 로 치환
[[nodiscard]] std::string apply_transform(std::string_view             text,
                                          const std::vector<PiiMatch>& spans,
                                          SanitizeMode                 mode);

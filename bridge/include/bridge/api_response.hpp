/*
 * 설명: 리소스 HTTP 채널의 JSON 응답 엔벨로프 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "bridge/protocol.hpp"

namespace bridge {

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message,
                                 const nlohmann::json& detail = nullptr);
// 프로토콜 오류 코드를 문자열 코드로 옮기고 원래 정수 코드는 detail.code에 남긴다.
nlohmann::json MakeErrorEnvelope(const OpError& error);

std::string_view ErrorCodeName(ErrorCode code);

}  // namespace bridge

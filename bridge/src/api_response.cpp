/*
 * 설명: JSON 응답 엔벨로프를 생성하고 오류 코드 이름을 매핑한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/json_envelope_test.cpp
 */
#include "bridge/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace bridge {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message, const nlohmann::json& detail) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", detail}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(const OpError& error) {
  return MakeErrorEnvelope(ErrorCodeName(error.code), error.message, {{"code", ToInt(error.code)}});
}

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kAuthFailed:
      return "unauthorized";
    case ErrorCode::kVersionMismatch:
      return "version_mismatch";
    case ErrorCode::kInvalidPayload:
      return "bad_request";
    case ErrorCode::kConnectionFull:
      return "connection_full";
    case ErrorCode::kSessionNotFound:
      return "session_not_found";
    case ErrorCode::kResourceNotFound:
      return "not_found";
    case ErrorCode::kResourceQuotaExceeded:
      return "quota_exceeded";
    case ErrorCode::kTtsFailed:
      return "tts_failed";
    case ErrorCode::kSttFailed:
      return "stt_failed";
    case ErrorCode::kPerformFailed:
      return "perform_failed";
    case ErrorCode::kUnsupportedType:
      return "unsupported_type";
    case ErrorCode::kUploadFailed:
      return "upload_failed";
    case ErrorCode::kResourceIo:
      return "resource_io";
  }
  return "internal_error";
}

}  // namespace bridge

/*
 * 설명: L2D-Bridge 프로토콜의 패킷 구조, 오퍼레이션 이름, 오류 코드와 패킷 생성 헬퍼를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/packet_codec_test.cpp, bridge/tests/e2e/handshake_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace bridge {

inline constexpr std::string_view kProtocolVersion = "1.0.0";

namespace op {
inline constexpr std::string_view kHandshake = "sys.handshake";
inline constexpr std::string_view kHandshakeAck = "sys.handshake_ack";
inline constexpr std::string_view kPing = "sys.ping";
inline constexpr std::string_view kPong = "sys.pong";
inline constexpr std::string_view kError = "sys.error";

inline constexpr std::string_view kInputMessage = "input.message";
inline constexpr std::string_view kInputTouch = "input.touch";
inline constexpr std::string_view kInputShortcut = "input.shortcut";

inline constexpr std::string_view kPerformShow = "perform.show";
inline constexpr std::string_view kPerformInterrupt = "perform.interrupt";

inline constexpr std::string_view kResourcePrepare = "resource.prepare";
inline constexpr std::string_view kResourceCommit = "resource.commit";
inline constexpr std::string_view kResourceGet = "resource.get";
inline constexpr std::string_view kResourceRelease = "resource.release";
inline constexpr std::string_view kResourceProgress = "resource.progress";

inline constexpr std::string_view kStateReady = "state.ready";
inline constexpr std::string_view kStatePlaying = "state.playing";
inline constexpr std::string_view kStateConfig = "state.config";
inline constexpr std::string_view kStateModel = "state.model";

inline constexpr std::string_view kDesktopWindowList = "desktop.window.list";
inline constexpr std::string_view kDesktopWindowActive = "desktop.window.active";
inline constexpr std::string_view kDesktopCaptureScreenshot = "desktop.capture.screenshot";
}  // namespace op

// 4xxx: 프로토콜/인증/용량, 5xxx: 실행 오류
enum class ErrorCode : int {
  kAuthFailed = 4001,
  kVersionMismatch = 4002,
  kInvalidPayload = 4003,
  kConnectionFull = 4004,
  kSessionNotFound = 4005,
  kResourceNotFound = 4006,
  kResourceQuotaExceeded = 4007,
  kTtsFailed = 5001,
  kSttFailed = 5002,
  kPerformFailed = 5003,
  kUnsupportedType = 5004,
  kUploadFailed = 5005,
  kResourceIo = 5006,
};

constexpr int ToInt(ErrorCode code) { return static_cast<int>(code); }

struct OpError {
  ErrorCode code{ErrorCode::kInvalidPayload};
  std::string message;
};

struct ErrorInfo {
  int code{0};
  std::string message;
};

struct Packet {
  std::string op;
  std::string id;
  std::int64_t ts{0};
  std::optional<nlohmann::json> payload;
  std::optional<ErrorInfo> error;

  const nlohmann::json& PayloadOrEmpty() const;
};

std::string NewPacketId();
std::int64_t NowMillis();

Packet MakePacket(std::string_view op, std::optional<nlohmann::json> payload = std::nullopt, std::string id = {});
Packet MakeErrorPacket(ErrorCode code, std::string message, std::string id = {});
Packet MakePerformInterrupt();

struct HandshakeAckInfo {
  std::string session_id;
  std::string user_id;
  std::vector<std::string> features;
  std::vector<std::string> capabilities;
  nlohmann::json config;
};

Packet MakeHandshakeAck(const std::string& request_id, const HandshakeAckInfo& info);

std::vector<std::string> DefaultServerFeatures();
std::vector<std::string> DefaultServerCapabilities();

}  // namespace bridge

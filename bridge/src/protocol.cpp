/*
 * 설명: 프로토콜 패킷 생성 헬퍼를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/packet_codec_test.cpp
 */
#include "bridge/protocol.hpp"

#include <chrono>

#include "bridge/digest.hpp"

namespace bridge {

const nlohmann::json& Packet::PayloadOrEmpty() const {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  if (payload && payload->is_object()) {
    return *payload;
  }
  return kEmpty;
}

std::string NewPacketId() { return NewUuid(); }

std::int64_t NowMillis() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

Packet MakePacket(std::string_view op, std::optional<nlohmann::json> payload, std::string id) {
  Packet packet;
  packet.op = std::string(op);
  packet.id = id.empty() ? NewPacketId() : std::move(id);
  packet.ts = NowMillis();
  packet.payload = std::move(payload);
  return packet;
}

Packet MakeErrorPacket(ErrorCode code, std::string message, std::string id) {
  Packet packet = MakePacket(op::kError, std::nullopt, std::move(id));
  packet.error = ErrorInfo{ToInt(code), std::move(message)};
  return packet;
}

Packet MakePerformInterrupt() { return MakePacket(op::kPerformInterrupt); }

Packet MakeHandshakeAck(const std::string& request_id, const HandshakeAckInfo& info) {
  nlohmann::json payload{{"version", kProtocolVersion},
                         {"serverTime", NowMillis()},
                         {"features", info.features},
                         {"capabilities", info.capabilities},
                         {"config", info.config},
                         {"session", {{"sessionId", info.session_id}, {"userId", info.user_id}}}};
  return MakePacket(op::kHandshakeAck, std::move(payload), request_id);
}

std::vector<std::string> DefaultServerFeatures() {
  return {"message_chain", "tts_url", "multi_modal", "voice_input", "streaming", "resource_transfer"};
}

std::vector<std::string> DefaultServerCapabilities() {
  return {std::string(op::kInputMessage),     std::string(op::kInputTouch),      std::string(op::kInputShortcut),
          std::string(op::kPerformShow),      std::string(op::kPerformInterrupt), std::string(op::kResourcePrepare),
          std::string(op::kResourceCommit),   std::string(op::kResourceGet),      std::string(op::kResourceRelease),
          std::string(op::kResourceProgress), std::string(op::kStateReady),       std::string(op::kStatePlaying),
          std::string(op::kStateConfig)};
}

}  // namespace bridge

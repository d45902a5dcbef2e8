/*
 * 설명: 패킷 엔벨로프를 JSON으로 파싱/직렬화하고 필수 필드와 프레임 크기를 검증한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/packet_codec_test.cpp
 */
#include "bridge/packet_codec.hpp"

namespace bridge {

PacketCodec::PacketCodec(std::size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {}

std::optional<Packet> PacketCodec::Decode(std::string_view frame, DecodeError& error) const {
  error = DecodeError{};
  if (frame.size() > max_frame_bytes_) {
    error.message = "프레임이 최대 크기를 초과했습니다. 대용량 데이터는 리소스 전송 채널을 사용하세요";
    return std::nullopt;
  }

  nlohmann::json message = nlohmann::json::parse(frame, nullptr, false);
  if (message.is_discarded()) {
    error.message = "JSON 파싱 오류";
    return std::nullopt;
  }
  if (!message.is_object()) {
    error.message = "패킷은 JSON 객체여야 합니다";
    return std::nullopt;
  }

  auto id_it = message.find("id");
  if (id_it != message.end() && id_it->is_string()) {
    error.id = id_it->get<std::string>();
  }

  auto op_it = message.find("op");
  if (op_it == message.end() || !op_it->is_string() || op_it->get_ref<const std::string&>().empty()) {
    error.message = "op 필드가 필요합니다";
    return std::nullopt;
  }
  if (id_it == message.end() || !id_it->is_string() || id_it->get_ref<const std::string&>().empty()) {
    error.message = "id 필드가 필요합니다";
    return std::nullopt;
  }
  auto ts_it = message.find("ts");
  if (ts_it == message.end() || !ts_it->is_number_integer()) {
    error.message = "ts 필드는 정수(ms)여야 합니다";
    return std::nullopt;
  }

  Packet packet;
  packet.op = op_it->get<std::string>();
  packet.id = id_it->get<std::string>();
  packet.ts = ts_it->get<std::int64_t>();

  auto payload_it = message.find("payload");
  if (payload_it != message.end() && !payload_it->is_null()) {
    if (!payload_it->is_object()) {
      error.message = "payload는 객체여야 합니다";
      return std::nullopt;
    }
    packet.payload = *payload_it;
  }

  auto error_it = message.find("error");
  if (error_it != message.end() && !error_it->is_null()) {
    if (!error_it->is_object() || !error_it->contains("code") || !(*error_it)["code"].is_number_integer()) {
      error.message = "error 필드 형식이 올바르지 않습니다";
      return std::nullopt;
    }
    ErrorInfo info;
    info.code = (*error_it)["code"].get<int>();
    auto msg_it = error_it->find("message");
    if (msg_it != error_it->end() && msg_it->is_string()) {
      info.message = msg_it->get<std::string>();
    }
    packet.error = std::move(info);
  }
  return packet;
}

nlohmann::json PacketCodec::ToJson(const Packet& packet) const {
  nlohmann::json j;
  j["op"] = packet.op;
  j["id"] = packet.id;
  j["ts"] = packet.ts;
  if (packet.payload) {
    j["payload"] = *packet.payload;
  }
  if (packet.error) {
    j["error"] = {{"code", packet.error->code}, {"message", packet.error->message}};
  }
  return j;
}

std::string PacketCodec::Encode(const Packet& packet) const {
  return ToJson(packet).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace bridge

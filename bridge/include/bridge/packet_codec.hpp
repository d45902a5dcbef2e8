/*
 * 설명: 와이어 엔벨로프 {op, id, ts, payload?, error?}의 파싱/직렬화와 형식 검증을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/packet_codec_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "bridge/protocol.hpp"

namespace bridge {

struct DecodeError {
  ErrorCode code{ErrorCode::kInvalidPayload};
  std::string message;
  // 파싱은 됐지만 형식이 틀린 경우 원본 id (오류 응답 상관관계용)
  std::string id;
};

class PacketCodec {
 public:
  explicit PacketCodec(std::size_t max_frame_bytes);

  std::optional<Packet> Decode(std::string_view frame, DecodeError& error) const;
  std::string Encode(const Packet& packet) const;
  nlohmann::json ToJson(const Packet& packet) const;

  std::size_t MaxFrameBytes() const { return max_frame_bytes_; }

 private:
  std::size_t max_frame_bytes_;
};

}  // namespace bridge

#include <gtest/gtest.h>

#include "bridge/packet_codec.hpp"
#include "bridge/protocol.hpp"

TEST(PacketCodecTest, DecodesFullEnvelope) {
  bridge::PacketCodec codec(1024);
  bridge::DecodeError error;
  auto packet = codec.Decode(R"({"op":"input.message","id":"abc","ts":1700000000000,"payload":{"text":"hi"}})", error);
  ASSERT_TRUE(packet.has_value()) << error.message;
  EXPECT_EQ(packet->op, "input.message");
  EXPECT_EQ(packet->id, "abc");
  EXPECT_EQ(packet->ts, 1700000000000);
  ASSERT_TRUE(packet->payload.has_value());
  EXPECT_EQ((*packet->payload)["text"], "hi");
  EXPECT_FALSE(packet->error.has_value());
}

TEST(PacketCodecTest, PayloadIsOptional) {
  bridge::PacketCodec codec(1024);
  bridge::DecodeError error;
  auto packet = codec.Decode(R"({"op":"sys.ping","id":"p1","ts":1})", error);
  ASSERT_TRUE(packet.has_value());
  EXPECT_FALSE(packet->payload.has_value());
  EXPECT_TRUE(packet->PayloadOrEmpty().is_object());
  EXPECT_TRUE(packet->PayloadOrEmpty().empty());
}

TEST(PacketCodecTest, RejectsMalformedJson) {
  bridge::PacketCodec codec(1024);
  bridge::DecodeError error;
  EXPECT_FALSE(codec.Decode("{not json", error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kInvalidPayload);
  EXPECT_FALSE(codec.Decode("[1,2,3]", error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kInvalidPayload);
}

TEST(PacketCodecTest, RejectsMissingRequiredFieldsAndKeepsId) {
  bridge::PacketCodec codec(1024);
  bridge::DecodeError error;
  EXPECT_FALSE(codec.Decode(R"({"id":"x1","ts":1})", error).has_value());
  EXPECT_EQ(error.id, "x1");
  EXPECT_FALSE(codec.Decode(R"({"op":"sys.ping","ts":1})", error).has_value());
  EXPECT_TRUE(error.id.empty());
  EXPECT_FALSE(codec.Decode(R"({"op":"sys.ping","id":"x2"})", error).has_value());
  EXPECT_EQ(error.id, "x2");
  EXPECT_FALSE(codec.Decode(R"({"op":"sys.ping","id":"x3","ts":"now"})", error).has_value());
}

TEST(PacketCodecTest, RejectsNonObjectPayload) {
  bridge::PacketCodec codec(1024);
  bridge::DecodeError error;
  EXPECT_FALSE(codec.Decode(R"({"op":"input.message","id":"a","ts":1,"payload":"text"})", error).has_value());
  EXPECT_EQ(error.id, "a");
}

TEST(PacketCodecTest, RejectsOversizedFrame) {
  bridge::PacketCodec codec(32);
  bridge::DecodeError error;
  std::string frame = R"({"op":"input.message","id":"a","ts":1,"payload":{"text":"long enough"}})";
  ASSERT_GT(frame.size(), 32u);
  EXPECT_FALSE(codec.Decode(frame, error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kInvalidPayload);
}

TEST(PacketCodecTest, EncodesErrorPacket) {
  bridge::PacketCodec codec(1024);
  auto packet = bridge::MakeErrorPacket(bridge::ErrorCode::kSessionNotFound, "없음", "req-1");
  auto json = nlohmann::json::parse(codec.Encode(packet));
  EXPECT_EQ(json["op"], "sys.error");
  EXPECT_EQ(json["id"], "req-1");
  EXPECT_TRUE(json["ts"].is_number_integer());
  EXPECT_FALSE(json.contains("payload"));
  EXPECT_EQ(json["error"]["code"], 4005);
  EXPECT_EQ(json["error"]["message"], "없음");
}

TEST(PacketCodecTest, DecodesErrorField) {
  bridge::PacketCodec codec(1024);
  bridge::DecodeError error;
  auto packet = codec.Decode(R"({"op":"sys.error","id":"e","ts":5,"error":{"code":5001,"message":"tts"}})", error);
  ASSERT_TRUE(packet.has_value());
  ASSERT_TRUE(packet->error.has_value());
  EXPECT_EQ(packet->error->code, 5001);
  EXPECT_EQ(packet->error->message, "tts");
}

TEST(ProtocolTest, MakePacketGeneratesIdWhenEmpty) {
  auto a = bridge::MakePacket(bridge::op::kPing);
  auto b = bridge::MakePacket(bridge::op::kPing);
  EXPECT_FALSE(a.id.empty());
  EXPECT_NE(a.id, b.id);
  EXPECT_GT(a.ts, 0);
  auto c = bridge::MakePacket(bridge::op::kPong, std::nullopt, "fixed");
  EXPECT_EQ(c.id, "fixed");
}

TEST(ProtocolTest, HandshakeAckCarriesSessionAndConfig) {
  bridge::HandshakeAckInfo info;
  info.session_id = "desktop:abc";
  info.user_id = "desktop-user:abc";
  info.features = bridge::DefaultServerFeatures();
  info.capabilities = bridge::DefaultServerCapabilities();
  info.config = {{"maxMessageLength", 5000}};
  auto ack = bridge::MakeHandshakeAck("hs-1", info);
  EXPECT_EQ(ack.op, "sys.handshake_ack");
  EXPECT_EQ(ack.id, "hs-1");
  const auto& payload = ack.PayloadOrEmpty();
  EXPECT_EQ(payload["version"], "1.0.0");
  EXPECT_EQ(payload["session"]["sessionId"], "desktop:abc");
  EXPECT_EQ(payload["session"]["userId"], "desktop-user:abc");
  EXPECT_EQ(payload["config"]["maxMessageLength"], 5000);
  EXPECT_FALSE(payload["features"].empty());
}

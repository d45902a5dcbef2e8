#include <chrono>
#include <future>
#include <thread>

#include "e2e/bridge_fixture.hpp"

namespace {

using namespace std::chrono_literals;
using bridge_test::BridgeServerFixture;
using bridge_test::WsClient;

void ExpectSysError(const std::optional<nlohmann::json>& packet, int code) {
  ASSERT_TRUE(packet.has_value());
  EXPECT_EQ((*packet)["op"], "sys.error");
  ASSERT_TRUE(packet->contains("error"));
  EXPECT_EQ((*packet)["error"]["code"], code);
}

}  // namespace

TEST_F(BridgeServerFixture, HandshakeAssignsSessionFromClientId) {
  StartServer();
  WsClient client(WsPort());
  auto ack = client.Handshake("desk-1");
  ASSERT_EQ(ack["op"], "sys.handshake_ack");
  EXPECT_EQ(ack["id"], "hs-desk-1");
  const auto& payload = ack["payload"];
  EXPECT_EQ(payload["version"], "1.0.0");
  EXPECT_EQ(payload["session"]["sessionId"], "live2d_session_desk-1");
  EXPECT_EQ(payload["session"]["userId"], "live2d_user_desk-1");
  EXPECT_EQ(payload["config"]["maxInlineBytes"], 16);
  EXPECT_EQ(payload["config"]["resourceBaseUrl"], "http://127.0.0.1:" + std::to_string(ResourcePort()));

  auto ready = client.ReadOp("state.ready");
  ASSERT_TRUE(ready.has_value());
  EXPECT_EQ((*ready)["payload"]["clientId"], "desk-1");
  EXPECT_EQ(app_->GetSessionManager()->ActiveCount(), 1u);
}

TEST_F(BridgeServerFixture, WrongTokenIsRejectedAndClosed) {
  StartServer();
  WsClient client(WsPort());
  client.SendPacket("sys.handshake", {{"version", "1.0.0"}, {"token", "wrong"}, {"clientId", "x"}}, "hs-1");
  auto reply = client.Read();
  ExpectSysError(reply, 4001);
  EXPECT_EQ((*reply)["id"], "hs-1");
  EXPECT_TRUE(client.WaitClosed());
  EXPECT_EQ(app_->GetSessionManager()->ActiveCount(), 0u);
}

TEST_F(BridgeServerFixture, IncompatibleVersionIsRejected) {
  StartServer();
  WsClient client(WsPort());
  client.SendPacket("sys.handshake", {{"version", "2.0.0"}, {"token", bridge_test::kTestToken}}, "hs-1");
  ExpectSysError(client.Read(), 4002);
  EXPECT_TRUE(client.WaitClosed());
}

TEST_F(BridgeServerFixture, FirstPacketMustBeHandshake) {
  StartServer();
  WsClient client(WsPort());
  client.SendPacket("sys.ping", nullptr, "p-1");
  ExpectSysError(client.Read(), 4001);
  EXPECT_TRUE(client.WaitClosed());
}

TEST_F(BridgeServerFixture, HandshakeTimeoutClosesConnection) {
  StartServer([](bridge::AppConfig& config) { config.handshake_timeout_seconds = 1; });
  WsClient client(WsPort());
  ExpectSysError(client.Read(3s), 4001);
  EXPECT_TRUE(client.WaitClosed());
}

TEST_F(BridgeServerFixture, PingIsAnsweredWithPong) {
  StartServer();
  WsClient client(WsPort());
  ASSERT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");
  client.SendPacket("sys.ping", nullptr, "ping-7");
  auto pong = client.ReadOp("sys.pong");
  ASSERT_TRUE(pong.has_value());
  EXPECT_EQ((*pong)["id"], "ping-7");
}

TEST_F(BridgeServerFixture, MalformedPacketsAreReportedThenConnectionClosed) {
  StartServer([](bridge::AppConfig& config) { config.max_protocol_violations = 2; });
  WsClient client(WsPort());
  ASSERT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");

  client.SendRaw("{not json");
  ExpectSysError(client.ReadOp("sys.error"), 4003);
  client.SendRaw(R"({"op":"sys.ping","id":"m-1"})");
  auto missing_ts = client.ReadOp("sys.error");
  ExpectSysError(missing_ts, 4003);
  EXPECT_EQ((*missing_ts)["id"], "m-1");

  client.SendRaw("[]");
  ExpectSysError(client.ReadOp("sys.error"), 4003);
  EXPECT_TRUE(client.WaitClosed());
  EXPECT_EQ(client.CloseReason().code, boost::beast::websocket::close_code::policy_error);
}

TEST_F(BridgeServerFixture, UnknownOpKeepsConnectionOpen) {
  StartServer();
  WsClient client(WsPort());
  ASSERT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");
  client.SendPacket("custom.op", nlohmann::json::object(), "u-1");
  ExpectSysError(client.ReadOp("sys.error"), 4003);
  client.SendPacket("sys.ping", nullptr, "ping-1");
  EXPECT_TRUE(client.ReadOp("sys.pong").has_value());
}

TEST_F(BridgeServerFixture, NewClientKicksOldestWhenFull) {
  StartServer([](bridge::AppConfig& config) { config.max_connections = 1; });
  WsClient first(WsPort());
  ASSERT_EQ(first.Handshake("a")["op"], "sys.handshake_ack");
  ASSERT_TRUE(first.ReadOp("state.ready").has_value());

  WsClient second(WsPort());
  ASSERT_EQ(second.Handshake("b")["op"], "sys.handshake_ack");
  ExpectSysError(first.ReadOp("sys.error"), 4004);
  EXPECT_TRUE(first.WaitClosed());

  auto sessions = app_->GetSessionManager()->Snapshot();
  ASSERT_EQ(sessions.size(), 1u);
  EXPECT_EQ(sessions[0].identity.client_id, "b");
}

TEST_F(BridgeServerFixture, FullServerRejectsWithoutKickOld) {
  StartServer([](bridge::AppConfig& config) {
    config.max_connections = 1;
    config.kick_old = false;
  });
  WsClient first(WsPort());
  ASSERT_EQ(first.Handshake("a")["op"], "sys.handshake_ack");

  WsClient second(WsPort());
  auto reply = second.Handshake("b");
  EXPECT_EQ(reply["op"], "sys.error");
  EXPECT_EQ(reply["error"]["code"], 4004);
  EXPECT_TRUE(second.WaitClosed());

  first.SendPacket("sys.ping", nullptr, "still-alive");
  EXPECT_TRUE(first.ReadOp("sys.pong").has_value());
}

TEST_F(BridgeServerFixture, SilentClientIsClosedByHeartbeat) {
  StartServer([](bridge::AppConfig& config) {
    config.heartbeat_interval_seconds = 1;
    config.heartbeat_timeout_multiplier = 1;
  });
  WsClient client(WsPort());
  ASSERT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");
  EXPECT_TRUE(client.WaitClosed(6s));
  EXPECT_EQ(client.CloseReason().code, boost::beast::websocket::close_code::going_away);
}

TEST_F(BridgeServerFixture, InputMessageIsEchoedBack) {
  StartServer();
  WsClient client(WsPort());
  ASSERT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");
  client.SendPacket("input.message",
                    {{"content", {{{"type", "text"}, {"text", "你好"}}}}, {"metadata", {{"messageId", "m-9"}}}},
                    "in-1");
  auto show = client.ReadOp("perform.show");
  ASSERT_TRUE(show.has_value());
  EXPECT_EQ((*show)["id"], "in-1");
  const auto& payload = (*show)["payload"];
  EXPECT_TRUE(payload["interrupt"].get<bool>());
  EXPECT_EQ(payload["sequence"][0]["type"], "text");
  EXPECT_EQ(payload["sequence"][0]["content"], "收到了消息：你好");
}

TEST_F(BridgeServerFixture, InputMessageWithoutContentIsRejected) {
  StartServer();
  WsClient client(WsPort());
  ASSERT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");
  client.SendPacket("input.message", {{"text", "hi"}}, "in-2");
  auto error = client.ReadOp("sys.error");
  ExpectSysError(error, 4003);
  EXPECT_EQ((*error)["id"], "in-2");
}

TEST_F(BridgeServerFixture, StateReportsUpdateSession) {
  StartServer();
  WsClient client(WsPort());
  ASSERT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");
  client.SendPacket("state.playing", {{"isPlaying", true}}, "s-1");
  client.SendPacket("state.config", {{"volume", 0.3}}, "s-2");
  client.SendPacket("sys.ping", nullptr, "sync");
  ASSERT_TRUE(client.ReadOp("sys.pong").has_value());

  auto info = app_->GetSessionManager()->Describe("pc");
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->playing);
  EXPECT_EQ(info->client_config["volume"], 0.3);
}

TEST_F(BridgeServerFixture, DesktopQueryRoundTripsThroughClient) {
  StartServer();
  WsClient client(WsPort());
  ASSERT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");
  ASSERT_TRUE(client.ReadOp("state.ready").has_value());

  bridge::OpError error;
  auto future = app_->GetService()->QueryDesktop("pc", "desktop.window.list", nullptr, 3000ms, error);
  ASSERT_TRUE(future.has_value()) << error.message;

  auto request = client.ReadOp("desktop.window.list");
  ASSERT_TRUE(request.has_value());
  client.SendPacket("desktop.window.list", {{"windows", {{{"title", "Editor"}}}}}, (*request)["id"].get<std::string>());

  ASSERT_EQ(future->wait_for(3s), std::future_status::ready);
  auto result = future->get();
  EXPECT_EQ(result.status, bridge::CorrelationStatus::kOk);
  ASSERT_TRUE(result.reply.has_value());
  EXPECT_EQ(result.reply->PayloadOrEmpty()["windows"][0]["title"], "Editor");
}

TEST_F(BridgeServerFixture, DesktopQueryTimesOutWithoutReply) {
  StartServer();
  WsClient client(WsPort());
  ASSERT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");

  bridge::OpError error;
  auto future = app_->GetService()->QueryDesktop("pc", "desktop.window.active", nullptr, 200ms, error);
  ASSERT_TRUE(future.has_value()) << error.message;
  ASSERT_EQ(future->wait_for(3s), std::future_status::ready);
  EXPECT_EQ(future->get().status, bridge::CorrelationStatus::kTimeout);
}

TEST_F(BridgeServerFixture, DisconnectCancelsPendingDesktopQuery) {
  StartServer();
  WsClient client(WsPort());
  ASSERT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");
  ASSERT_TRUE(client.ReadOp("state.ready").has_value());

  bridge::OpError error;
  auto future = app_->GetService()->QueryDesktop("pc", "desktop.capture.screenshot", nullptr, 30s, error);
  ASSERT_TRUE(future.has_value()) << error.message;
  ASSERT_TRUE(client.ReadOp("desktop.capture.screenshot").has_value());

  EXPECT_TRUE(client.Close());
  ASSERT_EQ(future->wait_for(5s), std::future_status::ready);
  auto result = future->get();
  EXPECT_EQ(result.status, bridge::CorrelationStatus::kCancelled);
  EXPECT_FALSE(result.reply.has_value());

  EXPECT_FALSE(app_->GetService()->QueryDesktop("pc", "desktop.window.list", nullptr, 1s, error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kSessionNotFound);
}

TEST_F(BridgeServerFixture, ServiceStreamsSentencesToClient) {
  StartServer([](bridge::AppConfig& config) { config.auto_emotion = false; });
  WsClient client(WsPort());
  ASSERT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");

  bridge::OpError error;
  auto stream = app_->GetService()->OpenStream("live2d_user_pc", app_->GetService()->DefaultOptions(), error);
  ASSERT_NE(stream, nullptr) << error.message;
  stream->PushText("第一句。第二");
  stream->PushText("句。");
  stream->Finish();

  auto first = client.ReadOp("perform.show");
  auto second = client.ReadOp("perform.show");
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_FALSE((*first)["payload"]["interrupt"].get<bool>());
  EXPECT_EQ((*first)["payload"]["sequence"][0]["content"], "第一句。");
  EXPECT_EQ((*second)["payload"]["sequence"][0]["content"], "第二句。");
}

TEST_F(BridgeServerFixture, PlainHttpOnWebSocketPortIsRejected) {
  StartServer();
  auto wrong_path = bridge_test::HttpRequest(WsPort(), boost::beast::http::verb::get, "/nope");
  EXPECT_EQ(wrong_path.status, boost::beast::http::status::not_found);
  EXPECT_EQ(wrong_path.body["error"]["code"], "not_found");

  auto no_upgrade = bridge_test::HttpRequest(WsPort(), boost::beast::http::verb::get, "/astrbot/live2d");
  EXPECT_EQ(no_upgrade.status, boost::beast::http::status::upgrade_required);
  EXPECT_FALSE(no_upgrade.body["success"].get<bool>());
}

TEST_F(BridgeServerFixture, AlternateWebSocketPathIsAccepted) {
  StartServer();
  WsClient client(WsPort(), "/ws?v=1");
  EXPECT_EQ(client.Handshake("pc")["op"], "sys.handshake_ack");
}

#include <thread>

#include <gtest/gtest.h>

#include "bridge/session_manager.hpp"
#include "fake_connection.hpp"

namespace {

bridge::HandshakeRequest Handshake(const std::string& client_id) {
  bridge::HandshakeRequest request;
  request.client_id = client_id;
  request.version = "1.0.0";
  return request;
}

bool AdmitClient(bridge::SessionManager& manager, const std::string& client_id,
                 const std::shared_ptr<bridge_test::FakeConnection>& connection, bridge::OpError& error) {
  return manager.Admit(bridge::IdentityForClient(client_id), Handshake(client_id), connection, error);
}

}  // namespace

TEST(HandshakeValidationTest, AcceptsValidHandshake) {
  bridge::OpError error;
  auto request = bridge::ValidateHandshake(
      {{"version", "1.2.0"}, {"token", "secret"}, {"clientId", "desk-1"}, {"capabilities", {"perform.show"}}}, "secret",
      error);
  ASSERT_TRUE(request.has_value()) << error.message;
  EXPECT_EQ(request->client_id, "desk-1");
  EXPECT_EQ(request->capabilities, std::vector<std::string>{"perform.show"});
}

TEST(HandshakeValidationTest, RejectsWrongVersionBeforeToken) {
  bridge::OpError error;
  EXPECT_FALSE(bridge::ValidateHandshake({{"version", "2.0.0"}, {"token", "wrong"}}, "secret", error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kVersionMismatch);
}

TEST(HandshakeValidationTest, RejectsWrongToken) {
  bridge::OpError error;
  EXPECT_FALSE(bridge::ValidateHandshake({{"version", "1.0.0"}, {"token", "nope"}}, "secret", error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kAuthFailed);
}

TEST(HandshakeValidationTest, GeneratesClientIdWhenMissing) {
  bridge::OpError error;
  auto request = bridge::ValidateHandshake({{"version", "1.0.0"}, {"token", "secret"}}, "secret", error);
  ASSERT_TRUE(request.has_value());
  EXPECT_FALSE(request->client_id.empty());
}

TEST(SessionIdentityTest, DerivesStableIdsFromClientId) {
  auto identity = bridge::IdentityForClient("abc");
  EXPECT_EQ(identity.session_id, "live2d_session_abc");
  EXPECT_EQ(identity.user_id, "live2d_user_abc");
  EXPECT_EQ(bridge::IdentityForClient("abc").session_id, identity.session_id);
}

TEST(SessionManagerTest, KickOldReplacesOldestSession) {
  bridge::SessionManager manager({1, true});
  auto first = std::make_shared<bridge_test::FakeConnection>();
  auto second = std::make_shared<bridge_test::FakeConnection>();
  bridge::OpError error;
  ASSERT_TRUE(AdmitClient(manager, "a", first, error));
  ASSERT_TRUE(AdmitClient(manager, "b", second, error));
  EXPECT_TRUE(first->kicked);
  EXPECT_FALSE(second->kicked);
  EXPECT_EQ(manager.ActiveCount(), 1u);
  EXPECT_EQ(manager.Find("live2d_session_b"), second);
  EXPECT_EQ(manager.Find("live2d_session_a"), nullptr);
}

TEST(SessionManagerTest, RejectsWhenFullWithoutKickOld) {
  bridge::SessionManager manager({1, false});
  auto first = std::make_shared<bridge_test::FakeConnection>();
  auto second = std::make_shared<bridge_test::FakeConnection>();
  bridge::OpError error;
  ASSERT_TRUE(AdmitClient(manager, "a", first, error));
  EXPECT_FALSE(AdmitClient(manager, "b", second, error));
  EXPECT_EQ(error.code, bridge::ErrorCode::kConnectionFull);
  EXPECT_FALSE(first->kicked);
  EXPECT_EQ(manager.ActiveCount(), 1u);
}

TEST(SessionManagerTest, SameClientReconnectReplacesEvenWhenFull) {
  bridge::SessionManager manager({1, false});
  auto first = std::make_shared<bridge_test::FakeConnection>();
  auto again = std::make_shared<bridge_test::FakeConnection>();
  bridge::OpError error;
  ASSERT_TRUE(AdmitClient(manager, "a", first, error));
  ASSERT_TRUE(AdmitClient(manager, "a", again, error));
  EXPECT_TRUE(first->kicked);
  EXPECT_EQ(manager.Find("a"), again);
}

TEST(SessionManagerTest, StaleRemoveDoesNotDropReplacement) {
  bridge::SessionManager manager({2, true});
  auto first = std::make_shared<bridge_test::FakeConnection>();
  auto again = std::make_shared<bridge_test::FakeConnection>();
  bridge::OpError error;
  ASSERT_TRUE(AdmitClient(manager, "a", first, error));
  ASSERT_TRUE(AdmitClient(manager, "a", again, error));
  manager.Remove("live2d_session_a", first.get());
  EXPECT_EQ(manager.Find("live2d_session_a"), again);
  manager.Remove("live2d_session_a", again.get());
  EXPECT_EQ(manager.ActiveCount(), 0u);
}

TEST(SessionManagerTest, LooksUpBySessionUserOrClientId) {
  bridge::SessionManager manager({3, true});
  auto connection = std::make_shared<bridge_test::FakeConnection>();
  bridge::OpError error;
  ASSERT_TRUE(AdmitClient(manager, "pc", connection, error));
  EXPECT_EQ(manager.Find("live2d_session_pc"), connection);
  EXPECT_EQ(manager.Find("live2d_user_pc"), connection);
  EXPECT_EQ(manager.Find("pc"), connection);
  EXPECT_EQ(manager.Find("other"), nullptr);
}

TEST(SessionManagerTest, TracksClientState) {
  bridge::SessionManager manager({3, true});
  auto connection = std::make_shared<bridge_test::FakeConnection>();
  bridge::OpError error;
  ASSERT_TRUE(AdmitClient(manager, "pc", connection, error));
  const std::string sid = "live2d_session_pc";
  manager.MarkReady(sid, {"perform.show"});
  manager.SetPlaying(sid, true);
  manager.SetClientConfig(sid, {{"volume", 0.5}});
  manager.SetClientConfig(sid, {{"lang", "zh"}});
  manager.SetModelInfo(sid, {{"name", "Hiyori"}});
  auto info = manager.Describe(sid);
  ASSERT_TRUE(info.has_value());
  EXPECT_TRUE(info->ready);
  EXPECT_TRUE(info->playing);
  EXPECT_EQ(info->capabilities, std::vector<std::string>{"perform.show"});
  EXPECT_EQ(info->client_config["volume"], 0.5);
  EXPECT_EQ(info->client_config["lang"], "zh");
  EXPECT_EQ(info->model_info["name"], "Hiyori");
}

TEST(SessionManagerTest, SnapshotIsOrderedByConnectTime) {
  bridge::SessionManager manager({0, true});
  bridge::OpError error;
  std::vector<std::shared_ptr<bridge_test::FakeConnection>> connections;
  for (const char* id : {"x", "y", "z"}) {
    connections.push_back(std::make_shared<bridge_test::FakeConnection>());
    ASSERT_TRUE(AdmitClient(manager, id, connections.back(), error));
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  auto snapshot = manager.Snapshot();
  ASSERT_EQ(snapshot.size(), 3u);
  EXPECT_EQ(snapshot[0].identity.client_id, "x");
  EXPECT_EQ(snapshot[2].identity.client_id, "z");
}

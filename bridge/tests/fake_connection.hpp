#pragma once

#include <future>
#include <string>
#include <vector>

#include "bridge/session_manager.hpp"

namespace bridge_test {

// 보낸 패킷과 종료 요청을 기록하는 연결. 요청에는 즉시 같은 op의 응답을 돌려준다.
class FakeConnection : public bridge::BridgeConnection {
 public:
  void SendPacket(bridge::Packet packet) override { sent.push_back(std::move(packet)); }

  void Kick(std::string reason) override {
    kicked = true;
    kick_reason = std::move(reason);
  }

  std::optional<std::future<bridge::CorrelationResult>> SendRequest(bridge::Packet packet,
                                                                    std::chrono::milliseconds timeout,
                                                                    bridge::OpError& error) override {
    if (reject_requests) {
      error = {bridge::ErrorCode::kSessionNotFound, "not active"};
      return std::nullopt;
    }
    last_timeout = timeout;
    requests.push_back(packet);
    bridge::CorrelationResult result;
    result.id = packet.id;
    result.reply = bridge::MakePacket(packet.op, nlohmann::json{{"ok", true}}, packet.id);
    std::promise<bridge::CorrelationResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
  }

  std::size_t PendingRequests() const override { return 0; }

  std::vector<bridge::Packet> sent;
  std::vector<bridge::Packet> requests;
  std::chrono::milliseconds last_timeout{0};
  bool kicked{false};
  bool reject_requests{false};
  std::string kick_reason;
};

}  // namespace bridge_test

/*
 * 설명: 핸드셰이크 검증, clientId 기반 세션/사용자 ID 할당, 동시 연결 수 정책(kick_old)과 세션 상태를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/session_manager_test.cpp, bridge/tests/e2e/handshake_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "bridge/observability.hpp"
#include "bridge/protocol.hpp"
#include "bridge/quota.hpp"
#include "bridge/request_correlator.hpp"

namespace bridge {

struct SessionIdentity {
  std::string client_id;
  std::string session_id;
  std::string user_id;
};

SessionIdentity IdentityForClient(const std::string& client_id);

struct HandshakeRequest {
  std::string client_id;
  std::string version;
  std::vector<std::string> capabilities;
  std::string client_name;
};

// 버전은 1.x만 허용(4002), 토큰은 상수 시간 비교(4001).
std::optional<HandshakeRequest> ValidateHandshake(const nlohmann::json& payload, const std::string& expected_token,
                                                  OpError& error);

// 세션 관리자가 연결 구현(WebSocket 등)에 요구하는 최소 인터페이스
class BridgeConnection {
 public:
  virtual ~BridgeConnection() = default;
  virtual void SendPacket(Packet packet) = 0;
  // 오류를 가능한 한 알리고 연결을 닫는다.
  virtual void Kick(std::string reason) = 0;
  virtual std::optional<std::future<CorrelationResult>> SendRequest(Packet packet, std::chrono::milliseconds timeout,
                                                                    OpError& error) = 0;
  virtual std::size_t PendingRequests() const = 0;
};

struct SessionLimits {
  std::size_t max_connections{1};
  bool kick_old{true};
};

struct SessionInfo {
  SessionIdentity identity;
  std::string client_version;
  std::string client_name;
  std::vector<std::string> capabilities;
  SystemClock::time_point created_at{};
  SystemClock::time_point last_seen_at{};
  bool ready{false};
  bool playing{false};
  nlohmann::json client_config = nlohmann::json::object();
  nlohmann::json model_info = nlohmann::json::object();
  std::size_t pending_requests{0};
};

class SessionManager {
 public:
  SessionManager(SessionLimits limits, std::shared_ptr<Observability> observability = nullptr);

  // 같은 세션 ID의 기존 연결은 항상 교체한다. 용량 초과 시 kick_old면 가장 오래된 세션을 닫고, 아니면 4004.
  bool Admit(const SessionIdentity& identity, const HandshakeRequest& handshake,
             const std::shared_ptr<BridgeConnection>& connection, OpError& error);
  // 등록된 연결이 connection과 같을 때만 제거한다(교체된 연결의 뒤늦은 정리 무시).
  void Remove(const std::string& session_id, const BridgeConnection* connection);

  void Touch(const std::string& session_id);
  void MarkReady(const std::string& session_id, const std::vector<std::string>& capabilities);
  void SetPlaying(const std::string& session_id, bool playing);
  void SetClientConfig(const std::string& session_id, const nlohmann::json& config);
  void SetModelInfo(const std::string& session_id, const nlohmann::json& model);

  // target은 세션 ID, 사용자 ID, clientId 중 하나
  std::shared_ptr<BridgeConnection> Find(const std::string& target) const;
  std::optional<SessionInfo> Describe(const std::string& target) const;
  std::vector<SessionInfo> Snapshot() const;
  std::size_t ActiveCount() const;

 private:
  struct Entry {
    SessionInfo info;
    std::weak_ptr<BridgeConnection> connection;
    const BridgeConnection* raw{nullptr};
  };

  const Entry* FindLocked(const std::string& target) const;
  SessionInfo InfoLocked(const Entry& entry) const;

  SessionLimits limits_;
  std::shared_ptr<Observability> observability_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> sessions_;
};

}  // namespace bridge

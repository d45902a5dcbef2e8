/*
 * 설명: WebSocket 연결 하나의 상태 머신(핸드셰이크, 하트비트, 패킷 분배, 송신 큐/백프레셔, 요청 상관관계)을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/e2e/handshake_flow_test.cpp, bridge/tests/e2e/resource_transfer_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "bridge/bridge_service.hpp"
#include "bridge/config.hpp"
#include "bridge/input_converter.hpp"
#include "bridge/observability.hpp"
#include "bridge/packet_codec.hpp"
#include "bridge/request_correlator.hpp"
#include "bridge/resource_ops.hpp"
#include "bridge/resource_store.hpp"
#include "bridge/session_manager.hpp"

namespace bridge {

// 모든 연결이 공유하는 협력 객체. config.auth_token은 시작 시 확정된 값이어야 한다.
struct ConnectionContext {
  AppConfig config;
  std::shared_ptr<Observability> observability;
  std::shared_ptr<SessionManager> sessions;
  std::shared_ptr<BridgeService> service;
  std::shared_ptr<ResourceStore> resource_store;
  std::shared_ptr<ResourceOpHandler> resource_ops;
  std::shared_ptr<const InputConverter> input_converter;
};

enum class ConnectionState { kConnecting, kAuthenticating, kActive, kClosing, kClosed };

std::string_view ToString(ConnectionState state);

class WebSocketSession : public BridgeConnection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                   std::shared_ptr<const ConnectionContext> context);
  ~WebSocketSession() override;

  void Run();

  // BridgeConnection. 어느 스레드에서 호출해도 연결의 strand로 넘겨 처리한다.
  void SendPacket(Packet packet) override;
  void Kick(std::string reason) override;
  std::optional<std::future<CorrelationResult>> SendRequest(Packet packet, std::chrono::milliseconds timeout,
                                                            OpError& error) override;
  std::size_t PendingRequests() const override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleFrame(std::string_view frame);
  void HandleHandshake(const Packet& packet);
  void HandlePacket(const Packet& packet);
  void HandleInputMessage(const Packet& packet);
  void HandleInputEvent(const Packet& packet);
  void HandleState(const Packet& packet);
  void HandleProtocolViolation(const DecodeError& error);

  void StartHandshakeTimer();
  void StartHeartbeat();
  void OnHeartbeat();

  void EnqueuePacket(const Packet& packet);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  void TriggerBackpressureClose();

  // 오류 패킷을 먼저 보낸 뒤 큐가 비면 닫는다.
  void CloseWithError(ErrorCode code, const std::string& message, const std::string& id, std::string_view reason);
  void BeginClose(boost::beast::websocket::close_code code, std::string_view reason);
  void DoClose();
  void Finalize(std::string_view cause);

  LogContext MakeLog(LogLevel level, std::string name, std::string message) const;
  bool IdleLongerThan(std::chrono::steady_clock::duration limit) const;

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<const ConnectionContext> context_;
  PacketCodec codec_;
  std::shared_ptr<RequestCorrelator> correlator_;
  boost::asio::steady_timer handshake_timer_;
  boost::asio::steady_timer heartbeat_timer_;
  std::atomic<ConnectionState> state_{ConnectionState::kConnecting};
  std::optional<SessionIdentity> identity_;
  std::string trace_id_;
  std::chrono::steady_clock::time_point last_seen_;
  std::size_t violations_{0};

  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool close_after_drain_{false};
  bool close_started_{false};
  bool finalized_{false};
  boost::beast::websocket::close_reason close_reason_;
};

}  // namespace bridge

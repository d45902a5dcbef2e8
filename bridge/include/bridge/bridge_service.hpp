/*
 * 설명: 호스트 프레임워크와의 경계. 수신 메시지를 싱크로 넘기고, 세션/사용자 ID로 연출 시퀀스 전송,
 *       스트리밍 응답, 연출 중단, 데스크톱 질의, 상태 조회를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/bridge_service_test.cpp, bridge/tests/e2e/handshake_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bridge/message.hpp"
#include "bridge/observability.hpp"
#include "bridge/output_converter.hpp"
#include "bridge/performance.hpp"
#include "bridge/protocol.hpp"
#include "bridge/request_correlator.hpp"
#include "bridge/session_manager.hpp"

namespace bridge {

struct InboundEnvelope {
  SessionIdentity identity;
  // metadata.messageId가 있으면 그 값, 없으면 패킷 id
  std::string message_id;
  std::string packet_id;
  std::int64_t timestamp{0};
  // input.message | input.touch | input.shortcut
  std::string kind;
  std::string plain_text;
  nlohmann::json metadata = nlohmann::json::object();
  CanonicalMessage message;
  bool truncated{false};
};

class InboundSink {
 public:
  virtual ~InboundSink() = default;
  // 연결의 수신 처리 흐름에서 호출되므로 오래 막으면 안 된다.
  virtual void OnInbound(const InboundEnvelope& envelope) = 0;
};

// 스트리밍 응답 하나. 문장 단위로 interrupt:false perform.show를 보내고 Finish에서 남은 내용을 보낸다.
// 스트리밍이 꺼진 배포에서는 모두 모았다가 Finish에서 interrupt:true 한 번으로 보낸다.
class ReplyStream {
 public:
  ReplyStream(std::shared_ptr<BridgeConnection> connection, std::shared_ptr<const OutputConverter> converter,
              OutputOptions options, bool streaming, std::shared_ptr<Observability> observability);

  void Push(const CanonicalMessage& chunk);
  void PushText(std::string_view text);
  void Finish();

  bool Finished() const { return assembler_.Finished() || buffered_finished_; }
  std::size_t PacketsSent() const { return packets_sent_; }

 private:
  void SendAll(const std::vector<PerformanceSequence>& sequences);

  std::shared_ptr<BridgeConnection> connection_;
  std::shared_ptr<const OutputConverter> converter_;
  OutputOptions options_;
  bool streaming_;
  std::shared_ptr<Observability> observability_;
  StreamAssembler assembler_;
  CanonicalMessage buffered_;
  bool buffered_finished_{false};
  std::size_t packets_sent_{0};
};

class BridgeService {
 public:
  BridgeService(std::shared_ptr<SessionManager> sessions, std::shared_ptr<const OutputConverter> converter,
                OutputOptions default_options, bool streaming, std::chrono::milliseconds request_timeout,
                std::shared_ptr<Observability> observability = nullptr);

  void SetInboundSink(std::shared_ptr<InboundSink> sink);
  void Deliver(const InboundEnvelope& envelope) const;

  const OutputOptions& DefaultOptions() const { return default_options_; }

  // target은 세션 ID 또는 사용자 ID. 변환 경고는 로그로 남기고 나머지 요소는 그대로 보낸다.
  bool Send(const std::string& target, const CanonicalMessage& message, const OutputOptions& options,
            OpError& error, const std::string& reply_id = {}) const;
  bool SendSequence(const std::string& target, const PerformanceSequence& sequence, OpError& error,
                    const std::string& reply_id = {}) const;
  std::unique_ptr<ReplyStream> OpenStream(const std::string& target, const OutputOptions& options,
                                          OpError& error) const;
  bool Interrupt(const std::string& target, OpError& error) const;

  // query_op은 desktop.* 중 하나. timeout이 0이면 기본 요청 타임아웃을 쓴다.
  std::optional<std::future<CorrelationResult>> QueryDesktop(const std::string& target, const std::string& query_op,
                                                             const nlohmann::json& payload,
                                                             std::chrono::milliseconds timeout,
                                                             OpError& error) const;

  nlohmann::json Status() const;

 private:
  std::shared_ptr<BridgeConnection> Resolve(const std::string& target, OpError& error) const;

  std::shared_ptr<SessionManager> sessions_;
  std::shared_ptr<const OutputConverter> converter_;
  OutputOptions default_options_;
  bool streaming_;
  std::chrono::milliseconds request_timeout_;
  std::shared_ptr<Observability> observability_;
  mutable std::mutex sink_mutex_;
  std::shared_ptr<InboundSink> sink_;
};

// 호스트가 연결되지 않은 단독 실행용. input.message에 "收到了消息：<text>" 텍스트로 답한다.
class EchoInboundSink : public InboundSink {
 public:
  explicit EchoInboundSink(std::weak_ptr<BridgeService> service,
                           std::shared_ptr<Observability> observability = nullptr);
  void OnInbound(const InboundEnvelope& envelope) override;

 private:
  std::weak_ptr<BridgeService> service_;
  std::shared_ptr<Observability> observability_;
};

nlohmann::json ToJson(const SessionInfo& info);

}  // namespace bridge

/*
 * 설명: 호스트 경계(수신 싱크 전달, 연출 전송, 스트리밍 응답, 데스크톱 질의, 상태 조회)를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/bridge_service_test.cpp, bridge/tests/e2e/handshake_flow_test.cpp
 */
#include "bridge/bridge_service.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace bridge {

namespace {
std::string ToIsoString(SystemClock::time_point tp) {
  auto tt = SystemClock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

Packet ShowPacket(const PerformanceSequence& sequence, const std::string& id = {}) {
  return MakePacket(op::kPerformShow, ToJson(sequence), id);
}
}  // namespace

nlohmann::json ToJson(const SessionInfo& info) {
  return {{"sessionId", info.identity.session_id},
          {"userId", info.identity.user_id},
          {"clientId", info.identity.client_id},
          {"clientName", info.client_name},
          {"clientVersion", info.client_version},
          {"capabilities", info.capabilities},
          {"connectedAt", ToIsoString(info.created_at)},
          {"lastSeenAt", ToIsoString(info.last_seen_at)},
          {"ready", info.ready},
          {"playing", info.playing},
          {"clientConfig", info.client_config},
          {"model", info.model_info},
          {"pendingRequests", info.pending_requests}};
}

ReplyStream::ReplyStream(std::shared_ptr<BridgeConnection> connection, std::shared_ptr<const OutputConverter> converter,
                         OutputOptions options, bool streaming, std::shared_ptr<Observability> observability)
    : connection_(std::move(connection)), converter_(std::move(converter)), options_(std::move(options)),
      streaming_(streaming), observability_(std::move(observability)), assembler_(converter_, options_) {}

void ReplyStream::Push(const CanonicalMessage& chunk) {
  if (Finished()) {
    return;
  }
  if (!streaming_) {
    buffered_.elements.insert(buffered_.elements.end(), chunk.elements.begin(), chunk.elements.end());
    return;
  }
  SendAll(assembler_.Push(chunk));
}

void ReplyStream::PushText(std::string_view text) {
  if (Finished()) {
    return;
  }
  if (!streaming_) {
    buffered_.elements.push_back(TextElement{std::string(text)});
    return;
  }
  SendAll(assembler_.PushText(text));
}

void ReplyStream::Finish() {
  if (Finished()) {
    return;
  }
  if (streaming_) {
    SendAll(assembler_.Finish());
    for (const auto& issue : assembler_.Issues()) {
      if (observability_) {
        observability_->Warn("stream_conversion_issue", issue.message, {{"code", ToInt(issue.code)}});
      }
    }
    return;
  }
  buffered_finished_ = true;
  auto conversion = converter_->Convert(buffered_, options_);
  for (const auto& issue : conversion.issues) {
    if (observability_) {
      observability_->Warn("output_conversion_issue", issue.message, {{"code", ToInt(issue.code)}});
    }
  }
  if (!conversion.sequence.elements.empty()) {
    SendAll({conversion.sequence});
  }
}

void ReplyStream::SendAll(const std::vector<PerformanceSequence>& sequences) {
  for (const auto& sequence : sequences) {
    if (sequence.elements.empty()) {
      continue;
    }
    connection_->SendPacket(ShowPacket(sequence));
    ++packets_sent_;
  }
}

BridgeService::BridgeService(std::shared_ptr<SessionManager> sessions, std::shared_ptr<const OutputConverter> converter,
                             OutputOptions default_options, bool streaming, std::chrono::milliseconds request_timeout,
                             std::shared_ptr<Observability> observability)
    : sessions_(std::move(sessions)), converter_(std::move(converter)), default_options_(std::move(default_options)),
      streaming_(streaming), request_timeout_(request_timeout), observability_(std::move(observability)) {}

void BridgeService::SetInboundSink(std::shared_ptr<InboundSink> sink) {
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ = std::move(sink);
}

void BridgeService::Deliver(const InboundEnvelope& envelope) const {
  std::shared_ptr<InboundSink> sink;
  {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink = sink_;
  }
  if (!sink) {
    if (observability_) {
      observability_->Warn("inbound_dropped", "수신 싱크가 없어 메시지를 버립니다",
                           {{"sessionId", envelope.identity.session_id}, {"kind", envelope.kind}});
    }
    return;
  }
  sink->OnInbound(envelope);
}

std::shared_ptr<BridgeConnection> BridgeService::Resolve(const std::string& target, OpError& error) const {
  auto connection = sessions_->Find(target);
  if (!connection) {
    error = {ErrorCode::kSessionNotFound, "세션을 찾을 수 없습니다: " + target};
  }
  return connection;
}

bool BridgeService::Send(const std::string& target, const CanonicalMessage& message, const OutputOptions& options,
                         OpError& error, const std::string& reply_id) const {
  auto connection = Resolve(target, error);
  if (!connection) {
    return false;
  }
  auto conversion = converter_->Convert(message, options);
  for (const auto& issue : conversion.issues) {
    if (observability_) {
      observability_->Warn("output_conversion_issue", issue.message, {{"code", ToInt(issue.code)}, {"target", target}});
    }
  }
  if (conversion.sequence.elements.empty()) {
    error = {ErrorCode::kPerformFailed, "보낼 연출 요소가 없습니다"};
    return false;
  }
  connection->SendPacket(ShowPacket(conversion.sequence, reply_id));
  return true;
}

bool BridgeService::SendSequence(const std::string& target, const PerformanceSequence& sequence, OpError& error,
                                 const std::string& reply_id) const {
  auto connection = Resolve(target, error);
  if (!connection) {
    return false;
  }
  connection->SendPacket(ShowPacket(sequence, reply_id));
  return true;
}

std::unique_ptr<ReplyStream> BridgeService::OpenStream(const std::string& target, const OutputOptions& options,
                                                       OpError& error) const {
  auto connection = Resolve(target, error);
  if (!connection) {
    return nullptr;
  }
  return std::make_unique<ReplyStream>(std::move(connection), converter_, options, streaming_, observability_);
}

bool BridgeService::Interrupt(const std::string& target, OpError& error) const {
  auto connection = Resolve(target, error);
  if (!connection) {
    return false;
  }
  connection->SendPacket(MakePerformInterrupt());
  return true;
}

std::optional<std::future<CorrelationResult>> BridgeService::QueryDesktop(const std::string& target,
                                                                          const std::string& query_op,
                                                                          const nlohmann::json& payload,
                                                                          std::chrono::milliseconds timeout,
                                                                          OpError& error) const {
  if (query_op != op::kDesktopWindowList && query_op != op::kDesktopWindowActive &&
      query_op != op::kDesktopCaptureScreenshot) {
    error = {ErrorCode::kInvalidPayload, "지원하지 않는 데스크톱 질의입니다: " + query_op};
    return std::nullopt;
  }
  auto connection = Resolve(target, error);
  if (!connection) {
    return std::nullopt;
  }
  auto effective = timeout.count() > 0 ? timeout : request_timeout_;
  std::optional<nlohmann::json> body;
  if (!payload.is_null()) {
    body = payload;
  }
  return connection->SendRequest(MakePacket(query_op, std::move(body)), effective, error);
}

nlohmann::json BridgeService::Status() const {
  nlohmann::json sessions = nlohmann::json::array();
  for (const auto& info : sessions_->Snapshot()) {
    sessions.push_back(ToJson(info));
  }
  nlohmann::json status{{"activeSessions", sessions.size()}, {"sessions", sessions}, {"streaming", streaming_}};
  if (observability_) {
    auto metrics = observability_->Snapshot();
    status["metrics"] = {{"requests", {{"total", metrics.request_total}, {"errors", metrics.request_errors}}},
                         {"websocketActive", metrics.websocket_active},
                         {"packetsIn", metrics.packets_in},
                         {"packetsOut", metrics.packets_out},
                         {"protocolErrors", metrics.protocol_errors}};
  }
  return status;
}

EchoInboundSink::EchoInboundSink(std::weak_ptr<BridgeService> service, std::shared_ptr<Observability> observability)
    : service_(std::move(service)), observability_(std::move(observability)) {}

void EchoInboundSink::OnInbound(const InboundEnvelope& envelope) {
  if (envelope.kind != op::kInputMessage) {
    return;
  }
  auto service = service_.lock();
  if (!service) {
    return;
  }
  std::string text;
  for (const auto& element : envelope.message.elements) {
    if (const auto* t = std::get_if<TextElement>(&element)) {
      text += t->text;
    }
  }
  PerformanceSequence sequence;
  sequence.interrupt = true;
  sequence.elements.push_back(TextDisplay{"收到了消息：" + text, 3000});
  OpError error;
  if (!service->SendSequence(envelope.identity.session_id, sequence, error, envelope.packet_id) && observability_) {
    observability_->Warn("echo_failed", error.message, {{"sessionId", envelope.identity.session_id}});
  }
}

}  // namespace bridge

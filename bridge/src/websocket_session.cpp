/*
 * 설명: WebSocket 패킷을 읽어 핸드셰이크/하트비트/입력/리소스/상태 보고를 처리하고 송신 큐로 응답한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/e2e/handshake_flow_test.cpp, bridge/tests/e2e/resource_transfer_test.cpp
 */
#include "bridge/websocket_session.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace bridge {

namespace {
std::string MessageIdFrom(const nlohmann::json& metadata, const std::string& fallback) {
  auto it = metadata.find("messageId");
  if (it == metadata.end()) {
    return fallback;
  }
  if (it->is_string() && !it->get_ref<const std::string&>().empty()) {
    return it->get<std::string>();
  }
  if (it->is_number()) {
    return it->dump();
  }
  return fallback;
}
}  // namespace

std::string_view ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kAuthenticating:
      return "authenticating";
    case ConnectionState::kActive:
      return "active";
    case ConnectionState::kClosing:
      return "closing";
    case ConnectionState::kClosed:
      return "closed";
  }
  return "closed";
}

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   std::shared_ptr<const ConnectionContext> context)
    : ws_(std::move(ws)), context_(std::move(context)), codec_(context_->config.max_frame_bytes),
      correlator_(std::make_shared<RequestCorrelator>(ws_.get_executor())), handshake_timer_(ws_.get_executor()),
      heartbeat_timer_(ws_.get_executor()) {}

WebSocketSession::~WebSocketSession() { Finalize("released"); }

void WebSocketSession::Run() {
  state_ = ConnectionState::kAuthenticating;
  last_seen_ = std::chrono::steady_clock::now();
  trace_id_ = context_->observability->NextTraceId();
  context_->observability->WebsocketOpened();
  ws_.read_message_max(context_->config.max_frame_bytes * 2);
  context_->observability->Log(MakeLog(LogLevel::kInfo, "ws_connected", "WebSocket 연결 수립, 핸드셰이크 대기"));
  StartHandshakeTimer();
  DoRead();
}

void WebSocketSession::DoRead() {
  if (finalized_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::websocket::error::closed) {
    return Finalize("peer_closed");
  }
  if (ec) {
    return Finalize(ec.message());
  }

  last_seen_ = std::chrono::steady_clock::now();
  auto frame = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  if (identity_) {
    context_->sessions->Touch(identity_->session_id);
  }
  HandleFrame(frame);
  DoRead();
}

void WebSocketSession::HandleFrame(std::string_view frame) {
  auto state = state_.load();
  if (state != ConnectionState::kAuthenticating && state != ConnectionState::kActive) {
    return;
  }
  context_->observability->IncrementPacketsIn();
  DecodeError decode_error;
  auto packet = codec_.Decode(frame, decode_error);

  if (state == ConnectionState::kAuthenticating) {
    if (!packet) {
      context_->observability->IncrementProtocolErrors();
      return CloseWithError(decode_error.code, decode_error.message, decode_error.id, "invalid_handshake");
    }
    if (packet->op != op::kHandshake) {
      return CloseWithError(ErrorCode::kAuthFailed, "첫 패킷은 sys.handshake여야 합니다", packet->id,
                            "handshake_required");
    }
    return HandleHandshake(*packet);
  }

  if (!packet) {
    return HandleProtocolViolation(decode_error);
  }
  violations_ = 0;
  HandlePacket(*packet);
}

void WebSocketSession::HandleHandshake(const Packet& packet) {
  const auto& config = context_->config;
  OpError error;
  auto request = ValidateHandshake(packet.PayloadOrEmpty(), config.auth_token, error);
  if (!request) {
    auto log = MakeLog(LogLevel::kWarn, "handshake_rejected", error.message);
    log.fields = {{"code", ToInt(error.code)}};
    context_->observability->Log(log);
    return CloseWithError(error.code, error.message, packet.id,
                          error.code == ErrorCode::kVersionMismatch ? "version_mismatch" : "auth_failed");
  }

  auto identity = IdentityForClient(request->client_id);
  if (!context_->sessions->Admit(identity, *request, shared_from_this(), error)) {
    return CloseWithError(error.code, error.message, packet.id, "connection_full");
  }
  identity_ = identity;
  state_ = ConnectionState::kActive;
  handshake_timer_.cancel();

  HandshakeAckInfo info;
  info.session_id = identity.session_id;
  info.user_id = identity.user_id;
  info.features = DefaultServerFeatures();
  info.capabilities = DefaultServerCapabilities();
  info.config = {{"maxMessageLength", config.max_message_length},
                 {"maxInlineBytes", context_->resource_store->MaxInlineBytes()},
                 {"supportedImageFormats", InputConverter::SupportedImageFormats()},
                 {"supportedAudioFormats", InputConverter::SupportedAudioFormats()},
                 {"supportedVideoFormats", InputConverter::SupportedVideoFormats()},
                 {"resourceBaseUrl", context_->resource_store->BaseUrl()},
                 {"resourcePath", context_->resource_store->ResourcePath()},
                 {"heartbeatIntervalMs", config.heartbeat_interval_seconds * 1000}};
  EnqueuePacket(MakeHandshakeAck(packet.id, info));
  EnqueuePacket(MakePacket(op::kStateReady, nlohmann::json{{"clientId", identity.client_id}}));

  auto log = MakeLog(LogLevel::kInfo, "handshake_accepted", "핸드셰이크 성공, 세션을 할당했습니다");
  log.fields = {{"userId", identity.user_id}, {"clientVersion", request->version}};
  context_->observability->Log(log);
  StartHeartbeat();
}

void WebSocketSession::HandlePacket(const Packet& packet) {
  if (correlator_->Resolve(packet)) {
    return;
  }
  const auto& name = packet.op;
  if (name == op::kPing) {
    return EnqueuePacket(MakePacket(op::kPong, std::nullopt, packet.id));
  }
  if (name == op::kPong) {
    return;
  }
  if (name == op::kHandshake) {
    return EnqueuePacket(MakeErrorPacket(ErrorCode::kInvalidPayload, "이미 핸드셰이크가 완료된 연결입니다", packet.id));
  }
  if (name == op::kError) {
    auto log = MakeLog(LogLevel::kWarn, "client_error", packet.error ? packet.error->message : "");
    log.fields = {{"code", packet.error ? packet.error->code : 0}, {"id", packet.id}};
    context_->observability->Log(log);
    return;
  }
  if (name == op::kInputMessage) {
    return HandleInputMessage(packet);
  }
  if (name == op::kInputTouch || name == op::kInputShortcut) {
    return HandleInputEvent(packet);
  }
  if (name.rfind("resource.", 0) == 0) {
    auto reply = context_->resource_ops->Handle(packet);
    if (reply) {
      EnqueuePacket(*reply);
    }
    return;
  }
  if (name.rfind("state.", 0) == 0) {
    return HandleState(packet);
  }
  EnqueuePacket(MakeErrorPacket(ErrorCode::kInvalidPayload, "지원하지 않는 op입니다: " + name, packet.id));
}

void WebSocketSession::HandleInputMessage(const Packet& packet) {
  const auto& payload = packet.PayloadOrEmpty();
  auto content = payload.find("content");
  if (content == payload.end() || !content->is_array()) {
    return EnqueuePacket(MakeErrorPacket(ErrorCode::kInvalidPayload, "content 배열이 필요합니다", packet.id));
  }
  auto conversion = context_->input_converter->Convert(*content);
  for (const auto& issue : conversion.issues) {
    EnqueuePacket(MakeErrorPacket(issue.code, issue.message, packet.id));
  }
  if (conversion.message.elements.empty()) {
    if (conversion.issues.empty()) {
      EnqueuePacket(MakeErrorPacket(ErrorCode::kInvalidPayload, "빈 메시지입니다", packet.id));
    }
    return;
  }

  InboundEnvelope envelope;
  envelope.identity = *identity_;
  envelope.packet_id = packet.id;
  auto metadata = payload.find("metadata");
  if (metadata != payload.end() && metadata->is_object()) {
    envelope.metadata = *metadata;
  }
  envelope.message_id = MessageIdFrom(envelope.metadata, packet.id);
  envelope.timestamp = packet.ts;
  envelope.kind = packet.op;
  envelope.plain_text = std::move(conversion.plain_text);
  envelope.message = std::move(conversion.message);
  envelope.truncated = conversion.truncated;
  context_->service->Deliver(envelope);
}

void WebSocketSession::HandleInputEvent(const Packet& packet) {
  const auto& payload = packet.PayloadOrEmpty();
  OpError error;
  auto message = packet.op == op::kInputTouch ? context_->input_converter->ConvertTouch(payload, error)
                                              : context_->input_converter->ConvertShortcut(payload, error);
  if (!message) {
    return EnqueuePacket(MakeErrorPacket(error.code, error.message, packet.id));
  }
  InboundEnvelope envelope;
  envelope.identity = *identity_;
  envelope.packet_id = packet.id;
  envelope.message_id = packet.id;
  envelope.timestamp = packet.ts;
  envelope.kind = packet.op;
  envelope.plain_text = PlainText(*message);
  if (payload.is_object()) {
    envelope.metadata = payload;
  }
  envelope.message = std::move(*message);
  context_->service->Deliver(envelope);
}

void WebSocketSession::HandleState(const Packet& packet) {
  const auto& payload = packet.PayloadOrEmpty();
  const auto& session_id = identity_->session_id;
  auto& sessions = *context_->sessions;
  if (packet.op == op::kStateReady) {
    std::vector<std::string> capabilities;
    auto caps = payload.find("capabilities");
    if (caps != payload.end() && caps->is_array()) {
      for (const auto& cap : *caps) {
        if (cap.is_string()) {
          capabilities.push_back(cap.get<std::string>());
        }
      }
    }
    sessions.MarkReady(session_id, capabilities);
    return;
  }
  if (packet.op == op::kStatePlaying) {
    auto playing = payload.find("isPlaying");
    if (playing == payload.end() || !playing->is_boolean()) {
      return EnqueuePacket(MakeErrorPacket(ErrorCode::kInvalidPayload, "isPlaying 불리언이 필요합니다", packet.id));
    }
    sessions.SetPlaying(session_id, playing->get<bool>());
    return;
  }
  if (packet.op == op::kStateConfig) {
    if (!payload.is_object()) {
      return EnqueuePacket(MakeErrorPacket(ErrorCode::kInvalidPayload, "설정 객체가 필요합니다", packet.id));
    }
    sessions.SetClientConfig(session_id, payload);
    return;
  }
  if (packet.op == op::kStateModel) {
    sessions.SetModelInfo(session_id, payload);
    return;
  }
  EnqueuePacket(MakeErrorPacket(ErrorCode::kInvalidPayload, "지원하지 않는 상태 보고입니다: " + packet.op, packet.id));
}

void WebSocketSession::HandleProtocolViolation(const DecodeError& error) {
  context_->observability->IncrementProtocolErrors();
  ++violations_;
  EnqueuePacket(MakeErrorPacket(error.code, error.message, error.id));
  if (violations_ > context_->config.max_protocol_violations) {
    auto log = MakeLog(LogLevel::kWarn, "protocol_violation_limit", "잘못된 패킷이 반복되어 연결을 종료합니다");
    log.fields = {{"violations", violations_}};
    context_->observability->Log(log);
    BeginClose(boost::beast::websocket::close_code::policy_error, "protocol_violation");
  }
}

void WebSocketSession::StartHandshakeTimer() {
  handshake_timer_.expires_after(std::chrono::seconds(context_->config.handshake_timeout_seconds));
  auto self = shared_from_this();
  handshake_timer_.async_wait([self](boost::beast::error_code ec) {
    if (ec || self->state_ != ConnectionState::kAuthenticating) {
      return;
    }
    self->CloseWithError(ErrorCode::kAuthFailed, "핸드셰이크 대기 시간이 초과되었습니다", "", "handshake_timeout");
  });
}

void WebSocketSession::StartHeartbeat() {
  if (context_->config.heartbeat_interval_seconds == 0) {
    return;
  }
  heartbeat_timer_.expires_after(std::chrono::seconds(context_->config.heartbeat_interval_seconds));
  auto self = shared_from_this();
  heartbeat_timer_.async_wait([self](boost::beast::error_code ec) {
    if (ec) {
      return;
    }
    self->OnHeartbeat();
  });
}

void WebSocketSession::OnHeartbeat() {
  if (state_ != ConnectionState::kActive) {
    return;
  }
  const auto& config = context_->config;
  auto limit = std::chrono::seconds(config.heartbeat_interval_seconds *
                                    std::max<std::size_t>(1, config.heartbeat_timeout_multiplier));
  if (IdleLongerThan(limit)) {
    context_->observability->Log(MakeLog(LogLevel::kWarn, "heartbeat_timeout", "하트비트 시간 초과로 연결을 종료합니다"));
    return BeginClose(boost::beast::websocket::close_code::going_away, "heartbeat_timeout");
  }
  EnqueuePacket(MakePacket(op::kPing));
  StartHeartbeat();
}

bool WebSocketSession::IdleLongerThan(std::chrono::steady_clock::duration limit) const {
  return std::chrono::steady_clock::now() - last_seen_ > limit;
}

void WebSocketSession::SendPacket(Packet packet) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, packet = std::move(packet)]() { self->EnqueuePacket(packet); });
}

void WebSocketSession::Kick(std::string reason) {
  auto self = shared_from_this();
  boost::asio::post(ws_.get_executor(), [self, reason = std::move(reason)]() {
    self->context_->observability->Log(self->MakeLog(LogLevel::kInfo, "session_replaced", reason));
    self->CloseWithError(ErrorCode::kConnectionFull, reason, "", "kicked");
  });
}

std::optional<std::future<CorrelationResult>> WebSocketSession::SendRequest(Packet packet,
                                                                            std::chrono::milliseconds timeout,
                                                                            OpError& error) {
  if (state_ != ConnectionState::kActive) {
    error = {ErrorCode::kSessionNotFound, "연결이 활성 상태가 아닙니다"};
    return std::nullopt;
  }
  if (packet.id.empty()) {
    packet.id = NewPacketId();
  }
  auto future = correlator_->Register(packet.id, timeout, error);
  if (!future) {
    return std::nullopt;
  }
  SendPacket(std::move(packet));
  return future;
}

std::size_t WebSocketSession::PendingRequests() const { return correlator_->Pending(); }

void WebSocketSession::EnqueuePacket(const Packet& packet) {
  if (close_after_drain_ || finalized_) {
    return;
  }
  context_->observability->IncrementPacketsOut();
  EnqueueMessage(codec_.Encode(packet));
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (close_after_drain_ || finalized_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= context_->config.ws_queue_limit_messages ||
      queued_bytes_ + message_size > context_->config.ws_queue_limit_bytes) {
    TriggerBackpressureClose();
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty() || finalized_) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  writing_ = false;
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  if (ec) {
    send_queue_.clear();
    queued_bytes_ = 0;
    boost::beast::error_code ignored;
    boost::beast::get_lowest_layer(ws_).socket().close(ignored);
    return Finalize("write_failed: " + ec.message());
  }
  if (!send_queue_.empty()) {
    return WriteNext();
  }
  if (close_after_drain_) {
    DoClose();
  }
}

void WebSocketSession::TriggerBackpressureClose() {
  if (close_after_drain_) {
    return;
  }
  // 진행 중인 쓰기 버퍼는 완료될 때까지 유지해야 한다.
  while (send_queue_.size() > (writing_ ? 1u : 0u)) {
    queued_bytes_ -= send_queue_.back().size();
    send_queue_.pop_back();
  }
  context_->observability->Log(MakeLog(LogLevel::kWarn, "backpressure_exceeded", "송신 큐 한도를 넘어 연결을 종료합니다"));
  BeginClose(boost::beast::websocket::close_code::policy_error, "backpressure_exceeded");
}

void WebSocketSession::CloseWithError(ErrorCode code, const std::string& message, const std::string& id,
                                      std::string_view reason) {
  EnqueuePacket(MakeErrorPacket(code, message, id));
  BeginClose(boost::beast::websocket::close_code::policy_error, reason);
}

void WebSocketSession::BeginClose(boost::beast::websocket::close_code code, std::string_view reason) {
  if (close_after_drain_ || finalized_) {
    return;
  }
  state_ = ConnectionState::kClosing;
  close_after_drain_ = true;
  close_reason_ = boost::beast::websocket::close_reason{code};
  close_reason_.reason = std::string(reason);
  handshake_timer_.cancel();
  heartbeat_timer_.cancel();
  if (!writing_) {
    DoClose();
  }
}

void WebSocketSession::DoClose() {
  if (close_started_ || finalized_) {
    return;
  }
  close_started_ = true;
  auto self = shared_from_this();
  ws_.async_close(close_reason_, [self](boost::beast::error_code ec) {
    if (ec) {
      boost::beast::error_code ignored;
      boost::beast::get_lowest_layer(self->ws_).socket().close(ignored);
    }
    self->Finalize(self->close_reason_.reason.c_str());
  });
}

void WebSocketSession::Finalize(std::string_view cause) {
  if (finalized_) {
    return;
  }
  finalized_ = true;
  state_ = ConnectionState::kClosed;
  handshake_timer_.cancel();
  heartbeat_timer_.cancel();
  // 취소된 요청의 호출자가 같은 세션을 다시 찾지 않도록 먼저 슬롯을 비운다.
  if (identity_) {
    context_->sessions->Remove(identity_->session_id, this);
  }
  correlator_->CancelAll("연결이 종료되었습니다");
  context_->observability->WebsocketClosed();
  auto log = MakeLog(LogLevel::kInfo, "ws_closed", "WebSocket 연결 종료");
  log.fields = {{"cause", cause}};
  context_->observability->Log(log);
}

LogContext WebSocketSession::MakeLog(LogLevel level, std::string name, std::string message) const {
  LogContext ctx;
  ctx.level = level;
  ctx.name = std::move(name);
  ctx.message = std::move(message);
  ctx.trace_id = trace_id_;
  if (identity_) {
    ctx.session_id = identity_->session_id;
    ctx.client_id = identity_->client_id;
  }
  return ctx;
}

}  // namespace bridge

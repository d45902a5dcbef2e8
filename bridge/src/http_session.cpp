/*
 * 설명: WebSocket 포트의 HTTP 요청을 경로 검사 후 업그레이드하거나 404/426으로 거절한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/http_session_test.cpp, bridge/tests/e2e/handshake_flow_test.cpp
 */
#include "bridge/http_session.hpp"

#include "bridge/api_response.hpp"

namespace bridge {

namespace {
constexpr const char* kServerName = "l2d-bridge";
}  // namespace

bool IsWebSocketPath(const std::string& target, const std::string& configured_path) {
  auto path = target.substr(0, target.find('?'));
  if (path.size() > 1 && path.back() == '/') {
    path.pop_back();
  }
  return path == configured_path || path == "/ws" || path == "/astrbot/live2d";
}

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ConnectionContext> context)
    : stream_(std::move(socket)), context_(std::move(context)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = context_->observability->NextTraceId();
  context_->observability->IncrementRequest();

  if (!IsWebSocketPath(std::string(req_.target()), context_->config.ws_path)) {
    return SendError(boost::beast::http::status::not_found, "not_found", "WebSocket 경로가 아닙니다");
  }
  if (!boost::beast::websocket::is_upgrade(req_)) {
    return SendError(boost::beast::http::status::upgrade_required, "upgrade_required",
                     "WebSocket 업그레이드가 필요합니다");
  }
  HandleWebSocket();
}

void HttpSession::SendError(boost::beast::http::status status, std::string_view code, std::string_view message) {
  auto res = std::make_shared<boost::beast::http::response<boost::beast::http::string_body>>();
  res->version(req_.version());
  res->result(status);
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  if (status == boost::beast::http::status::upgrade_required) {
    res->set(boost::beast::http::field::upgrade, "websocket");
  }
  auto body = MakeErrorEnvelope(code, message).dump();
  res->body() = body;
  res->content_length(body.size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    context_->observability->IncrementError();
  }
  LogContext ctx;
  ctx.name = "http_request";
  ctx.message = std::string(req_.target());
  ctx.trace_id = trace_id_;
  ctx.latency_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  ctx.fields = {{"status", res->result_int()}, {"port", "ws"}};
  context_->observability->Log(ctx);
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

boost::beast::websocket::stream_base::timeout WebSocketTimeouts() {
  auto timeouts = boost::beast::websocket::stream_base::timeout::suggested(boost::beast::role_type::server);
  timeouts.idle_timeout = boost::beast::websocket::stream_base::none();
  timeouts.keep_alive_pings = false;
  return timeouts;
}

void HttpSession::HandleWebSocket() {
  // 업그레이드 이후 타임아웃은 WebSocket 스트림 옵션이 맡는다.
  stream_.expires_never();
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(WebSocketTimeouts());
  ws.set_option(boost::beast::websocket::stream_base::decorator([](boost::beast::websocket::response_type& res) {
    res.set(boost::beast::http::field::server, kServerName);
  }));
  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    context_->observability->Warn("ws_accept_failed", ec.message(), {{"traceId", trace_id_}});
    boost::beast::get_lowest_layer(ws).socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return;
  }
  std::make_shared<WebSocketSession>(std::move(ws), context_)->Run();
}

}  // namespace bridge

/*
 * 설명: WebSocket 포트의 HTTP 연결을 받아 허용된 경로의 업그레이드만 WebSocketSession으로 넘긴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/http_session_test.cpp, bridge/tests/e2e/handshake_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "bridge/websocket_session.hpp"

namespace bridge {

// 설정된 경로와 /ws, /astrbot/live2d를 허용한다. 쿼리 문자열은 무시한다.
bool IsWebSocketPath(const std::string& target, const std::string& configured_path);

// 업그레이드 핸드셰이크 타임아웃만 Beast에 맡긴다. 유휴 연결 판정은 sys.ping 하트비트가 한다.
boost::beast::websocket::stream_base::timeout WebSocketTimeouts();

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ConnectionContext> context);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void SendError(boost::beast::http::status status, std::string_view code, std::string_view message);
  void SendResponse(std::shared_ptr<boost::beast::http::response<boost::beast::http::string_body>> res);
  void HandleWebSocket();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<const ConnectionContext> context_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace bridge

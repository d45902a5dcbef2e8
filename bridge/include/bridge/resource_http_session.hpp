/*
 * 설명: 리소스 전송용 HTTP 채널(PUT 업로드, GET 다운로드, DELETE 해제)과 /health, /ops/status를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/e2e/resource_transfer_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "bridge/bridge_service.hpp"
#include "bridge/observability.hpp"
#include "bridge/resource_store.hpp"
#include "bridge/temp_store.hpp"

namespace bridge {

struct ResourceEndpointContext {
  std::shared_ptr<ResourceStore> store;
  std::shared_ptr<TempFileStore> temp_store;
  std::shared_ptr<BridgeService> service;
  std::shared_ptr<Observability> observability;
};

boost::beast::http::status HttpStatusFor(ErrorCode code);

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query);

class ResourceHttpSession : public std::enable_shared_from_this<ResourceHttpSession> {
 public:
  ResourceHttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ResourceEndpointContext> context);
  void Run();

 private:
  using HeaderParser = boost::beast::http::request_parser<boost::beast::http::empty_body>;
  using UploadParser = boost::beast::http::request_parser<boost::beast::http::file_body>;

  void DoReadHeader();
  void OnHeader(boost::beast::error_code ec);
  bool Authorized(const std::unordered_map<std::string, std::string>& query) const;
  void HandleUpload(const std::string& rid);
  void OnUploadRead(boost::beast::error_code ec, const std::string& rid);
  void HandleDownload(const std::string& rid);
  void HandleRelease(const std::string& rid);
  void HandleStatus();

  void SendJson(boost::beast::http::status status, const nlohmann::json& body);
  void SendError(const OpError& error);
  template <class Body>
  void SendResponse(std::shared_ptr<boost::beast::http::response<Body>> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  std::shared_ptr<const ResourceEndpointContext> context_;
  std::optional<HeaderParser> header_parser_;
  std::optional<UploadParser> upload_parser_;
  std::string target_;
  unsigned version_{11};
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace bridge

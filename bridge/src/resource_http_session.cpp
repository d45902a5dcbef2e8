/*
 * 설명: 리소스 HTTP 채널의 인증, 업로드 스트리밍(file_body), 다운로드, 해제, 운영 상태 응답을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/e2e/resource_transfer_test.cpp
 */
#include "bridge/resource_http_session.hpp"

#include "bridge/api_response.hpp"
#include "bridge/auth.hpp"

namespace bridge {

namespace http = boost::beast::http;

namespace {
constexpr const char* kServerName = "l2d-bridge";
}  // namespace

boost::beast::http::status HttpStatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::kAuthFailed:
      return http::status::unauthorized;
    case ErrorCode::kResourceNotFound:
    case ErrorCode::kSessionNotFound:
      return http::status::not_found;
    case ErrorCode::kResourceQuotaExceeded:
      return http::status::payload_too_large;
    case ErrorCode::kInvalidPayload:
    case ErrorCode::kVersionMismatch:
    case ErrorCode::kUnsupportedType:
      return http::status::bad_request;
    case ErrorCode::kConnectionFull:
      return http::status::service_unavailable;
    default:
      return http::status::internal_server_error;
  }
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

ResourceHttpSession::ResourceHttpSession(boost::asio::ip::tcp::socket socket,
                                         std::shared_ptr<const ResourceEndpointContext> context)
    : stream_(std::move(socket)), context_(std::move(context)) {}

void ResourceHttpSession::Run() { DoReadHeader(); }

void ResourceHttpSession::DoReadHeader() {
  auto self = shared_from_this();
  header_parser_.emplace();
  stream_.expires_after(std::chrono::seconds(30));
  http::async_read_header(stream_, buffer_, *header_parser_,
                          [self](boost::beast::error_code ec, std::size_t) { self->OnHeader(ec); });
}

void ResourceHttpSession::OnHeader(boost::beast::error_code ec) {
  if (ec == http::error::end_of_stream) {
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

  const auto& req = header_parser_->get();
  version_ = req.version();
  target_ = std::string(req.target());
  std::string path = target_;
  std::string query;
  auto qpos = target_.find('?');
  if (qpos != std::string::npos) {
    path = target_.substr(0, qpos);
    query = target_.substr(qpos + 1);
  }
  auto params = ParseQueryParams(query);

  if (req.method() == http::verb::get && path == "/health") {
    auto metrics = context_->observability->Snapshot();
    nlohmann::json data{{"status", "ok"}, {"version", "v1.0.0"}, {"websocketActive", metrics.websocket_active}};
    return SendJson(http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req.method() == http::verb::get && path == "/ops/status") {
    if (!Authorized(params)) {
      return SendJson(http::status::unauthorized, MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    }
    return HandleStatus();
  }

  const auto& base = context_->store->ResourcePath();
  if (path.size() <= base.size() + 1 || path.compare(0, base.size(), base) != 0 || path[base.size()] != '/') {
    return SendJson(http::status::not_found, MakeErrorEnvelope("not_found", "경로를 찾을 수 없습니다"));
  }
  std::string rid = path.substr(base.size() + 1);
  if (rid.find('/') != std::string::npos) {
    return SendJson(http::status::not_found, MakeErrorEnvelope("not_found", "경로를 찾을 수 없습니다"));
  }
  if (!Authorized(params)) {
    return SendJson(http::status::unauthorized, MakeErrorEnvelope("unauthorized", "리소스 토큰이 올바르지 않습니다"));
  }

  switch (req.method()) {
    case http::verb::put:
      return HandleUpload(rid);
    case http::verb::get:
      return HandleDownload(rid);
    case http::verb::delete_:
      return HandleRelease(rid);
    default:
      return SendJson(http::status::method_not_allowed,
                      MakeErrorEnvelope("method_not_allowed", "지원하지 않는 메서드입니다"));
  }
}

bool ResourceHttpSession::Authorized(const std::unordered_map<std::string, std::string>& query) const {
  const auto& req = header_parser_->get();
  std::string provided;
  auto auth_it = req.find(http::field::authorization);
  if (auth_it != req.end()) {
    provided = ParseBearer(std::string(auth_it->value()));
  }
  if (provided.empty()) {
    auto token_it = query.find("token");
    if (token_it != query.end()) {
      provided = token_it->second;
    }
  }
  return TokenMatches(context_->store->Token(), provided);
}

void ResourceHttpSession::HandleUpload(const std::string& rid) {
  auto content_length = header_parser_->content_length();
  std::optional<std::uint64_t> declared;
  if (content_length) {
    declared = *content_length;
  }
  OpError error;
  auto slot = context_->store->BeginUpload(rid, declared, error);
  if (!slot) {
    return SendError(error);
  }

  // chunked 본문도 선언 크기를 넘으면 body_limit 오류로 끊긴다.
  upload_parser_.emplace(std::move(*header_parser_));
  upload_parser_->body_limit(slot->body_limit);
  boost::beast::error_code ec;
  upload_parser_->get().body().open(slot->part_path.string().c_str(), boost::beast::file_mode::write, ec);
  if (ec) {
    context_->store->AbortUpload(rid);
    return SendError({ErrorCode::kResourceIo, "업로드 파일을 열 수 없습니다: " + ec.message()});
  }

  stream_.expires_after(std::chrono::minutes(10));
  auto self = shared_from_this();
  http::async_read(stream_, buffer_, *upload_parser_,
                   [self, rid](boost::beast::error_code read_ec, std::size_t) { self->OnUploadRead(read_ec, rid); });
}

void ResourceHttpSession::OnUploadRead(boost::beast::error_code ec, const std::string& rid) {
  upload_parser_->get().body().close();
  if (ec) {
    context_->store->AbortUpload(rid);
    context_->observability->Warn("upload_aborted", ec.message(), {{"rid", rid}});
    if (ec == http::error::body_limit) {
      return SendError({ErrorCode::kResourceQuotaExceeded, "본문이 선언된 크기를 초과합니다"});
    }
    return SendError({ErrorCode::kUploadFailed, "업로드 본문 수신 실패: " + ec.message()});
  }
  OpError error;
  auto resource = context_->store->FinishUpload(rid, error);
  if (!resource) {
    return SendError(error);
  }
  context_->observability->Info("upload_received", "리소스 업로드 수신 완료",
                                {{"rid", rid}, {"size", resource->received_bytes}});
  SendJson(http::status::ok, MakeSuccessEnvelope(
                                 {{"rid", rid}, {"size", resource->received_bytes}, {"sha256", resource->sha256}}));
}

void ResourceHttpSession::HandleDownload(const std::string& rid) {
  OpError error;
  auto file = context_->store->Get(rid, error);
  if (!file) {
    return SendError(error);
  }
  http::file_body::value_type body;
  boost::beast::error_code ec;
  body.open(file->path.string().c_str(), boost::beast::file_mode::scan, ec);
  if (ec) {
    return SendError({ErrorCode::kResourceIo, "리소스 파일을 열 수 없습니다: " + ec.message()});
  }
  auto size = body.size();
  auto res = std::make_shared<http::response<http::file_body>>(
      std::piecewise_construct, std::make_tuple(std::move(body)), std::make_tuple(http::status::ok, version_));
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, file->resource.mime.empty() ? "application/octet-stream" : file->resource.mime);
  res->content_length(size);
  SendResponse(res);
}

void ResourceHttpSession::HandleRelease(const std::string& rid) {
  bool released = context_->store->Release(rid);
  SendJson(http::status::ok, MakeSuccessEnvelope({{"rid", rid}, {"released", released}}));
}

void ResourceHttpSession::HandleStatus() {
  auto data = context_->service->Status();
  auto usage = context_->store->GetUsage();
  data["resources"] = {{"totalBytes", usage.total_bytes},
                       {"files", usage.files},
                       {"pending", context_->store->PendingCount()}};
  if (context_->temp_store) {
    auto temp = context_->temp_store->GetUsage();
    data["temp"] = {{"totalBytes", temp.total_bytes}, {"files", temp.files}};
  }
  SendJson(http::status::ok, MakeSuccessEnvelope(data));
}

void ResourceHttpSession::SendJson(http::status status, const nlohmann::json& body) {
  auto res = std::make_shared<http::response<http::string_body>>(status, version_);
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void ResourceHttpSession::SendError(const OpError& error) {
  SendJson(HttpStatusFor(error.code), MakeErrorEnvelope(error));
}

template <class Body>
void ResourceHttpSession::SendResponse(std::shared_ptr<http::response<Body>> res) {
  auto self = shared_from_this();
  res->keep_alive(false);
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    context_->observability->IncrementError();
  }
  LogContext ctx;
  ctx.name = "http_request";
  ctx.message = target_;
  ctx.trace_id = trace_id_;
  ctx.latency_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  ctx.fields = {{"status", res->result_int()}, {"port", "resource"}};
  context_->observability->Log(ctx);
  http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace bridge

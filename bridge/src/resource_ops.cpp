/*
 * 설명: resource.prepare/commit/get/release/progress 요청 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/resource_ops_test.cpp, bridge/tests/e2e/resource_transfer_test.cpp
 */
#include "bridge/resource_ops.hpp"

#include "bridge/digest.hpp"

namespace bridge {

namespace {
std::string StringField(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

// size 또는 sizeBytes. 음수/비정수는 실패.
std::optional<std::uint64_t> SizeField(const nlohmann::json& payload) {
  for (const char* key : {"size", "sizeBytes"}) {
    auto it = payload.find(key);
    if (it == payload.end()) {
      continue;
    }
    if (it->is_number_unsigned()) {
      return it->get<std::uint64_t>();
    }
    if (it->is_number_integer() && it->get<std::int64_t>() >= 0) {
      return static_cast<std::uint64_t>(it->get<std::int64_t>());
    }
    return std::nullopt;
  }
  return std::nullopt;
}

nlohmann::json ResourceJson(const Resource& res) {
  return {{"rid", res.rid},
          {"kind", res.kind},
          {"mime", res.mime},
          {"size", res.size_bytes},
          {"sha256", res.sha256},
          {"status", ToString(res.status)}};
}
}  // namespace

nlohmann::json ToJson(const UploadTarget& target) {
  nlohmann::json headers = nlohmann::json::object();
  for (const auto& [name, value] : target.headers) {
    headers[name] = value;
  }
  return {{"url", target.url}, {"method", target.method}, {"headers", headers}};
}

nlohmann::json ToJson(const ResourceReference& reference) {
  nlohmann::json j{{"rid", reference.rid},
                   {"url", reference.url},
                   {"mime", reference.mime},
                   {"size", reference.size_bytes}};
  if (reference.inline_base64) {
    j["inline"] = *reference.inline_base64;
  }
  return j;
}

ResourceOpHandler::ResourceOpHandler(std::shared_ptr<ResourceStore> store, std::shared_ptr<Observability> observability)
    : store_(std::move(store)), observability_(std::move(observability)) {}

std::optional<Packet> ResourceOpHandler::Handle(const Packet& request) const {
  if (request.op == op::kResourcePrepare) {
    return HandlePrepare(request);
  }
  if (request.op == op::kResourceCommit) {
    return HandleCommit(request);
  }
  if (request.op == op::kResourceGet) {
    return HandleGet(request);
  }
  if (request.op == op::kResourceRelease) {
    return HandleRelease(request);
  }
  if (request.op == op::kResourceProgress) {
    HandleProgress(request);
    return std::nullopt;
  }
  return MakeErrorPacket(ErrorCode::kInvalidPayload, "알 수 없는 리소스 op: " + request.op, request.id);
}

Packet ResourceOpHandler::HandlePrepare(const Packet& request) const {
  const auto& payload = request.PayloadOrEmpty();
  auto size = SizeField(payload);
  PrepareRequest prepare;
  prepare.kind = StringField(payload, "kind");
  prepare.mime = StringField(payload, "mime");
  prepare.sha256 = StringField(payload, "sha256");
  auto inline_it = payload.find("inline");
  if (inline_it != payload.end() && inline_it->is_string()) {
    prepare.inline_base64 = inline_it->get<std::string>();
  }
  if (!size) {
    return MakeErrorPacket(ErrorCode::kInvalidPayload, "size가 필요합니다", request.id);
  }
  prepare.size_bytes = *size;

  OpError error;
  auto result = store_->Prepare(prepare, error);
  if (!result) {
    return MakeErrorPacket(error.code, error.message, request.id);
  }
  auto body = ResourceJson(result->resource);
  if (result->upload) {
    body["upload"] = ToJson(*result->upload);
  } else {
    body["url"] = store_->UrlFor(result->resource.rid);
  }
  if (observability_) {
    observability_->Info("resource_prepared", "리소스 업로드를 준비했습니다",
                         {{"rid", result->resource.rid}, {"size", result->resource.size_bytes},
                          {"inline", !result->upload.has_value()}});
  }
  return MakePacket(op::kResourcePrepare, body, request.id);
}

Packet ResourceOpHandler::HandleCommit(const Packet& request) const {
  const auto& payload = request.PayloadOrEmpty();
  auto rid = StringField(payload, "rid");
  auto size = SizeField(payload);
  if (rid.empty() || !size) {
    return MakeErrorPacket(ErrorCode::kInvalidPayload, "rid와 size가 필요합니다", request.id);
  }
  OpError error;
  auto committed = store_->Commit(rid, *size, error);
  if (!committed) {
    return MakeErrorPacket(error.code, error.message, request.id);
  }
  auto body = ResourceJson(*committed);
  body["url"] = store_->UrlFor(rid);
  return MakePacket(op::kResourceCommit, body, request.id);
}

Packet ResourceOpHandler::HandleGet(const Packet& request) const {
  auto rid = StringField(request.PayloadOrEmpty(), "rid");
  if (rid.empty()) {
    return MakeErrorPacket(ErrorCode::kInvalidPayload, "rid가 필요합니다", request.id);
  }
  OpError error;
  auto file = store_->Get(rid, error);
  if (!file) {
    return MakeErrorPacket(error.code, error.message, request.id);
  }
  auto body = ResourceJson(file->resource);
  body["url"] = store_->UrlFor(rid);
  if (!store_->RequiresUpload(file->resource.size_bytes)) {
    auto bytes = store_->ReadBytes(rid, error);
    if (!bytes) {
      return MakeErrorPacket(error.code, error.message, request.id);
    }
    body["inline"] = Base64Encode(*bytes);
  }
  return MakePacket(op::kResourceGet, body, request.id);
}

Packet ResourceOpHandler::HandleRelease(const Packet& request) const {
  auto rid = StringField(request.PayloadOrEmpty(), "rid");
  if (rid.empty()) {
    return MakeErrorPacket(ErrorCode::kInvalidPayload, "rid가 필요합니다", request.id);
  }
  bool released = store_->Release(rid);
  return MakePacket(op::kResourceRelease, nlohmann::json{{"rid", rid}, {"released", released}}, request.id);
}

void ResourceOpHandler::HandleProgress(const Packet& request) const {
  if (observability_) {
    observability_->Debug("resource_progress", "클라이언트 전송 진행률", request.PayloadOrEmpty());
  }
}

}  // namespace bridge

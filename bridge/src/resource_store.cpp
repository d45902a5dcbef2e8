/*
 * 설명: 리소스 메타데이터와 파일을 단일 뮤텍스로 보호하며 수명 주기/용량 정책을 적용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/resource_store_test.cpp, bridge/tests/e2e/resource_transfer_test.cpp
 */
#include "bridge/resource_store.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

#include "bridge/digest.hpp"

namespace bridge {

namespace {
std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool LooksLikeStoreFile(const std::filesystem::path& path) {
  auto name = path.filename().string();
  if (name.size() > 5 && name.compare(name.size() - 5, 5, ".part") == 0) {
    return true;
  }
  // uuid 형식(8-4-4-4-12)
  if (name.size() != 36) {
    return false;
  }
  for (std::size_t i = 0; i < name.size(); ++i) {
    bool dash = i == 8 || i == 13 || i == 18 || i == 23;
    if (dash ? name[i] != '-' : !std::isxdigit(static_cast<unsigned char>(name[i]))) {
      return false;
    }
  }
  return true;
}

bool WriteWholeFile(const std::filesystem::path& path, std::string_view bytes) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return false;
  }
  out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  return static_cast<bool>(out);
}
}  // namespace

std::string_view ToString(ResourceStatus status) {
  switch (status) {
    case ResourceStatus::kPending:
      return "pending";
    case ResourceStatus::kReady:
      return "ready";
    case ResourceStatus::kExpired:
      return "expired";
  }
  return "pending";
}

ResourceStore::ResourceStore(ResourceStoreConfig config, std::shared_ptr<Observability> observability)
    : config_(std::move(config)), observability_(std::move(observability)) {
  if (!config_.clock) {
    config_.clock = [] { return SystemClock::now(); };
  }
  if (config_.resource_path.empty() || config_.resource_path.front() != '/') {
    config_.resource_path = "/" + config_.resource_path;
  }
  while (config_.resource_path.size() > 1 && config_.resource_path.back() == '/') {
    config_.resource_path.pop_back();
  }
  while (!config_.base_url.empty() && config_.base_url.back() == '/') {
    config_.base_url.pop_back();
  }
  std::error_code ec;
  std::filesystem::create_directories(config_.dir, ec);
  if (ec) {
    throw std::runtime_error("리소스 디렉터리 생성 실패: " + config_.dir.string() + " (" + ec.message() + ")");
  }
  RemoveStaleFiles();
}

SystemClock::time_point ResourceStore::Now() const { return config_.clock(); }

std::filesystem::path ResourceStore::FilePath(const std::string& rid) const { return config_.dir / rid; }

std::filesystem::path ResourceStore::PartPath(const std::string& rid) const { return config_.dir / (rid + ".part"); }

void ResourceStore::SetBaseUrl(std::string base_url) {
  while (!base_url.empty() && base_url.back() == '/') {
    base_url.pop_back();
  }
  config_.base_url = std::move(base_url);
}

std::string ResourceStore::UrlFor(const std::string& rid) const {
  return config_.base_url + config_.resource_path + "/" + rid;
}

UploadTarget ResourceStore::UploadTargetFor(const std::string& rid) const {
  UploadTarget target;
  target.url = UrlFor(rid);
  target.method = "PUT";
  if (!config_.token.empty()) {
    target.headers["Authorization"] = "Bearer " + config_.token;
  }
  return target;
}

void ResourceStore::RemoveStaleFiles() {
  // 이전 실행의 파일은 메타데이터가 없으므로 시작 시 정리한다.
  std::error_code ec;
  std::vector<std::filesystem::path> stale;
  for (auto it = std::filesystem::directory_iterator(config_.dir, ec); !ec && it != std::filesystem::directory_iterator();
       it.increment(ec)) {
    if (it->is_regular_file() && LooksLikeStoreFile(it->path())) {
      stale.push_back(it->path());
    }
  }
  if (ec && observability_) {
    observability_->Warn("resource_store_scan_failed", ec.message(), {{"dir", config_.dir.string()}});
  }
  for (const auto& path : stale) {
    RemoveFile(path);
  }
}

void ResourceStore::RemoveFile(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec && observability_) {
    observability_->Warn("resource_remove_failed", ec.message(), {{"path", path.string()}});
  }
}

void ResourceStore::EraseLocked(const std::string& rid) {
  RemoveFile(FilePath(rid));
  RemoveFile(PartPath(rid));
  resources_.erase(rid);
}

bool ResourceStore::AdmitLocked(std::uint64_t size_bytes, OpError& error) {
  std::uint64_t limit = config_.max_resource_bytes > 0 ? config_.max_resource_bytes : config_.quota.max_total_bytes;
  if (limit > 0 && size_bytes > limit) {
    error = {ErrorCode::kResourceQuotaExceeded, "리소스 크기가 허용 한도를 초과했습니다"};
    return false;
  }
  auto now = Now();
  std::vector<QuotaEntry> entries;
  entries.reserve(resources_.size());
  for (const auto& [rid, res] : resources_) {
    QuotaEntry entry;
    entry.key = rid;
    entry.size_bytes = res.size_bytes;
    entry.created_at = res.created_at;
    entry.last_access_at = res.last_access_at;
    // 업로드 대기 중이거나 최근에 접근된 리소스는 자리를 내주지 않는다.
    entry.evictable = res.status != ResourceStatus::kPending && now - res.last_access_at >= config_.protect_recent;
    entries.push_back(std::move(entry));
  }
  auto plan = SelectEvictions(entries, config_.quota, size_bytes, 1);
  if (!plan.satisfied) {
    error = {ErrorCode::kResourceQuotaExceeded, "리소스 저장 공간이 부족합니다"};
    return false;
  }
  for (const auto& rid : plan.keys) {
    EraseLocked(rid);
  }
  if (!plan.keys.empty() && observability_) {
    observability_->Info("resource_evicted", "공간 확보를 위해 오래된 리소스를 제거했습니다",
                         {{"count", plan.keys.size()}});
  }
  return true;
}

std::optional<Resource> ResourceStore::StoreReadyLocked(std::string_view bytes, const std::string& kind,
                                                        const std::string& mime, const std::string& sha256,
                                                        OpError& error) {
  Resource res;
  res.rid = NewUuid();
  res.kind = kind;
  res.mime = mime;
  res.size_bytes = bytes.size();
  res.sha256 = sha256.empty() ? Sha256Hex(bytes) : sha256;
  res.status = ResourceStatus::kReady;
  res.created_at = Now();
  res.last_access_at = res.created_at;
  res.received_bytes = bytes.size();
  res.uploaded = true;
  if (!WriteWholeFile(FilePath(res.rid), bytes)) {
    RemoveFile(FilePath(res.rid));
    error = {ErrorCode::kResourceIo, "리소스 파일 쓰기 실패"};
    return std::nullopt;
  }
  resources_[res.rid] = res;
  return res;
}

std::optional<PrepareResult> ResourceStore::Prepare(const PrepareRequest& request, OpError& error) {
  if (request.kind.empty()) {
    error = {ErrorCode::kInvalidPayload, "kind가 필요합니다"};
    return std::nullopt;
  }
  std::string sha = ToLower(request.sha256);
  if (!sha.empty() && !IsSha256Hex(sha)) {
    error = {ErrorCode::kInvalidPayload, "sha256 형식이 올바르지 않습니다"};
    return std::nullopt;
  }

  if (request.inline_base64) {
    if (request.size_bytes > config_.max_inline_bytes) {
      error = {ErrorCode::kInvalidPayload, "인라인 데이터는 임계값 이하 크기만 허용됩니다"};
      return std::nullopt;
    }
    auto decoded = Base64Decode(*request.inline_base64);
    if (!decoded) {
      error = {ErrorCode::kInvalidPayload, "inline base64 디코딩 실패"};
      return std::nullopt;
    }
    if (decoded->size() != request.size_bytes) {
      error = {ErrorCode::kInvalidPayload, "inline 데이터 크기가 size와 다릅니다"};
      return std::nullopt;
    }
    if (!sha.empty() && Sha256Hex(*decoded) != sha) {
      error = {ErrorCode::kInvalidPayload, "inline 데이터의 sha256이 일치하지 않습니다"};
      return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!AdmitLocked(decoded->size(), error)) {
      return std::nullopt;
    }
    auto stored = StoreReadyLocked(*decoded, request.kind, request.mime, sha, error);
    if (!stored) {
      return std::nullopt;
    }
    return PrepareResult{*stored, std::nullopt};
  }

  if (request.size_bytes == 0) {
    error = {ErrorCode::kInvalidPayload, "size는 0보다 커야 합니다"};
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!AdmitLocked(request.size_bytes, error)) {
    return std::nullopt;
  }
  Resource res;
  res.rid = NewUuid();
  res.kind = request.kind;
  res.mime = request.mime;
  res.size_bytes = request.size_bytes;
  res.sha256 = sha;
  res.status = ResourceStatus::kPending;
  res.created_at = Now();
  res.last_access_at = res.created_at;
  resources_[res.rid] = res;
  return PrepareResult{res, UploadTargetFor(res.rid)};
}

std::optional<UploadSlot> ResourceStore::BeginUpload(const std::string& rid,
                                                     std::optional<std::uint64_t> content_length, OpError& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = resources_.find(rid);
  if (it == resources_.end()) {
    error = {ErrorCode::kResourceNotFound, "리소스를 찾을 수 없습니다"};
    return std::nullopt;
  }
  auto& res = it->second;
  if (res.status != ResourceStatus::kPending) {
    error = {ErrorCode::kInvalidPayload, "업로드 대기 상태가 아닙니다"};
    return std::nullopt;
  }
  if (res.uploading) {
    error = {ErrorCode::kInvalidPayload, "이미 업로드가 진행 중입니다"};
    return std::nullopt;
  }
  if (content_length && *content_length > res.size_bytes) {
    error = {ErrorCode::kResourceQuotaExceeded, "본문이 선언된 크기를 초과합니다"};
    return std::nullopt;
  }
  res.uploading = true;
  res.uploaded = false;
  res.received_bytes = 0;
  res.last_access_at = Now();
  return UploadSlot{PartPath(rid), content_length ? *content_length : res.size_bytes};
}

std::optional<Resource> ResourceStore::FinishUpload(const std::string& rid, OpError& error) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = resources_.find(rid);
    if (it == resources_.end() || !it->second.uploading) {
      error = {ErrorCode::kResourceNotFound, "진행 중인 업로드가 없습니다"};
      return std::nullopt;
    }
  }

  // 해시 계산은 잠금 밖에서 수행한다. uploading 플래그가 동시 업로드를 막는다.
  auto digest = DigestFile(PartPath(rid));

  std::lock_guard<std::mutex> lock(mutex_);
  auto it = resources_.find(rid);
  if (it == resources_.end()) {
    RemoveFile(PartPath(rid));
    error = {ErrorCode::kResourceNotFound, "업로드 중 리소스가 해제되었습니다"};
    return std::nullopt;
  }
  auto& res = it->second;
  res.uploading = false;
  if (!digest) {
    RemoveFile(PartPath(rid));
    error = {ErrorCode::kResourceIo, "업로드 파일을 읽을 수 없습니다"};
    return std::nullopt;
  }
  if (digest->size_bytes > res.size_bytes) {
    RemoveFile(PartPath(rid));
    error = {ErrorCode::kResourceQuotaExceeded, "본문이 선언된 크기를 초과합니다"};
    return std::nullopt;
  }
  if (!res.sha256.empty() && digest->sha256 != res.sha256) {
    RemoveFile(PartPath(rid));
    error = {ErrorCode::kInvalidPayload, "SHA-256 불일치"};
    return std::nullopt;
  }
  res.received_bytes = digest->size_bytes;
  res.uploaded = true;
  if (res.sha256.empty()) {
    res.sha256 = digest->sha256;
  }
  res.last_access_at = Now();
  return res;
}

void ResourceStore::AbortUpload(const std::string& rid) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = resources_.find(rid);
  if (it != resources_.end()) {
    it->second.uploading = false;
    it->second.uploaded = false;
    it->second.received_bytes = 0;
  }
  RemoveFile(PartPath(rid));
}

std::optional<Resource> ResourceStore::Commit(const std::string& rid, std::uint64_t size_bytes, OpError& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = resources_.find(rid);
  if (it == resources_.end()) {
    error = {ErrorCode::kResourceNotFound, "리소스를 찾을 수 없습니다"};
    return std::nullopt;
  }
  auto& res = it->second;
  if (res.status != ResourceStatus::kPending) {
    error = {ErrorCode::kInvalidPayload, "커밋할 수 있는 상태가 아닙니다: " + std::string(ToString(res.status))};
    return std::nullopt;
  }
  if (size_bytes != res.size_bytes) {
    error = {ErrorCode::kInvalidPayload, "커밋 크기가 prepare 시 선언된 크기와 다릅니다"};
    return std::nullopt;
  }
  if (!res.uploaded || res.uploading) {
    error = {ErrorCode::kUploadFailed, "업로드가 완료되지 않았습니다"};
    return std::nullopt;
  }
  if (res.received_bytes != size_bytes) {
    error = {ErrorCode::kInvalidPayload, "수신된 바이트 수가 선언된 크기와 다릅니다"};
    return std::nullopt;
  }
  std::error_code ec;
  std::filesystem::rename(PartPath(rid), FilePath(rid), ec);
  if (ec) {
    error = {ErrorCode::kResourceIo, "리소스 파일 확정 실패: " + ec.message()};
    return std::nullopt;
  }
  res.status = ResourceStatus::kReady;
  res.last_access_at = Now();
  return res;
}

std::optional<ResourceFile> ResourceStore::Get(const std::string& rid, OpError& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = resources_.find(rid);
  if (it == resources_.end()) {
    error = {ErrorCode::kResourceNotFound, "리소스를 찾을 수 없습니다"};
    return std::nullopt;
  }
  auto& res = it->second;
  auto now = Now();
  if (res.status == ResourceStatus::kReady && config_.quota.ttl.count() > 0 &&
      now - res.created_at > config_.quota.ttl) {
    res.status = ResourceStatus::kExpired;
  }
  if (res.status != ResourceStatus::kReady) {
    error = {ErrorCode::kResourceNotFound, "사용할 수 없는 리소스입니다: " + std::string(ToString(res.status))};
    return std::nullopt;
  }
  auto path = FilePath(rid);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    error = {ErrorCode::kResourceNotFound, "리소스 파일이 없습니다"};
    return std::nullopt;
  }
  res.last_access_at = now;
  return ResourceFile{res, path};
}

std::optional<std::string> ResourceStore::ReadBytes(const std::string& rid, OpError& error) {
  auto file = Get(rid, error);
  if (!file) {
    return std::nullopt;
  }
  std::ifstream in(file->path, std::ios::binary);
  if (!in) {
    error = {ErrorCode::kResourceIo, "리소스 파일을 열 수 없습니다"};
    return std::nullopt;
  }
  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    error = {ErrorCode::kResourceIo, "리소스 파일 읽기 실패"};
    return std::nullopt;
  }
  return bytes;
}

bool ResourceStore::Release(const std::string& rid) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (resources_.find(rid) == resources_.end()) {
    return false;
  }
  EraseLocked(rid);
  return true;
}

SweepStats ResourceStore::Sweep() {
  SweepStats stats;
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = Now();

  std::vector<QuotaEntry> entries;
  for (const auto& [rid, res] : resources_) {
    QuotaEntry entry{rid, res.size_bytes, res.created_at, res.last_access_at, !res.uploading};
    entries.push_back(std::move(entry));
  }
  for (const auto& rid : SelectExpired(entries, config_.quota, now)) {
    stats.freed_bytes += resources_[rid].size_bytes;
    EraseLocked(rid);
    ++stats.expired;
  }

  entries.clear();
  for (const auto& [rid, res] : resources_) {
    QuotaEntry entry{rid, res.size_bytes, res.created_at, res.last_access_at,
                     res.status != ResourceStatus::kPending};
    entries.push_back(std::move(entry));
  }
  auto plan = SelectEvictions(entries, config_.quota, 0, 0);
  for (const auto& rid : plan.keys) {
    stats.freed_bytes += resources_[rid].size_bytes;
    EraseLocked(rid);
    ++stats.evicted;
  }
  return stats;
}

void ResourceStore::SetQuotaPolicy(const QuotaPolicy& quota) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_.quota = quota;
}

std::optional<ResourceReference> ResourceStore::ImportBytes(std::string_view bytes, const std::string& kind,
                                                            const std::string& mime, OpError& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!AdmitLocked(bytes.size(), error)) {
    return std::nullopt;
  }
  auto stored = StoreReadyLocked(bytes, kind, mime, {}, error);
  if (!stored) {
    return std::nullopt;
  }
  return ResourceReference{stored->rid, UrlFor(stored->rid), stored->mime, stored->size_bytes, std::nullopt};
}

std::optional<ResourceReference> ResourceStore::ImportFile(const std::filesystem::path& path, const std::string& kind,
                                                           const std::string& mime, OpError& error) {
  auto digest = DigestFile(path);
  if (!digest) {
    error = {ErrorCode::kResourceIo, "가져올 파일을 읽을 수 없습니다: " + path.string()};
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!AdmitLocked(digest->size_bytes, error)) {
    return std::nullopt;
  }
  Resource res;
  res.rid = NewUuid();
  res.kind = kind;
  res.mime = mime;
  res.size_bytes = digest->size_bytes;
  res.sha256 = digest->sha256;
  res.status = ResourceStatus::kReady;
  res.created_at = Now();
  res.last_access_at = res.created_at;
  res.received_bytes = digest->size_bytes;
  res.uploaded = true;
  std::error_code ec;
  std::filesystem::copy_file(path, FilePath(res.rid), std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    RemoveFile(FilePath(res.rid));
    error = {ErrorCode::kResourceIo, "리소스 파일 복사 실패: " + ec.message()};
    return std::nullopt;
  }
  resources_[res.rid] = res;
  return ResourceReference{res.rid, UrlFor(res.rid), res.mime, res.size_bytes, std::nullopt};
}

Usage ResourceStore::GetUsage() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Usage usage;
  for (const auto& [rid, res] : resources_) {
    usage.total_bytes += res.size_bytes;
    ++usage.files;
  }
  return usage;
}

std::size_t ResourceStore::PendingCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(std::count_if(resources_.begin(), resources_.end(), [](const auto& kv) {
    return kv.second.status == ResourceStatus::kPending;
  }));
}

}  // namespace bridge

/*
 * 설명: rid로 주소 지정되는 대용량 미디어 저장소(prepare/upload/commit/get/release, TTL/용량 정리)를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/resource_store_test.cpp, bridge/tests/e2e/resource_transfer_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "bridge/observability.hpp"
#include "bridge/protocol.hpp"
#include "bridge/quota.hpp"

namespace bridge {

enum class ResourceStatus { kPending, kReady, kExpired };

std::string_view ToString(ResourceStatus status);

struct Resource {
  std::string rid;
  std::string kind;
  std::string mime;
  std::uint64_t size_bytes{0};
  std::string sha256;
  ResourceStatus status{ResourceStatus::kPending};
  SystemClock::time_point created_at{};
  SystemClock::time_point last_access_at{};
  std::uint64_t received_bytes{0};
  bool uploaded{false};
  bool uploading{false};
};

struct UploadTarget {
  std::string url;
  std::string method{"PUT"};
  std::map<std::string, std::string> headers;
};

// PUT 본문을 받을 위치와 본문 상한. 상한은 선언 크기를 넘지 않는다.
struct UploadSlot {
  std::filesystem::path part_path;
  std::uint64_t body_limit{0};
};

struct PrepareRequest {
  std::string kind;
  std::string mime;
  std::uint64_t size_bytes{0};
  std::string sha256;
  // 임계값 이하일 때만 허용되는 base64 본문
  std::optional<std::string> inline_base64;
};

struct PrepareResult {
  Resource resource;
  std::optional<UploadTarget> upload;
};

struct ResourceFile {
  Resource resource;
  std::filesystem::path path;
};

struct ResourceReference {
  std::string rid;
  std::string url;
  std::string mime;
  std::uint64_t size_bytes{0};
  std::optional<std::string> inline_base64;
};

struct ResourceStoreConfig {
  std::filesystem::path dir;
  std::uint64_t max_inline_bytes{262144};
  // 0이면 quota.max_total_bytes를 상한으로 사용한다.
  std::uint64_t max_resource_bytes{0};
  QuotaPolicy quota;
  std::chrono::seconds protect_recent{60};
  std::string base_url;
  std::string resource_path{"/resources"};
  std::string token;
  std::function<SystemClock::time_point()> clock;
};

class ResourceStore {
 public:
  explicit ResourceStore(ResourceStoreConfig config, std::shared_ptr<Observability> observability = nullptr);

  std::optional<PrepareResult> Prepare(const PrepareRequest& request, OpError& error);

  // PUT 본문을 받을 .part 경로와 본문 상한을 돌려준다. 이미 업로드 중이거나 pending이 아니면 실패.
  // Content-Length가 없으면 선언 크기가 상한이다.
  std::optional<UploadSlot> BeginUpload(const std::string& rid, std::optional<std::uint64_t> content_length,
                                                   OpError& error);
  // 수신된 .part 파일의 크기/해시를 검증한다. 해시 불일치면 파일을 지우고 pending으로 되돌린다.
  std::optional<Resource> FinishUpload(const std::string& rid, OpError& error);
  void AbortUpload(const std::string& rid);

  // 선언 크기, 수신 크기, 요청 크기가 모두 정확히 일치해야 ready로 전환한다.
  std::optional<Resource> Commit(const std::string& rid, std::uint64_t size_bytes, OpError& error);
  std::optional<ResourceFile> Get(const std::string& rid, OpError& error);
  std::optional<std::string> ReadBytes(const std::string& rid, OpError& error);
  // 존재하던 rid를 지웠으면 true. 없는 rid도 오류가 아니다.
  bool Release(const std::string& rid);

  SweepStats Sweep();
  // 상한을 바꾼다. 이미 상한을 넘은 저장분은 다음 Sweep에서 오래된 ready부터 정리된다.
  void SetQuotaPolicy(const QuotaPolicy& quota);

  std::optional<ResourceReference> ImportBytes(std::string_view bytes, const std::string& kind,
                                               const std::string& mime, OpError& error);
  std::optional<ResourceReference> ImportFile(const std::filesystem::path& path, const std::string& kind,
                                              const std::string& mime, OpError& error);

  bool RequiresUpload(std::uint64_t size_bytes) const { return size_bytes > config_.max_inline_bytes; }
  std::uint64_t MaxInlineBytes() const { return config_.max_inline_bytes; }
  std::string UrlFor(const std::string& rid) const;
  UploadTarget UploadTargetFor(const std::string& rid) const;
  const std::string& ResourcePath() const { return config_.resource_path; }
  const std::string& BaseUrl() const { return config_.base_url; }
  // 리스너가 임의 포트를 받은 경우에만 연결을 받기 전에 호출한다.
  void SetBaseUrl(std::string base_url);
  const std::string& Token() const { return config_.token; }
  Usage GetUsage() const;
  std::size_t PendingCount() const;

 private:
  SystemClock::time_point Now() const;
  std::filesystem::path FilePath(const std::string& rid) const;
  std::filesystem::path PartPath(const std::string& rid) const;
  void RemoveStaleFiles();
  bool AdmitLocked(std::uint64_t size_bytes, OpError& error);
  void EraseLocked(const std::string& rid);
  void RemoveFile(const std::filesystem::path& path);
  std::optional<Resource> StoreReadyLocked(std::string_view bytes, const std::string& kind, const std::string& mime,
                                           const std::string& sha256, OpError& error);

  ResourceStoreConfig config_;
  std::shared_ptr<Observability> observability_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Resource> resources_;
};

}  // namespace bridge

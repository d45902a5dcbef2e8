/*
 * 설명: 임시 파일 기록과 TTL/용량 기반 정리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/temp_store_test.cpp
 */
#include "bridge/temp_store.hpp"

#include <fstream>
#include <stdexcept>
#include <vector>

#include "bridge/digest.hpp"

namespace bridge {

TempFileStore::TempFileStore(TempStoreConfig config, std::shared_ptr<Observability> observability)
    : config_(std::move(config)), observability_(std::move(observability)) {
  if (!config_.clock) {
    config_.clock = [] { return SystemClock::now(); };
  }
  std::error_code ec;
  std::filesystem::create_directories(config_.dir, ec);
  if (ec) {
    throw std::runtime_error("임시 디렉터리 생성 실패: " + config_.dir.string() + " (" + ec.message() + ")");
  }
}

SystemClock::time_point TempFileStore::Now() const { return config_.clock(); }

void TempFileStore::RemoveLocked(const std::string& key) {
  auto it = files_.find(key);
  if (it == files_.end()) {
    return;
  }
  std::error_code ec;
  std::filesystem::remove(it->second.path, ec);
  if (ec && observability_) {
    observability_->Warn("temp_remove_failed", ec.message(), {{"path", it->second.path.string()}});
  }
  files_.erase(it);
}

std::optional<TempFile> TempFileStore::Materialize(std::string_view bytes, std::string_view extension,
                                                   std::string_view prefix, OpError& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = Now();
  if (config_.quota.max_total_bytes > 0 && bytes.size() > config_.quota.max_total_bytes) {
    error = {ErrorCode::kResourceQuotaExceeded, "임시 파일이 임시 저장소 한도보다 큽니다"};
    return std::nullopt;
  }
  std::vector<QuotaEntry> entries;
  for (const auto& [key, file] : files_) {
    entries.push_back(
        QuotaEntry{key, file.size_bytes, file.created_at, file.created_at, now - file.created_at >= config_.protect_recent});
  }
  auto plan = SelectEvictions(entries, config_.quota, bytes.size(), 1);
  if (!plan.satisfied) {
    error = {ErrorCode::kResourceQuotaExceeded, "임시 저장소 공간이 부족합니다"};
    return std::nullopt;
  }
  for (const auto& key : plan.keys) {
    RemoveLocked(key);
  }

  std::string name = std::string(prefix.empty() ? "input" : prefix) + "_" + NewUuid();
  if (!extension.empty()) {
    name += extension.front() == '.' ? std::string(extension) : "." + std::string(extension);
  }
  TempFile file;
  file.path = config_.dir / name;
  file.size_bytes = bytes.size();
  file.created_at = now;
  std::ofstream out(file.path, std::ios::binary | std::ios::trunc);
  if (out) {
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  }
  if (!out) {
    out.close();
    std::error_code ec;
    std::filesystem::remove(file.path, ec);
    if (ec && observability_) {
      observability_->Warn("temp_remove_failed", ec.message(), {{"path", file.path.string()}});
    }
    error = {ErrorCode::kResourceIo, "임시 파일 쓰기 실패: " + file.path.string()};
    return std::nullopt;
  }
  files_[name] = file;
  return file;
}

SweepStats TempFileStore::Sweep() {
  SweepStats stats;
  std::lock_guard<std::mutex> lock(mutex_);
  auto now = Now();
  std::vector<QuotaEntry> entries;
  for (const auto& [key, file] : files_) {
    entries.push_back(QuotaEntry{key, file.size_bytes, file.created_at, file.created_at, true});
  }
  for (const auto& key : SelectExpired(entries, config_.quota, now)) {
    stats.freed_bytes += files_[key].size_bytes;
    RemoveLocked(key);
    ++stats.expired;
  }
  entries.clear();
  for (const auto& [key, file] : files_) {
    entries.push_back(QuotaEntry{key, file.size_bytes, file.created_at, file.created_at, true});
  }
  for (const auto& key : SelectEvictions(entries, config_.quota, 0, 0).keys) {
    stats.freed_bytes += files_[key].size_bytes;
    RemoveLocked(key);
    ++stats.evicted;
  }
  return stats;
}

void TempFileStore::SetQuotaPolicy(const QuotaPolicy& quota) {
  std::lock_guard<std::mutex> lock(mutex_);
  config_.quota = quota;
}

Usage TempFileStore::GetUsage() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Usage usage;
  for (const auto& [key, file] : files_) {
    usage.total_bytes += file.size_bytes;
    ++usage.files;
  }
  return usage;
}

}  // namespace bridge

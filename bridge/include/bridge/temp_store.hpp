/*
 * 설명: 인라인 입력 미디어를 임시 파일로 기록하고 별도의 TTL/용량 정책으로 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/temp_store_test.cpp
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

#include "bridge/observability.hpp"
#include "bridge/protocol.hpp"
#include "bridge/quota.hpp"

namespace bridge {

struct TempFile {
  std::filesystem::path path;
  std::uint64_t size_bytes{0};
  SystemClock::time_point created_at{};
};

struct TempStoreConfig {
  std::filesystem::path dir;
  QuotaPolicy quota;
  std::chrono::seconds protect_recent{60};
  std::function<SystemClock::time_point()> clock;
};

class TempFileStore {
 public:
  explicit TempFileStore(TempStoreConfig config, std::shared_ptr<Observability> observability = nullptr);

  std::optional<TempFile> Materialize(std::string_view bytes, std::string_view extension, std::string_view prefix,
                                      OpError& error);
  SweepStats Sweep();
  // 다음 Sweep부터 새 상한을 적용한다.
  void SetQuotaPolicy(const QuotaPolicy& quota);
  Usage GetUsage() const;
  const std::filesystem::path& Dir() const { return config_.dir; }

 private:
  SystemClock::time_point Now() const;
  void RemoveLocked(const std::string& key);

  TempStoreConfig config_;
  std::shared_ptr<Observability> observability_;
  mutable std::mutex mutex_;
  // key는 파일 이름
  std::map<std::string, TempFile> files_;
};

}  // namespace bridge

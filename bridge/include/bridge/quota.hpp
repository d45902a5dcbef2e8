/*
 * 설명: TTL/용량/파일 수 기반 보존 정책과 오래된 순 축출 계획을 계산한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/quota_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace bridge {

using SystemClock = std::chrono::system_clock;

// 0은 무제한을 뜻한다.
struct QuotaPolicy {
  std::chrono::seconds ttl{0};
  std::uint64_t max_total_bytes{0};
  std::size_t max_files{0};
};

struct QuotaEntry {
  std::string key;
  std::uint64_t size_bytes{0};
  SystemClock::time_point created_at{};
  SystemClock::time_point last_access_at{};
  bool evictable{true};
};

struct EvictionPlan {
  std::vector<std::string> keys;
  bool satisfied{false};
};

struct SweepStats {
  std::size_t expired{0};
  std::size_t evicted{0};
  std::uint64_t freed_bytes{0};
};

struct Usage {
  std::uint64_t total_bytes{0};
  std::size_t files{0};
};

bool IsExpired(const QuotaEntry& entry, const QuotaPolicy& policy, SystemClock::time_point now);

std::vector<std::string> SelectExpired(const std::vector<QuotaEntry>& entries, const QuotaPolicy& policy,
                                       SystemClock::time_point now);

// reserve_bytes/reserve_files 만큼의 여유가 생길 때까지 evictable 항목을 생성 시각이 오래된 순으로 고른다.
// 모든 후보를 제거해도 부족하면 satisfied=false.
EvictionPlan SelectEvictions(const std::vector<QuotaEntry>& entries, const QuotaPolicy& policy,
                             std::uint64_t reserve_bytes, std::size_t reserve_files);

Usage SumUsage(const std::vector<QuotaEntry>& entries);

}  // namespace bridge

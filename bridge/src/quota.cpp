/*
 * 설명: 보존 정책 계산(만료 판정, 축출 후보 선정)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/quota_test.cpp
 */
#include "bridge/quota.hpp"

#include <algorithm>

namespace bridge {

namespace {
bool OverLimit(std::uint64_t bytes, std::size_t files, const QuotaPolicy& policy) {
  if (policy.max_total_bytes > 0 && bytes > policy.max_total_bytes) {
    return true;
  }
  if (policy.max_files > 0 && files > policy.max_files) {
    return true;
  }
  return false;
}
}  // namespace

bool IsExpired(const QuotaEntry& entry, const QuotaPolicy& policy, SystemClock::time_point now) {
  if (policy.ttl.count() <= 0) {
    return false;
  }
  return now - entry.created_at > policy.ttl;
}

std::vector<std::string> SelectExpired(const std::vector<QuotaEntry>& entries, const QuotaPolicy& policy,
                                       SystemClock::time_point now) {
  std::vector<std::string> expired;
  for (const auto& entry : entries) {
    if (entry.evictable && IsExpired(entry, policy, now)) {
      expired.push_back(entry.key);
    }
  }
  return expired;
}

EvictionPlan SelectEvictions(const std::vector<QuotaEntry>& entries, const QuotaPolicy& policy,
                             std::uint64_t reserve_bytes, std::size_t reserve_files) {
  EvictionPlan plan;
  auto usage = SumUsage(entries);
  std::uint64_t bytes = usage.total_bytes + reserve_bytes;
  std::size_t files = usage.files + reserve_files;
  if (!OverLimit(bytes, files, policy)) {
    plan.satisfied = true;
    return plan;
  }

  std::vector<const QuotaEntry*> candidates;
  for (const auto& entry : entries) {
    if (entry.evictable) {
      candidates.push_back(&entry);
    }
  }
  std::sort(candidates.begin(), candidates.end(), [](const QuotaEntry* a, const QuotaEntry* b) {
    if (a->created_at != b->created_at) {
      return a->created_at < b->created_at;
    }
    return a->key < b->key;
  });

  for (const auto* entry : candidates) {
    if (!OverLimit(bytes, files, policy)) {
      break;
    }
    plan.keys.push_back(entry->key);
    bytes -= std::min(bytes, entry->size_bytes);
    files -= std::min<std::size_t>(files, 1);
  }
  plan.satisfied = !OverLimit(bytes, files, policy);
  return plan;
}

Usage SumUsage(const std::vector<QuotaEntry>& entries) {
  Usage usage;
  for (const auto& entry : entries) {
    usage.total_bytes += entry.size_bytes;
    ++usage.files;
  }
  return usage;
}

}  // namespace bridge

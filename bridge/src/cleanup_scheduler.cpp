/*
 * 설명: 정리 주기 타이머와 저장소별 Sweep 호출/로그를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/cleanup_scheduler_test.cpp
 */
#include "bridge/cleanup_scheduler.hpp"

#include <boost/asio/post.hpp>

namespace bridge {

CleanupScheduler::CleanupScheduler(boost::asio::io_context& ioc, std::chrono::milliseconds interval,
                                   std::shared_ptr<ResourceStore> resources, std::shared_ptr<TempFileStore> temp_files,
                                   std::shared_ptr<Observability> observability)
    : strand_(boost::asio::make_strand(ioc)), timer_(strand_), interval_(interval), resources_(std::move(resources)),
      temp_files_(std::move(temp_files)), observability_(std::move(observability)) {}

void CleanupScheduler::Start() {
  if (running_.exchange(true)) {
    return;
  }
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() {
    self->RunOnce();
    self->Schedule();
  });
}

void CleanupScheduler::Stop() {
  running_ = false;
  auto self = shared_from_this();
  boost::asio::post(strand_, [self]() { self->timer_.cancel(); });
}

void CleanupScheduler::Schedule() {
  if (!running_) {
    return;
  }
  timer_.expires_after(interval_);
  auto self = shared_from_this();
  timer_.async_wait([self](const boost::system::error_code& ec) {
    if (ec || !self->running_) {
      return;
    }
    self->RunOnce();
    self->Schedule();
  });
}

void CleanupScheduler::RunOnce() {
  SweepStats resource_stats;
  SweepStats temp_stats;
  if (resources_) {
    resource_stats = resources_->Sweep();
  }
  if (temp_files_) {
    temp_stats = temp_files_->Sweep();
  }
  ++runs_;
  if (!observability_) {
    return;
  }
  nlohmann::json fields{{"resourceExpired", resource_stats.expired},
                        {"resourceEvicted", resource_stats.evicted},
                        {"resourceFreedBytes", resource_stats.freed_bytes},
                        {"tempExpired", temp_stats.expired},
                        {"tempEvicted", temp_stats.evicted},
                        {"tempFreedBytes", temp_stats.freed_bytes}};
  bool removed = resource_stats.expired + resource_stats.evicted + temp_stats.expired + temp_stats.evicted > 0;
  if (removed) {
    observability_->Info("cleanup_sweep", "만료/초과 파일을 정리했습니다", fields);
  } else {
    observability_->Debug("cleanup_sweep", "정리할 파일이 없습니다", fields);
  }
}

}  // namespace bridge

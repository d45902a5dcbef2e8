/*
 * 설명: 리소스/임시 파일 저장소를 고정 주기로 정리하는 독립 타이머 작업.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/cleanup_scheduler_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include "bridge/observability.hpp"
#include "bridge/resource_store.hpp"
#include "bridge/temp_store.hpp"

namespace bridge {

class CleanupScheduler : public std::enable_shared_from_this<CleanupScheduler> {
 public:
  CleanupScheduler(boost::asio::io_context& ioc, std::chrono::milliseconds interval,
                   std::shared_ptr<ResourceStore> resources, std::shared_ptr<TempFileStore> temp_files,
                   std::shared_ptr<Observability> observability = nullptr);

  // 즉시 한 번 정리한 뒤 interval마다 반복한다.
  void Start();
  void Stop();
  // 타이머와 무관하게 현재 스레드에서 정리한다.
  void RunOnce();

  std::uint64_t Runs() const { return runs_.load(); }

 private:
  void Schedule();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::chrono::milliseconds interval_;
  std::shared_ptr<ResourceStore> resources_;
  std::shared_ptr<TempFileStore> temp_files_;
  std::shared_ptr<Observability> observability_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> runs_{0};
};

}  // namespace bridge

/*
 * 설명: 서버가 보낸 요청 패킷과 클라이언트 응답을 packet id로 짝지으며 요청별 타임아웃을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/request_correlator_test.cpp, bridge/tests/e2e/handshake_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/steady_timer.hpp>

#include "bridge/protocol.hpp"

namespace bridge {

enum class CorrelationStatus { kOk, kTimeout, kCancelled, kPeerError };

std::string_view ToString(CorrelationStatus status);

struct CorrelationResult {
  CorrelationStatus status{CorrelationStatus::kOk};
  std::string id;
  std::optional<Packet> reply;
  std::optional<ErrorInfo> error;
};

class RequestCorrelator : public std::enable_shared_from_this<RequestCorrelator> {
 public:
  explicit RequestCorrelator(boost::asio::any_io_executor executor);
  ~RequestCorrelator();

  // 같은 id가 이미 대기 중이면 실패한다.
  std::optional<std::future<CorrelationResult>> Register(const std::string& id, std::chrono::milliseconds timeout,
                                                         OpError& error);
  // 대기 중인 id에 대한 응답이면 소비하고 true. sys.error 응답은 kPeerError로 완료된다.
  bool Resolve(const Packet& reply);
  // 연결 종료 시 남은 요청을 모두 취소 상태로 완료한다.
  void CancelAll(const std::string& reason);
  std::size_t Pending() const;

 private:
  struct Entry {
    std::promise<CorrelationResult> promise;
    std::unique_ptr<boost::asio::steady_timer> timer;
    // 같은 id를 다시 등록해도 이전 타이머 핸들러가 새 요청을 완료하지 못하게 한다.
    std::uint64_t generation{0};
  };

  // generation이 주어지면 그 등록에 대해서만 완료한다.
  bool Complete(const std::string& id, CorrelationResult result,
                std::optional<std::uint64_t> generation = std::nullopt);

  boost::asio::any_io_executor executor_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> pending_;
  std::uint64_t next_generation_{0};
};

}  // namespace bridge

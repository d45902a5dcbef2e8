/*
 * 설명: 요청/응답 상관관계 테이블과 steady_timer 기반 타임아웃을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/request_correlator_test.cpp
 */
#include "bridge/request_correlator.hpp"

namespace bridge {

std::string_view ToString(CorrelationStatus status) {
  switch (status) {
    case CorrelationStatus::kOk:
      return "ok";
    case CorrelationStatus::kTimeout:
      return "timeout";
    case CorrelationStatus::kCancelled:
      return "cancelled";
    case CorrelationStatus::kPeerError:
      return "peer_error";
  }
  return "ok";
}

RequestCorrelator::RequestCorrelator(boost::asio::any_io_executor executor) : executor_(std::move(executor)) {}

RequestCorrelator::~RequestCorrelator() { CancelAll("상관관계 테이블이 해제되었습니다"); }

std::optional<std::future<CorrelationResult>> RequestCorrelator::Register(const std::string& id,
                                                                           std::chrono::milliseconds timeout,
                                                                           OpError& error) {
  if (id.empty()) {
    error = {ErrorCode::kInvalidPayload, "요청 id가 비어 있습니다"};
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_.find(id) != pending_.end()) {
    error = {ErrorCode::kInvalidPayload, "이미 대기 중인 요청 id입니다: " + id};
    return std::nullopt;
  }
  Entry entry;
  entry.generation = ++next_generation_;
  entry.timer = std::make_unique<boost::asio::steady_timer>(executor_);
  entry.timer->expires_after(timeout);
  std::weak_ptr<RequestCorrelator> weak = weak_from_this();
  entry.timer->async_wait([weak, id, timeout, generation = entry.generation](const boost::system::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    auto self = weak.lock();
    if (!self) {
      return;
    }
    CorrelationResult result;
    result.status = CorrelationStatus::kTimeout;
    result.id = id;
    result.error = ErrorInfo{0, "응답 대기 시간 초과 (" + std::to_string(timeout.count()) + "ms)"};
    self->Complete(id, std::move(result), generation);
  });
  auto future = entry.promise.get_future();
  pending_.emplace(id, std::move(entry));
  return future;
}

bool RequestCorrelator::Complete(const std::string& id, CorrelationResult result,
                                 std::optional<std::uint64_t> generation) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = pending_.find(id);
  if (it == pending_.end()) {
    return false;
  }
  // 이미 만료되어 큐에 올라간 핸들러가 재등록된 요청에 도착한 경우
  if (generation && it->second.generation != *generation) {
    return false;
  }
  it->second.timer->cancel();
  it->second.promise.set_value(std::move(result));
  pending_.erase(it);
  return true;
}

bool RequestCorrelator::Resolve(const Packet& reply) {
  CorrelationResult result;
  result.id = reply.id;
  if (reply.op == op::kError || reply.error) {
    result.status = CorrelationStatus::kPeerError;
    result.error = reply.error ? *reply.error : ErrorInfo{0, "클라이언트가 오류를 반환했습니다"};
  } else {
    result.status = CorrelationStatus::kOk;
  }
  result.reply = reply;
  return Complete(reply.id, std::move(result));
}

void RequestCorrelator::CancelAll(const std::string& reason) {
  std::unordered_map<std::string, Entry> drained;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    drained.swap(pending_);
    for (auto& [id, entry] : drained) {
      entry.timer->cancel();
    }
  }
  for (auto& [id, entry] : drained) {
    CorrelationResult result;
    result.status = CorrelationStatus::kCancelled;
    result.id = id;
    result.error = ErrorInfo{0, reason};
    entry.promise.set_value(std::move(result));
  }
}

std::size_t RequestCorrelator::Pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

}  // namespace bridge

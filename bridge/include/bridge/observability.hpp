/*
 * 설명: 구조화 로그(JSON 한 줄)와 연결/패킷/HTTP 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace bridge {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(std::string_view value);
std::string_view ToString(LogLevel level);

struct LogContext {
  LogLevel level{LogLevel::kInfo};
  std::string name;
  std::string message;
  std::string trace_id;
  std::optional<std::string> session_id;
  std::optional<std::string> client_id;
  std::optional<long> latency_ms;
  nlohmann::json fields;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t packets_in{0};
  std::uint64_t packets_out{0};
  std::uint64_t protocol_errors{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo, std::ostream* sink = nullptr);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementPacketsIn();
  void IncrementPacketsOut();
  void IncrementProtocolErrors();
  void WebsocketOpened();
  void WebsocketClosed();
  MetricsSnapshot Snapshot() const;

  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(const LogContext& ctx) const;
  void Debug(std::string_view name, std::string_view message, nlohmann::json fields = nullptr) const;
  void Info(std::string_view name, std::string_view message, nlohmann::json fields = nullptr) const;
  void Warn(std::string_view name, std::string_view message, nlohmann::json fields = nullptr) const;
  void Error(std::string_view name, std::string_view message, nlohmann::json fields = nullptr) const;

 private:
  void Emit(LogLevel level, std::string_view name, std::string_view message, nlohmann::json fields) const;

  LogLevel min_level_;
  std::ostream* sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> packets_in_{0};
  std::atomic<std::uint64_t> packets_out_{0};
  std::atomic<std::uint64_t> protocol_errors_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace bridge

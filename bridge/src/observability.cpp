/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "bridge/observability.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace bridge {

LogLevel ParseLogLevel(std::string_view value) {
  if (value == "debug") {
    return LogLevel::kDebug;
  }
  if (value == "warn" || value == "warning") {
    return LogLevel::kWarn;
  }
  if (value == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level, std::ostream* sink)
    : min_level_(min_level), sink_(sink ? sink : &std::cout) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementPacketsIn() { packets_in_.fetch_add(1); }

void Observability::IncrementPacketsOut() { packets_out_.fetch_add(1); }

void Observability::IncrementProtocolErrors() { protocol_errors_.fetch_add(1); }

void Observability::WebsocketOpened() { websocket_active_.fetch_add(1); }

void Observability::WebsocketClosed() { websocket_active_.fetch_sub(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.packets_in = packets_in_.load();
  snapshot.packets_out = packets_out_.load();
  snapshot.protocol_errors = protocol_errors_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (!Enabled(ctx.level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  log_json["level"] = ToString(ctx.level);
  log_json["event"] = ctx.name;
  if (!ctx.message.empty()) {
    log_json["message"] = ctx.message;
  }
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (ctx.client_id) {
    log_json["clientId"] = *ctx.client_id;
  }
  if (ctx.latency_ms) {
    log_json["latencyMs"] = *ctx.latency_ms;
  }
  if (ctx.fields.is_object()) {
    for (const auto& [key, value] : ctx.fields.items()) {
      log_json[key] = value;
    }
  }
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(sink_mutex_);
  *sink_ << line << std::endl;
}

void Observability::Emit(LogLevel level, std::string_view name, std::string_view message,
                         nlohmann::json fields) const {
  if (!Enabled(level)) {
    return;
  }
  LogContext ctx;
  ctx.level = level;
  ctx.name = std::string(name);
  ctx.message = std::string(message);
  ctx.fields = std::move(fields);
  Log(ctx);
}

void Observability::Debug(std::string_view name, std::string_view message, nlohmann::json fields) const {
  Emit(LogLevel::kDebug, name, message, std::move(fields));
}

void Observability::Info(std::string_view name, std::string_view message, nlohmann::json fields) const {
  Emit(LogLevel::kInfo, name, message, std::move(fields));
}

void Observability::Warn(std::string_view name, std::string_view message, nlohmann::json fields) const {
  Emit(LogLevel::kWarn, name, message, std::move(fields));
}

void Observability::Error(std::string_view name, std::string_view message, nlohmann::json fields) const {
  Emit(LogLevel::kError, name, message, std::move(fields));
}

}  // namespace bridge

/*
 * 설명: 환경변수에서 설정을 읽고 파생 기본값을 채운다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/config_test.cpp
 */
#include "bridge/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace bridge {

namespace {
constexpr std::size_t kMinCleanupIntervalSeconds = 10;

std::uint64_t ParseUnsigned(const char* key, const std::string& value) {
  std::size_t idx = 0;
  unsigned long long parsed = 0;
  try {
    parsed = std::stoull(value, &idx);
  } catch (const std::exception&) {
    throw std::invalid_argument(std::string("숫자 설정값이 올바르지 않습니다: ") + key + "=" + value);
  }
  if (idx != value.size() || value.find('-') != std::string::npos) {
    throw std::invalid_argument(std::string("숫자 설정값이 올바르지 않습니다: ") + key + "=" + value);
  }
  return parsed;
}

bool ParseBool(const char* key, std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return std::tolower(c); });
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  throw std::invalid_argument(std::string("불리언 설정값이 올바르지 않습니다: ") + key + "=" + value);
}

unsigned short ParsePort(const char* key, const std::string& value) {
  auto parsed = ParseUnsigned(key, value);
  if (parsed > 65535) {
    throw std::invalid_argument(std::string("포트 범위를 벗어났습니다: ") + key + "=" + value);
  }
  return static_cast<unsigned short>(parsed);
}
}  // namespace

std::string DefaultResourceBaseUrl(const std::string& host, unsigned short port) {
  std::string public_host = host;
  if (public_host == "0.0.0.0" || public_host == "::" || public_host.empty()) {
    public_host = "127.0.0.1";
  }
  return "http://" + public_host + ":" + std::to_string(port);
}

void ApplyDerivedDefaults(AppConfig& config) {
  if (config.resource_dir.empty()) {
    config.resource_dir = config.data_dir + "/resources";
  }
  if (config.temp_dir.empty()) {
    config.temp_dir = config.data_dir + "/temp";
  }
  if (config.resource_base_url.empty()) {
    config.resource_base_url = DefaultResourceBaseUrl(config.resource_host, config.resource_port);
  }
  while (!config.resource_base_url.empty() && config.resource_base_url.back() == '/') {
    config.resource_base_url.pop_back();
  }
  config.cleanup_interval_seconds = std::max(config.cleanup_interval_seconds, kMinCleanupIntervalSeconds);
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const std::string& def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : def;
  };
  auto get_size = [&](const char* key, std::size_t def) -> std::size_t {
    const char* val = std::getenv(key);
    return val ? static_cast<std::size_t>(ParseUnsigned(key, val)) : def;
  };
  auto get_u64 = [&](const char* key, std::uint64_t def) -> std::uint64_t {
    const char* val = std::getenv(key);
    return val ? ParseUnsigned(key, val) : def;
  };
  auto get_bool = [&](const char* key, bool def) -> bool {
    const char* val = std::getenv(key);
    return val ? ParseBool(key, val) : def;
  };
  auto get_port = [&](const char* key, unsigned short def) -> unsigned short {
    const char* val = std::getenv(key);
    return val ? ParsePort(key, val) : def;
  };

  AppConfig cfg;
  cfg.ws_host = get_env("WS_HOST", cfg.ws_host);
  cfg.ws_port = get_port("WS_PORT", cfg.ws_port);
  cfg.ws_path = get_env("WS_PATH", cfg.ws_path);
  cfg.auth_token = get_env("AUTH_TOKEN", cfg.auth_token);
  cfg.max_connections = get_size("MAX_CONNECTIONS", cfg.max_connections);
  cfg.kick_old = get_bool("KICK_OLD", cfg.kick_old);
  cfg.data_dir = get_env("DATA_DIR", cfg.data_dir);

  cfg.resource_host = get_env("RESOURCE_HOST", cfg.resource_host);
  cfg.resource_port = get_port("RESOURCE_PORT", cfg.resource_port);
  cfg.resource_path = get_env("RESOURCE_PATH", cfg.resource_path);
  cfg.resource_dir = get_env("RESOURCE_DIR", cfg.resource_dir);
  cfg.resource_base_url = get_env("RESOURCE_BASE_URL", cfg.resource_base_url);
  cfg.resource_token = get_env("RESOURCE_TOKEN", cfg.resource_token);
  cfg.resource_max_inline_bytes = get_u64("RESOURCE_MAX_INLINE_BYTES", cfg.resource_max_inline_bytes);
  cfg.resource_max_bytes = get_u64("RESOURCE_MAX_BYTES", cfg.resource_max_bytes);
  cfg.resource_ttl_seconds = get_size("RESOURCE_TTL_SECONDS", cfg.resource_ttl_seconds);
  cfg.resource_max_total_bytes = get_u64("RESOURCE_MAX_TOTAL_BYTES", cfg.resource_max_total_bytes);
  cfg.resource_max_files = get_size("RESOURCE_MAX_FILES", cfg.resource_max_files);
  cfg.resource_protect_seconds = get_size("RESOURCE_PROTECT_SECONDS", cfg.resource_protect_seconds);

  cfg.temp_dir = get_env("TEMP_DIR", cfg.temp_dir);
  cfg.temp_ttl_seconds = get_size("TEMP_TTL_SECONDS", cfg.temp_ttl_seconds);
  cfg.temp_max_total_bytes = get_u64("TEMP_MAX_TOTAL_BYTES", cfg.temp_max_total_bytes);
  cfg.temp_max_files = get_size("TEMP_MAX_FILES", cfg.temp_max_files);

  cfg.cleanup_interval_seconds = get_size("CLEANUP_INTERVAL_SECONDS", cfg.cleanup_interval_seconds);
  cfg.handshake_timeout_seconds = get_size("HANDSHAKE_TIMEOUT_SECONDS", cfg.handshake_timeout_seconds);
  cfg.heartbeat_interval_seconds = get_size("HEARTBEAT_INTERVAL_SECONDS", cfg.heartbeat_interval_seconds);
  cfg.heartbeat_timeout_multiplier = get_size("HEARTBEAT_TIMEOUT_MULTIPLIER", cfg.heartbeat_timeout_multiplier);
  cfg.request_timeout_ms = get_size("REQUEST_TIMEOUT_MS", cfg.request_timeout_ms);

  cfg.max_frame_bytes = get_size("MAX_FRAME_BYTES", cfg.max_frame_bytes);
  cfg.max_message_length = get_size("MAX_MESSAGE_LENGTH", cfg.max_message_length);
  cfg.max_protocol_violations = get_size("MAX_PROTOCOL_VIOLATIONS", cfg.max_protocol_violations);
  cfg.ws_queue_limit_messages = get_size("WS_QUEUE_LIMIT_MESSAGES", cfg.ws_queue_limit_messages);
  cfg.ws_queue_limit_bytes = get_size("WS_QUEUE_LIMIT_BYTES", cfg.ws_queue_limit_bytes);

  cfg.log_level = get_env("LOG_LEVEL", cfg.log_level);
  cfg.tts_mode = get_env("TTS_MODE", cfg.tts_mode);
  if (cfg.tts_mode != "none" && cfg.tts_mode != "local" && cfg.tts_mode != "remote") {
    throw std::invalid_argument("TTS_MODE는 none, local, remote 중 하나여야 합니다: " + cfg.tts_mode);
  }
  cfg.tts_voice = get_env("TTS_VOICE", cfg.tts_voice);
  cfg.auto_emotion = get_bool("AUTO_EMOTION", cfg.auto_emotion);
  cfg.enable_streaming = get_bool("ENABLE_STREAMING", cfg.enable_streaming);

  ApplyDerivedDefaults(cfg);
  return cfg;
}

}  // namespace bridge

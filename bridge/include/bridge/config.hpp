/*
 * 설명: 브리지 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/config_test.cpp, bridge/tests/e2e/handshake_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace bridge {

struct AppConfig {
  // WebSocket
  std::string ws_host{"0.0.0.0"};
  unsigned short ws_port{9090};
  std::string ws_path{"/astrbot/live2d"};
  std::string auth_token;
  std::size_t max_connections{1};
  bool kick_old{true};
  std::string data_dir{"data"};

  // 리소스 리스너/저장소
  std::string resource_host{"0.0.0.0"};
  unsigned short resource_port{9091};
  std::string resource_path{"/resources"};
  // 비어 있으면 {data_dir}/resources
  std::string resource_dir;
  // 비어 있으면 http://{resource_host}:{resource_port}
  std::string resource_base_url;
  // 비어 있으면 auth_token 재사용
  std::string resource_token;
  std::uint64_t resource_max_inline_bytes{262144};
  std::uint64_t resource_max_bytes{0};
  std::size_t resource_ttl_seconds{604800};
  std::uint64_t resource_max_total_bytes{1073741824};
  std::size_t resource_max_files{2000};
  std::size_t resource_protect_seconds{60};

  // 입력 임시 파일
  std::string temp_dir;
  std::size_t temp_ttl_seconds{21600};
  std::uint64_t temp_max_total_bytes{268435456};
  std::size_t temp_max_files{5000};

  std::size_t cleanup_interval_seconds{600};
  std::size_t handshake_timeout_seconds{10};
  std::size_t heartbeat_interval_seconds{30};
  std::size_t heartbeat_timeout_multiplier{3};
  std::size_t request_timeout_ms{15000};

  std::size_t max_frame_bytes{1048576};
  std::size_t max_message_length{5000};
  std::size_t max_protocol_violations{5};
  std::size_t ws_queue_limit_messages{64};
  std::size_t ws_queue_limit_bytes{4194304};

  std::string log_level{"info"};
  // none | local | remote
  std::string tts_mode{"none"};
  std::string tts_voice{"zh-CN-XiaoxiaoNeural"};
  bool auto_emotion{true};
  bool enable_streaming{true};
};

// 와일드카드 호스트는 127.0.0.1로 바꿔 http://{host}:{port}를 만든다.
std::string DefaultResourceBaseUrl(const std::string& host, unsigned short port);

// 파생 기본값(resource_dir, temp_dir, resource_base_url, 정리 주기 하한)을 채운다.
void ApplyDerivedDefaults(AppConfig& config);

// 잘못된 숫자/불리언 값이면 std::invalid_argument.
AppConfig LoadConfigFromEnv();

}  // namespace bridge

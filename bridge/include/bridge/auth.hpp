/*
 * 설명: 공유 비밀 토큰 비교, Bearer 헤더 파싱, 빈 토큰 설정 시 토큰 생성/보관을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/auth_test.cpp
 */
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace bridge {

// 상수 시간 비교. 기대 토큰이 비어 있으면 항상 거부한다.
bool TokenMatches(std::string_view expected, std::string_view provided);

std::string ParseBearer(std::string_view header_value);

struct TokenSource {
  std::string token;
  bool generated{false};
  bool loaded_from_file{false};
};

// configured가 비어 있으면 {data_dir}/auth_token을 읽고, 없으면 32바이트 난수 토큰을 만들어 0600 권한으로 저장한다.
// 저장에 실패하면 std::runtime_error.
TokenSource EnsureAuthToken(const std::string& configured, const std::filesystem::path& data_dir);

}  // namespace bridge

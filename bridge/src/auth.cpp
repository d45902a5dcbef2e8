/*
 * 설명: 토큰 비교/파싱과 인증 토큰 자동 생성을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/auth_test.cpp
 */
#include "bridge/auth.hpp"

#include <fstream>
#include <stdexcept>

#include <openssl/crypto.h>

#include "bridge/digest.hpp"

namespace bridge {

namespace {
std::string Trim(std::string value) {
  const char* ws = " \t\r\n";
  auto start = value.find_first_not_of(ws);
  if (start == std::string::npos) {
    return {};
  }
  auto end = value.find_last_not_of(ws);
  return value.substr(start, end - start + 1);
}
}  // namespace

bool TokenMatches(std::string_view expected, std::string_view provided) {
  if (expected.empty() || expected.size() != provided.size()) {
    return false;
  }
  return CRYPTO_memcmp(expected.data(), provided.data(), expected.size()) == 0;
}

std::string ParseBearer(std::string_view header_value) {
  const std::string_view prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return Trim(std::string(header_value.substr(prefix.size())));
}

TokenSource EnsureAuthToken(const std::string& configured, const std::filesystem::path& data_dir) {
  TokenSource source;
  auto trimmed = Trim(configured);
  if (!trimmed.empty()) {
    source.token = trimmed;
    return source;
  }

  auto token_path = data_dir / "auth_token";
  std::error_code ec;
  if (std::filesystem::exists(token_path, ec)) {
    std::ifstream in(token_path);
    std::string stored;
    std::getline(in, stored);
    stored = Trim(stored);
    if (!stored.empty()) {
      source.token = stored;
      source.loaded_from_file = true;
      return source;
    }
  }

  std::filesystem::create_directories(data_dir, ec);
  if (ec) {
    throw std::runtime_error("데이터 디렉터리 생성 실패: " + data_dir.string() + " (" + ec.message() + ")");
  }
  source.token = RandomHex(32);
  source.generated = true;
  {
    std::ofstream out(token_path, std::ios::trunc);
    out << source.token << '\n';
    if (!out) {
      throw std::runtime_error("인증 토큰 저장 실패: " + token_path.string());
    }
  }
  std::filesystem::permissions(token_path, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    throw std::runtime_error("인증 토큰 파일 권한 설정 실패: " + ec.message());
  }
  return source;
}

}  // namespace bridge

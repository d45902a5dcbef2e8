/*
 * 설명: OpenSSL 기반 SHA-256, base64, 난수 토큰과 UUID 생성을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/digest_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace bridge {

std::string BytesToHex(const unsigned char* data, std::size_t len);
std::string RandomHex(std::size_t bytes);
std::string NewUuid();

std::string Sha256Hex(std::string_view data);

struct FileDigest {
  std::uint64_t size_bytes{0};
  std::string sha256;
};

std::optional<FileDigest> DigestFile(const std::filesystem::path& path);

std::string Base64Encode(std::string_view data);
// 공백은 무시하고 누락된 패딩은 보충한다. 형식 오류면 nullopt.
std::optional<std::string> Base64Decode(std::string_view encoded);

bool IsSha256Hex(std::string_view value);

}  // namespace bridge

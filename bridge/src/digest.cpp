/*
 * 설명: OpenSSL EVP API로 다이제스트/인코딩을 구현하고 Boost.UUID로 식별자를 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/digest_test.cpp
 */
#include "bridge/digest.hpp"

#include <array>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace bridge {

namespace {
using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

DigestContext NewSha256Context() {
  DigestContext ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("SHA-256 컨텍스트 초기화 실패");
  }
  return ctx;
}

std::string FinishSha256(EVP_MD_CTX* ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, digest.data(), &len) != 1) {
    throw std::runtime_error("SHA-256 계산 실패");
  }
  return BytesToHex(digest.data(), len);
}
}  // namespace

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::string RandomHex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("보안 난수 생성 실패");
  }
  return BytesToHex(buffer.data(), buffer.size());
}

std::string NewUuid() {
  thread_local boost::uuids::random_generator generator;
  return boost::uuids::to_string(generator());
}

std::string Sha256Hex(std::string_view data) {
  auto ctx = NewSha256Context();
  if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
    throw std::runtime_error("SHA-256 갱신 실패");
  }
  return FinishSha256(ctx.get());
}

std::optional<FileDigest> DigestFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  auto ctx = NewSha256Context();
  FileDigest result;
  std::vector<char> chunk(1 << 16);
  while (in) {
    in.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
    auto got = in.gcount();
    if (got <= 0) {
      break;
    }
    if (EVP_DigestUpdate(ctx.get(), chunk.data(), static_cast<std::size_t>(got)) != 1) {
      throw std::runtime_error("SHA-256 갱신 실패");
    }
    result.size_bytes += static_cast<std::uint64_t>(got);
  }
  if (in.bad()) {
    return std::nullopt;
  }
  result.sha256 = FinishSha256(ctx.get());
  return result;
}

std::string Base64Encode(std::string_view data) {
  if (data.empty()) {
    return {};
  }
  std::string out(4 * ((data.size() + 2) / 3) + 1, '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::optional<std::string> Base64Decode(std::string_view encoded) {
  std::string clean;
  clean.reserve(encoded.size());
  for (char c : encoded) {
    if (!std::isspace(static_cast<unsigned char>(c))) {
      clean.push_back(c);
    }
  }
  if (clean.empty()) {
    return std::string{};
  }
  while (clean.size() % 4 != 0) {
    clean.push_back('=');
  }
  std::size_t padding = 0;
  if (clean.back() == '=') {
    ++padding;
    if (clean[clean.size() - 2] == '=') {
      ++padding;
    }
  }
  std::string out(3 * clean.size() / 4, '\0');
  int decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(clean.data()), static_cast<int>(clean.size()));
  if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) {
    return std::nullopt;
  }
  // EVP_DecodeBlock은 패딩 바이트까지 0으로 채워 길이에 포함한다.
  out.resize(static_cast<std::size_t>(decoded) - padding);
  return out;
}

bool IsSha256Hex(std::string_view value) {
  if (value.size() != 64) {
    return false;
  }
  for (char c : value) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

}  // namespace bridge

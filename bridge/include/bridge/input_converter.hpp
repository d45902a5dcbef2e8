/*
 * 설명: input.message/input.touch/input.shortcut 페이로드를 정규 메시지로 변환한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/input_converter_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "bridge/message.hpp"
#include "bridge/protocol.hpp"
#include "bridge/temp_store.hpp"

namespace bridge {

struct DataUri {
  std::string mime;
  std::string base64;
};

// data:<mime>[;param...];base64,<data>
std::optional<DataUri> ParseDataUri(std::string_view uri);

// 오디오는 webm/ogg/opus/m4a/mp3/wav로 매핑하고 나머지는 서브타입을 그대로 쓴다.
std::string ExtensionForMime(std::string_view mime);

// 코드포인트 기준으로 자르며 UTF-8 시퀀스를 중간에서 끊지 않는다. 잘렸으면 truncated=true.
std::string TruncateUtf8(std::string_view text, std::size_t max_code_points, bool& truncated);

struct ConversionIssue {
  std::size_t part_index{0};
  ErrorCode code{ErrorCode::kUnsupportedType};
  std::string message;
};

struct InputConversion {
  CanonicalMessage message;
  std::string plain_text;
  std::vector<ConversionIssue> issues;
  bool truncated{false};
};

class InputConverter {
 public:
  InputConverter(std::size_t max_text_length, std::shared_ptr<TempFileStore> temp_store);

  // 파트 단위로 실패를 issues에 기록하고 나머지 파트는 계속 변환한다.
  InputConversion Convert(const nlohmann::json& content) const;
  std::optional<CanonicalMessage> ConvertTouch(const nlohmann::json& payload, OpError& error) const;
  std::optional<CanonicalMessage> ConvertShortcut(const nlohmann::json& payload, OpError& error) const;

  static const std::vector<std::string>& SupportedImageFormats();
  static const std::vector<std::string>& SupportedAudioFormats();
  static const std::vector<std::string>& SupportedVideoFormats();

 private:
  enum class MediaKind { kImage, kAudio, kVideo };

  std::optional<MessageElement> ConvertMedia(MediaKind kind, const nlohmann::json& part, OpError& error) const;
  std::optional<MediaSource> ResolveSource(MediaKind kind, const nlohmann::json& part, std::string& mime,
                                           OpError& error) const;
  bool MimeSupported(MediaKind kind, std::string_view mime) const;

  std::size_t max_text_length_;
  std::shared_ptr<TempFileStore> temp_store_;
};

}  // namespace bridge

/*
 * 설명: perform.show로 전송되는 연출 시퀀스(텍스트/TTS/모션/표정/이미지/비디오/대기)의 타입과 JSON 형식을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/output_converter_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "bridge/motion_types.hpp"

namespace bridge {

// url/rid/inline 중 어떤 방식으로 내용을 가져올지. 저장소에 올린 경우 rid와 url이 함께 채워진다.
struct MediaLocator {
  std::optional<std::string> url;
  std::optional<std::string> rid;
  std::optional<std::string> inline_base64;

  bool Empty() const { return !url && !rid && !inline_base64; }
};

struct TextDisplay {
  std::string content;
  int duration_ms{0};
  std::string position{"center"};
};

enum class TtsMode { kNone, kLocal, kRemote };

struct TtsDisplay {
  std::string text;
  TtsMode mode{TtsMode::kLocal};
  MediaLocator audio;
  std::optional<std::string> voice;
  double volume{1.0};
  double speed{1.0};
};

struct ImageDisplay {
  MediaLocator source;
  int duration_ms{5000};
  std::string position{"center"};
};

struct VideoDisplay {
  MediaLocator source;
  int duration_ms{0};
  std::string position{"center"};
  bool autoplay{true};
  bool loop{false};
};

struct MotionDisplay {
  std::string group{"Idle"};
  int index{0};
  int priority{2};
  bool loop{false};
  int fade_in_ms{300};
  int fade_out_ms{300};
  std::optional<MotionType> motion_type;
};

struct ExpressionDisplay {
  std::string id;
  int fade_ms{300};
  std::optional<MotionType> motion_type;
};

struct WaitDisplay {
  int duration_ms{0};
};

using PerformanceElement = std::variant<TextDisplay, TtsDisplay, ImageDisplay, VideoDisplay, MotionDisplay,
                                        ExpressionDisplay, WaitDisplay>;

struct PerformanceSequence {
  bool interrupt{true};
  std::vector<PerformanceElement> elements;
};

nlohmann::json ToJson(const PerformanceElement& element);
// perform.show 페이로드 {"interrupt", "sequence"}
nlohmann::json ToJson(const PerformanceSequence& sequence);

// 텍스트 요소 content를 순서대로 이어 붙인 결과
std::string JoinedText(const PerformanceSequence& sequence);

}  // namespace bridge

/*
 * 설명: 호스트 프레임워크와 무관한 정규 메시지(텍스트/미디어 참조/모션·표정 지시)를 닫힌 variant로 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/input_converter_test.cpp, bridge/tests/unit/output_converter_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "bridge/motion_types.hpp"

namespace bridge {

// std::visit용 람다 묶음
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// http(s)://, file:// URL 또는 로컬 경로
struct UrlSource {
  std::string url;
};

struct ResourceSource {
  std::string rid;
};

// 디코딩된 원본 바이트
struct InlineSource {
  std::string bytes;
};

// 참조 방식은 항상 하나만 채워진다.
using MediaSource = std::variant<UrlSource, ResourceSource, InlineSource>;

struct TextElement {
  std::string text;
};

struct ImageRef {
  MediaSource source;
  std::string mime;
};

struct AudioRef {
  MediaSource source;
  std::string mime;
  // 음성 인식 결과나 TTS 원문
  std::string transcript;
};

struct VideoRef {
  MediaSource source;
  std::string mime;
  bool autoplay{true};
  bool loop{false};
};

struct MotionDirective {
  std::string group{"Idle"};
  int index{0};
  int priority{2};
  bool loop{false};
  int fade_in_ms{300};
  int fade_out_ms{300};
  std::optional<MotionType> motion_type;
};

struct ExpressionDirective {
  std::string id;
  int fade_ms{300};
  std::optional<MotionType> motion_type;
};

struct WaitDirective {
  int duration_ms{0};
};

using MessageElement =
    std::variant<TextElement, ImageRef, AudioRef, VideoRef, MotionDirective, ExpressionDirective, WaitDirective>;

struct CanonicalMessage {
  std::vector<MessageElement> elements;
};

// 텍스트는 그대로, 미디어는 [image]/[voice]/[video] 자리표시자로 이어 붙인다.
std::string PlainText(const CanonicalMessage& message);

bool HasDirective(const CanonicalMessage& message);

// 편의 생성자
CanonicalMessage TextMessage(std::string text);

}  // namespace bridge

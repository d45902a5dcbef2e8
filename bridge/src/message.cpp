/*
 * 설명: 정규 메시지의 텍스트 렌더링 헬퍼를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "bridge/message.hpp"

namespace bridge {

std::string PlainText(const CanonicalMessage& message) {
  std::string out;
  for (const auto& element : message.elements) {
    std::visit(Overloaded{
                   [&](const TextElement& text) { out += text.text; },
                   [&](const ImageRef&) { out += "[image]"; },
                   [&](const AudioRef& audio) { out += audio.transcript.empty() ? "[voice]" : audio.transcript; },
                   [&](const VideoRef&) { out += "[video]"; },
                   [](const MotionDirective&) {},
                   [](const ExpressionDirective&) {},
                   [](const WaitDirective&) {},
               },
               element);
  }
  return out;
}

bool HasDirective(const CanonicalMessage& message) {
  for (const auto& element : message.elements) {
    if (std::holds_alternative<MotionDirective>(element) || std::holds_alternative<ExpressionDirective>(element)) {
      return true;
    }
  }
  return false;
}

CanonicalMessage TextMessage(std::string text) {
  CanonicalMessage message;
  message.elements.push_back(TextElement{std::move(text)});
  return message;
}

}  // namespace bridge

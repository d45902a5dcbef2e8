/*
 * 설명: 연출 요소를 클라이언트 JSON 형식으로 직렬화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/output_converter_test.cpp
 */
#include "bridge/performance.hpp"

#include "bridge/message.hpp"

namespace bridge {

namespace {
void ApplyLocator(nlohmann::json& j, const MediaLocator& locator) {
  if (locator.url) {
    j["url"] = *locator.url;
  }
  if (locator.rid) {
    j["rid"] = *locator.rid;
  }
  if (locator.inline_base64) {
    j["inline"] = *locator.inline_base64;
  }
}

void ApplyMotionType(nlohmann::json& j, const std::optional<MotionType>& type) {
  if (type) {
    j["motionType"] = ToString(*type);
  }
}
}  // namespace

nlohmann::json ToJson(const PerformanceElement& element) {
  return std::visit(
      Overloaded{
          [](const TextDisplay& text) {
            return nlohmann::json{
                {"type", "text"}, {"content", text.content}, {"duration", text.duration_ms}, {"position", text.position}};
          },
          [](const TtsDisplay& tts) {
            nlohmann::json j{{"type", "tts"}, {"text", tts.text}, {"volume", tts.volume}, {"speed", tts.speed}};
            ApplyLocator(j, tts.audio);
            if (!tts.audio.Empty() || tts.mode == TtsMode::kRemote) {
              j["ttsMode"] = "remote";
            } else {
              j["ttsMode"] = "local";
            }
            if (tts.voice) {
              j["voice"] = *tts.voice;
            }
            return j;
          },
          [](const ImageDisplay& image) {
            nlohmann::json j{{"type", "image"}, {"duration", image.duration_ms}, {"position", image.position}};
            ApplyLocator(j, image.source);
            return j;
          },
          [](const VideoDisplay& video) {
            nlohmann::json j{{"type", "video"},
                             {"duration", video.duration_ms},
                             {"position", video.position},
                             {"autoplay", video.autoplay},
                             {"loop", video.loop}};
            ApplyLocator(j, video.source);
            return j;
          },
          [](const MotionDisplay& motion) {
            nlohmann::json j{{"type", "motion"},         {"group", motion.group},         {"index", motion.index},
                             {"priority", motion.priority}, {"loop", motion.loop},         {"fadeIn", motion.fade_in_ms},
                             {"fadeOut", motion.fade_out_ms}};
            ApplyMotionType(j, motion.motion_type);
            return j;
          },
          [](const ExpressionDisplay& expression) {
            nlohmann::json j{{"type", "expression"}, {"id", expression.id}, {"fade", expression.fade_ms}};
            ApplyMotionType(j, expression.motion_type);
            return j;
          },
          [](const WaitDisplay& wait) {
            return nlohmann::json{{"type", "wait"}, {"duration", wait.duration_ms}};
          },
      },
      element);
}

nlohmann::json ToJson(const PerformanceSequence& sequence) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& element : sequence.elements) {
    items.push_back(ToJson(element));
  }
  return {{"interrupt", sequence.interrupt}, {"sequence", std::move(items)}};
}

std::string JoinedText(const PerformanceSequence& sequence) {
  std::string out;
  for (const auto& element : sequence.elements) {
    if (const auto* text = std::get_if<TextDisplay>(&element)) {
      out += text->content;
    }
  }
  return out;
}

}  // namespace bridge

/*
 * 설명: 정규 메시지를 연출 시퀀스로 변환하고(미디어 인라인/리소스 선택, TTS, 자동 감정) 스트리밍 분할을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/output_converter_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bridge/message.hpp"
#include "bridge/motion_types.hpp"
#include "bridge/observability.hpp"
#include "bridge/performance.hpp"
#include "bridge/protocol.hpp"
#include "bridge/resource_store.hpp"

namespace bridge {

inline constexpr std::string_view kDefaultTtsVoice = "zh-CN-XiaoxiaoNeural";

struct OutputOptions {
  bool interrupt{true};
  TtsMode tts_mode{TtsMode::kNone};
  // remote 모드에서 상위 단계가 미리 합성해 둔 음성 URL
  std::optional<std::string> tts_url;
  std::string voice{kDefaultTtsVoice};
  bool auto_emotion{true};
};

struct OutputConversion {
  PerformanceSequence sequence;
  std::vector<OpError> issues;
};

class OutputConverter {
 public:
  OutputConverter(std::uint64_t max_inline_bytes, std::shared_ptr<ResourceStore> store,
                  std::shared_ptr<const MotionClassifier> classifier,
                  std::shared_ptr<Observability> observability = nullptr);

  // 전체 응답을 한 번에 변환한다. sequence.interrupt는 options.interrupt를 따른다.
  OutputConversion Convert(const CanonicalMessage& message, const OutputOptions& options) const;

  // 텍스트가 아닌 요소 하나를 변환한다. 참조를 해석할 수 없으면 nullopt와 error.
  std::optional<PerformanceElement> ConvertElement(const MessageElement& element, OpError& error) const;
  std::optional<MediaLocator> ResolveMedia(const MediaSource& source, const std::string& kind, const std::string& mime,
                                           OpError& error) const;

  // 텍스트에 붙일 TTS 요소(없으면 빈 벡터). remote URL은 attach_remote가 true일 때만 붙는다.
  std::vector<PerformanceElement> TtsFor(const std::string& text, const OutputOptions& options, bool attach_remote,
                                         std::vector<OpError>& issues) const;
  // 분류 결과로 motionType이 달린 expression + motion 요소
  std::vector<PerformanceElement> EmotionFor(std::string_view text) const;

  MotionType Classify(std::string_view text) const { return classifier_->Classify(text); }

 private:
  std::uint64_t max_inline_bytes_;
  std::shared_ptr<ResourceStore> store_;
  std::shared_ptr<const MotionClassifier> classifier_;
  std::shared_ptr<Observability> observability_;
};

// 스트리밍 응답을 문장 단위 interrupt:false 시퀀스로 나눈다.
// 종결 문자가 없는 텍스트는 Finish()까지 보류되고, 추론된 감정은 마지막 시퀀스에 붙는다.
class StreamAssembler {
 public:
  StreamAssembler(std::shared_ptr<const OutputConverter> converter, OutputOptions options);

  std::vector<PerformanceSequence> Push(const CanonicalMessage& chunk);
  std::vector<PerformanceSequence> PushText(std::string_view text);
  std::vector<PerformanceSequence> Finish();

  bool Finished() const { return finished_; }
  const std::vector<OpError>& Issues() const { return issues_; }

 private:
  void EmitCompleteSentences(std::vector<PerformanceSequence>& out);
  void EmitText(std::string text, std::vector<PerformanceSequence>& out);

  std::shared_ptr<const OutputConverter> converter_;
  OutputOptions options_;
  std::string pending_;
  std::string full_text_;
  bool directive_seen_{false};
  bool remote_tts_attached_{false};
  bool finished_{false};
  std::vector<OpError> issues_;
};

// 문장 종결 위치(종결 문자 직후 바이트 오프셋). 없으면 npos.
std::size_t FindSentenceEnd(std::string_view text, std::size_t from);

}  // namespace bridge

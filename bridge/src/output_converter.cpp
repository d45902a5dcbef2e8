/*
 * 설명: 출력 변환(요소 매핑, 미디어 전달 방식 선택, TTS/감정 부착)과 문장 단위 스트리밍 분할을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/output_converter_test.cpp
 */
#include "bridge/output_converter.hpp"

#include <array>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>

#include "bridge/digest.hpp"

namespace bridge {

namespace {
bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

std::filesystem::path LocalPath(std::string_view url) {
  if (StartsWith(url, "file://")) {
    return std::filesystem::path(std::string(url.substr(7)));
  }
  return std::filesystem::path(std::string(url));
}

std::optional<std::string> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return std::nullopt;
  }
  return bytes;
}
}  // namespace

std::size_t FindSentenceEnd(std::string_view text, std::size_t from) {
  static constexpr std::array<std::string_view, 4> kWide = {"。", "！", "？", "；"};
  for (std::size_t i = from; i < text.size(); ++i) {
    char c = text[i];
    if (c == '!' || c == '?' || c == ';' || c == '\n') {
      return i + 1;
    }
    if (c == '.') {
      // 소수점/약어에서 끊지 않도록 뒤에 공백이 확인될 때만 종결로 본다.
      if (i + 1 < text.size() && std::isspace(static_cast<unsigned char>(text[i + 1]))) {
        return i + 1;
      }
      continue;
    }
    for (auto wide : kWide) {
      if (text.compare(i, wide.size(), wide) == 0) {
        return i + wide.size();
      }
    }
  }
  return std::string_view::npos;
}

OutputConverter::OutputConverter(std::uint64_t max_inline_bytes, std::shared_ptr<ResourceStore> store,
                                 std::shared_ptr<const MotionClassifier> classifier,
                                 std::shared_ptr<Observability> observability)
    : max_inline_bytes_(max_inline_bytes), store_(std::move(store)), classifier_(std::move(classifier)),
      observability_(std::move(observability)) {
  if (!classifier_) {
    classifier_ = std::make_shared<KeywordMotionClassifier>();
  }
}

std::optional<MediaLocator> OutputConverter::ResolveMedia(const MediaSource& source, const std::string& kind,
                                                          const std::string& mime, OpError& error) const {
  return std::visit(
      Overloaded{
          [&](const UrlSource& src) -> std::optional<MediaLocator> {
            MediaLocator locator;
            if (StartsWith(src.url, "http://") || StartsWith(src.url, "https://")) {
              locator.url = src.url;
              return locator;
            }
            auto path = LocalPath(src.url);
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec)) {
              error = {ErrorCode::kResourceIo, "로컬 파일을 찾을 수 없습니다: " + path.string()};
              return std::nullopt;
            }
            auto size = std::filesystem::file_size(path, ec);
            if (ec) {
              error = {ErrorCode::kResourceIo, "파일 크기를 확인할 수 없습니다: " + ec.message()};
              return std::nullopt;
            }
            if (size <= max_inline_bytes_) {
              auto bytes = ReadFile(path);
              if (!bytes) {
                error = {ErrorCode::kResourceIo, "로컬 파일 읽기 실패: " + path.string()};
                return std::nullopt;
              }
              locator.inline_base64 = Base64Encode(*bytes);
              return locator;
            }
            if (!store_) {
              locator.url = "file://" + path.string();
              return locator;
            }
            auto ref = store_->ImportFile(path, kind, mime, error);
            if (!ref) {
              return std::nullopt;
            }
            locator.rid = ref->rid;
            locator.url = ref->url;
            return locator;
          },
          [&](const ResourceSource& src) -> std::optional<MediaLocator> {
            MediaLocator locator;
            locator.rid = src.rid;
            if (store_) {
              locator.url = store_->UrlFor(src.rid);
            }
            return locator;
          },
          [&](const InlineSource& src) -> std::optional<MediaLocator> {
            MediaLocator locator;
            if (src.bytes.size() <= max_inline_bytes_ || !store_) {
              locator.inline_base64 = Base64Encode(src.bytes);
              return locator;
            }
            auto ref = store_->ImportBytes(src.bytes, kind, mime, error);
            if (!ref) {
              return std::nullopt;
            }
            locator.rid = ref->rid;
            locator.url = ref->url;
            return locator;
          },
      },
      source);
}

std::optional<PerformanceElement> OutputConverter::ConvertElement(const MessageElement& element,
                                                                  OpError& error) const {
  return std::visit(
      Overloaded{
          [&](const TextElement& text) -> std::optional<PerformanceElement> {
            return TextDisplay{text.text};
          },
          [&](const ImageRef& image) -> std::optional<PerformanceElement> {
            auto locator = ResolveMedia(image.source, "image", image.mime, error);
            if (!locator) {
              return std::nullopt;
            }
            ImageDisplay display;
            display.source = std::move(*locator);
            return display;
          },
          [&](const AudioRef& audio) -> std::optional<PerformanceElement> {
            // 오디오는 클라이언트에서 TTS 요소로 재생한다.
            auto locator = ResolveMedia(audio.source, "audio", audio.mime, error);
            if (!locator) {
              return std::nullopt;
            }
            TtsDisplay display;
            display.text = audio.transcript;
            display.mode = TtsMode::kRemote;
            display.audio = std::move(*locator);
            return display;
          },
          [&](const VideoRef& video) -> std::optional<PerformanceElement> {
            auto locator = ResolveMedia(video.source, "video", video.mime, error);
            if (!locator) {
              return std::nullopt;
            }
            VideoDisplay display;
            display.source = std::move(*locator);
            display.autoplay = video.autoplay;
            display.loop = video.loop;
            return display;
          },
          [](const MotionDirective& motion) -> std::optional<PerformanceElement> {
            return MotionDisplay{motion.group,      motion.index,       motion.priority,   motion.loop,
                                 motion.fade_in_ms, motion.fade_out_ms, motion.motion_type};
          },
          [](const ExpressionDirective& expression) -> std::optional<PerformanceElement> {
            return ExpressionDisplay{expression.id, expression.fade_ms, expression.motion_type};
          },
          [](const WaitDirective& wait) -> std::optional<PerformanceElement> {
            return WaitDisplay{wait.duration_ms};
          },
      },
      element);
}

std::vector<PerformanceElement> OutputConverter::TtsFor(const std::string& text, const OutputOptions& options,
                                                        bool attach_remote, std::vector<OpError>& issues) const {
  std::vector<PerformanceElement> out;
  if (text.empty()) {
    return out;
  }
  if (options.tts_mode == TtsMode::kLocal) {
    TtsDisplay tts;
    tts.text = text;
    tts.mode = TtsMode::kLocal;
    tts.voice = options.voice;
    out.push_back(std::move(tts));
  } else if (options.tts_mode == TtsMode::kRemote && attach_remote && options.tts_url) {
    OpError error;
    auto locator = ResolveMedia(UrlSource{*options.tts_url}, "audio", "", error);
    if (!locator) {
      error.code = ErrorCode::kTtsFailed;
      issues.push_back(std::move(error));
      return out;
    }
    TtsDisplay tts;
    tts.text = text;
    tts.mode = TtsMode::kRemote;
    tts.audio = std::move(*locator);
    out.push_back(std::move(tts));
  }
  return out;
}

std::vector<PerformanceElement> OutputConverter::EmotionFor(std::string_view text) const {
  // 구체적인 에셋 ID는 보내지 않고 motionType만 태그한다. 클라이언트가 유형별 에셋을 고른다.
  auto type = Classify(text);
  std::vector<PerformanceElement> out;
  out.push_back(ExpressionDisplay{"", 300, type});
  MotionDisplay motion;
  motion.motion_type = type;
  out.push_back(std::move(motion));
  return out;
}

OutputConversion OutputConverter::Convert(const CanonicalMessage& message, const OutputOptions& options) const {
  OutputConversion result;
  result.sequence.interrupt = options.interrupt;
  std::string full_text;
  bool remote_attached = false;

  for (const auto& element : message.elements) {
    if (const auto* text = std::get_if<TextElement>(&element)) {
      if (text->text.empty()) {
        continue;
      }
      result.sequence.elements.push_back(TextDisplay{text->text});
      full_text += text->text;
      auto tts = TtsFor(text->text, options, !remote_attached, result.issues);
      if (options.tts_mode == TtsMode::kRemote && options.tts_url) {
        remote_attached = true;
      }
      for (auto& item : tts) {
        result.sequence.elements.push_back(std::move(item));
      }
      continue;
    }
    OpError error;
    auto converted = ConvertElement(element, error);
    if (converted) {
      result.sequence.elements.push_back(std::move(*converted));
    } else {
      result.issues.push_back(std::move(error));
    }
  }

  if (options.auto_emotion && !full_text.empty() && !HasDirective(message)) {
    for (auto& item : EmotionFor(full_text)) {
      result.sequence.elements.push_back(std::move(item));
    }
  }

  if (observability_) {
    for (const auto& issue : result.issues) {
      observability_->Warn("output_conversion_issue", issue.message, {{"code", ToInt(issue.code)}});
    }
  }
  return result;
}

StreamAssembler::StreamAssembler(std::shared_ptr<const OutputConverter> converter, OutputOptions options)
    : converter_(std::move(converter)), options_(std::move(options)) {}

void StreamAssembler::EmitText(std::string text, std::vector<PerformanceSequence>& out) {
  if (text.empty()) {
    return;
  }
  PerformanceSequence seq;
  seq.interrupt = false;
  auto tts = converter_->TtsFor(text, options_, !remote_tts_attached_, issues_);
  if (options_.tts_mode == TtsMode::kRemote && options_.tts_url) {
    remote_tts_attached_ = true;
  }
  seq.elements.push_back(TextDisplay{std::move(text)});
  for (auto& item : tts) {
    seq.elements.push_back(std::move(item));
  }
  out.push_back(std::move(seq));
}

void StreamAssembler::EmitCompleteSentences(std::vector<PerformanceSequence>& out) {
  auto end = FindSentenceEnd(pending_, 0);
  while (end != std::string::npos) {
    EmitText(pending_.substr(0, end), out);
    pending_.erase(0, end);
    end = FindSentenceEnd(pending_, 0);
  }
}

std::vector<PerformanceSequence> StreamAssembler::PushText(std::string_view text) {
  return Push(TextMessage(std::string(text)));
}

std::vector<PerformanceSequence> StreamAssembler::Push(const CanonicalMessage& chunk) {
  std::vector<PerformanceSequence> out;
  if (finished_) {
    return out;
  }
  for (const auto& element : chunk.elements) {
    if (const auto* text = std::get_if<TextElement>(&element)) {
      pending_ += text->text;
      full_text_ += text->text;
      EmitCompleteSentences(out);
      continue;
    }
    if (std::holds_alternative<MotionDirective>(element) || std::holds_alternative<ExpressionDirective>(element)) {
      directive_seen_ = true;
    }
    // 순서를 지키기 위해 보류 중인 텍스트를 먼저 내보낸다.
    EmitText(std::move(pending_), out);
    pending_.clear();
    OpError error;
    auto converted = converter_->ConvertElement(element, error);
    if (!converted) {
      issues_.push_back(std::move(error));
      continue;
    }
    PerformanceSequence seq;
    seq.interrupt = false;
    seq.elements.push_back(std::move(*converted));
    out.push_back(std::move(seq));
  }
  return out;
}

std::vector<PerformanceSequence> StreamAssembler::Finish() {
  std::vector<PerformanceSequence> out;
  if (finished_) {
    return out;
  }
  finished_ = true;
  EmitText(std::move(pending_), out);
  pending_.clear();
  if (options_.auto_emotion && !full_text_.empty() && !directive_seen_) {
    auto emotion = converter_->EmotionFor(full_text_);
    if (out.empty()) {
      PerformanceSequence seq;
      seq.interrupt = false;
      out.push_back(std::move(seq));
    }
    for (auto& item : emotion) {
      out.back().elements.push_back(std::move(item));
    }
  }
  return out;
}

}  // namespace bridge

/*
 * 설명: 입력 파트별 변환(텍스트 길이 제한, 미디어 참조 해석, 인라인 데이터 임시 파일화)을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: bridge/tests/unit/input_converter_test.cpp
 */
#include "bridge/input_converter.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "bridge/digest.hpp"

namespace bridge {

namespace {
std::string Lower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string StringField(const nlohmann::json& obj, const char* key) {
  auto it = obj.find(key);
  if (it != obj.end() && it->is_string()) {
    return it->get<std::string>();
  }
  return {};
}

// "type/subtype; params" -> {type, subtype}
std::pair<std::string, std::string> SplitMime(std::string_view mime) {
  auto lowered = Lower(mime);
  auto semi = lowered.find(';');
  if (semi != std::string::npos) {
    lowered.resize(semi);
  }
  while (!lowered.empty() && std::isspace(static_cast<unsigned char>(lowered.back()))) {
    lowered.pop_back();
  }
  auto slash = lowered.find('/');
  if (slash == std::string::npos) {
    return {lowered, {}};
  }
  return {lowered.substr(0, slash), lowered.substr(slash + 1)};
}

bool HasScheme(std::string_view url, std::string_view scheme) {
  return url.size() > scheme.size() && Lower(url.substr(0, scheme.size())) == scheme;
}
}  // namespace

std::optional<DataUri> ParseDataUri(std::string_view uri) {
  if (!HasScheme(uri, "data:")) {
    return std::nullopt;
  }
  auto comma = uri.find(',');
  if (comma == std::string_view::npos) {
    return std::nullopt;
  }
  auto header = uri.substr(5, comma - 5);
  const std::string_view marker = ";base64";
  if (header.size() < marker.size() || Lower(header.substr(header.size() - marker.size())) != marker) {
    return std::nullopt;
  }
  DataUri result;
  auto semi = header.find(';');
  result.mime = Lower(header.substr(0, semi));
  result.base64 = std::string(uri.substr(comma + 1));
  if (result.mime.empty()) {
    return std::nullopt;
  }
  return result;
}

std::string ExtensionForMime(std::string_view mime) {
  static const std::unordered_map<std::string, std::string> kAudio{
      {"webm", "webm"}, {"ogg", "ogg"}, {"opus", "opus"}, {"mp4", "m4a"}, {"mpeg", "mp3"}, {"wav", "wav"},
      {"x-wav", "wav"}};
  auto [type, subtype] = SplitMime(mime);
  if (type == "audio") {
    auto it = kAudio.find(subtype);
    if (it != kAudio.end()) {
      return it->second;
    }
  }
  if (subtype == "jpeg") {
    return "jpg";
  }
  return subtype.empty() ? "bin" : subtype;
}

std::string TruncateUtf8(std::string_view text, std::size_t max_code_points, bool& truncated) {
  truncated = false;
  std::size_t count = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) {
      continue;
    }
    if (count == max_code_points) {
      truncated = true;
      return std::string(text.substr(0, i));
    }
    ++count;
  }
  return std::string(text);
}

InputConverter::InputConverter(std::size_t max_text_length, std::shared_ptr<TempFileStore> temp_store)
    : max_text_length_(max_text_length), temp_store_(std::move(temp_store)) {}

const std::vector<std::string>& InputConverter::SupportedImageFormats() {
  static const std::vector<std::string> kFormats{"png", "jpeg", "jpg", "gif", "webp", "bmp"};
  return kFormats;
}

const std::vector<std::string>& InputConverter::SupportedAudioFormats() {
  static const std::vector<std::string> kFormats{"webm", "ogg", "opus", "mp4", "m4a", "mpeg", "mp3", "wav", "x-wav"};
  return kFormats;
}

const std::vector<std::string>& InputConverter::SupportedVideoFormats() {
  static const std::vector<std::string> kFormats{"mp4", "webm", "ogg"};
  return kFormats;
}

bool InputConverter::MimeSupported(MediaKind kind, std::string_view mime) const {
  auto [type, subtype] = SplitMime(mime);
  const std::vector<std::string>* formats = nullptr;
  std::string expected;
  switch (kind) {
    case MediaKind::kImage:
      formats = &SupportedImageFormats();
      expected = "image";
      break;
    case MediaKind::kAudio:
      formats = &SupportedAudioFormats();
      expected = "audio";
      break;
    case MediaKind::kVideo:
      formats = &SupportedVideoFormats();
      expected = "video";
      break;
  }
  return type == expected && std::find(formats->begin(), formats->end(), subtype) != formats->end();
}

std::optional<MediaSource> InputConverter::ResolveSource(MediaKind kind, const nlohmann::json& part,
                                                         std::string& mime, OpError& error) const {
  mime = StringField(part, "mime");
  std::optional<std::string> base64;
  if (auto inline_data = StringField(part, "inline"); !inline_data.empty()) {
    base64 = std::move(inline_data);
  } else if (auto data = StringField(part, "data"); !data.empty()) {
    auto uri = ParseDataUri(data);
    if (!uri) {
      error = {ErrorCode::kInvalidPayload, "data URI 형식이 올바르지 않습니다"};
      return std::nullopt;
    }
    mime = uri->mime;
    base64 = std::move(uri->base64);
  }

  if (!mime.empty() && !MimeSupported(kind, mime)) {
    error = {ErrorCode::kUnsupportedType, "지원하지 않는 미디어 형식입니다: " + mime};
    return std::nullopt;
  }

  if (base64) {
    if (mime.empty()) {
      error = {ErrorCode::kInvalidPayload, "인라인 데이터에는 mime이 필요합니다"};
      return std::nullopt;
    }
    auto bytes = Base64Decode(*base64);
    if (!bytes) {
      error = {ErrorCode::kInvalidPayload, "base64 디코딩 실패"};
      return std::nullopt;
    }
    if (!temp_store_) {
      return InlineSource{std::move(*bytes)};
    }
    const char* prefix = kind == MediaKind::kImage ? "live2d_img" : kind == MediaKind::kAudio ? "live2d_voice" : "live2d_video";
    auto file = temp_store_->Materialize(*bytes, ExtensionForMime(mime), prefix, error);
    if (!file) {
      return std::nullopt;
    }
    return UrlSource{"file://" + file->path.string()};
  }

  if (auto rid = StringField(part, "rid"); !rid.empty()) {
    return ResourceSource{rid};
  }

  if (auto url = StringField(part, "url"); !url.empty()) {
    if (HasScheme(url, "http://") || HasScheme(url, "https://") || HasScheme(url, "file://")) {
      return UrlSource{url};
    }
    error = {ErrorCode::kUnsupportedType, "지원하지 않는 URL 스킴입니다"};
    return std::nullopt;
  }

  error = {ErrorCode::kInvalidPayload, "url, rid, inline, data 중 하나가 필요합니다"};
  return std::nullopt;
}

std::optional<MessageElement> InputConverter::ConvertMedia(MediaKind kind, const nlohmann::json& part,
                                                           OpError& error) const {
  std::string mime;
  auto source = ResolveSource(kind, part, mime, error);
  if (!source) {
    return std::nullopt;
  }
  switch (kind) {
    case MediaKind::kImage:
      return ImageRef{std::move(*source), mime};
    case MediaKind::kAudio:
      return AudioRef{std::move(*source), mime, {}};
    case MediaKind::kVideo:
      return VideoRef{std::move(*source), mime};
  }
  return std::nullopt;
}

InputConversion InputConverter::Convert(const nlohmann::json& content) const {
  InputConversion result;
  if (!content.is_array()) {
    result.issues.push_back({0, ErrorCode::kInvalidPayload, "content는 배열이어야 합니다"});
    return result;
  }

  for (std::size_t i = 0; i < content.size(); ++i) {
    const auto& part = content[i];
    if (!part.is_object()) {
      result.issues.push_back({i, ErrorCode::kInvalidPayload, "파트는 객체여야 합니다"});
      continue;
    }
    auto type = StringField(part, "type");
    OpError error;
    std::optional<MessageElement> element;

    if (type == "text") {
      auto text_it = part.find("text");
      if (text_it == part.end() || !text_it->is_string()) {
        error = {ErrorCode::kInvalidPayload, "text 파트에는 문자열 text가 필요합니다"};
      } else {
        bool truncated = false;
        element = TextElement{TruncateUtf8(text_it->get<std::string>(), max_text_length_, truncated)};
        result.truncated = result.truncated || truncated;
      }
    } else if ((type == "voice" || type == "audio") && StringField(part, "sttMode") == "local") {
      // 클라이언트가 이미 음성 인식을 마친 경우
      bool truncated = false;
      auto text = TruncateUtf8(StringField(part, "text"), max_text_length_, truncated);
      result.truncated = result.truncated || truncated;
      if (!text.empty()) {
        element = TextElement{std::move(text)};
      }
    } else if (type == "image") {
      element = ConvertMedia(MediaKind::kImage, part, error);
    } else if (type == "voice" || type == "audio") {
      element = ConvertMedia(MediaKind::kAudio, part, error);
    } else if (type == "video") {
      element = ConvertMedia(MediaKind::kVideo, part, error);
    } else {
      error = {ErrorCode::kUnsupportedType, "지원하지 않는 파트 유형입니다: " + type};
    }

    if (element) {
      result.message.elements.push_back(std::move(*element));
    } else if (!error.message.empty()) {
      result.issues.push_back({i, error.code, std::move(error.message)});
    }
  }
  result.plain_text = PlainText(result.message);
  return result;
}

std::optional<CanonicalMessage> InputConverter::ConvertTouch(const nlohmann::json& payload, OpError& error) const {
  if (!payload.is_object()) {
    error = {ErrorCode::kInvalidPayload, "touch 페이로드는 객체여야 합니다"};
    return std::nullopt;
  }
  auto part = StringField(payload, "part");
  if (part.empty()) {
    part = StringField(payload, "area");
  }
  if (part.empty()) {
    part = "Unknown";
  }
  auto action = StringField(payload, "action");
  if (action.empty()) {
    action = "tap";
  }
  return TextMessage("[touch] part=" + part + " action=" + action);
}

std::optional<CanonicalMessage> InputConverter::ConvertShortcut(const nlohmann::json& payload, OpError& error) const {
  auto key = payload.is_object() ? StringField(payload, "key") : std::string{};
  if (key.empty()) {
    error = {ErrorCode::kInvalidPayload, "shortcut 페이로드에는 key가 필요합니다"};
    return std::nullopt;
  }
  return TextMessage("[shortcut] key=" + key);
}

}  // namespace bridge

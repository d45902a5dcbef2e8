#include <gtest/gtest.h>

#include "bridge/digest.hpp"
#include "bridge/input_converter.hpp"

namespace {

class InputConverterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / ("bridge_input_" + bridge::RandomHex(6));
    bridge::TempStoreConfig config;
    config.dir = dir_;
    temp_store_ = std::make_shared<bridge::TempFileStore>(config);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::filesystem::path dir_;
  std::shared_ptr<bridge::TempFileStore> temp_store_;
};

}  // namespace

TEST(TruncateUtf8Test, CountsCodePointsNotBytes) {
  bool truncated = false;
  EXPECT_EQ(bridge::TruncateUtf8("你好世界", 2, truncated), "你好");
  EXPECT_TRUE(truncated);
  EXPECT_EQ(bridge::TruncateUtf8("abc", 3, truncated), "abc");
  EXPECT_FALSE(truncated);
}

TEST(DataUriTest, ParsesBase64DataUri) {
  auto uri = bridge::ParseDataUri("data:image/PNG;base64,aGVsbG8=");
  ASSERT_TRUE(uri.has_value());
  EXPECT_EQ(uri->mime, "image/png");
  EXPECT_EQ(uri->base64, "aGVsbG8=");
  EXPECT_FALSE(bridge::ParseDataUri("data:image/png,plain").has_value());
  EXPECT_FALSE(bridge::ParseDataUri("http://example.com/a.png").has_value());
}

TEST(DataUriTest, MapsAudioMimeToExtension) {
  EXPECT_EQ(bridge::ExtensionForMime("audio/webm;codecs=opus"), "webm");
  EXPECT_EQ(bridge::ExtensionForMime("audio/mpeg"), "mp3");
  EXPECT_EQ(bridge::ExtensionForMime("audio/mp4"), "m4a");
  EXPECT_EQ(bridge::ExtensionForMime("image/jpeg"), "jpg");
  EXPECT_EQ(bridge::ExtensionForMime("image/png"), "png");
}

TEST_F(InputConverterTest, ConvertsTextAndTruncates) {
  bridge::InputConverter converter(5, temp_store_);
  auto result = converter.Convert(nlohmann::json::array({{{"type", "text"}, {"text", "hello world"}}}));
  EXPECT_TRUE(result.issues.empty());
  EXPECT_TRUE(result.truncated);
  EXPECT_EQ(result.plain_text, "hello");
}

TEST_F(InputConverterTest, InlineImageBecomesTempFile) {
  bridge::InputConverter converter(100, temp_store_);
  auto content = nlohmann::json::array(
      {{{"type", "text"}, {"text", "看这个"}},
       {{"type", "image"}, {"data", "data:image/png;base64," + bridge::Base64Encode("png-bytes")}}});
  auto result = converter.Convert(content);
  ASSERT_TRUE(result.issues.empty()) << result.issues[0].message;
  ASSERT_EQ(result.message.elements.size(), 2u);
  const auto& image = std::get<bridge::ImageRef>(result.message.elements[1]);
  EXPECT_EQ(image.mime, "image/png");
  const auto& url = std::get<bridge::UrlSource>(image.source).url;
  ASSERT_EQ(url.rfind("file://", 0), 0u);
  EXPECT_TRUE(std::filesystem::exists(url.substr(7)));
  EXPECT_EQ(result.plain_text, "看这个[image]");
  EXPECT_EQ(temp_store_->GetUsage().files, 1u);
}

TEST_F(InputConverterTest, ResourceAndUrlReferencesPassThrough) {
  bridge::InputConverter converter(100, temp_store_);
  auto content = nlohmann::json::array({{{"type", "voice"}, {"rid", "r-1"}, {"mime", "audio/webm"}},
                                        {{"type", "video"}, {"url", "https://cdn.example.com/v.mp4"}}});
  auto result = converter.Convert(content);
  ASSERT_TRUE(result.issues.empty());
  ASSERT_EQ(result.message.elements.size(), 2u);
  const auto& audio = std::get<bridge::AudioRef>(result.message.elements[0]);
  EXPECT_EQ(std::get<bridge::ResourceSource>(audio.source).rid, "r-1");
  const auto& video = std::get<bridge::VideoRef>(result.message.elements[1]);
  EXPECT_EQ(std::get<bridge::UrlSource>(video.source).url, "https://cdn.example.com/v.mp4");
  EXPECT_EQ(result.plain_text, "[voice][video]");
}

TEST_F(InputConverterTest, LocalSttVoiceBecomesText) {
  bridge::InputConverter converter(100, temp_store_);
  auto result =
      converter.Convert(nlohmann::json::array({{{"type", "voice"}, {"sttMode", "local"}, {"text", "你好"}}}));
  ASSERT_EQ(result.message.elements.size(), 1u);
  EXPECT_EQ(std::get<bridge::TextElement>(result.message.elements[0]).text, "你好");
}

TEST_F(InputConverterTest, BadPartsAreReportedButOthersSurvive) {
  bridge::InputConverter converter(100, temp_store_);
  auto content = nlohmann::json::array({{{"type", "sticker"}},
                                        {{"type", "image"}, {"mime", "image/tiff"}, {"url", "http://x/a.tiff"}},
                                        {{"type", "image"}, {"url", "ftp://x/a.png"}},
                                        {{"type", "image"}},
                                        {{"type", "text"}, {"text", "ok"}}});
  auto result = converter.Convert(content);
  ASSERT_EQ(result.issues.size(), 4u);
  EXPECT_EQ(result.issues[0].part_index, 0u);
  EXPECT_EQ(result.issues[0].code, bridge::ErrorCode::kUnsupportedType);
  EXPECT_EQ(result.issues[1].code, bridge::ErrorCode::kUnsupportedType);
  EXPECT_EQ(result.issues[2].code, bridge::ErrorCode::kUnsupportedType);
  EXPECT_EQ(result.issues[3].code, bridge::ErrorCode::kInvalidPayload);
  EXPECT_EQ(result.plain_text, "ok");
}

TEST_F(InputConverterTest, NonArrayContentIsInvalid) {
  bridge::InputConverter converter(100, temp_store_);
  auto result = converter.Convert(nlohmann::json{{"text", "hi"}});
  ASSERT_EQ(result.issues.size(), 1u);
  EXPECT_EQ(result.issues[0].code, bridge::ErrorCode::kInvalidPayload);
}

TEST_F(InputConverterTest, TouchAndShortcutBecomeText) {
  bridge::InputConverter converter(100, temp_store_);
  bridge::OpError error;
  auto touch = converter.ConvertTouch({{"part", "Head"}, {"action", "tap"}}, error);
  ASSERT_TRUE(touch.has_value());
  EXPECT_EQ(bridge::PlainText(*touch), "[touch] part=Head action=tap");
  auto shortcut = converter.ConvertShortcut({{"key", "F1"}}, error);
  ASSERT_TRUE(shortcut.has_value());
  EXPECT_EQ(bridge::PlainText(*shortcut), "[shortcut] key=F1");
  EXPECT_FALSE(converter.ConvertShortcut(nlohmann::json::object(), error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kInvalidPayload);
}

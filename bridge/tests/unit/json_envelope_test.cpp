#include <gtest/gtest.h>

#include "bridge/api_response.hpp"
#include "bridge/resource_http_session.hpp"

namespace http = boost::beast::http;

TEST(JsonEnvelopeTest, SuccessCarriesDataAndTimestamp) {
  nlohmann::json resource{{"rid", "abc"}, {"size", 12}};
  auto env = bridge::MakeSuccessEnvelope(resource);
  EXPECT_TRUE(env["success"].get<bool>());
  EXPECT_EQ(env["data"]["rid"], "abc");
  EXPECT_TRUE(env["error"].is_null());
  EXPECT_TRUE(env["meta"].contains("timestamp"));
}

TEST(JsonEnvelopeTest, PlainErrorKeepsDetail) {
  auto env = bridge::MakeErrorEnvelope("unauthorized", "토큰 없음", nlohmann::json{{"path", "/resources/x"}});
  EXPECT_FALSE(env["success"].get<bool>());
  EXPECT_TRUE(env["data"].is_null());
  EXPECT_EQ(env["error"]["code"], "unauthorized");
  EXPECT_EQ(env["error"]["detail"]["path"], "/resources/x");
}

TEST(JsonEnvelopeTest, ProtocolErrorKeepsNumericCode) {
  auto env = bridge::MakeErrorEnvelope(bridge::OpError{bridge::ErrorCode::kResourceQuotaExceeded, "가득 참"});
  EXPECT_EQ(env["error"]["code"], "quota_exceeded");
  EXPECT_EQ(env["error"]["message"], "가득 참");
  EXPECT_EQ(env["error"]["detail"]["code"], 4007);
}

TEST(JsonEnvelopeTest, ErrorCodesMapToHttpStatus) {
  EXPECT_EQ(bridge::HttpStatusFor(bridge::ErrorCode::kAuthFailed), http::status::unauthorized);
  EXPECT_EQ(bridge::HttpStatusFor(bridge::ErrorCode::kResourceNotFound), http::status::not_found);
  EXPECT_EQ(bridge::HttpStatusFor(bridge::ErrorCode::kResourceQuotaExceeded), http::status::payload_too_large);
  EXPECT_EQ(bridge::HttpStatusFor(bridge::ErrorCode::kInvalidPayload), http::status::bad_request);
  EXPECT_EQ(bridge::HttpStatusFor(bridge::ErrorCode::kConnectionFull), http::status::service_unavailable);
  EXPECT_EQ(bridge::HttpStatusFor(bridge::ErrorCode::kResourceIo), http::status::internal_server_error);
}

TEST(JsonEnvelopeTest, EveryErrorCodeHasName) {
  EXPECT_EQ(bridge::ErrorCodeName(bridge::ErrorCode::kVersionMismatch), "version_mismatch");
  EXPECT_EQ(bridge::ErrorCodeName(bridge::ErrorCode::kUploadFailed), "upload_failed");
  EXPECT_EQ(bridge::ErrorCodeName(bridge::ErrorCode::kUnsupportedType), "unsupported_type");
}

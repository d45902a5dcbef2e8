#include <fstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "bridge/digest.hpp"
#include "bridge/resource_store.hpp"

namespace {

using namespace std::chrono_literals;

class ResourceStoreTest : public ::testing::Test {
 protected:
  void SetUp() override {
    dir_ = std::filesystem::temp_directory_path() / ("bridge_resources_" + bridge::RandomHex(6));
    now_ = bridge::SystemClock::now();
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
  }

  std::shared_ptr<bridge::ResourceStore> MakeStore(bridge::QuotaPolicy quota = {}, std::uint64_t max_inline = 16) {
    bridge::ResourceStoreConfig config;
    config.dir = dir_;
    config.max_inline_bytes = max_inline;
    config.quota = quota;
    config.protect_recent = 0s;
    config.base_url = "http://127.0.0.1:9091/";
    config.resource_path = "/resources";
    config.token = "secret";
    config.clock = [this] { return now_; };
    return std::make_shared<bridge::ResourceStore>(config);
  }

  // PUT 본문 수신을 흉내 내 .part 파일을 채운다.
  bool Upload(bridge::ResourceStore& store, const std::string& rid, const std::string& body) {
    bridge::OpError error;
    auto part = store.BeginUpload(rid, body.size(), error);
    if (!part) {
      return false;
    }
    std::ofstream(part->part_path, std::ios::binary) << body;
    return store.FinishUpload(rid, error).has_value();
  }

  std::filesystem::path dir_;
  bridge::SystemClock::time_point now_;
};

}  // namespace

TEST_F(ResourceStoreTest, PrepareUploadCommitGet) {
  auto store = MakeStore();
  const std::string body = "0123456789abcdefXYZ";
  bridge::OpError error;
  bridge::PrepareRequest req{"image", "image/png", body.size(), bridge::Sha256Hex(body), std::nullopt};
  auto prepared = store->Prepare(req, error);
  ASSERT_TRUE(prepared.has_value()) << error.message;
  EXPECT_EQ(prepared->resource.status, bridge::ResourceStatus::kPending);
  ASSERT_TRUE(prepared->upload.has_value());
  const auto& rid = prepared->resource.rid;
  EXPECT_EQ(prepared->upload->url, "http://127.0.0.1:9091/resources/" + rid);
  EXPECT_EQ(prepared->upload->method, "PUT");
  EXPECT_EQ(prepared->upload->headers.at("Authorization"), "Bearer secret");

  EXPECT_FALSE(store->Get(rid, error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kResourceNotFound);

  ASSERT_TRUE(Upload(*store, rid, body));
  auto committed = store->Commit(rid, body.size(), error);
  ASSERT_TRUE(committed.has_value()) << error.message;
  EXPECT_EQ(committed->status, bridge::ResourceStatus::kReady);

  auto bytes = store->ReadBytes(rid, error);
  ASSERT_TRUE(bytes.has_value());
  EXPECT_EQ(*bytes, body);
  EXPECT_EQ(store->PendingCount(), 0u);
}

TEST_F(ResourceStoreTest, CommitRequiresExactSize) {
  auto store = MakeStore();
  bridge::OpError error;
  auto prepared = store->Prepare({"audio", "audio/wav", 20, "", std::nullopt}, error);
  ASSERT_TRUE(prepared.has_value());
  const auto& rid = prepared->resource.rid;
  ASSERT_TRUE(Upload(*store, rid, std::string(10, 'a')));
  EXPECT_FALSE(store->Commit(rid, 10, error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kInvalidPayload);
  EXPECT_FALSE(store->Commit(rid, 20, error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kInvalidPayload);
}

TEST_F(ResourceStoreTest, CommitBeforeUploadFails) {
  auto store = MakeStore();
  bridge::OpError error;
  auto prepared = store->Prepare({"file", "", 20, "", std::nullopt}, error);
  ASSERT_TRUE(prepared.has_value());
  EXPECT_FALSE(store->Commit(prepared->resource.rid, 20, error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kUploadFailed);
}

TEST_F(ResourceStoreTest, HashMismatchRejectsUpload) {
  auto store = MakeStore();
  bridge::OpError error;
  auto prepared = store->Prepare({"file", "", 5, bridge::Sha256Hex("hello"), std::nullopt}, error);
  ASSERT_TRUE(prepared.has_value());
  EXPECT_FALSE(Upload(*store, prepared->resource.rid, "jello"));
  EXPECT_EQ(store->PendingCount(), 1u);
}

TEST_F(ResourceStoreTest, InlinePrepareIsReadyImmediately) {
  auto store = MakeStore();
  bridge::OpError error;
  auto prepared = store->Prepare({"image", "image/png", 5, "", bridge::Base64Encode("hello")}, error);
  ASSERT_TRUE(prepared.has_value()) << error.message;
  EXPECT_EQ(prepared->resource.status, bridge::ResourceStatus::kReady);
  EXPECT_FALSE(prepared->upload.has_value());
  EXPECT_EQ(prepared->resource.sha256, bridge::Sha256Hex("hello"));
}

TEST_F(ResourceStoreTest, InlineAboveThresholdIsRejected) {
  auto store = MakeStore({}, 4);
  bridge::OpError error;
  EXPECT_FALSE(store->Prepare({"image", "image/png", 5, "", bridge::Base64Encode("hello")}, error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kInvalidPayload);
}

TEST_F(ResourceStoreTest, PrepareValidatesRequest) {
  auto store = MakeStore();
  bridge::OpError error;
  EXPECT_FALSE(store->Prepare({"", "", 5, "", std::nullopt}, error).has_value());
  EXPECT_FALSE(store->Prepare({"file", "", 0, "", std::nullopt}, error).has_value());
  EXPECT_FALSE(store->Prepare({"file", "", 5, "nothex", std::nullopt}, error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kInvalidPayload);
}

TEST_F(ResourceStoreTest, OversizedResourceExceedsQuota) {
  bridge::QuotaPolicy quota;
  quota.max_total_bytes = 100;
  auto store = MakeStore(quota);
  bridge::OpError error;
  EXPECT_FALSE(store->Prepare({"file", "", 101, "", std::nullopt}, error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kResourceQuotaExceeded);
}

TEST_F(ResourceStoreTest, AdmissionEvictsOldestReadyResource) {
  bridge::QuotaPolicy quota;
  quota.max_files = 2;
  auto store = MakeStore(quota);
  bridge::OpError error;
  auto first = store->ImportBytes("first", "file", "text/plain", error);
  ASSERT_TRUE(first.has_value());
  now_ += 1s;
  auto second = store->ImportBytes("second", "file", "text/plain", error);
  ASSERT_TRUE(second.has_value());
  now_ += 1s;
  auto third = store->ImportBytes("third", "file", "text/plain", error);
  ASSERT_TRUE(third.has_value());
  EXPECT_FALSE(store->Get(first->rid, error).has_value());
  EXPECT_TRUE(store->Get(second->rid, error).has_value());
  EXPECT_TRUE(store->Get(third->rid, error).has_value());
  EXPECT_EQ(store->GetUsage().files, 2u);
}

TEST_F(ResourceStoreTest, SweepRemovesExpiredResources) {
  bridge::QuotaPolicy quota;
  quota.ttl = 60s;
  auto store = MakeStore(quota);
  bridge::OpError error;
  auto ref = store->ImportBytes("data", "file", "", error);
  ASSERT_TRUE(ref.has_value());
  now_ += 30s;
  EXPECT_EQ(store->Sweep().expired, 0u);
  now_ += 60s;
  EXPECT_FALSE(store->Get(ref->rid, error).has_value());
  auto stats = store->Sweep();
  EXPECT_EQ(stats.expired, 1u);
  EXPECT_EQ(stats.freed_bytes, 4u);
  EXPECT_EQ(store->GetUsage().files, 0u);
  EXPECT_FALSE(std::filesystem::exists(dir_ / ref->rid));
}

TEST_F(ResourceStoreTest, SweepEvictsOldestReadyOverFileCap) {
  auto store = MakeStore();
  bridge::OpError error;
  auto first = store->ImportBytes("aaaa", "file", "", error);
  ASSERT_TRUE(first.has_value());
  now_ += 1s;
  auto second = store->ImportBytes("bbbb", "file", "", error);
  ASSERT_TRUE(second.has_value());
  now_ += 1s;
  auto third = store->ImportBytes("cccc", "file", "", error);
  ASSERT_TRUE(third.has_value());
  now_ += 1s;
  // 업로드 대기 중인 리소스는 가장 최근이 아니어도 축출 대상이 아니다.
  auto pending = store->Prepare({"file", "", 20, "", std::nullopt}, error);
  ASSERT_TRUE(pending.has_value());

  bridge::QuotaPolicy quota;
  quota.max_files = 2;
  store->SetQuotaPolicy(quota);
  auto stats = store->Sweep();
  EXPECT_EQ(stats.expired, 0u);
  EXPECT_EQ(stats.evicted, 2u);
  EXPECT_EQ(stats.freed_bytes, 8u);
  EXPECT_FALSE(store->Get(first->rid, error).has_value());
  EXPECT_FALSE(store->Get(second->rid, error).has_value());
  EXPECT_TRUE(store->Get(third->rid, error).has_value());
  EXPECT_FALSE(std::filesystem::exists(dir_ / first->rid));
  EXPECT_FALSE(std::filesystem::exists(dir_ / second->rid));
  EXPECT_EQ(store->PendingCount(), 1u);
  EXPECT_EQ(store->GetUsage().files, 2u);
}

TEST_F(ResourceStoreTest, SweepEvictsUntilUnderByteCap) {
  auto store = MakeStore();
  bridge::OpError error;
  std::vector<std::string> rids;
  for (const char* body : {"0123", "4567", "89ab"}) {
    auto ref = store->ImportBytes(body, "file", "", error);
    ASSERT_TRUE(ref.has_value());
    rids.push_back(ref->rid);
    now_ += 1s;
  }

  bridge::QuotaPolicy quota;
  quota.max_total_bytes = 5;
  store->SetQuotaPolicy(quota);
  auto stats = store->Sweep();
  EXPECT_EQ(stats.evicted, 2u);
  EXPECT_LE(store->GetUsage().total_bytes, 5u);
  EXPECT_FALSE(store->Get(rids[0], error).has_value());
  EXPECT_FALSE(store->Get(rids[1], error).has_value());
  EXPECT_TRUE(store->Get(rids[2], error).has_value());

  EXPECT_EQ(store->Sweep().evicted, 0u);
}

TEST_F(ResourceStoreTest, ReleaseIsIdempotent) {
  auto store = MakeStore();
  bridge::OpError error;
  auto ref = store->ImportBytes("data", "file", "", error);
  ASSERT_TRUE(ref.has_value());
  EXPECT_TRUE(store->Release(ref->rid));
  EXPECT_FALSE(store->Release(ref->rid));
  EXPECT_FALSE(store->Get(ref->rid, error).has_value());
}

TEST_F(ResourceStoreTest, SecondConcurrentUploadIsRejected) {
  auto store = MakeStore();
  bridge::OpError error;
  auto prepared = store->Prepare({"file", "", 4, "", std::nullopt}, error);
  ASSERT_TRUE(prepared.has_value());
  ASSERT_TRUE(store->BeginUpload(prepared->resource.rid, 4, error).has_value());
  EXPECT_FALSE(store->BeginUpload(prepared->resource.rid, 4, error).has_value());
  store->AbortUpload(prepared->resource.rid);
  EXPECT_TRUE(store->BeginUpload(prepared->resource.rid, 4, error).has_value());
}

TEST_F(ResourceStoreTest, DeclaredContentLengthAboveSizeIsRejected) {
  auto store = MakeStore();
  bridge::OpError error;
  auto prepared = store->Prepare({"file", "", 4, "", std::nullopt}, error);
  ASSERT_TRUE(prepared.has_value());
  EXPECT_FALSE(store->BeginUpload(prepared->resource.rid, 5, error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kResourceQuotaExceeded);
}

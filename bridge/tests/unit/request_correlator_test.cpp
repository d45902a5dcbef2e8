#include <thread>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "bridge/request_correlator.hpp"

namespace {

using namespace std::chrono_literals;

std::shared_ptr<bridge::RequestCorrelator> MakeCorrelator(boost::asio::io_context& ioc) {
  return std::make_shared<bridge::RequestCorrelator>(ioc.get_executor());
}

}  // namespace

TEST(RequestCorrelatorTest, ReplyCompletesMatchingRequest) {
  boost::asio::io_context ioc;
  auto correlator = MakeCorrelator(ioc);
  bridge::OpError error;
  auto future = correlator->Register("q-1", 5s, error);
  ASSERT_TRUE(future.has_value());
  EXPECT_EQ(correlator->Pending(), 1u);

  auto reply = bridge::MakePacket(bridge::op::kDesktopWindowList, nlohmann::json{{"windows", nlohmann::json::array()}},
                                  "q-1");
  EXPECT_TRUE(correlator->Resolve(reply));
  ASSERT_EQ(future->wait_for(0s), std::future_status::ready);
  auto result = future->get();
  EXPECT_EQ(result.status, bridge::CorrelationStatus::kOk);
  ASSERT_TRUE(result.reply.has_value());
  EXPECT_TRUE(result.reply->PayloadOrEmpty().contains("windows"));
  EXPECT_EQ(correlator->Pending(), 0u);
}

TEST(RequestCorrelatorTest, UnknownReplyIsNotConsumed) {
  boost::asio::io_context ioc;
  auto correlator = MakeCorrelator(ioc);
  EXPECT_FALSE(correlator->Resolve(bridge::MakePacket(bridge::op::kPong, std::nullopt, "nobody")));
}

TEST(RequestCorrelatorTest, DuplicateIdIsRejected) {
  boost::asio::io_context ioc;
  auto correlator = MakeCorrelator(ioc);
  bridge::OpError error;
  ASSERT_TRUE(correlator->Register("dup", 5s, error).has_value());
  EXPECT_FALSE(correlator->Register("dup", 5s, error).has_value());
  EXPECT_EQ(error.code, bridge::ErrorCode::kInvalidPayload);
}

TEST(RequestCorrelatorTest, TimeoutCompletesWithTimeoutAndDropsLateReply) {
  boost::asio::io_context ioc;
  auto correlator = MakeCorrelator(ioc);
  bridge::OpError error;
  auto future = correlator->Register("slow", 20ms, error);
  ASSERT_TRUE(future.has_value());
  ioc.run();
  ASSERT_EQ(future->wait_for(0s), std::future_status::ready);
  auto result = future->get();
  EXPECT_EQ(result.status, bridge::CorrelationStatus::kTimeout);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_FALSE(correlator->Resolve(bridge::MakePacket(bridge::op::kPong, std::nullopt, "slow")));
}

TEST(RequestCorrelatorTest, ErrorReplyCompletesAsPeerError) {
  boost::asio::io_context ioc;
  auto correlator = MakeCorrelator(ioc);
  bridge::OpError error;
  auto future = correlator->Register("shot", 5s, error);
  ASSERT_TRUE(future.has_value());
  EXPECT_TRUE(correlator->Resolve(bridge::MakeErrorPacket(bridge::ErrorCode::kPerformFailed, "capture failed", "shot")));
  auto result = future->get();
  EXPECT_EQ(result.status, bridge::CorrelationStatus::kPeerError);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->code, 5003);
}

TEST(RequestCorrelatorTest, CancelAllCompletesEverything) {
  boost::asio::io_context ioc;
  auto correlator = MakeCorrelator(ioc);
  bridge::OpError error;
  auto a = correlator->Register("a", 5s, error);
  auto b = correlator->Register("b", 5s, error);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  correlator->CancelAll("closed");
  EXPECT_EQ(a->get().status, bridge::CorrelationStatus::kCancelled);
  EXPECT_EQ(b->get().status, bridge::CorrelationStatus::kCancelled);
  EXPECT_EQ(correlator->Pending(), 0u);
  ioc.run();
}

TEST(RequestCorrelatorTest, QueuedTimeoutDoesNotHitReusedId) {
  boost::asio::io_context ioc;
  auto correlator = MakeCorrelator(ioc);
  bridge::OpError error;
  auto first = correlator->Register("a", 1ms, error);
  auto second = correlator->Register("b", 2ms, error);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());

  // 두 타이머가 모두 만료된 뒤 핸들러 하나만 실행한다. 나머지 핸들러는 큐에 남는다.
  std::this_thread::sleep_for(20ms);
  ASSERT_EQ(ioc.run_one(), 1u);
  ASSERT_EQ(correlator->Pending(), 1u);
  const std::string late = first->wait_for(0s) == std::future_status::ready ? "b" : "a";

  EXPECT_TRUE(correlator->Resolve(bridge::MakePacket(bridge::op::kDesktopWindowActive, std::nullopt, late)));
  auto reused = correlator->Register(late, 10s, error);
  ASSERT_TRUE(reused.has_value()) << error.message;

  ioc.poll();
  EXPECT_EQ(correlator->Pending(), 1u);
  EXPECT_EQ(reused->wait_for(0s), std::future_status::timeout);

  EXPECT_TRUE(correlator->Resolve(bridge::MakePacket(bridge::op::kDesktopWindowActive, std::nullopt, late)));
  ASSERT_EQ(reused->wait_for(0s), std::future_status::ready);
  EXPECT_EQ(reused->get().status, bridge::CorrelationStatus::kOk);
}

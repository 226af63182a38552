#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "agent/event_channel.hpp"

using namespace harness;
using namespace std::chrono_literals;

using Channel = EventChannel<std::string>;

TEST(EventChannelTest, DeliversInPushOrder) {
  Channel channel;
  channel.push("a");
  channel.push("b");
  EXPECT_EQ(channel.pending(), 2u);

  std::string item;
  ASSERT_EQ(channel.next(item), Channel::Status::Item);
  EXPECT_EQ(item, "a");
  ASSERT_EQ(channel.next(item), Channel::Status::Item);
  EXPECT_EQ(item, "b");
}

TEST(EventChannelTest, DrainsQueuedItemsBeforeReportingClosed) {
  Channel channel;
  channel.push("last");
  channel.close();
  channel.push("ignored");

  std::string item;
  ASSERT_EQ(channel.next(item), Channel::Status::Item);
  EXPECT_EQ(item, "last");
  EXPECT_EQ(channel.next(item), Channel::Status::Closed);
  EXPECT_TRUE(channel.closed());
}

TEST(EventChannelTest, TimesOutWhenIdle) {
  Channel channel;
  std::string item;

  auto begin = std::chrono::steady_clock::now();
  EXPECT_EQ(channel.next(item, nullptr, 30ms), Channel::Status::TimedOut);
  EXPECT_GE(std::chrono::steady_clock::now() - begin, 30ms);
}

TEST(EventChannelTest, AbortWakesWaiter) {
  Channel channel;
  auto abort = make_abort_signal();

  std::thread setter([abort]() {
    std::this_thread::sleep_for(50ms);
    abort->store(true);
  });

  std::string item;
  EXPECT_EQ(channel.next(item, abort), Channel::Status::Aborted);
  setter.join();
}

TEST(EventChannelTest, PushFromAnotherThreadWakesWaiter) {
  Channel channel;

  std::thread producer([&channel]() {
    std::this_thread::sleep_for(20ms);
    channel.push("hello");
    channel.close();
  });

  std::string item;
  EXPECT_EQ(channel.next(item, nullptr, 2000ms), Channel::Status::Item);
  EXPECT_EQ(item, "hello");
  EXPECT_EQ(channel.next(item), Channel::Status::Closed);
  producer.join();
}

// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ProgressChannel
 */

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "progress_channel.hpp"

using namespace uplift::transfer;
using std::chrono::milliseconds;

namespace {

ProgressEvent event(const std::string& id, uint64_t bytes) {
  ProgressEvent e;
  e.item_id = id;
  e.attempt = 1;
  e.bytes_transferred = bytes;
  e.total_bytes = 1000;
  return e;
}

}  // namespace

TEST(ProgressChannelTest, ZeroCapacityRejected) {
  EXPECT_THROW(ProgressChannel(0), std::invalid_argument);
}

TEST(ProgressChannelTest, DeliversInOrder) {
  ProgressChannel channel(8);
  EXPECT_TRUE(channel.post(event("a", 1)));
  EXPECT_TRUE(channel.post(event("a", 2)));
  EXPECT_EQ(channel.size(), 2u);

  auto first = channel.receive(milliseconds(10));
  auto second = channel.receive(milliseconds(10));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->bytes_transferred, 1u);
  EXPECT_EQ(second->bytes_transferred, 2u);
  EXPECT_EQ(channel.size(), 0u);
}

TEST(ProgressChannelTest, ReceiveTimesOutWhenEmpty) {
  ProgressChannel channel(4);
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(channel.receive(milliseconds(30)).has_value());
  EXPECT_GE(std::chrono::steady_clock::now() - start, milliseconds(25));
}

TEST(ProgressChannelTest, FullChannelDropsOldest) {
  ProgressChannel channel(3);
  for (uint64_t i = 1; i <= 3; ++i) {
    EXPECT_TRUE(channel.post(event("a", i)));
  }
  EXPECT_FALSE(channel.post(event("a", 4)));
  EXPECT_FALSE(channel.post(event("a", 5)));
  EXPECT_EQ(channel.droppedCount(), 2u);
  EXPECT_EQ(channel.size(), 3u);

  auto events = channel.drain();
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events.front().bytes_transferred, 3u);
  EXPECT_EQ(events.back().bytes_transferred, 5u);
  EXPECT_EQ(channel.size(), 0u);
}

TEST(ProgressChannelTest, CloseWakesBlockedConsumer) {
  ProgressChannel channel(4);
  std::optional<ProgressEvent> received = event("x", 0);
  std::thread consumer([&] { received = channel.receive(milliseconds(5000)); });

  std::this_thread::sleep_for(milliseconds(20));
  const auto start = std::chrono::steady_clock::now();
  channel.close();
  consumer.join();

  EXPECT_FALSE(received.has_value());
  EXPECT_LT(std::chrono::steady_clock::now() - start, milliseconds(2000));
  EXPECT_TRUE(channel.isClosed());
}

TEST(ProgressChannelTest, PostAfterCloseRejected) {
  ProgressChannel channel(4);
  channel.post(event("a", 1));
  channel.close();

  EXPECT_FALSE(channel.post(event("a", 2)));
  EXPECT_EQ(channel.droppedCount(), 0u);

  // Queued events survive close
  auto remaining = channel.receive(milliseconds(10));
  ASSERT_TRUE(remaining.has_value());
  EXPECT_EQ(remaining->bytes_transferred, 1u);
  EXPECT_FALSE(channel.receive(milliseconds(10)).has_value());
}

TEST(ProgressChannelTest, ManyProducersOneConsumer) {
  constexpr int kProducers = 4;
  constexpr int kPerProducer = 500;
  ProgressChannel channel(kProducers * kPerProducer);

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&channel, p] {
      for (int i = 0; i < kPerProducer; ++i) {
        channel.post(event("p" + std::to_string(p), static_cast<uint64_t>(i)));
      }
    });
  }

  size_t received = 0;
  while (received < static_cast<size_t>(kProducers * kPerProducer)) {
    if (channel.receive(milliseconds(1000))) {
      ++received;
    } else {
      break;
    }
  }
  for (auto& t : producers) {
    t.join();
  }

  EXPECT_EQ(received, static_cast<size_t>(kProducers * kPerProducer));
  EXPECT_EQ(channel.droppedCount(), 0u);
}

/**
 * @file test_monitor.cpp
 * @brief Unit tests for clipboard change detection
 */

#include "support/fakes.h"

#include <clipshare/monitor.h>
#include <gtest/gtest.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

using namespace clipshare;
using clipshare::test::FakeClient;
using clipshare::test::FakeClipboard;

namespace {

/// Client whose send blocks until released
class GatedClient : public LiveClient {
public:
  Result<void> send_text(const std::string &) override {
    std::unique_lock<std::mutex> lock(mutex_);
    entered_ = true;
    cv_.notify_all();
    cv_.wait(lock, [this] { return released_; });
    return Result<void>::ok();
  }

  void close() override { release(); }

  bool wait_entered() {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, std::chrono::seconds(5),
                        [this] { return entered_; });
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    released_ = true;
    cv_.notify_all();
  }

private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool entered_ = false;
  bool released_ = false;
};

} // namespace

class MonitorTest : public ::testing::Test {
protected:
  void SetUp() override {
    client = std::make_shared<FakeClient>();
    hub.register_client(client);
  }

  FakeClipboard clipboard;
  HistoryStore history;
  BroadcastHub hub{clipboard, history};
  ClipboardMonitor monitor{clipboard, hub};
  std::shared_ptr<FakeClient> client;
};

// ============================================================================
// Tick Tests
// ============================================================================

TEST_F(MonitorTest, FirstTickReportsCurrentContent) {
  clipboard.set(ClipboardSnapshot::from_text("initial"));

  EXPECT_TRUE(monitor.poll_once());
  ASSERT_TRUE(monitor.last_seen().has_value());
  EXPECT_EQ(*monitor.last_seen(), "initial");
  EXPECT_EQ(client->received().size(), 1u);
}

TEST_F(MonitorTest, UnchangedContentNotBroadcast) {
  clipboard.set(ClipboardSnapshot::from_text("same"));
  monitor.poll_once();

  EXPECT_FALSE(monitor.poll_once());
  EXPECT_FALSE(monitor.poll_once());
  EXPECT_EQ(client->received().size(), 1u);
  EXPECT_EQ(monitor.tick_count(), 3u);
}

TEST_F(MonitorTest, ChangeIsBroadcast) {
  clipboard.set(ClipboardSnapshot::from_text("before"));
  monitor.poll_once();

  clipboard.set(ClipboardSnapshot::from_text("after"));
  EXPECT_TRUE(monitor.poll_once());

  auto messages = client->received();
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_NE(messages.back().find("\"after\""), std::string::npos);
  EXPECT_EQ(*monitor.last_seen(), "after");
}

TEST_F(MonitorTest, ReadFailureCountsAsUnchanged) {
  clipboard.set(ClipboardSnapshot::from_text("stable"));
  monitor.poll_once();

  clipboard.set_failing(true);
  EXPECT_FALSE(monitor.poll_once());
  EXPECT_EQ(*monitor.last_seen(), "stable");
  EXPECT_EQ(client->received().size(), 1u);

  // Recovery with the same content is still no change
  clipboard.set_failing(false);
  EXPECT_FALSE(monitor.poll_once());
}

TEST_F(MonitorTest, ClearedClipboardIsAChange) {
  clipboard.set(ClipboardSnapshot::from_text("text"));
  monitor.poll_once();

  clipboard.set(ClipboardSnapshot::empty());
  EXPECT_TRUE(monitor.poll_once());
  EXPECT_EQ(client->received().size(), 2u);
}

TEST_F(MonitorTest, RecordsHistoryWhenEnabled) {
  hub.set_history_enabled(true);

  clipboard.set(ClipboardSnapshot::from_text("one"));
  monitor.poll_once();
  clipboard.set(ClipboardSnapshot::empty());
  monitor.poll_once();
  clipboard.set(ClipboardSnapshot::from_text("two"));
  monitor.poll_once();

  auto entries = history.list(10);
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].content, "two");
  EXPECT_EQ(entries[1].content, "one");
}

TEST_F(MonitorTest, HistoryFollowsDetectionOrder) {
  hub.set_history_enabled(true);
  auto gated = std::make_shared<GatedClient>();
  hub.register_client(gated);

  clipboard.set(ClipboardSnapshot::from_text("A"));
  std::thread poller([this] { monitor.poll_once(); });

  // The poller is now pushing "A"; a request reads newer content
  bool entered = gated->wait_entered();
  if (entered) {
    clipboard.set(ClipboardSnapshot::from_text("B"));
    hub.handle_read();
  }
  gated->release();
  poller.join();

  ASSERT_TRUE(entered);
  auto entries = history.list(10);
  ASSERT_EQ(entries.size(), 2u);
  EXPECT_EQ(entries[0].content, "B");
  EXPECT_EQ(entries[1].content, "A");
}

TEST_F(MonitorTest, NoHistoryWhenDisabled) {
  clipboard.set(ClipboardSnapshot::from_text("one"));
  monitor.poll_once();
  EXPECT_EQ(history.size(), 0u);
}

TEST_F(MonitorTest, FailingClientDropped) {
  auto broken = std::make_shared<FakeClient>(true);
  hub.register_client(broken);

  clipboard.set(ClipboardSnapshot::from_text("fan-out"));
  monitor.poll_once();

  EXPECT_EQ(hub.client_count(), 1u);
  EXPECT_EQ(client->received().size(), 1u);
}

// ============================================================================
// Interval Tests
// ============================================================================

TEST_F(MonitorTest, DefaultInterval) {
  EXPECT_EQ(monitor.interval(), ClipboardMonitor::DEFAULT_INTERVAL);
}

TEST_F(MonitorTest, IntervalClampedToMinimum) {
  monitor.set_interval(std::chrono::milliseconds(100));
  EXPECT_EQ(monitor.interval(), std::chrono::milliseconds(500));

  monitor.set_interval(std::chrono::seconds(3));
  EXPECT_EQ(monitor.interval(), std::chrono::milliseconds(3000));
}

// ============================================================================
// Thread Tests
// ============================================================================

TEST_F(MonitorTest, StartAndStop) {
  clipboard.set(ClipboardSnapshot::from_text("running"));

  ASSERT_TRUE(monitor.start().is_ok());
  EXPECT_TRUE(monitor.is_running());

  // The first tick runs immediately
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (monitor.tick_count() == 0 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  EXPECT_GE(monitor.tick_count(), 1u);

  monitor.stop();
  EXPECT_FALSE(monitor.is_running());
  EXPECT_EQ(monitor.state(), MonitorState::Stopped);
}

TEST_F(MonitorTest, DoubleStartRejected) {
  ASSERT_TRUE(monitor.start().is_ok());

  auto second = monitor.start();
  ASSERT_TRUE(second.is_error());
  EXPECT_EQ(second.error().code, ErrorCode::AlreadyInitialized);

  monitor.stop();
}

TEST_F(MonitorTest, StopInterruptsLongWait) {
  monitor.set_interval(std::chrono::seconds(30));
  ASSERT_TRUE(monitor.start().is_ok());
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  auto start = std::chrono::steady_clock::now();
  monitor.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
}

TEST_F(MonitorTest, Restartable) {
  ASSERT_TRUE(monitor.start().is_ok());
  monitor.stop();
  ASSERT_TRUE(monitor.start().is_ok());
  EXPECT_TRUE(monitor.is_running());
  monitor.stop();
}

TEST(MonitorStateTest, Names) {
  EXPECT_STREQ(monitor_state_name(MonitorState::Idle), "Idle");
  EXPECT_STREQ(monitor_state_name(MonitorState::Polling), "Polling");
  EXPECT_STREQ(monitor_state_name(MonitorState::Unchanged), "Unchanged");
  EXPECT_STREQ(monitor_state_name(MonitorState::Changed), "Changed");
  EXPECT_STREQ(monitor_state_name(MonitorState::Stopped), "Stopped");
}

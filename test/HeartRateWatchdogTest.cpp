#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "src/domain/HeartRateWatchdog.h"

namespace {

// Source whose reconnect succeeds immediately and counts the calls.
class FakeHeartRateSource : public HeartRateSource {
 public:
  bool isDisposed() const override { return disposed.load(); }

  ConnectResult initiateDefault(const DeviceTarget& /*target*/) override {
    reconnects++;
    if (disposed.load()) {
      return ConnectResult::failure(ConnectError::Disposed, "disposed");
    }
    return ConnectResult::success();
  }

  uint32_t subscribe(ReadingBroadcast::Callback cb, void* ctx) override {
    return readings.subscribe(cb, ctx);
  }
  bool unsubscribe(uint32_t id) override { return readings.unsubscribe(id); }

  void emit(int bpm) {
    HeartRateReading r;
    r.beatsPerMinute = bpm;
    readings.publish(r);
  }

  ReadingBroadcast readings;
  std::atomic<bool> disposed{false};
  std::atomic<int> reconnects{0};
};

void sleepMs(int ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace

TEST(HeartRateWatchdogTest, ReconnectsOnceAfterSilenceThenStaysQuietWhileFed) {
  FakeHeartRateSource source;
  HeartRateWatchdog watchdog(source, DeviceTarget::any(), 1000, 100);
  watchdog.start();
  EXPECT_EQ(HeartRateWatchdog::State::Running, watchdog.state());

  sleepMs(1500);
  EXPECT_EQ(1u, watchdog.reconnectCount());
  EXPECT_EQ(1, source.reconnects.load());

  for (int i = 0; i < 8; ++i) {
    source.emit(70 + i);
    sleepMs(200);
  }
  EXPECT_EQ(1u, watchdog.reconnectCount());

  watchdog.dispose();
}

TEST(HeartRateWatchdogTest, ErrorReadingsAlsoResetTheTimer) {
  FakeHeartRateSource source;
  HeartRateWatchdog watchdog(source, DeviceTarget::any(), 400, 50);
  watchdog.start();

  for (int i = 0; i < 10; ++i) {
    source.readings.publish(HeartRateReading::makeError("Unable to connect"));
    sleepMs(100);
  }
  EXPECT_EQ(0u, watchdog.reconnectCount());
  watchdog.dispose();
}

TEST(HeartRateWatchdogTest, DisposeIsIdempotentAndFinal) {
  FakeHeartRateSource source;
  HeartRateWatchdog watchdog(source, DeviceTarget::any(), 1000, 50);
  EXPECT_EQ(HeartRateWatchdog::State::Idle, watchdog.state());

  watchdog.start();
  watchdog.dispose();
  EXPECT_EQ(HeartRateWatchdog::State::Disposed, watchdog.state());
  watchdog.dispose();
  EXPECT_EQ(HeartRateWatchdog::State::Disposed, watchdog.state());

  watchdog.start();
  EXPECT_EQ(HeartRateWatchdog::State::Disposed, watchdog.state());
}

TEST(HeartRateWatchdogTest, DisposeBeforeStartNeverReconnects) {
  FakeHeartRateSource source;
  HeartRateWatchdog watchdog(source, DeviceTarget::any(), 10, 10);
  watchdog.dispose();
  watchdog.start();
  sleepMs(100);
  EXPECT_EQ(0u, watchdog.reconnectCount());
}

TEST(HeartRateWatchdogTest, DisposedSourceStopsSupervision) {
  FakeHeartRateSource source;
  source.disposed = true;
  HeartRateWatchdog watchdog(source, DeviceTarget::any(), 10, 10);
  watchdog.start();
  sleepMs(100);
  EXPECT_EQ(0u, watchdog.reconnectCount());
  watchdog.dispose();
}

TEST(HeartRateWatchdogTest, DestructorUnsubscribesFromSource) {
  FakeHeartRateSource source;
  {
    HeartRateWatchdog watchdog(source, DeviceTarget::any(), 1000, 50);
    EXPECT_EQ(1u, source.readings.subscriberCount());
    watchdog.start();
  }
  EXPECT_EQ(0u, source.readings.subscriberCount());
  source.emit(60);
}

TEST(HeartRateWatchdogTest, TeardownWhilePublishingIsSafe) {
  FakeHeartRateSource source;
  std::atomic<bool> stop(false);
  std::thread publisher([&source, &stop]() {
    while (!stop.load()) source.emit(72);
  });

  for (int i = 0; i < 2000; ++i) {
    HeartRateWatchdog* watchdog = new HeartRateWatchdog(source, DeviceTarget::any(), 1000, 100);
    delete watchdog;
  }

  stop = true;
  publisher.join();
  EXPECT_EQ(0u, source.readings.subscriberCount());
  EXPECT_EQ(0, source.reconnects.load());
}

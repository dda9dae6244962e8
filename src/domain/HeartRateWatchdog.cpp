// HeartRateWatchdog.cpp

#include "HeartRateWatchdog.h"

#include "src/infrastructure/Logger.h"

HeartRateWatchdog::HeartRateWatchdog(HeartRateSource& source, const DeviceTarget& target,
                                     uint32_t timeoutMs, uint32_t pollIntervalMs)
    : source_(source),
      target_(target),
      timeout_(std::chrono::milliseconds(timeoutMs)),
      pollInterval_(std::chrono::milliseconds(pollIntervalMs)),
      lastUpdate_(Clock::now()),
      reconnects_(0) {
  subscription_ = source_.subscribe(&HeartRateWatchdog::onReading, this);
}

HeartRateWatchdog::~HeartRateWatchdog() {
  dispose();
  source_.unsubscribe(subscription_);
}

void HeartRateWatchdog::onReading(const HeartRateReading& /*reading*/, void* ctx) {
  HeartRateWatchdog* self = static_cast<HeartRateWatchdog*>(ctx);
  if (self) self->resetTimer();
}

void HeartRateWatchdog::resetTimer() {
  std::lock_guard<std::mutex> lock(mutex_);
  lastUpdate_ = Clock::now();
}

void HeartRateWatchdog::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ != State::Idle) return;

  lastUpdate_ = Clock::now();
  state_ = State::Running;
  thread_ = std::thread(&HeartRateWatchdog::run, this);
  Logger::info("Watchdog: started (timeout=%ldms, poll=%ldms)",
               (long)std::chrono::duration_cast<std::chrono::milliseconds>(timeout_).count(),
               (long)std::chrono::duration_cast<std::chrono::milliseconds>(pollInterval_).count());
}

void HeartRateWatchdog::dispose() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == State::Disposed) return;
    state_ = State::Disposed;
  }
  wake_.notify_all();
  if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
    thread_.join();
  } else if (thread_.joinable()) {
    thread_.detach();
  }
}

HeartRateWatchdog::State HeartRateWatchdog::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void HeartRateWatchdog::run() {
  while (!source_.isDisposed()) {
    bool needsRefresh = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (state_ == State::Disposed) break;
      needsRefresh = Clock::now() - lastUpdate_ > timeout_;
    }

    if (needsRefresh) {
      Logger::warn("Watchdog: no reading within timeout, restarting connection");
      reconnects_.fetch_add(1);
      ConnectResult r = source_.initiateDefault(target_);
      if (r.ok()) {
        resetTimer();
      } else {
        Logger::error("Watchdog: restart failed (%s): %s", connectErrorName(r.error),
                      r.message.c_str());
      }
    }

    std::unique_lock<std::mutex> lock(mutex_);
    wake_.wait_for(lock, pollInterval_, [this] { return state_ == State::Disposed; });
    if (state_ == State::Disposed) break;
  }

  Logger::info("Watchdog: thread exiting");
}

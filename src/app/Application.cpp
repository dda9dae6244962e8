// Application.cpp
// See Application.h for high-level responsibilities.

#include "Application.h"

#include <esp_pthread.h>

#include <string>

Application::~Application() {
  // Service first: it unblocks a watchdog reconnect stuck in its retry loop
  if (service_) service_->dispose();
  if (watchdog_) watchdog_->dispose();
  if (connectWorker_.joinable()) connectWorker_.join();
}

void Application::begin() {
  if (initialized_) return;

  initializeLogger();

  loadSettings();

  initializeBle();

  startWorkers();

  Logger::info("Application initialized. Target: %s", settings_.target.describe().c_str());
  initialized_ = true;
}

void Application::runLoop() {
  if (!initialized_) return;

  // Periodic status line every 15s
  const uint32_t nowMs = millis();
  if (nowMs - lastStatusLogMs_ >= 15000u) {
    lastStatusLogMs_ = nowMs;
    logStatus();
  }

  delay(50);  // Yield; radio work runs on the worker threads
}

void Application::initializeLogger() {
  // Initialize Serial with a reasonable baud rate for logs.
  Serial.begin(BUILD_LOG_BAUD_RATE);
  uint32_t start = millis();
  while (!Serial && millis() - start < 2000) {
    // Wait briefly for Serial on boards that require it; timeout to avoid boot stalls.
    delay(10);
  }
  Logger::setSink(&Application::serialSink, nullptr);
  Logger::setLevel(LOG_LEVEL_INFO);
  Logger::info("Logger initialized (baud=%d)", BUILD_LOG_BAUD_RATE);
}

void Application::loadSettings() {
  if (settingsStore_.load(settings_)) {
    Logger::info("Settings: loaded (timeout=%lums, poll=%lums)",
                 (unsigned long)settings_.disconnectedTimeoutMs,
                 (unsigned long)settings_.watchdogPollMs);
  } else {
    // First boot: persist defaults so the record can be edited in place
    Logger::info("Settings: no stored record, using defaults");
    if (!settingsStore_.save(settings_)) {
      Logger::warn("Settings: failed to persist defaults");
    }
  }
  Logger::setLevel(static_cast<LogLevel>(settings_.logLevel));
}

void Application::initializeBle() {
  central_.begin(BUILD_DEVICE_NAME);
  service_.reset(new HeartRateService(central_));
  service_->subscribe(&Application::onReading, this);
}

void Application::startWorkers() {
  // std::thread maps to pthreads; give the workers room for NimBLE calls
  esp_pthread_cfg_t cfg = esp_pthread_get_default_config();
  cfg.stack_size = BUILD_WORKER_STACK_BYTES;
  cfg.thread_name = "hr-connect";
  if (esp_pthread_set_cfg(&cfg) != ESP_OK) {
    Logger::warn("Threads: could not apply worker stack size");
  }

  HeartRateService* service = service_.get();
  const DeviceTarget target = settings_.target;
  connectWorker_ = std::thread([service, target]() {
    ConnectResult r = service->initiateDefault(target);
    if (!r.ok()) {
      Logger::warn("Worker: initial connect ended (%s)", connectErrorName(r.error));
    }
  });

  cfg.thread_name = "hr-watchdog";
  if (esp_pthread_set_cfg(&cfg) != ESP_OK) {
    Logger::warn("Threads: could not apply watchdog stack size");
  }
  watchdog_.reset(new HeartRateWatchdog(*service_, settings_.target,
                                        settings_.disconnectedTimeoutMs,
                                        settings_.watchdogPollMs));
  watchdog_->start();
}

void Application::logStatus() {
  int bpm;
  bool wasError;
  uint32_t lastMs;
  portENTER_CRITICAL(&statusMux_);
  bpm = lastBpm_;
  wasError = lastWasError_;
  lastMs = lastReadingMs_;
  portEXIT_CRITICAL(&statusMux_);

  const NotificationBridge& bridge = service_->bridge();
  Logger::info("Status: link=%s, bpm=%d%s, age=%lums, frames=%lu, skipped=%lu, restarts=%lu",
               service_->isConnected() ? "up" : "down", bpm, wasError ? " (error)" : "",
               (unsigned long)(lastMs ? millis() - lastMs : 0),
               (unsigned long)bridge.framesDecoded(), (unsigned long)bridge.framesSkipped(),
               (unsigned long)watchdog_->reconnectCount());
}

void Application::onReading(const HeartRateReading& reading, void* ctx) {
  Application* self = static_cast<Application*>(ctx);
  if (!self) return;

  portENTER_CRITICAL(&self->statusMux_);
  self->lastWasError_ = reading.isError;
  if (!reading.isError) self->lastBpm_ = reading.beatsPerMinute;
  self->lastReadingMs_ = millis();
  portEXIT_CRITICAL(&self->statusMux_);

  if (reading.isError) {
    Logger::warn("Reading: error: %s", reading.error.c_str());
    return;
  }

  // Serial console consumer: one line per reading
  std::string rr;
  for (size_t i = 0; i < reading.rrIntervals.size(); ++i) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%s%.0f", i ? "," : "", rrIntervalMs(reading.rrIntervals[i]));
    rr += buf;
  }
  if (reading.hasEnergyExpended) {
    Logger::info("Reading: bpm=%d contact=%s energy=%dkJ rr=[%s]ms", reading.beatsPerMinute,
                 contactSensorStatusName(reading.status), reading.energyExpended, rr.c_str());
  } else {
    Logger::info("Reading: bpm=%d contact=%s rr=[%s]ms", reading.beatsPerMinute,
                 contactSensorStatusName(reading.status), rr.c_str());
  }
}

void Application::serialSink(const char* line, void* /*ctx*/) {
  Serial.println(line);
}

// Application.h
// High-level composition root for the heart rate monitor firmware. Responsible for
// initializing subsystems (logging, configuration, BLE) and driving the main loop.

#pragma once

#include <Arduino.h>

#include <memory>
#include <thread>

#include "src/config/BuildConfig.h"
#include "src/domain/HeartRateReading.h"
#include "src/domain/HeartRateService.h"
#include "src/domain/HeartRateSettings.h"
#include "src/domain/HeartRateWatchdog.h"
#include "src/infrastructure/Logger.h"
#include "src/infrastructure/SettingsStore.h"
#include "src/infrastructure/ble/NimBleHeartRateCentral.h"

class Application {
 public:
  ~Application();

  // Initializes logging, loads settings and starts the connection worker
  // and watchdog. Safe to call only once from Arduino setup().
  void begin();

  // Runs a single iteration of the application's main loop. This function is
  // non-blocking; all radio work happens on the worker threads.
  void runLoop();

 private:
  bool initialized_ = false;  // Tracks whether begin() was called

  HeartRateSettings settings_;
  SettingsStore settingsStore_;
  NimBleHeartRateCentral central_;
  std::unique_ptr<HeartRateService> service_;
  std::unique_ptr<HeartRateWatchdog> watchdog_;
  std::thread connectWorker_;

  // Latest values for the periodic status line (written from the BLE host task)
  portMUX_TYPE statusMux_ = portMUX_INITIALIZER_UNLOCKED;
  int lastBpm_ = 0;
  bool lastWasError_ = false;
  uint32_t lastReadingMs_ = 0;
  uint32_t lastStatusLogMs_ = 0;

  // Internal helpers
  void initializeLogger();
  void loadSettings();
  void initializeBle();
  void startWorkers();
  void logStatus();

  static void onReading(const HeartRateReading& reading, void* ctx);
  static void serialSink(const char* line, void* ctx);
};

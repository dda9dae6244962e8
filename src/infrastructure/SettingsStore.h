// SettingsStore.h
// Flash-backed persistence for HeartRateSettings using ESP32 NVS (Preferences).
//
// Purpose
// - Keep the pinned device address and watchdog timings across power cycles.
// - The store depends only on the HeartRateSettings struct; the Application
//   decides when to load and save.

#pragma once

#include "src/domain/HeartRateSettings.h"

class SettingsStore {
 public:
  // Load settings from flash (NVS namespace `heartrate`).
  // Returns true if a valid record was loaded (schema version present); otherwise leaves
  // settingsOut unchanged so the caller can retain defaults.
  bool load(HeartRateSettings &settingsOut);

  // Save settings to flash. Returns true on success.
  bool save(const HeartRateSettings &settingsIn);
};
